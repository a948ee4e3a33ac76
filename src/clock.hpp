// clock.hpp - time source for the game loop
#pragma once

#include <chrono>
#include <thread>

namespace lanejump {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() = 0;
    virtual void sleep_for(duration d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() override { return std::chrono::steady_clock::now(); }
    void sleep_for(duration d) override { std::this_thread::sleep_for(d); }
};

} // namespace lanejump
