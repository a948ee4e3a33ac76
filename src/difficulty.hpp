// difficulty.hpp - timed speed-ups and the level-complete condition
#pragma once

#include "config.hpp"

#include <chrono>

namespace lanejump {

enum class DifficultyState { Running, LevelComplete };

class Difficulty {
public:
    using time_point = std::chrono::steady_clock::time_point;

    Difficulty(int level, const GameConfig& cfg, time_point start);

    // Fires a speed-up if the interval has elapsed since the last one.
    // Returns true when it did.
    bool update(time_point now);

    DifficultyState state() const { return state_; }
    bool level_complete() const { return state_ == DifficultyState::LevelComplete; }

    int speed() const { return speed_; }
    double spawn_rate() const { return spawn_rate_; }
    int speedups() const { return speedups_; }
    time_point last_speedup() const { return last_speedup_; }

private:
    GameConfig cfg_;
    int speed_;
    double spawn_rate_;
    int speedups_{0};
    time_point last_speedup_;
    DifficultyState state_{DifficultyState::Running};
};

} // namespace lanejump
