#include "log.hpp"

#include <iostream>
#include <mutex>
#include <vector>

namespace lanejump {

namespace {

std::mutex log_mtx;
bool held = false;
std::vector<std::string> pending;

void emit(const char* level, const std::string& msg) {
    std::string line = std::string("[lanejump] [") + level + "] " + msg;
    std::lock_guard<std::mutex> lk(log_mtx);
    if (held) { pending.push_back(std::move(line)); return; }
    std::cerr << line << "\n";
}

} // namespace

void log_info(const std::string& msg)  { emit("INFO", msg); }
void log_warn(const std::string& msg)  { emit("WARN", msg); }
void log_error(const std::string& msg) { emit("ERROR", msg); }

void log_hold(bool hold) {
    {
        std::lock_guard<std::mutex> lk(log_mtx);
        held = hold;
    }
    if (!hold) log_flush();
}

void log_flush() {
    std::lock_guard<std::mutex> lk(log_mtx);
    for (const auto& line : pending) std::cerr << line << "\n";
    pending.clear();
    std::cerr << std::flush;
}

} // namespace lanejump
