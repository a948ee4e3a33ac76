#include "difficulty.hpp"

#include <algorithm>

namespace lanejump {

Difficulty::Difficulty(int level, const GameConfig& cfg, time_point start)
    : cfg_(cfg),
      speed_(level),
      spawn_rate_(std::min(cfg.max_spawn_rate, cfg.initial_spawn_rate + cfg.level_spawn_step * (level - 1))),
      last_speedup_(start) {}

bool Difficulty::update(time_point now) {
    if (state_ == DifficultyState::LevelComplete) return false;
    if (now - last_speedup_ < cfg_.speed_up_interval) return false;

    speed_ += 1;
    spawn_rate_ = std::min(cfg_.max_spawn_rate, spawn_rate_ + cfg_.spawn_increase);
    speedups_ += 1;
    last_speedup_ = now;
    if (speedups_ >= cfg_.speedups_per_level) state_ = DifficultyState::LevelComplete;
    return true;
}

} // namespace lanejump
