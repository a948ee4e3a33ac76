#include "obstacles.hpp"

#include <algorithm>

namespace lanejump {

bool ObstacleStream::spawn(double spawn_rate, int height, int width) {
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    if (chance(rng_) >= spawn_rate) return false;
    std::uniform_int_distribution<int> row(1, std::max(1, height - 2));
    obstacles_.push_back(Obstacle{row(rng_), width - 2});
    return true;
}

void ObstacleStream::advance(int speed) {
    for (auto& o : obstacles_) o.col -= speed;
    obstacles_.erase(std::remove_if(obstacles_.begin(), obstacles_.end(),
                                    [](const Obstacle& o) { return o.col <= 0; }),
                     obstacles_.end());
}

std::vector<Obstacle> ObstacleStream::collide(int row, int col) {
    std::vector<Obstacle> hits;
    std::vector<Obstacle> remaining;
    remaining.reserve(obstacles_.size());
    for (const auto& o : obstacles_) {
        if (o.row == row && o.col == col) hits.push_back(o);
        else                              remaining.push_back(o);
    }
    obstacles_.swap(remaining);
    return hits;
}

std::vector<Obstacle> ObstacleStream::tick(double spawn_rate, int speed, int height, int width,
                                           int player_row, int player_col) {
    spawn(spawn_rate, height, width);
    advance(speed);
    return collide(player_row, player_col);
}

} // namespace lanejump
