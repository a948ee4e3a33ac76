// obstacles.hpp - spawning, scrolling and collision of incoming obstacles
#pragma once

#include <random>
#include <vector>

namespace lanejump {

struct Obstacle {
    int row;
    int col;
};

class ObstacleStream {
public:
    explicit ObstacleStream(std::mt19937& rng) : rng_(rng) {}

    // One Bernoulli trial; a hit places a new obstacle at the right edge on
    // a random interior row. Returns true if one was added.
    bool spawn(double spawn_rate, int height, int width);
    // Moves everything left by speed and drops what left the screen.
    void advance(int speed);
    // Removes and returns every obstacle sitting on (row, col).
    std::vector<Obstacle> collide(int row, int col);

    // spawn + advance + collide, in that order.
    std::vector<Obstacle> tick(double spawn_rate, int speed, int height, int width,
                               int player_row, int player_col);

    void insert(Obstacle o) { obstacles_.push_back(o); }
    const std::vector<Obstacle>& obstacles() const { return obstacles_; }
    std::size_t size() const { return obstacles_.size(); }

private:
    std::mt19937& rng_;
    std::vector<Obstacle> obstacles_;
};

} // namespace lanejump
