// player.hpp - lane movement, double jump and gravity
#pragma once

#include "config.hpp"

namespace lanejump {

enum class Command { None, MoveLeft, MoveRight, Jump };
enum class JumpKind { None, First, Second };

struct PlayerState {
    int  lane_x{0};
    int  height_y{0};
    int  vertical_velocity{0};
    bool on_ground{true};
    int  jumps_used{0};
};

// Launch speed (negative is up) that peaks at peak_fraction * play_height
// rows under the given gravity.
int jump_velocity(int gravity, double peak_fraction, int play_height);

class Player {
public:
    // width/height are the full surface including the border.
    Player(int width, int height, const GameConfig& cfg);

    JumpKind apply_input(Command cmd);
    void advance_gravity();

    const PlayerState& state() const { return st_; }
    int lane_x() const { return st_.lane_x; }
    int height_y() const { return st_.height_y; }

    int ground_y() const { return ground_y_; }
    int top_bound() const { return top_bound_; }
    int first_jump_velocity() const { return v1_; }
    int second_jump_velocity() const { return v2_; }

private:
    PlayerState st_;
    int width_;
    int ground_y_;
    int top_bound_{1};
    int gravity_;
    int v1_;
    int v2_;
};

} // namespace lanejump
