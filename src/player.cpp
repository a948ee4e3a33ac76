#include "player.hpp"

#include <algorithm>
#include <cmath>

namespace lanejump {

int jump_velocity(int gravity, double peak_fraction, int play_height) {
    return -static_cast<int>(std::lround(std::sqrt(2.0 * gravity * peak_fraction * play_height)));
}

Player::Player(int width, int height, const GameConfig& cfg)
    : width_(width), ground_y_(height - 2), gravity_(cfg.gravity) {
    int play_height = ground_y_ - top_bound_ + 1;
    v1_ = jump_velocity(gravity_, cfg.first_jump_peak, play_height);
    v2_ = jump_velocity(gravity_, cfg.second_jump_peak, play_height);

    st_.lane_x = width / 4;
    st_.height_y = ground_y_;
}

JumpKind Player::apply_input(Command cmd) {
    switch (cmd) {
        case Command::MoveLeft:
            st_.lane_x = std::max(1, st_.lane_x - 1);
            return JumpKind::None;
        case Command::MoveRight:
            st_.lane_x = std::min(width_ - 2, st_.lane_x + 1);
            return JumpKind::None;
        case Command::Jump:
            if (st_.on_ground) {
                st_.vertical_velocity = v1_;
                st_.on_ground = false;
                st_.jumps_used = 1;
                return JumpKind::First;
            }
            if (st_.jumps_used == 1) {
                st_.vertical_velocity = v2_;
                st_.jumps_used = 2;
                return JumpKind::Second;
            }
            return JumpKind::None; // budget spent until landing
        case Command::None:
            break;
    }
    return JumpKind::None;
}

void Player::advance_gravity() {
    st_.height_y += st_.vertical_velocity;
    st_.vertical_velocity += gravity_;
    if (st_.height_y >= ground_y_) {
        st_.height_y = ground_y_;
        st_.vertical_velocity = 0;
        st_.on_ground = true;
        st_.jumps_used = 0;
    }
    if (st_.height_y < top_bound_) {
        st_.height_y = top_bound_;
        st_.vertical_velocity = 0;
    }
}

} // namespace lanejump
