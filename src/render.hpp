// render.hpp - playfield, status line and banners
#pragma once

#include "obstacles.hpp"
#include "player.hpp"
#include "surface.hpp"

#include <string>
#include <vector>

namespace lanejump {

static constexpr const char* PLAYER_GLYPH   = "^";
static constexpr const char* OBSTACLE_GLYPH = "-";

struct StatusInfo {
    int level;
    int level_count;
    int speed;
    double spawn_rate;
    int lives;
};

std::string status_line(const StatusInfo& s);

void draw_frame(Surface& surface, const PlayerState& player,
                const std::vector<Obstacle>& obstacles, const StatusInfo& status);

// Clears the surface and centres msg on the middle row.
void draw_banner(Surface& surface, const std::string& msg);

} // namespace lanejump
