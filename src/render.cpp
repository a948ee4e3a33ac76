#include "render.hpp"

#include <algorithm>
#include <cstdio>

namespace lanejump {

bool check_surface(int rows, int cols, int min_rows, int min_cols, std::string* why) {
    if (rows >= min_rows && cols >= min_cols) return true;
    if (why) {
        *why = "terminal is " + std::to_string(cols) + "x" + std::to_string(rows) +
               ", need at least " + std::to_string(min_cols) + "x" + std::to_string(min_rows);
    }
    return false;
}

std::string status_line(const StatusInfo& s) {
    char rate[16];
    std::snprintf(rate, sizeof(rate), "%.2f", s.spawn_rate);
    return "Lvl:" + std::to_string(s.level) + "/" + std::to_string(s.level_count) +
           "  Spd:" + std::to_string(s.speed) +
           "  Spawn:" + rate +
           "  Life:" + std::to_string(s.lives);
}

void draw_frame(Surface& surface, const PlayerState& player,
                const std::vector<Obstacle>& obstacles, const StatusInfo& status) {
    surface.clear();
    surface.draw_border();
    surface.put(player.height_y, player.lane_x, PLAYER_GLYPH, Color::Player);
    for (const auto& o : obstacles) surface.put(o.row, o.col, OBSTACLE_GLYPH, Color::Obstacle);

    // Keep the right border intact.
    std::string line = status_line(status);
    int room = std::max(0, surface.cols() - 3);
    if (static_cast<int>(line.size()) > room) line.resize(room);
    surface.text(0, 2, line, Color::Text);
    surface.present();
}

void draw_banner(Surface& surface, const std::string& msg) {
    surface.clear();
    int col = std::max(0, (surface.cols() - static_cast<int>(msg.size())) / 2);
    surface.text(surface.rows() / 2, col, msg, Color::Text);
    surface.present();
}

} // namespace lanejump
