// surface.hpp - fixed-size character grid the game draws on
#pragma once

#include <string>

namespace lanejump {

enum class Key { None, Left, Right, Space, Quit };

enum class Color { Default, Player, Obstacle, Text };

class Surface {
public:
    virtual ~Surface() = default;

    virtual int rows() const = 0;
    virtual int cols() const = 0;

    // Non-blocking; Key::None when nothing is pending.
    virtual Key poll_key() = 0;

    virtual void clear() = 0;
    virtual void draw_border() = 0;
    // Writes outside the grid are dropped.
    virtual void put(int row, int col, const char* glyph, Color color) = 0;
    virtual void text(int row, int col, const std::string& s, Color color) = 0;
    virtual void present() = 0;
};

// False (with a reason) when rows x cols can't hold the playfield.
bool check_surface(int rows, int cols, int min_rows, int min_cols, std::string* why);

} // namespace lanejump
