// ansi_surface.hpp - raw-mode terminal surface drawn with ANSI escapes
#pragma once

#include "surface.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include <termios.h>

namespace lanejump {

// Turns raw keyboard bytes into game keys. Escape sequences split across
// reads are carried over to the next feed().
class KeyDecoder {
public:
    void feed(const char* bytes, std::size_t n);
    Key next();
    bool pending() const { return !keys_.empty(); }

private:
    void byte(char ch);

    std::string partial_;
    std::deque<Key> keys_;
};

// Feeds whatever is already readable on fd into decoder and returns the
// number of bytes consumed. Never blocks, even when fd is not in raw mode.
std::size_t drain_input(int fd, KeyDecoder& decoder);

// ---------- Raw terminal guard ----------
struct RawTerm {
    termios orig{};
    bool ok{false};
    RawTerm();
    ~RawTerm();
    RawTerm(const RawTerm&) = delete;
    RawTerm& operator=(const RawTerm&) = delete;
};

class AnsiSurface : public Surface {
public:
    AnsiSurface();
    ~AnsiSurface() override;

    bool raw_ok() const { return raw_.ok; }

    int rows() const override { return rows_; }
    int cols() const override { return cols_; }
    Key poll_key() override;
    void clear() override;
    void draw_border() override;
    void put(int row, int col, const char* glyph, Color color) override;
    void text(int row, int col, const std::string& s, Color color) override;
    void present() override;

private:
    struct Cell {
        std::string glyph{" "};
        Color color{Color::Default};
    };

    RawTerm raw_;
    KeyDecoder keys_;
    int rows_;
    int cols_;
    std::vector<std::vector<Cell>> grid_;
    std::vector<std::string> back_; // what is on screen now, per row
};

} // namespace lanejump
