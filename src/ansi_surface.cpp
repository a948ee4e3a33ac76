#include "ansi_surface.hpp"

#include <cerrno>
#include <iostream>

#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace lanejump {

namespace {

// ---------- ANSI colors ----------
constexpr const char* RESET    = "\x1b[0m";
constexpr const char* FG_BLUE  = "\x1b[94m";
constexpr const char* FG_RED   = "\x1b[91m";
constexpr const char* FG_WHITE = "\x1b[97m";

// ---------- Box-drawing (UTF-8) ----------
constexpr const char* BOX_TL = "╔";
constexpr const char* BOX_TR = "╗";
constexpr const char* BOX_BL = "╚";
constexpr const char* BOX_BR = "╝";
constexpr const char* BOX_H  = "═";
constexpr const char* BOX_V  = "║";

constexpr int FALLBACK_ROWS = 24;
constexpr int FALLBACK_COLS = 80;

// ESC [ params final, or ESC O final. Longer runs are dropped.
constexpr std::size_t MAX_SEQUENCE = 16;

const char* color_code(Color c) {
    switch (c) {
        case Color::Player:   return FG_BLUE;
        case Color::Obstacle: return FG_RED;
        case Color::Text:     return FG_WHITE;
        case Color::Default:  break;
    }
    return RESET;
}

int term_cols() {
    winsize ws{}; if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col; return FALLBACK_COLS;
}
int term_rows() {
    winsize ws{}; if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) return ws.ws_row; return FALLBACK_ROWS;
}

inline void cursor_xy(int row1, int col1) { std::cout << "\x1b[" << row1 << ";" << col1 << "H"; }

} // namespace

// ---------- KeyDecoder ----------
void KeyDecoder::feed(const char* bytes, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) byte(bytes[i]);
}

Key KeyDecoder::next() {
    if (keys_.empty()) return Key::None;
    Key k = keys_.front();
    keys_.pop_front();
    return k;
}

void KeyDecoder::byte(char ch) {
    if (!partial_.empty()) {
        if (partial_.size() == 1) {
            if (ch == '[' || ch == 'O') { partial_.push_back(ch); return; }
            partial_.clear(); // lone ESC, fall through with this byte
        } else {
            const bool csi = partial_[1] == '[';
            if (csi && ch >= 0x20 && ch <= 0x3f) { // parameter / intermediate
                partial_.push_back(ch);
                if (partial_.size() > MAX_SEQUENCE) partial_.clear();
                return;
            }
            partial_.clear();
            if (ch < 0x40 || ch > 0x7e) return; // malformed, drop it
            // ESC [ 1;5 D (Ctrl-Left) and friends still mean left.
            if (ch == 'D') keys_.push_back(Key::Left);
            else if (ch == 'C') keys_.push_back(Key::Right);
            return; // up/down and anything else are ignored
        }
    }

    switch (ch) {
        case '\x1b': partial_.push_back(ch); break;
        case ' ': case 'w': case 'W': keys_.push_back(Key::Space); break;
        case 'a': case 'A': keys_.push_back(Key::Left); break;
        case 'd': case 'D': keys_.push_back(Key::Right); break;
        case 'q': case 'Q': case 3: keys_.push_back(Key::Quit); break; // 3 = Ctrl-C
        default: break;
    }
}

std::size_t drain_input(int fd, KeyDecoder& decoder) {
    std::size_t total = 0;
    char buf[64];
    while (true) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, 0);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0 || !(pfd.revents & POLLIN)) break;
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break; // EOF or error
        decoder.feed(buf, static_cast<std::size_t>(n));
        total += static_cast<std::size_t>(n);
    }
    return total;
}

// ---------- RawTerm ----------
RawTerm::RawTerm() {
    if (!isatty(STDIN_FILENO)) return;
    if (tcgetattr(STDIN_FILENO, &orig) != 0) return;
    termios raw = orig;
    raw.c_lflag &= ~(ICANON | ECHO | ISIG);
    raw.c_cc[VMIN]  = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) return;
    ok = true;
}

RawTerm::~RawTerm() {
    if (ok) tcsetattr(STDIN_FILENO, TCSANOW, &orig);
}

// ---------- AnsiSurface ----------
AnsiSurface::AnsiSurface()
    : rows_(term_rows()), cols_(term_cols()),
      grid_(rows_, std::vector<Cell>(cols_)),
      back_(rows_) {
    std::cout << "\x1b[?1049h\x1b[?25l\x1b[2J\x1b[H" << std::flush; // alt screen, hide cursor
}

AnsiSurface::~AnsiSurface() {
    std::cout << RESET << "\x1b[2J\x1b[H\x1b[?25h\x1b[?1049l" << std::flush;
}

Key AnsiSurface::poll_key() {
    drain_input(STDIN_FILENO, keys_);
    return keys_.next();
}

void AnsiSurface::clear() {
    for (auto& row : grid_)
        for (auto& cell : row) cell = Cell{};
}

void AnsiSurface::draw_border() {
    if (rows_ < 2 || cols_ < 2) return;
    for (int c = 1; c < cols_ - 1; ++c) {
        put(0, c, BOX_H, Color::Text);
        put(rows_ - 1, c, BOX_H, Color::Text);
    }
    for (int r = 1; r < rows_ - 1; ++r) {
        put(r, 0, BOX_V, Color::Text);
        put(r, cols_ - 1, BOX_V, Color::Text);
    }
    put(0, 0, BOX_TL, Color::Text);
    put(0, cols_ - 1, BOX_TR, Color::Text);
    put(rows_ - 1, 0, BOX_BL, Color::Text);
    put(rows_ - 1, cols_ - 1, BOX_BR, Color::Text);
}

void AnsiSurface::put(int row, int col, const char* glyph, Color color) {
    if (row < 0 || row >= rows_ || col < 0 || col >= cols_ || glyph == nullptr) return;
    grid_[row][col] = Cell{glyph, color};
}

void AnsiSurface::text(int row, int col, const std::string& s, Color color) {
    char one[2] = { 0, 0 };
    for (std::size_t i = 0; i < s.size(); ++i) {
        one[0] = s[i];
        put(row, col + static_cast<int>(i), one, color);
    }
}

// Only rows that changed since the last frame are rewritten.
void AnsiSurface::present() {
    for (int r = 0; r < rows_; ++r) {
        std::string line;
        Color current = Color::Default;
        for (const auto& cell : grid_[r]) {
            if (cell.color != current) { line += color_code(cell.color); current = cell.color; }
            line += cell.glyph;
        }
        line += RESET;
        if (line == back_[r]) continue;
        cursor_xy(r + 1, 1);
        std::cout << line;
        back_[r].swap(line);
    }
    std::cout << std::flush;
}

} // namespace lanejump
