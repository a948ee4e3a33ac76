#include <catch2/catch.hpp>

#include "ansi_surface.hpp"
#include "level.hpp"

#include <chrono>
#include <string>

#include <unistd.h>

using namespace lanejump;

namespace {

std::vector<Key> decode(KeyDecoder& dec, const std::string& bytes) {
    dec.feed(bytes.data(), bytes.size());
    std::vector<Key> out;
    while (dec.pending()) out.push_back(dec.next());
    return out;
}

} // namespace

TEST_CASE("arrow keys and letters", "[input]") {
    KeyDecoder dec;
    CHECK(decode(dec, "\x1b[D") == std::vector<Key>{Key::Left});
    CHECK(decode(dec, "\x1b[C") == std::vector<Key>{Key::Right});
    CHECK(decode(dec, "\x1bOD") == std::vector<Key>{Key::Left});
    CHECK(decode(dec, " ") == std::vector<Key>{Key::Space});
    CHECK(decode(dec, "aAdDwWqQ") == std::vector<Key>{Key::Left, Key::Left, Key::Right, Key::Right,
                                                      Key::Space, Key::Space, Key::Quit, Key::Quit});
    CHECK(decode(dec, std::string(1, '\x03')) == std::vector<Key>{Key::Quit});
}

TEST_CASE("unknown bytes and vertical arrows are ignored", "[input]") {
    KeyDecoder dec;
    CHECK(decode(dec, "xyz\x1b[A\x1b[B").empty());
    CHECK(dec.next() == Key::None);
}

TEST_CASE("escape sequences split across reads", "[input]") {
    KeyDecoder dec;
    CHECK(decode(dec, "\x1b").empty());
    CHECK(decode(dec, "[").empty());
    CHECK(decode(dec, "C ") == std::vector<Key>{Key::Right, Key::Space});
}

TEST_CASE("lone escape does not eat the next key", "[input]") {
    KeyDecoder dec;
    CHECK(decode(dec, "\x1bq") == std::vector<Key>{Key::Quit});
}

TEST_CASE("modified arrows carry parameters", "[input]") {
    KeyDecoder dec;
    CHECK(decode(dec, "\x1b[1;5D") == std::vector<Key>{Key::Left});
    CHECK(decode(dec, "\x1b[1;5C") == std::vector<Key>{Key::Right});
    CHECK(decode(dec, "\x1b[1;2A\x1b[3~").empty());

    CHECK(decode(dec, "\x1b[1").empty());
    CHECK(decode(dec, ";5").empty());
    CHECK(decode(dec, "Dd") == std::vector<Key>{Key::Left, Key::Right});
}

TEST_CASE("runaway escape sequence is dropped", "[input]") {
    KeyDecoder dec;
    CHECK(decode(dec, "\x1b[" + std::string(40, '1')).empty());
    CHECK(decode(dec, " ") == std::vector<Key>{Key::Space});
}

TEST_CASE("drain_input returns at once when nothing is readable", "[input]") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    KeyDecoder dec;

    auto t0 = std::chrono::steady_clock::now();
    CHECK(drain_input(fds[0], dec) == 0);
    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(500));
    CHECK(dec.next() == Key::None);

    REQUIRE(write(fds[1], "d\x1b[D", 4) == 4);
    CHECK(drain_input(fds[0], dec) == 4);
    CHECK(dec.next() == Key::Right);
    CHECK(dec.next() == Key::Left);

    close(fds[1]);
    CHECK(drain_input(fds[0], dec) == 0); // EOF
    close(fds[0]);
}

TEST_CASE("keys map to player commands", "[input]") {
    CHECK(command_for(Key::Left) == Command::MoveLeft);
    CHECK(command_for(Key::Right) == Command::MoveRight);
    CHECK(command_for(Key::Space) == Command::Jump);
    CHECK(command_for(Key::None) == Command::None);
    CHECK(command_for(Key::Quit) == Command::None);
}
