#include <catch2/catch.hpp>

#include "playback.hpp"
#include "test_support.hpp"

using namespace lanejump;
using lanejump::testing::RecordingSink;

namespace {

ToneBufferPtr tone(double hz, int ms) {
    return std::make_shared<const ToneBuffer>(synthesize_square_tone(hz, ms, 8000));
}

} // namespace

TEST_CASE("blocking playback waits for the sound", "[playback]") {
    RecordingSink sink;
    PlaybackDispatcher audio(sink, false);
    auto b = tone(500, 100);

    audio.play_blocking(b);
    REQUIRE(sink.log.entries.size() == 1);
    CHECK(sink.log.entries[0].buffer == b);
    CHECK(sink.log.entries[0].waited);
    CHECK(audio.in_flight() == 0);
}

TEST_CASE("async playback returns without waiting", "[playback]") {
    RecordingSink sink;
    PlaybackDispatcher audio(sink, false);
    auto b = tone(700, 50);

    audio.play_async(b);
    audio.play_async(b);
    REQUIRE(sink.log.entries.size() == 2);
    CHECK_FALSE(sink.log.entries[0].waited);
    CHECK_FALSE(sink.log.entries[1].waited);
    CHECK(audio.in_flight() == 2);
}

TEST_CASE("cue policy follows the blocking flag", "[playback]") {
    auto b = tone(300, 50);

    SECTION("non-blocking cues") {
        RecordingSink sink;
        PlaybackDispatcher audio(sink, false);
        audio.play_cue(b);
        REQUIRE(sink.log.entries.size() == 1);
        CHECK_FALSE(sink.log.entries[0].waited);
    }
    SECTION("blocking cues") {
        RecordingSink sink;
        PlaybackDispatcher audio(sink, true);
        CHECK(audio.blocking_cues());
        audio.play_cue(b);
        REQUIRE(sink.log.entries.size() == 1);
        CHECK(sink.log.entries[0].waited);
    }
}

TEST_CASE("a new background track stops the previous one", "[playback]") {
    RecordingSink sink;
    PlaybackDispatcher audio(sink, false);
    auto first = tone(261.63, 200);
    auto second = tone(287.79, 200);

    audio.start_background(first);
    CHECK_FALSE(sink.log.entries[0].stopped);

    audio.start_background(second);
    REQUIRE(sink.log.entries.size() == 2);
    CHECK(sink.log.entries[0].stopped);
    CHECK_FALSE(sink.log.entries[1].stopped);

    audio.stop_background();
    CHECK(sink.log.entries[1].stopped);
    audio.stop_background(); // nothing left, no-op
}

TEST_CASE("dispatcher stops leftovers on destruction", "[playback]") {
    RecordingSink sink;
    {
        PlaybackDispatcher audio(sink, false);
        audio.start_background(tone(440, 200));
        audio.play_async(tone(700, 50));
    }
    REQUIRE(sink.log.entries.size() == 2);
    CHECK(sink.log.entries[0].stopped);
    CHECK(sink.log.entries[1].stopped);
}

TEST_CASE("unavailable sink degrades silently", "[playback]") {
    RecordingSink sink;
    sink.broken = true;
    PlaybackDispatcher audio(sink, false);
    auto b = tone(700, 50);

    audio.play_blocking(b);
    audio.play_async(b);
    audio.play_cue(b);
    audio.start_background(b);
    audio.stop_background();
    CHECK(sink.log.entries.empty());
    CHECK(audio.in_flight() == 0);
}
