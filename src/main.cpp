// main.cpp - lanejump: dodge the incoming dashes, double jump over them,
// survive three speed-ups per level across three levels.
//
// Controls: LEFT/RIGHT (or A/D) to move, SPACE (or W) to jump, Q to quit.

#include "ansi_surface.hpp"
#include "audio_sink.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "log.hpp"
#include "playback.hpp"
#include "session.hpp"

#include <iostream>
#include <memory>
#include <random>

using namespace lanejump;

int main() {
    std::ios::sync_with_stdio(false);

    GameConfig cfg;

    std::unique_ptr<AudioSink> sink;
    if (ENABLE_SOUNDS) sink.reset(new ProcessAudioSink());
    else               sink.reset(new NullAudioSink());

    SessionResult result;
    {
        PlaybackDispatcher audio(*sink, cfg.blocking_cues);
        SteadyClock clock;
        std::mt19937 rng{std::random_device{}()};

        log_hold(true);
        {
            AnsiSurface surface;
            if (!surface.raw_ok()) log_warn("stdin is not a raw-capable terminal; keys need Enter");
            Session session(surface, audio, clock, rng, cfg);
            result = session.run();
        }
        log_hold(false);
    }

    if (result.outcome == SessionOutcome::SurfaceTooSmall) {
        std::cerr << "lanejump: " << result.error << "\n";
        return 1;
    }
    std::cout << "Thanks for playing.\n";
    return 0;
}
