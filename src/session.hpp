// session.hpp - runs the levels in order and carries lives between them
#pragma once

#include "clock.hpp"
#include "config.hpp"
#include "level.hpp"
#include "playback.hpp"
#include "surface.hpp"
#include "synth.hpp"

#include <random>
#include <string>

namespace lanejump {

enum class SessionOutcome { Won, Lost, Quit, SurfaceTooSmall };

struct SessionState {
    int current_level{1};
    int carried_lives{0};
};

struct SessionResult {
    SessionOutcome outcome{SessionOutcome::Quit};
    int levels_completed{0};
    int lives{0};
    std::string error; // set for SurfaceTooSmall
};

const char* outcome_name(SessionOutcome o);

class Session {
public:
    Session(Surface& surface, PlaybackDispatcher& audio, Clock& clock, std::mt19937& rng,
            const GameConfig& cfg = GameConfig{});

    SessionResult run();

    const SessionState& state() const { return state_; }
    const CueBank& cues() const { return cues_; }

private:
    Surface& surface_;
    PlaybackDispatcher& audio_;
    Clock& clock_;
    std::mt19937& rng_;
    GameConfig cfg_;
    CueBank cues_;
    SessionState state_;
};

} // namespace lanejump
