// level.hpp - the fixed-tick loop for one level
#pragma once

#include "clock.hpp"
#include "config.hpp"
#include "difficulty.hpp"
#include "obstacles.hpp"
#include "player.hpp"
#include "playback.hpp"
#include "surface.hpp"
#include "synth.hpp"

#include <optional>
#include <random>

namespace lanejump {

enum class LevelEnd { Completed, GameOver, Quit };

struct LevelResult {
    bool completed{false};
    int lives_remaining{0};
    LevelEnd reason{LevelEnd::Quit};
};

Command command_for(Key key);

const char* level_end_name(LevelEnd end);

class Level {
public:
    Level(int number, int starting_lives, Surface& surface, PlaybackDispatcher& audio,
          const CueBank& cues, Clock& clock, std::mt19937& rng, const GameConfig& cfg);

    // Ticks until the level is won, lost or quit.
    LevelResult run();

    // One tick; a value once the level is over.
    std::optional<LevelResult> tick();

    int number() const { return number_; }
    int lives() const { return lives_; }
    long ticks() const { return ticks_; }

    Player& player() { return player_; }
    ObstacleStream& obstacles() { return obstacles_; }
    const Difficulty& difficulty() const { return difficulty_; }

private:
    LevelResult finish(bool completed, LevelEnd reason, const ToneBufferPtr& stinger, const std::string& banner);

    int number_;
    int lives_;
    Surface& surface_;
    PlaybackDispatcher& audio_;
    const CueBank& cues_;
    Clock& clock_;
    GameConfig cfg_;
    Player player_;
    ObstacleStream obstacles_;
    Difficulty difficulty_;
    long ticks_{0};
};

} // namespace lanejump
