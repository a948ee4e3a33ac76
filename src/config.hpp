// config.hpp - compile-time tuning for lanejump
#pragma once

#include <chrono>

namespace lanejump {

// ---------- Sound config ----------
static constexpr bool ENABLE_SOUNDS = true;
static constexpr bool BLOCKING_CUES = false; // jump/hit cues block the loop when true
static constexpr int  SAMPLE_RATE = 44100;
static constexpr int  BACKGROUND_SECONDS = 30;

// ---------- Timing ----------
static constexpr int TICK_MS              = 50;
static constexpr int SPEED_UP_INTERVAL_MS = 10000;
static constexpr int BANNER_PAUSE_MS      = 3000;

// ---------- Difficulty ----------
static constexpr double INITIAL_SPAWN_RATE = 0.2;
static constexpr double LEVEL_SPAWN_STEP   = 0.1;  // extra starting spawn chance per level
static constexpr double SPAWN_INCREASE     = 0.05; // per speed-up
static constexpr double MAX_SPAWN_RATE     = 1.0;
static constexpr int    SPEEDUPS_PER_LEVEL = 3;
static constexpr int    LEVEL_COUNT        = 3;

// ---------- Physics ----------
static constexpr int    GRAVITY             = 1;
static constexpr double FIRST_JUMP_PEAK     = 0.18; // fraction of play height
static constexpr double SECOND_JUMP_PEAK    = 0.36;

// ---------- Surface ----------
static constexpr int MIN_ROWS = 10;
static constexpr int MIN_COLS = 40;

// Startup values handed to every component. Defaults come from the
// constants above; tests override single fields.
struct GameConfig {
    std::chrono::milliseconds tick{TICK_MS};
    std::chrono::milliseconds speed_up_interval{SPEED_UP_INTERVAL_MS};
    std::chrono::milliseconds banner_pause{BANNER_PAUSE_MS};

    double initial_spawn_rate{INITIAL_SPAWN_RATE};
    double level_spawn_step{LEVEL_SPAWN_STEP};
    double spawn_increase{SPAWN_INCREASE};
    double max_spawn_rate{MAX_SPAWN_RATE};
    int    speedups_per_level{SPEEDUPS_PER_LEVEL};
    int    level_count{LEVEL_COUNT};

    int    gravity{GRAVITY};
    double first_jump_peak{FIRST_JUMP_PEAK};
    double second_jump_peak{SECOND_JUMP_PEAK};

    int  min_rows{MIN_ROWS};
    int  min_cols{MIN_COLS};

    bool blocking_cues{BLOCKING_CUES};
    int  sample_rate{SAMPLE_RATE};
    int  background_seconds{BACKGROUND_SECONDS};
};

} // namespace lanejump
