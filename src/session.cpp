#include "session.hpp"
#include "log.hpp"
#include "render.hpp"

#include <memory>

namespace lanejump {

const char* outcome_name(SessionOutcome o) {
    switch (o) {
        case SessionOutcome::Won:             return "won";
        case SessionOutcome::Lost:            return "lost";
        case SessionOutcome::Quit:            return "quit";
        case SessionOutcome::SurfaceTooSmall: return "surface too small";
    }
    return "?";
}

Session::Session(Surface& surface, PlaybackDispatcher& audio, Clock& clock, std::mt19937& rng,
                 const GameConfig& cfg)
    : surface_(surface), audio_(audio), clock_(clock), rng_(rng), cfg_(cfg),
      cues_(CueBank::build(cfg.sample_rate)) {}

SessionResult Session::run() {
    SessionResult result;

    std::string why;
    if (!check_surface(surface_.rows(), surface_.cols(), cfg_.min_rows, cfg_.min_cols, &why)) {
        log_error(why);
        result.outcome = SessionOutcome::SurfaceTooSmall;
        result.error = why;
        return result;
    }

    for (int level = 1; level <= cfg_.level_count; ++level) {
        state_.current_level = level;

        auto track = std::make_shared<const ToneBuffer>(
            synthesize_background_track(level, cfg_.background_seconds, cfg_.sample_rate, rng_));
        audio_.start_background(track);

        Level lvl(level, 1 + state_.carried_lives, surface_, audio_, cues_, clock_, rng_, cfg_);
        LevelResult r = lvl.run();
        result.lives = r.lives_remaining;
        log_info("level " + std::to_string(lvl.number()) + " ended: " + level_end_name(r.reason) +
                 ", " + std::to_string(r.lives_remaining) + " lives left");

        if (!r.completed) {
            audio_.stop_background();
            result.outcome = (r.reason == LevelEnd::Quit) ? SessionOutcome::Quit : SessionOutcome::Lost;
            log_info("session " + std::string(outcome_name(result.outcome)) + " on level " + std::to_string(level));
            return result;
        }
        ++result.levels_completed;
        state_.carried_lives = r.lives_remaining;
    }

    audio_.stop_background();
    audio_.play_blocking(cues_.win_fanfare);
    draw_banner(surface_, "CONGRATULATIONS! YOU WON!");
    clock_.sleep_for(cfg_.banner_pause);

    result.outcome = SessionOutcome::Won;
    log_info("session won with " + std::to_string(result.lives) + " lives left");
    return result;
}

} // namespace lanejump
