#include "level.hpp"
#include "log.hpp"
#include "render.hpp"

namespace lanejump {

Command command_for(Key key) {
    switch (key) {
        case Key::Left:  return Command::MoveLeft;
        case Key::Right: return Command::MoveRight;
        case Key::Space: return Command::Jump;
        case Key::Quit:
        case Key::None:  break;
    }
    return Command::None;
}

const char* level_end_name(LevelEnd end) {
    switch (end) {
        case LevelEnd::Completed: return "completed";
        case LevelEnd::GameOver:  return "game over";
        case LevelEnd::Quit:      return "quit";
    }
    return "unknown";
}

Level::Level(int number, int starting_lives, Surface& surface, PlaybackDispatcher& audio,
             const CueBank& cues, Clock& clock, std::mt19937& rng, const GameConfig& cfg)
    : number_(number),
      lives_(starting_lives),
      surface_(surface),
      audio_(audio),
      cues_(cues),
      clock_(clock),
      cfg_(cfg),
      player_(surface.cols(), surface.rows(), cfg),
      obstacles_(rng),
      difficulty_(number, cfg, clock.now()) {}

LevelResult Level::run() {
    log_info("level " + std::to_string(number_) + " start, lives " + std::to_string(lives_) +
             ", jump velocities " + std::to_string(player_.first_jump_velocity()) + "/" +
             std::to_string(player_.second_jump_velocity()));
    while (true) {
        if (auto result = tick()) return *result;
    }
}

LevelResult Level::finish(bool completed, LevelEnd reason, const ToneBufferPtr& stinger, const std::string& banner) {
    if (stinger) audio_.play_blocking(stinger);
    if (!banner.empty()) {
        draw_banner(surface_, banner);
        clock_.sleep_for(cfg_.banner_pause);
    }
    LevelResult r;
    r.completed = completed;
    r.lives_remaining = lives_;
    r.reason = reason;
    return r;
}

std::optional<LevelResult> Level::tick() {
    const auto t0 = clock_.now();
    ++ticks_;

    // Speed-ups
    if (difficulty_.update(t0)) {
        log_info("level " + std::to_string(number_) + " speed-up " + std::to_string(difficulty_.speedups()) +
                 ": speed " + std::to_string(difficulty_.speed()));
        if (difficulty_.level_complete()) {
            return finish(true, LevelEnd::Completed, cues_.win_fanfare,
                          "Level " + std::to_string(number_) + " Complete!");
        }
    }

    // Input
    Key key = surface_.poll_key();
    if (key == Key::Quit) return finish(false, LevelEnd::Quit, nullptr, "");
    if (player_.apply_input(command_for(key)) != JumpKind::None) audio_.play_cue(cues_.jump);

    player_.advance_gravity();

    // Obstacles and collisions
    auto hits = obstacles_.tick(difficulty_.spawn_rate(), difficulty_.speed(),
                                surface_.rows(), surface_.cols(),
                                player_.height_y(), player_.lane_x());
    for (std::size_t i = 0; i < hits.size(); ++i) { // each hit costs a life
        audio_.play_cue(cues_.hit);
        if (lives_ > 0) {
            --lives_;
            continue;
        }
        return finish(false, LevelEnd::GameOver, cues_.fail_motif, "GAME OVER");
    }

    draw_frame(surface_, player_.state(), obstacles_.obstacles(),
               StatusInfo{number_, cfg_.level_count, difficulty_.speed(), difficulty_.spawn_rate(), lives_});

    // Throttle
    auto dt = clock_.now() - t0;
    if (dt < cfg_.tick) clock_.sleep_for(cfg_.tick - dt);
    return std::nullopt;
}

} // namespace lanejump
