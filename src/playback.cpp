#include "playback.hpp"
#include "log.hpp"

#include <algorithm>

namespace lanejump {

PlaybackDispatcher::PlaybackDispatcher(AudioSink& sink, bool blocking_cues)
    : sink_(sink), blocking_cues_(blocking_cues) {}

PlaybackDispatcher::~PlaybackDispatcher() {
    stop_background();
    for (auto& p : detached_) p->stop();
}

std::unique_ptr<Playback> PlaybackDispatcher::start(const ToneBufferPtr& buffer) {
    if (!buffer) return nullptr;
    auto playback = sink_.start(buffer);
    if (!playback && !warned_) {
        warned_ = true;
        log_warn("audio playback unavailable, continuing without sound");
    }
    return playback;
}

void PlaybackDispatcher::reap() {
    detached_.erase(std::remove_if(detached_.begin(), detached_.end(),
                                   [](const std::unique_ptr<Playback>& p) { return p->finished(); }),
                    detached_.end());
}

void PlaybackDispatcher::play_blocking(const ToneBufferPtr& buffer) {
    if (auto p = start(buffer)) p->wait();
}

void PlaybackDispatcher::play_async(const ToneBufferPtr& buffer) {
    reap();
    if (auto p = start(buffer)) detached_.push_back(std::move(p));
}

void PlaybackDispatcher::play_cue(const ToneBufferPtr& buffer) {
    if (blocking_cues_) play_blocking(buffer);
    else                play_async(buffer);
}

void PlaybackDispatcher::start_background(const ToneBufferPtr& buffer) {
    stop_background();
    background_ = start(buffer);
}

void PlaybackDispatcher::stop_background() {
    if (!background_) return;
    background_->stop();
    background_.reset();
}

std::size_t PlaybackDispatcher::in_flight() {
    reap();
    return detached_.size();
}

} // namespace lanejump
