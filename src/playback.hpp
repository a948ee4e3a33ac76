// playback.hpp - blocking / fire-and-forget playback on top of an AudioSink
#pragma once

#include "audio_sink.hpp"

#include <memory>
#include <vector>

namespace lanejump {

class PlaybackDispatcher {
public:
    PlaybackDispatcher(AudioSink& sink, bool blocking_cues);
    ~PlaybackDispatcher();

    PlaybackDispatcher(const PlaybackDispatcher&) = delete;
    PlaybackDispatcher& operator=(const PlaybackDispatcher&) = delete;

    // Returns once the sound has finished (or at once if it couldn't start).
    void play_blocking(const ToneBufferPtr& buffer);
    // Returns immediately; the sound keeps playing on its own.
    void play_async(const ToneBufferPtr& buffer);
    // Short gameplay cue, dispatched per the blocking_cues policy.
    void play_cue(const ToneBufferPtr& buffer);

    // Stops the current background track, if any, then starts this one.
    void start_background(const ToneBufferPtr& buffer);
    void stop_background();

    bool blocking_cues() const { return blocking_cues_; }
    // Fire-and-forget sounds still playing.
    std::size_t in_flight();

private:
    std::unique_ptr<Playback> start(const ToneBufferPtr& buffer);
    void reap();

    AudioSink& sink_;
    bool blocking_cues_;
    bool warned_{false};
    std::unique_ptr<Playback> background_;
    std::vector<std::unique_ptr<Playback>> detached_;
};

} // namespace lanejump
