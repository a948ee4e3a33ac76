// audio_sink.hpp - hands PCM buffers to the platform's sound player
#pragma once

#include "synth.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace lanejump {

// One running playback. Dropping it without wait() or stop() leaves the
// sound playing.
class Playback {
public:
    virtual ~Playback() = default;
    virtual void wait() = 0;
    virtual void stop() = 0;
    virtual bool finished() = 0;
};

class AudioSink {
public:
    virtual ~AudioSink() = default;
    // Null when the sound could not be started.
    virtual std::unique_ptr<Playback> start(const ToneBufferPtr& buffer) = 0;
    virtual bool available() const = 0;
};

// Muted sink.
class NullAudioSink : public AudioSink {
public:
    std::unique_ptr<Playback> start(const ToneBufferPtr&) override { return nullptr; }
    bool available() const override { return false; }
};

// 16-bit mono PCM WAV image of a buffer, little endian.
std::string encode_wav(const ToneBuffer& buffer);

// A player child process (aplay, paplay or afplay) in its own process group.
class ProcessPlayback : public Playback {
public:
    explicit ProcessPlayback(pid_t pid) : pid_(pid) {}
    ~ProcessPlayback() override = default;

    void wait() override;
    void stop() override;
    bool finished() override;

private:
    pid_t pid_;
};

// Writes each buffer once as a WAV file in a private temp directory and
// forks the first player program found on PATH to play it.
class ProcessAudioSink : public AudioSink {
public:
    ProcessAudioSink();
    // Runs player_args with the clip path appended; no PATH search.
    explicit ProcessAudioSink(std::vector<std::string> player_args);
    ~ProcessAudioSink() override;

    ProcessAudioSink(const ProcessAudioSink&) = delete;
    ProcessAudioSink& operator=(const ProcessAudioSink&) = delete;

    std::unique_ptr<Playback> start(const ToneBufferPtr& buffer) override;
    bool available() const override { return !player_.empty() && !dir_.empty(); }

    const std::string& dir() const { return dir_; }
    std::size_t clip_count() const { return clips_.size(); }

private:
    struct Clip {
        ToneBufferPtr keep; // pins the buffer so its address can't be reused
        std::string path;
    };

    void make_scratch_dir();
    const std::string* clip_path(const ToneBufferPtr& buffer);

    std::string player_;
    std::vector<std::string> player_args_;
    std::string dir_;
    int next_clip_{0};
    std::unordered_map<const ToneBuffer*, Clip> clips_;
};

} // namespace lanejump
