// synth.hpp - square-wave tone synthesis, background tracks and the cue bank
#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace lanejump {

// Immutable mono PCM, signed 16-bit.
class ToneBuffer {
public:
    ToneBuffer(int sample_rate, std::vector<int16_t> samples)
        : sample_rate_(sample_rate), samples_(std::move(samples)) {}

    int sample_rate() const { return sample_rate_; }
    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    const std::vector<int16_t>& samples() const { return samples_; }
    int16_t operator[](std::size_t i) const { return samples_[i]; }

    // Rounded to the nearest millisecond.
    int duration_ms() const;

private:
    int sample_rate_;
    std::vector<int16_t> samples_;
};

using ToneBufferPtr = std::shared_ptr<const ToneBuffer>;

static constexpr double TONE_AMPLITUDE = 0.3; // fraction of full scale

// Number of samples a tone of duration_ms occupies at sample_rate.
std::size_t samples_for(int duration_ms, int sample_rate);

ToneBuffer synthesize_square_tone(double frequency_hz, int duration_ms, int sample_rate);
ToneBuffer synthesize_sine_tone(double frequency_hz, int duration_ms, int sample_rate);
ToneBuffer synthesize_silence(int duration_ms, int sample_rate);

// Joins buffers end to end. All parts must share one sample rate.
ToneBuffer concat(const std::vector<ToneBuffer>& parts);

// Random walk over the C major scale, pitched up 10% per level above 1 and
// cut to exactly target_seconds * sample_rate samples.
ToneBuffer synthesize_background_track(int level, int target_seconds, int sample_rate, std::mt19937& rng);

// Frequency multiplier applied to background notes at a given level.
double level_pitch_scale(int level);

// One-shot sounds, synthesized once per session.
struct CueBank {
    ToneBufferPtr jump;
    ToneBufferPtr hit;
    ToneBufferPtr win_fanfare;
    ToneBufferPtr fail_motif;

    static CueBank build(int sample_rate);
};

} // namespace lanejump
