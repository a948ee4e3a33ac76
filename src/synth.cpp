#include "synth.hpp"

#include <cmath>

namespace lanejump {

namespace {

constexpr double PI = 3.14159265358979323846;

// C4..B4
constexpr double SCALE_HZ[] = { 261.63, 293.66, 329.63, 349.23, 392.00, 440.00, 493.88 };
constexpr int    NOTE_MS[]  = { 100, 200, 400 };
constexpr int    LONGEST_NOTE_MS = 400;

constexpr double JUMP_HZ = 700.0;
constexpr double HIT_HZ  = 300.0;
constexpr int    CUE_MS  = 50;

// Fanfare climbs +50% per note, the fail motif drops about a third.
constexpr double FANFARE_HZ[] = { 500.0, 750.0, 1125.0 };
constexpr int    FANFARE_MS   = 100;
constexpr int    FANFARE_GAP_MS = 50;

constexpr double FAIL_HZ[] = { 450.0, 300.0, 200.0 };
constexpr int    FAIL_MS[] = { 660, 660, 1000 };
constexpr int    FAIL_GAP_MS = 100;

int16_t quantize(double s) {
    return static_cast<int16_t>(std::lround(s * TONE_AMPLITUDE * 32767.0));
}

template <typename Wave>
ToneBuffer synthesize(double frequency_hz, int duration_ms, int sample_rate, Wave wave) {
    std::size_t n = samples_for(duration_ms, sample_rate);
    std::vector<int16_t> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        double t = static_cast<double>(i) / sample_rate;
        out[i] = quantize(wave(std::sin(2.0 * PI * frequency_hz * t)));
    }
    return ToneBuffer(sample_rate, std::move(out));
}

double sign(double v) { return (v > 0.0) - (v < 0.0); }

} // namespace

int ToneBuffer::duration_ms() const {
    if (sample_rate_ <= 0) return 0;
    return static_cast<int>(std::lround(samples_.size() * 1000.0 / sample_rate_));
}

std::size_t samples_for(int duration_ms, int sample_rate) {
    if (duration_ms <= 0 || sample_rate <= 0) return 0;
    return static_cast<std::size_t>(std::lround(duration_ms / 1000.0 * sample_rate));
}

ToneBuffer synthesize_square_tone(double frequency_hz, int duration_ms, int sample_rate) {
    return synthesize(frequency_hz, duration_ms, sample_rate, [](double s) { return sign(s); });
}

ToneBuffer synthesize_sine_tone(double frequency_hz, int duration_ms, int sample_rate) {
    return synthesize(frequency_hz, duration_ms, sample_rate, [](double s) { return s; });
}

ToneBuffer synthesize_silence(int duration_ms, int sample_rate) {
    return ToneBuffer(sample_rate, std::vector<int16_t>(samples_for(duration_ms, sample_rate), 0));
}

ToneBuffer concat(const std::vector<ToneBuffer>& parts) {
    if (parts.empty()) return ToneBuffer(0, {});
    const int rate = parts.front().sample_rate();
    std::size_t total = 0;
    for (const auto& p : parts) total += p.size();
    std::vector<int16_t> out;
    out.reserve(total);
    for (const auto& p : parts) out.insert(out.end(), p.samples().begin(), p.samples().end());
    return ToneBuffer(rate, std::move(out));
}

double level_pitch_scale(int level) {
    return 1.0 + 0.1 * (level - 1);
}

ToneBuffer synthesize_background_track(int level, int target_seconds, int sample_rate, std::mt19937& rng) {
    const std::size_t target = static_cast<std::size_t>(target_seconds) * static_cast<std::size_t>(sample_rate);
    const double scale = level_pitch_scale(level);

    std::uniform_int_distribution<int> pick_note(0, static_cast<int>(sizeof(SCALE_HZ) / sizeof(SCALE_HZ[0])) - 1);
    std::uniform_int_distribution<int> pick_len(0, static_cast<int>(sizeof(NOTE_MS) / sizeof(NOTE_MS[0])) - 1);

    std::vector<int16_t> out;
    out.reserve(target + samples_for(LONGEST_NOTE_MS, sample_rate));
    while (out.size() < target) {
        ToneBuffer note = synthesize_square_tone(SCALE_HZ[pick_note(rng)] * scale, NOTE_MS[pick_len(rng)], sample_rate);
        if (note.empty()) break;
        out.insert(out.end(), note.samples().begin(), note.samples().end());
    }
    out.resize(target);
    return ToneBuffer(sample_rate, std::move(out));
}

CueBank CueBank::build(int sample_rate) {
    CueBank bank;
    bank.jump = std::make_shared<const ToneBuffer>(synthesize_square_tone(JUMP_HZ, CUE_MS, sample_rate));
    bank.hit  = std::make_shared<const ToneBuffer>(synthesize_square_tone(HIT_HZ, CUE_MS, sample_rate));

    std::vector<ToneBuffer> fanfare;
    for (double f : FANFARE_HZ) {
        fanfare.push_back(synthesize_square_tone(f, FANFARE_MS, sample_rate));
        fanfare.push_back(synthesize_silence(FANFARE_GAP_MS, sample_rate));
    }
    bank.win_fanfare = std::make_shared<const ToneBuffer>(concat(fanfare));

    std::vector<ToneBuffer> fail;
    for (int i = 0; i < 3; ++i) {
        fail.push_back(synthesize_square_tone(FAIL_HZ[i], FAIL_MS[i], sample_rate));
        fail.push_back(synthesize_silence(FAIL_GAP_MS, sample_rate));
    }
    bank.fail_motif = std::make_shared<const ToneBuffer>(concat(fail));
    return bank;
}

} // namespace lanejump
