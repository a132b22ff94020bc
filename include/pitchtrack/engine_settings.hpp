#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pitchtrack {

struct EngineSettings {
    float sample_rate = 48000.0f;
    int buffer_size = 4096;        // YIN and refiner frame; power of two
    int cqt_window = 16384;        // history available to the CQT

    // Tracking range and trajectory grid
    float min_freq = 50.0f;
    float max_freq = 2000.0f;
    float cents_per_state = 10.0f;
    float max_transition_cents = 100.0f;
    float fast_passage_cents = 50.0f;
    int reacquire_frames = 5;
    float smoothing_alpha = 0.7f;

    // CQT bank
    float cqt_min_freq = 27.5f;
    float cqt_max_freq = 4186.0f;
    int cqt_bins_per_octave = 48;

    // Noise suppression
    int noise_fft_size = 1024;
    int calibration_frames = 30;
    float over_subtraction = 1.5f;
    float spectral_floor = 0.002f;
    float calibration_rms_gate = 0.01f;
    bool noise_bypass = false;

    // Input conditioning
    float input_gain = 1.0f;
    float highpass_hz = 50.0f;
    float silence_rms = 0.003f;

    std::string instrument = "default";
    float a4_hz = 440.0f;
};

// Partial update: unset fields keep their current value.
struct EngineSettingsUpdate {
    std::optional<float> sample_rate;
    std::optional<int> buffer_size;
    std::optional<int> cqt_window;

    std::optional<float> min_freq;
    std::optional<float> max_freq;
    std::optional<float> cents_per_state;
    std::optional<float> max_transition_cents;
    std::optional<float> fast_passage_cents;
    std::optional<int> reacquire_frames;
    std::optional<float> smoothing_alpha;

    std::optional<float> cqt_min_freq;
    std::optional<float> cqt_max_freq;
    std::optional<int> cqt_bins_per_octave;

    std::optional<int> noise_fft_size;
    std::optional<int> calibration_frames;
    std::optional<float> over_subtraction;
    std::optional<float> spectral_floor;
    std::optional<float> calibration_rms_gate;
    std::optional<bool> noise_bypass;

    std::optional<float> input_gain;
    std::optional<float> highpass_hz;
    std::optional<float> silence_rms;

    std::optional<std::string> instrument;
    std::optional<float> a4_hz;

    // Replays a stored profile; length must be noise_fft_size / 2
    std::optional<std::vector<float>> noise_profile;
};

// Overlays the set fields of `update` on `settings`.
void apply_update(EngineSettings& settings, const EngineSettingsUpdate& update);

// Every field of `settings` as an update (noise_profile left unset).
EngineSettingsUpdate to_update(const EngineSettings& settings);

// Checks fields in declaration order and stops at the first bad one.
bool validate_settings(const EngineSettings& settings, std::string* error);

// True when switching from `a` to `b` needs new analyzers (buffer sizes,
// ranges or grids differ); tunables alone never do.
bool needs_rebuild(const EngineSettings& a, const EngineSettings& b);

} // namespace pitchtrack
