#include "pitchtrack/engine_settings.hpp"

#include <cmath>

#include "dsp/analysis/inharmonicity_corrector.hpp"
#include "fft/fft_utils.hpp"

namespace pitchtrack {

namespace {

template<typename T>
void take(T& field, const std::optional<T>& value) {
    if (value) field = *value;
}

bool fail(std::string* error, const char* reason) {
    if (error) *error = reason;
    return false;
}

bool finite(float v) { return std::isfinite(v); }

}

void apply_update(EngineSettings& s, const EngineSettingsUpdate& u) {
    take(s.sample_rate, u.sample_rate);
    take(s.buffer_size, u.buffer_size);
    take(s.cqt_window, u.cqt_window);
    take(s.min_freq, u.min_freq);
    take(s.max_freq, u.max_freq);
    take(s.cents_per_state, u.cents_per_state);
    take(s.max_transition_cents, u.max_transition_cents);
    take(s.fast_passage_cents, u.fast_passage_cents);
    take(s.reacquire_frames, u.reacquire_frames);
    take(s.smoothing_alpha, u.smoothing_alpha);
    take(s.cqt_min_freq, u.cqt_min_freq);
    take(s.cqt_max_freq, u.cqt_max_freq);
    take(s.cqt_bins_per_octave, u.cqt_bins_per_octave);
    take(s.noise_fft_size, u.noise_fft_size);
    take(s.calibration_frames, u.calibration_frames);
    take(s.over_subtraction, u.over_subtraction);
    take(s.spectral_floor, u.spectral_floor);
    take(s.calibration_rms_gate, u.calibration_rms_gate);
    take(s.noise_bypass, u.noise_bypass);
    take(s.input_gain, u.input_gain);
    take(s.highpass_hz, u.highpass_hz);
    take(s.silence_rms, u.silence_rms);
    take(s.instrument, u.instrument);
    take(s.a4_hz, u.a4_hz);
}

EngineSettingsUpdate to_update(const EngineSettings& s) {
    EngineSettingsUpdate u;
    u.sample_rate = s.sample_rate;
    u.buffer_size = s.buffer_size;
    u.cqt_window = s.cqt_window;
    u.min_freq = s.min_freq;
    u.max_freq = s.max_freq;
    u.cents_per_state = s.cents_per_state;
    u.max_transition_cents = s.max_transition_cents;
    u.fast_passage_cents = s.fast_passage_cents;
    u.reacquire_frames = s.reacquire_frames;
    u.smoothing_alpha = s.smoothing_alpha;
    u.cqt_min_freq = s.cqt_min_freq;
    u.cqt_max_freq = s.cqt_max_freq;
    u.cqt_bins_per_octave = s.cqt_bins_per_octave;
    u.noise_fft_size = s.noise_fft_size;
    u.calibration_frames = s.calibration_frames;
    u.over_subtraction = s.over_subtraction;
    u.spectral_floor = s.spectral_floor;
    u.calibration_rms_gate = s.calibration_rms_gate;
    u.noise_bypass = s.noise_bypass;
    u.input_gain = s.input_gain;
    u.highpass_hz = s.highpass_hz;
    u.silence_rms = s.silence_rms;
    u.instrument = s.instrument;
    u.a4_hz = s.a4_hz;
    return u;
}

bool validate_settings(const EngineSettings& s, std::string* error) {
    const float nyquist = s.sample_rate / 2.0f;

    if (!finite(s.sample_rate) || s.sample_rate < 8000.0f || s.sample_rate > 384000.0f)
        return fail(error, "sample_rate must be in [8000, 384000]");
    if (!fft::is_power_of_two(s.buffer_size) || s.buffer_size < 256 || s.buffer_size > 65536)
        return fail(error, "buffer_size must be a power of two in [256, 65536]");
    if (s.cqt_window < 1024 || s.cqt_window > 65536)
        return fail(error, "cqt_window must be in [1024, 65536]");

    if (!finite(s.min_freq) || s.min_freq <= 0.0f)
        return fail(error, "min_freq must be positive");
    if (!finite(s.max_freq) || s.max_freq <= s.min_freq || s.max_freq >= nyquist)
        return fail(error, "max_freq must lie between min_freq and sample_rate / 2");
    if (!finite(s.cents_per_state) || s.cents_per_state <= 0.0f || s.cents_per_state > 100.0f)
        return fail(error, "cents_per_state must be in (0, 100]");
    if (!finite(s.max_transition_cents) || s.max_transition_cents <= 0.0f || s.max_transition_cents > 1200.0f)
        return fail(error, "max_transition_cents must be in (0, 1200]");
    if (!finite(s.fast_passage_cents) || s.fast_passage_cents < 0.0f || s.fast_passage_cents > s.max_transition_cents)
        return fail(error, "fast_passage_cents must be in [0, max_transition_cents]");
    if (s.reacquire_frames < 1 || s.reacquire_frames > 1000)
        return fail(error, "reacquire_frames must be in [1, 1000]");
    if (!finite(s.smoothing_alpha) || s.smoothing_alpha <= 0.0f || s.smoothing_alpha > 1.0f)
        return fail(error, "smoothing_alpha must be in (0, 1]");

    if (!finite(s.cqt_min_freq) || s.cqt_min_freq <= 0.0f)
        return fail(error, "cqt_min_freq must be positive");
    if (!finite(s.cqt_max_freq) || s.cqt_max_freq <= s.cqt_min_freq || s.cqt_max_freq >= nyquist)
        return fail(error, "cqt_max_freq must lie between cqt_min_freq and sample_rate / 2");
    if (s.cqt_bins_per_octave < 12 || s.cqt_bins_per_octave > 96)
        return fail(error, "cqt_bins_per_octave must be in [12, 96]");

    if (!fft::is_power_of_two(s.noise_fft_size) || s.noise_fft_size < 64 || s.noise_fft_size > 16384)
        return fail(error, "noise_fft_size must be a power of two in [64, 16384]");
    if (s.calibration_frames < 1 || s.calibration_frames > 10000)
        return fail(error, "calibration_frames must be in [1, 10000]");
    if (!finite(s.over_subtraction) || s.over_subtraction < 0.0f || s.over_subtraction > 10.0f)
        return fail(error, "over_subtraction must be in [0, 10]");
    if (!finite(s.spectral_floor) || s.spectral_floor < 0.0f || s.spectral_floor > 1.0f)
        return fail(error, "spectral_floor must be in [0, 1]");
    if (!finite(s.calibration_rms_gate) || s.calibration_rms_gate <= 0.0f || s.calibration_rms_gate > 1.0f)
        return fail(error, "calibration_rms_gate must be in (0, 1]");

    if (!finite(s.input_gain) || s.input_gain <= 0.0f || s.input_gain > 100.0f)
        return fail(error, "input_gain must be in (0, 100]");
    if (!finite(s.highpass_hz) || s.highpass_hz < 0.0f || s.highpass_hz > s.sample_rate / 4.0f)
        return fail(error, "highpass_hz must be in [0, sample_rate / 4]");
    if (!finite(s.silence_rms) || s.silence_rms < 0.0f || s.silence_rms > 1.0f)
        return fail(error, "silence_rms must be in [0, 1]");

    if (!dsp::InharmonicityCorrector::find_instrument(s.instrument))
        return fail(error, "unknown instrument");
    if (!finite(s.a4_hz) || s.a4_hz < 400.0f || s.a4_hz > 480.0f)
        return fail(error, "a4_hz must be in [400, 480]");
    return true;
}

bool needs_rebuild(const EngineSettings& a, const EngineSettings& b) {
    return a.sample_rate != b.sample_rate || a.buffer_size != b.buffer_size ||
           a.cqt_window != b.cqt_window || a.min_freq != b.min_freq || a.max_freq != b.max_freq ||
           a.cents_per_state != b.cents_per_state || a.max_transition_cents != b.max_transition_cents ||
           a.fast_passage_cents != b.fast_passage_cents || a.reacquire_frames != b.reacquire_frames ||
           a.cqt_min_freq != b.cqt_min_freq || a.cqt_max_freq != b.cqt_max_freq ||
           a.cqt_bins_per_octave != b.cqt_bins_per_octave || a.noise_fft_size != b.noise_fft_size;
}

} // namespace pitchtrack
