#pragma once

#include <complex>
#include <optional>
#include <vector>

#include "fft/fft_utils.hpp"
#include "fft/window.hpp"

namespace pitchtrack::dsp {

struct PhaseVocoderConfig {
    float sample_rate = 48000.0f;
    int fft_size = 4096;        // power of two
    int search_bins = 5;        // peak search radius around the coarse bin
    int confidence_bins = 3;    // neighbourhood used for the peak/mean ratio
};

struct RefinedPitch {
    float frequency_hz = 0.0f;
    float confidence = 0.0f;
    float bin = 0.0f;           // parabolic bin position
    float magnitude = 0.0f;
    bool used_phase = false;
    float phase_velocity_hz_per_s = 0.0f;
};

// Sub-bin frequency refinement from the phase advance of the peak bin between
// consecutive analysis frames. Needs a coarse estimate; it never searches the
// whole spectrum on its own.
class PhaseVocoder {
public:
    explicit PhaseVocoder(const PhaseVocoderConfig& config, fft::WindowCache& windows);

    // `frame` holds at least fft_size samples; the last fft_size are analyzed.
    // `hop` is the number of samples between this frame and the previous one.
    std::optional<RefinedPitch> refine(const float* frame, int length, float coarse_hz, int hop);

    void reset();

    bool has_previous_frame() const { return has_prev_; }
    float bin_width() const { return bin_width_; }
    const PhaseVocoderConfig& config() const { return config_; }

    // Wraps into (-pi, pi]
    static float wrap_phase(float phase);

private:
    float confidence_at(int peak_bin, float peak_mag) const;

    PhaseVocoderConfig config_;
    int half_;
    float bin_width_;
    fft::FftPlan plan_;
    const std::vector<float>& window_;

    std::vector<std::complex<float>> spectrum_;
    std::vector<float> magnitude_;
    std::vector<float> phase_;
    std::vector<float> prev_phase_;
    bool has_prev_ = false;
    float prev_frequency_hz_ = 0.0f;
};

} // namespace pitchtrack::dsp
