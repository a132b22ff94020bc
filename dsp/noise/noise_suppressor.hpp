#pragma once

#include <complex>
#include <optional>
#include <vector>

#include "fft/fft_utils.hpp"
#include "pitchtrack/types.hpp"

namespace pitchtrack::dsp {

struct NoiseSuppressorConfig {
    int fft_size = 1024;              // power of two; profile has fft_size/2 bins
    int calibration_frames = 30;
    float over_subtraction = 1.5f;
    float spectral_floor = 0.002f;    // fraction of the signal magnitude kept
    float calibration_rms_gate = 0.01f; // louder frames are not noise
};

enum class CalibrationState { Idle, Calibrating, Calibrated };

// Adaptive spectral subtraction. Blocks are processed in fft_size chunks
// (the last one zero padded); phase is kept and only magnitudes are reduced.
class NoiseSuppressor {
public:
    explicit NoiseSuppressor(const NoiseSuppressorConfig& config = NoiseSuppressorConfig{});

    void start_calibration();
    // Completes calibration with whatever was collected. Zero frames is a
    // failure and leaves suppression disabled.
    std::optional<CalibrationStatus> finish_calibration();
    void reset();

    void set_parameters(float over_subtraction, float spectral_floor);
    void set_calibration_frames(int frames);
    void set_calibration_gate(float rms) { config_.calibration_rms_gate = rms; }
    void set_bypassed(bool bypassed) { bypassed_ = bypassed; }

    // Replaces the profile by swapping storage with `profile`. Returns false
    // (and leaves everything untouched) when the length does not match.
    bool swap_profile(std::vector<float>& profile);

    // Takes over a finished profile, or a calibration still collecting frames,
    // from a suppressor of the same fft size (used when the pipeline is
    // rebuilt). Returns false when nothing was taken.
    bool adopt_calibration(NoiseSuppressor& previous);

    // in and out may alias. Returns the latest calibration event raised while
    // processing this block, if any.
    std::optional<CalibrationStatus> process(const float* in, float* out, int n);

    CalibrationState state() const { return state_; }
    bool bypassed() const { return bypassed_; }
    bool active() const { return state_ == CalibrationState::Calibrated && !bypassed_; }
    float progress() const;
    int frames_collected() const { return frame_count_; }
    int profile_size() const { return half_; }
    const std::vector<float>& profile() const { return profile_; }
    const NoiseSuppressorConfig& config() const { return config_; }

private:
    void accumulate(const float* chunk, int n);
    CalibrationStatus finalize();
    void subtract(const float* chunk, float* out, int n);
    void load_chunk(const float* chunk, int n);

    NoiseSuppressorConfig config_;
    int half_;
    fft::FftPlan plan_;

    CalibrationState state_ = CalibrationState::Idle;
    bool bypassed_ = false;
    int frame_count_ = 0;

    std::vector<std::complex<float>> spectrum_;
    std::vector<float> magnitude_;
    std::vector<double> accumulator_;
    std::vector<float> profile_;
};

} // namespace pitchtrack::dsp
