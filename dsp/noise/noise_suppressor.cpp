#include "noise_suppressor.hpp"

#include <algorithm>
#include <cmath>

namespace pitchtrack::dsp {

NoiseSuppressor::NoiseSuppressor(const NoiseSuppressorConfig& config)
    : config_(config),
      half_(config.fft_size / 2),
      plan_(config.fft_size),
      spectrum_(config.fft_size),
      magnitude_(config.fft_size / 2, 0.0f),
      accumulator_(config.fft_size / 2, 0.0),
      profile_(config.fft_size / 2, 0.0f) {
    config_.calibration_frames = std::max(1, config_.calibration_frames);
}

void NoiseSuppressor::start_calibration() {
    std::fill(accumulator_.begin(), accumulator_.end(), 0.0);
    frame_count_ = 0;
    state_ = CalibrationState::Calibrating;
}

std::optional<CalibrationStatus> NoiseSuppressor::finish_calibration() {
    if (state_ != CalibrationState::Calibrating) return std::nullopt;
    return finalize();
}

void NoiseSuppressor::reset() {
    std::fill(accumulator_.begin(), accumulator_.end(), 0.0);
    std::fill(profile_.begin(), profile_.end(), 0.0f);
    frame_count_ = 0;
    state_ = CalibrationState::Idle;
}

void NoiseSuppressor::set_parameters(float over_subtraction, float spectral_floor) {
    config_.over_subtraction = std::max(0.0f, over_subtraction);
    config_.spectral_floor = std::clamp(spectral_floor, 0.0f, 1.0f);
}

void NoiseSuppressor::set_calibration_frames(int frames) {
    config_.calibration_frames = std::max(1, frames);
}

bool NoiseSuppressor::swap_profile(std::vector<float>& profile) {
    if (static_cast<int>(profile.size()) != half_) return false;
    profile_.swap(profile);
    frame_count_ = 0;
    state_ = CalibrationState::Calibrated;
    return true;
}

bool NoiseSuppressor::adopt_calibration(NoiseSuppressor& previous) {
    if (previous.state_ == CalibrationState::Idle || previous.half_ != half_) return false;
    if (previous.state_ == CalibrationState::Calibrating) {
        accumulator_.swap(previous.accumulator_);
        frame_count_ = previous.frame_count_;
    } else {
        profile_.swap(previous.profile_);
        frame_count_ = 0;
    }
    state_ = previous.state_;
    previous.state_ = CalibrationState::Idle;
    previous.frame_count_ = 0;
    return true;
}

float NoiseSuppressor::progress() const {
    switch (state_) {
        case CalibrationState::Calibrated: return 1.0f;
        case CalibrationState::Idle: return 0.0f;
        case CalibrationState::Calibrating:
            return std::min(1.0f, static_cast<float>(frame_count_) / config_.calibration_frames);
    }
    return 0.0f;
}

std::optional<CalibrationStatus> NoiseSuppressor::process(const float* in, float* out, int n) {
    std::optional<CalibrationStatus> event;
    const int N = config_.fft_size;

    for (int offset = 0; offset < n; offset += N) {
        const int len = std::min(N, n - offset);
        const float* chunk = in + offset;
        float* dst = out + offset;

        if (state_ == CalibrationState::Calibrating) {
            double acc = 0.0;
            for (int i = 0; i < len; ++i) acc += static_cast<double>(chunk[i]) * chunk[i];
            const float rms = static_cast<float>(std::sqrt(acc / len));

            // Skip frames carrying signal; they would bias the noise estimate
            if (rms <= config_.calibration_rms_gate) {
                accumulate(chunk, len);
                if (frame_count_ >= config_.calibration_frames) {
                    event = finalize();
                } else {
                    CalibrationStatus st;
                    st.phase = CalibrationPhase::Calibrating;
                    st.frames = frame_count_;
                    st.progress = progress();
                    event = st;
                }
            }
        }

        if (active()) {
            subtract(chunk, dst, len);
        } else if (dst != chunk) {
            std::copy(chunk, chunk + len, dst);
        }
    }
    return event;
}

void NoiseSuppressor::load_chunk(const float* chunk, int n) {
    for (int i = 0; i < n; ++i) spectrum_[i] = std::complex<float>(chunk[i], 0.0f);
    for (int i = n; i < config_.fft_size; ++i) spectrum_[i] = std::complex<float>(0.0f, 0.0f);
    plan_.forward(spectrum_);
}

void NoiseSuppressor::accumulate(const float* chunk, int n) {
    load_chunk(chunk, n);
    fft::magnitudes(spectrum_.data(), half_, 1.0f / config_.fft_size, magnitude_.data());
    for (int k = 0; k < half_; ++k) accumulator_[k] += magnitude_[k];
    ++frame_count_;
}

CalibrationStatus NoiseSuppressor::finalize() {
    CalibrationStatus st;
    if (frame_count_ == 0) {
        state_ = CalibrationState::Idle;
        st.phase = CalibrationPhase::Failed;
        st.reason = "no frames collected";
        return st;
    }

    const double inv = 1.0 / frame_count_;
    for (int k = 0; k < half_; ++k) profile_[k] = static_cast<float>(accumulator_[k] * inv);
    state_ = CalibrationState::Calibrated;

    st.phase = CalibrationPhase::Complete;
    st.progress = 1.0f;
    st.frames = frame_count_;
    st.profile = profile_.data();
    st.profile_size = half_;
    return st;
}

void NoiseSuppressor::subtract(const float* chunk, float* out, int n) {
    const int N = config_.fft_size;
    const float inv_n = 1.0f / N;
    load_chunk(chunk, n);

    auto gain_for = [&](int k, float noise) {
        const float signal_mag = std::abs(spectrum_[k]) * inv_n;
        float clean = signal_mag - config_.over_subtraction * noise;
        const float floor = config_.spectral_floor * signal_mag;
        if (clean < floor) clean = floor;
        return clean / (signal_mag + 1e-10f);
    };

    for (int k = 0; k < half_; ++k) {
        const float g = gain_for(k, profile_[k]);
        spectrum_[k] *= g;
        if (k > 0) spectrum_[N - k] *= g;  // keep the spectrum Hermitian
    }
    // Nyquist bin shares the top profile bin
    spectrum_[half_] *= gain_for(half_, profile_[half_ - 1]);

    plan_.inverse(spectrum_);
    for (int i = 0; i < n; ++i) out[i] = spectrum_[i].real() * inv_n;
}

} // namespace pitchtrack::dsp
