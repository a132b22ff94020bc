#include "yin_estimator.hpp"

#include <algorithm>
#include <cmath>

#include "fft/peak_interp.hpp"

namespace pitchtrack::dsp {

YinEstimator::YinEstimator(const YinConfig& config)
    : config_(config), window_(config.buffer_size / 2) {
    max_tau_ = std::min(window_ - 1, static_cast<int>(std::ceil(config_.sample_rate / config_.min_freq)) + 1);
    min_tau_ = std::max(2, static_cast<int>(std::floor(config_.sample_rate / config_.max_freq)) - 1);
    min_tau_ = std::min(min_tau_, max_tau_);
    diff_.assign(max_tau_ + 1, 0.0f);
    cmnd_.assign(max_tau_ + 1, 1.0f);
}

void YinEstimator::difference(const float* x) {
    diff_[0] = 0.0f;
    for (int tau = 1; tau <= max_tau_; ++tau) {
        float sum = 0.0f;
        for (int j = 0; j < window_; ++j) {
            const float d = x[j] - x[j + tau];
            sum += d * d;
        }
        diff_[tau] = sum;
    }
}

void YinEstimator::cumulative_mean_normalize() {
    cmnd_[0] = 1.0f;
    double running = 0.0;
    for (int tau = 1; tau <= max_tau_; ++tau) {
        running += diff_[tau];
        cmnd_[tau] = running > 0.0 ? static_cast<float>(diff_[tau] * tau / running) : 1.0f;
    }
}

int YinEstimator::absolute_threshold() const {
    for (int tau = min_tau_; tau <= max_tau_; ++tau) {
        if (cmnd_[tau] < config_.threshold) {
            // Walk down to the bottom of the dip
            while (tau + 1 <= max_tau_ && cmnd_[tau + 1] < cmnd_[tau]) ++tau;
            return tau;
        }
    }
    return -1;
}

std::optional<PitchEstimate> YinEstimator::estimate(const float* buffer, int length) {
    if (!buffer || length < config_.buffer_size || max_tau_ < 2) return std::nullopt;

    const float* x = buffer + (length - config_.buffer_size);
    difference(x);
    cumulative_mean_normalize();

    const int tau = absolute_threshold();
    if (tau < 0) return std::nullopt;

    float refined = static_cast<float>(tau);
    if (tau > 0 && tau < max_tau_) {
        // Minimum of the dip: interpolate the negated curve
        const fft::ParabolicPeak p = fft::parabolic_peak(-cmnd_[tau - 1], -cmnd_[tau], -cmnd_[tau + 1], tau);
        refined = p.index;
    }
    if (!(refined > 0.0f)) return std::nullopt;

    const float freq = config_.sample_rate / refined;
    if (freq < config_.min_freq || freq > config_.max_freq) return std::nullopt;

    PitchEstimate e;
    e.frequency_hz = freq;
    e.confidence = std::clamp(1.0f - cmnd_[tau], 0.0f, 1.0f);
    return e;
}

} // namespace pitchtrack::dsp
