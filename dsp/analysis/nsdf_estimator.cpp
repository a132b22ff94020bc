#include "nsdf_estimator.hpp"

#include <algorithm>
#include <cmath>

#include "fft/peak_interp.hpp"

namespace pitchtrack::dsp {

NsdfEstimator::NsdfEstimator(const NsdfConfig& config)
    : config_(config), window_(config.buffer_size / 2) {
    max_tau_ = std::min(window_ - 1, static_cast<int>(std::ceil(config_.sample_rate / config_.min_freq)) + 1);
    min_tau_ = std::max(2, static_cast<int>(std::floor(config_.sample_rate / config_.max_freq)));
    min_tau_ = std::min(min_tau_, max_tau_);
    nsdf_.assign(max_tau_ + 1, 0.0f);
}

void NsdfEstimator::compute(const float* x) {
    // m(tau) = sum x[j]^2 + sum x[j+tau]^2; the second sum slides with tau
    double head = 0.0;
    for (int j = 0; j < window_; ++j) head += static_cast<double>(x[j]) * x[j];
    double tail = head;

    for (int tau = 0; tau <= max_tau_; ++tau) {
        if (tau > 0) {
            tail += static_cast<double>(x[window_ + tau - 1]) * x[window_ + tau - 1];
            tail -= static_cast<double>(x[tau - 1]) * x[tau - 1];
        }
        float acf = 0.0f;
        for (int j = 0; j < window_; ++j) acf += x[j] * x[j + tau];
        const double m = head + tail;
        nsdf_[tau] = m > 0.0 ? static_cast<float>(2.0 * acf / m) : 0.0f;
    }
}

std::optional<PitchEstimate> NsdfEstimator::estimate(const float* buffer, int length) {
    if (!buffer || length < config_.buffer_size || max_tau_ < 2) return std::nullopt;

    compute(buffer + (length - config_.buffer_size));

    // Key maxima: positive local peaks inside the lag range
    float highest = 0.0f;
    for (int tau = std::max(1, min_tau_); tau < max_tau_; ++tau) {
        const float v = nsdf_[tau];
        if (v > 0.0f && v > nsdf_[tau - 1] && v >= nsdf_[tau + 1]) highest = std::max(highest, v);
    }
    if (!(highest > 0.0f)) return std::nullopt;

    const float cutoff = highest * config_.key_threshold;
    int chosen = -1;
    for (int tau = std::max(1, min_tau_); tau < max_tau_; ++tau) {
        const float v = nsdf_[tau];
        if (v >= cutoff && v > nsdf_[tau - 1] && v >= nsdf_[tau + 1]) {
            chosen = tau;
            break;
        }
    }
    if (chosen < 0) return std::nullopt;

    const fft::ParabolicPeak p = fft::parabolic_peak(nsdf_.data(), max_tau_ + 1, chosen);
    if (!(p.index > 0.0f)) return std::nullopt;

    const float freq = config_.sample_rate / p.index;
    if (freq < config_.min_freq || freq > config_.max_freq) return std::nullopt;

    PitchEstimate e;
    e.frequency_hz = freq;
    e.confidence = std::clamp(p.value, 0.0f, 1.0f);
    return e;
}

} // namespace pitchtrack::dsp
