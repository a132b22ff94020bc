#include "kalman_filter.hpp"

#include <algorithm>
#include <cmath>

namespace pitchtrack::dsp {

namespace {
constexpr float kMinConfidence = 0.1f;
}

KalmanFilter::KalmanFilter(const KalmanConfig& config) : config_(config) {}

std::optional<float> KalmanFilter::filter(float measurement_hz, float confidence) {
    if (!(measurement_hz > 0.0f) || !std::isfinite(measurement_hz)) return value();

    if (!initialized_) {
        x_ = measurement_hz;
        initialized_ = true;
        return x_;
    }

    const float r = config_.measurement_noise / std::max(kMinConfidence, std::min(confidence, 1.0f));
    const float predicted_p = p_ + config_.process_noise;
    const float gain = predicted_p / (predicted_p + r);
    x_ += gain * (measurement_hz - x_);
    p_ = (1.0f - gain) * predicted_p;
    return x_;
}

std::optional<float> KalmanFilter::value() const {
    if (!initialized_) return std::nullopt;
    return x_;
}

void KalmanFilter::reset() {
    x_ = 0.0f;
    p_ = 1.0f;
    initialized_ = false;
}

} // namespace pitchtrack::dsp
