#pragma once

#include <optional>

namespace pitchtrack::dsp {

struct KalmanConfig {
    float process_noise = 0.01f;       // Hz^2 added per frame
    float measurement_noise = 0.005f;  // Hz^2 at confidence 1
};

// Scalar constant-state Kalman filter over frequency. Measurement noise is
// scaled by 1 / max(0.1, confidence), so weak frames move the estimate less.
class KalmanFilter {
public:
    explicit KalmanFilter(const KalmanConfig& config = KalmanConfig{});

    // The first valid measurement seeds the state. Non-positive or non-finite
    // measurements leave the state alone and return it (empty before seeding).
    std::optional<float> filter(float measurement_hz, float confidence = 1.0f);

    std::optional<float> value() const;
    float variance() const { return p_; }
    void reset();

    const KalmanConfig& config() const { return config_; }

private:
    KalmanConfig config_;
    float x_ = 0.0f;
    float p_ = 1.0f;
    bool initialized_ = false;
};

} // namespace pitchtrack::dsp
