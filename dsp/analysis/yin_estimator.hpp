#pragma once

#include <optional>
#include <vector>

#include "pitchtrack/types.hpp"

namespace pitchtrack::dsp {

struct YinConfig {
    float sample_rate = 48000.0f;
    int buffer_size = 4096;     // samples examined; the integration window is half of it
    float min_freq = 50.0f;
    float max_freq = 2000.0f;
    float threshold = 0.12f;
};

// Time-domain fundamental estimate (de Cheveigne & Kawahara). Confidence is
// 1 - d'(tau) at the chosen lag.
class YinEstimator {
public:
    explicit YinEstimator(const YinConfig& config = YinConfig{});

    // Uses the last buffer_size samples of `buffer`
    std::optional<PitchEstimate> estimate(const float* buffer, int length);

    int min_lag() const { return min_tau_; }
    int max_lag() const { return max_tau_; }
    const YinConfig& config() const { return config_; }

private:
    void difference(const float* x);
    void cumulative_mean_normalize();
    int absolute_threshold() const;

    YinConfig config_;
    int window_;
    int min_tau_;
    int max_tau_;
    std::vector<float> diff_;
    std::vector<float> cmnd_;
};

} // namespace pitchtrack::dsp
