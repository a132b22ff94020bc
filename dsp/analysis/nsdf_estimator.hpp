#pragma once

#include <optional>
#include <vector>

#include "pitchtrack/types.hpp"

namespace pitchtrack::dsp {

struct NsdfConfig {
    float sample_rate = 48000.0f;
    int buffer_size = 4096;     // samples examined; the integration window is half of it
    float min_freq = 50.0f;
    float max_freq = 2000.0f;
    float key_threshold = 0.8f; // fraction of the highest key maximum
};

// McLeod pitch method: normalized square difference function
//   n(tau) = 2 r(tau) / m(tau)
// over the analysis window. The first key maximum reaching key_threshold of the
// highest one gives the period; confidence is its interpolated height.
class NsdfEstimator {
public:
    explicit NsdfEstimator(const NsdfConfig& config = NsdfConfig{});

    // Uses the last buffer_size samples of `buffer`
    std::optional<PitchEstimate> estimate(const float* buffer, int length);

    // n(tau) from the last estimate() call, indices 0..max_lag()
    const std::vector<float>& nsdf() const { return nsdf_; }
    int min_lag() const { return min_tau_; }
    int max_lag() const { return max_tau_; }
    const NsdfConfig& config() const { return config_; }

private:
    void compute(const float* x);

    NsdfConfig config_;
    int window_;
    int min_tau_;
    int max_tau_;
    std::vector<float> nsdf_;
};

} // namespace pitchtrack::dsp
