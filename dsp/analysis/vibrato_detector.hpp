#pragma once

#include <array>

#include "pitchtrack/types.hpp"

namespace pitchtrack::dsp {

struct VibratoConfig {
    int min_history = 10;         // entries needed before any decision
    int analysis_frames = 20;     // most recent entries examined
    float min_depth_cents = 5.0f;
    float min_rate_hz = 3.0f;
    float max_rate_hz = 10.0f;
};

// Periodic pitch modulation from the decoded trajectory: depth is the largest
// deviation from the mean in cents, rate comes from zero crossings.
class VibratoDetector {
public:
    static constexpr int kHistorySize = 30;

    explicit VibratoDetector(const VibratoConfig& cfg = VibratoConfig{}) : cfg_(cfg) {}

    const VibratoState& push(float freq_hz, double timestamp_ms);

    const VibratoState& state() const { return state_; }
    int history_count() const { return count_; }
    const VibratoConfig& config() const { return cfg_; }

    void reset();

private:
    struct Entry { float freq_hz; double timestamp_ms; };

    const Entry& recent(int age) const;   // age 0 = newest

    VibratoConfig cfg_;
    std::array<Entry, kHistorySize> history_{};
    std::array<float, kHistorySize> deviations_{};
    int head_ = 0;
    int count_ = 0;
    VibratoState state_;
};

} // namespace pitchtrack::dsp
