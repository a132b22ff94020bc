#include "vibrato_detector.hpp"

#include <algorithm>
#include <cmath>

namespace pitchtrack::dsp {

const VibratoDetector::Entry& VibratoDetector::recent(int age) const {
    int idx = head_ - 1 - age;
    if (idx < 0) idx += kHistorySize;
    return history_[idx];
}

const VibratoState& VibratoDetector::push(float freq_hz, double timestamp_ms) {
    if (!(freq_hz > 0.0f)) return state_;

    history_[head_] = Entry{freq_hz, timestamp_ms};
    head_ = (head_ + 1) % kHistorySize;
    count_ = std::min(count_ + 1, kHistorySize);

    state_ = VibratoState{};
    if (count_ < cfg_.min_history) return state_;

    const int n = std::min({count_, cfg_.analysis_frames, kHistorySize});

    // Oldest first
    double sum = 0.0;
    for (int i = 0; i < n; ++i) sum += recent(n - 1 - i).freq_hz;
    const double mean = sum / n;

    float max_dev = 0.0f;
    for (int i = 0; i < n; ++i) {
        deviations_[i] = static_cast<float>(1200.0 * std::log2(recent(n - 1 - i).freq_hz / mean));
        max_dev = std::max(max_dev, std::abs(deviations_[i]));
    }
    if (max_dev < cfg_.min_depth_cents) return state_;

    int crossings = 0;
    for (int i = 1; i < n; ++i) {
        if (deviations_[i] * deviations_[i - 1] < 0.0f) ++crossings;
    }

    const double duration_s = (recent(0).timestamp_ms - recent(n - 1).timestamp_ms) / 1000.0;
    if (duration_s <= 0.0) return state_;

    const float rate = static_cast<float>(crossings / (2.0 * duration_s));
    if (rate >= cfg_.min_rate_hz && rate <= cfg_.max_rate_hz) {
        state_.detected = true;
        state_.rate_hz = rate;
        state_.depth_cents = max_dev;
    }
    return state_;
}

void VibratoDetector::reset() {
    head_ = 0;
    count_ = 0;
    state_ = VibratoState{};
}

} // namespace pitchtrack::dsp
