#pragma once

#include <cmath>

namespace pitchtrack::fft {

struct ParabolicPeak {
    float index = 0.0f;
    float value = 0.0f;
};

// Three-point parabolic refinement around a discrete peak at index i with
// neighbours y0 (i-1) and y2 (i+1). A flat or degenerate neighbourhood returns
// the unrefined index.
inline ParabolicPeak parabolic_peak(float y0, float y1, float y2, int i) {
    const float denom = y0 - 2.0f * y1 + y2;
    if (std::fabs(denom) < 1e-12f) {
        return {static_cast<float>(i), y1};
    }
    const float delta = 0.5f * (y0 - y2) / denom;
    return {static_cast<float>(i) + delta, y1 - 0.25f * (y0 - y2) * delta};
}

// Refines data[i] using its neighbours; edges are returned unrefined.
inline ParabolicPeak parabolic_peak(const float* data, int size, int i) {
    if (i <= 0 || i >= size - 1) {
        return {static_cast<float>(i), (i >= 0 && i < size) ? data[i] : 0.0f};
    }
    return parabolic_peak(data[i - 1], data[i], data[i + 1], i);
}

} // namespace pitchtrack::fft
