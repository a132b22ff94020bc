#pragma once

#include <map>
#include <utility>
#include <vector>

namespace pitchtrack::fft {

enum class WindowType { Hamming, Hann, Blackman };

// Symmetric window of length n (denominator n - 1).
std::vector<float> make_window(WindowType type, int n);

// Windows cached by (type, size). Lookups for a new size allocate, so owners
// fetch their windows at construction and keep the reference.
class WindowCache {
public:
    const std::vector<float>& get(WindowType type, int n);
    std::size_t size() const { return cache_.size(); }

private:
    std::map<std::pair<WindowType, int>, std::vector<float>> cache_;
};

} // namespace pitchtrack::fft
