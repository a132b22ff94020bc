#include "window.hpp"

#include <cmath>

namespace pitchtrack::fft {

std::vector<float> make_window(WindowType type, int n) {
    std::vector<float> w(n > 0 ? n : 0, 1.0f);
    if (n <= 1) return w;

    const double two_pi = 6.28318530717958647692;
    const double denom = static_cast<double>(n - 1);
    for (int i = 0; i < n; ++i) {
        const double x = two_pi * i / denom;
        switch (type) {
            case WindowType::Hamming:
                w[i] = static_cast<float>(0.54 - 0.46 * std::cos(x));
                break;
            case WindowType::Hann:
                w[i] = static_cast<float>(0.5 - 0.5 * std::cos(x));
                break;
            case WindowType::Blackman:
                w[i] = static_cast<float>(0.42 - 0.5 * std::cos(x) + 0.08 * std::cos(2.0 * x));
                break;
        }
    }
    return w;
}

const std::vector<float>& WindowCache::get(WindowType type, int n) {
    const auto key = std::make_pair(type, n);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
    auto [ins, _] = cache_.emplace(key, make_window(type, n));
    return ins->second;
}

} // namespace pitchtrack::fft
