#include "fft_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace pitchtrack::fft {

FftPlan::FftPlan(int n) : n_(n) {
    if (!is_power_of_two(n)) {
        throw std::invalid_argument("FftPlan: size must be a power of two");
    }

    int bits = 0; while ((1 << bits) < n) ++bits;
    bitrev_.resize(n);
    for (int i = 0; i < n; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        bitrev_[i] = static_cast<int>(r);
    }

    // n/2 + n/4 + ... + 1 = n - 1 twiddles in total
    const double two_pi = 6.28318530717958647692;
    twiddles_.reserve(n > 1 ? n - 1 : 0);
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        for (int k = 0; k < half; ++k) {
            const double angle = -two_pi * k / static_cast<double>(len);
            twiddles_.emplace_back(static_cast<float>(std::cos(angle)),
                                   static_cast<float>(std::sin(angle)));
        }
    }
}

void FftPlan::forward(std::complex<float>* data) const {
    const int n = n_;
    if (n <= 1) return;

    // In-place bit reversal
    for (int i = 0; i < n; ++i) {
        const int j = bitrev_[i];
        if (i < j) std::swap(data[i], data[j]);
    }

    // Iterative radix-2
    int stage_offset = 0;
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        const std::complex<float>* W = twiddles_.data() + stage_offset;
        for (int i = 0; i < n; i += len) {
            for (int k = 0; k < half; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + half] * W[k];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
        stage_offset += half;
    }
}

void FftPlan::inverse(std::complex<float>* data) const {
    for (int i = 0; i < n_; ++i) data[i] = std::conj(data[i]);
    forward(data);
    for (int i = 0; i < n_; ++i) data[i] = std::conj(data[i]);
}

void magnitudes(const std::complex<float>* spectrum, int bins, float scale, float* out) {
    for (int k = 0; k < bins; ++k) out[k] = std::abs(spectrum[k]) * scale;
}

void power(const std::complex<float>* spectrum, int bins, float scale, float* out) {
    for (int k = 0; k < bins; ++k) out[k] = std::norm(spectrum[k]) * scale;
}

} // namespace pitchtrack::fft
