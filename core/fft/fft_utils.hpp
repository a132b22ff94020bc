#pragma once

#include <complex>
#include <vector>

namespace pitchtrack::fft {

inline bool is_power_of_two(int n) { return n > 0 && (n & (n - 1)) == 0; }

inline int next_power_of_two(int n) {
    int p = 1;
    while (p < n) p <<= 1;
    return p;
}

// Radix-2 Cooley-Tukey transform of a fixed power-of-two size. Bit-reversal
// and twiddle tables are built in the constructor; forward()/inverse() work in
// place and do not allocate.
class FftPlan {
public:
    explicit FftPlan(int n);

    int size() const { return n_; }

    void forward(std::complex<float>* data) const;
    // Unscaled inverse: divide by size() to recover the input.
    void inverse(std::complex<float>* data) const;

    void forward(std::vector<std::complex<float>>& data) const { forward(data.data()); }
    void inverse(std::vector<std::complex<float>>& data) const { inverse(data.data()); }

private:
    int n_;
    std::vector<int> bitrev_;
    std::vector<std::complex<float>> twiddles_;  // stages packed back to back
};

// |X[k]| * scale for k in [0, bins)
void magnitudes(const std::complex<float>* spectrum, int bins, float scale, float* out);
// |X[k]|^2 * scale for k in [0, bins)
void power(const std::complex<float>* spectrum, int bins, float scale, float* out);

} // namespace pitchtrack::fft
