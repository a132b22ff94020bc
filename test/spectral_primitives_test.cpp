#include <catch2/catch.hpp>

#include <complex>
#include <stdexcept>
#include <vector>

#include "fft/fft_utils.hpp"
#include "fft/peak_interp.hpp"
#include "fft/window.hpp"
#include "test_signals.hpp"

using namespace pitchtrack;

TEST_CASE("FftPlan matches a direct DFT", "[fft]") {
    const int n = 64;
    test_signals::Lcg rng(7);
    std::vector<std::complex<float>> x(n);
    for (auto& v : x) v = {rng.uniform() - 0.5f, rng.uniform() - 0.5f};

    std::vector<std::complex<float>> expected(n);
    for (int k = 0; k < n; ++k) {
        std::complex<double> acc = 0.0;
        for (int t = 0; t < n; ++t) {
            const double a = -test_signals::kTwoPi * k * t / n;
            acc += std::complex<double>(x[t]) * std::complex<double>(std::cos(a), std::sin(a));
        }
        expected[k] = std::complex<float>(acc);
    }

    fft::FftPlan plan(n);
    auto y = x;
    plan.forward(y);
    for (int k = 0; k < n; ++k) {
        CHECK(y[k].real() == Approx(expected[k].real()).margin(1e-4));
        CHECK(y[k].imag() == Approx(expected[k].imag()).margin(1e-4));
    }
}

TEST_CASE("FftPlan inverse is unscaled", "[fft]") {
    const int n = 256;
    fft::FftPlan plan(n);
    std::vector<std::complex<float>> x(n);
    for (int i = 0; i < n; ++i) x[i] = {std::sin(0.1f * i), 0.0f};
    auto y = x;
    plan.forward(y);
    plan.inverse(y);
    for (int i = 0; i < n; ++i) {
        CHECK(y[i].real() / n == Approx(x[i].real()).margin(1e-5));
        CHECK(y[i].imag() / n == Approx(0.0f).margin(1e-5));
    }
}

TEST_CASE("FftPlan rejects sizes that are not powers of two", "[fft]") {
    CHECK_THROWS_AS(fft::FftPlan(100), std::invalid_argument);
    CHECK_NOTHROW(fft::FftPlan(128));
    CHECK(fft::is_power_of_two(1024));
    CHECK_FALSE(fft::is_power_of_two(0));
    CHECK(fft::next_power_of_two(1000) == 1024);
}

TEST_CASE("magnitudes and power of a bin-centred tone", "[fft]") {
    const int n = 512;
    fft::FftPlan plan(n);
    std::vector<std::complex<float>> x(n);
    for (int i = 0; i < n; ++i) x[i] = {std::cos(static_cast<float>(test_signals::kTwoPi) * 8.0f * i / n), 0.0f};
    plan.forward(x);

    std::vector<float> mag(n / 2), pow(n / 2);
    fft::magnitudes(x.data(), n / 2, 1.0f / n, mag.data());
    fft::power(x.data(), n / 2, 1.0f, pow.data());
    CHECK(mag[8] == Approx(0.5f).margin(1e-4));
    CHECK(mag[9] == Approx(0.0f).margin(1e-4));
    CHECK(pow[8] == Approx((n / 2.0f) * (n / 2.0f)).epsilon(1e-3));
}

TEST_CASE("windows are symmetric and cached by type and size", "[window]") {
    for (auto type : {fft::WindowType::Hamming, fft::WindowType::Hann, fft::WindowType::Blackman}) {
        const auto w = fft::make_window(type, 33);
        REQUIRE(w.size() == 33);
        for (int i = 0; i < 16; ++i) CHECK(w[i] == Approx(w[32 - i]).margin(1e-6));
        CHECK(w[16] == Approx(1.0f).margin(1e-5));
    }
    CHECK(fft::make_window(fft::WindowType::Hann, 33)[0] == Approx(0.0f).margin(1e-7));
    CHECK(fft::make_window(fft::WindowType::Hamming, 33)[0] == Approx(0.08f).margin(1e-6));

    fft::WindowCache cache;
    const auto& a = cache.get(fft::WindowType::Hann, 1024);
    const auto& b = cache.get(fft::WindowType::Hann, 1024);
    CHECK(&a == &b);
    cache.get(fft::WindowType::Hamming, 1024);
    CHECK(cache.size() == 2);
}

TEST_CASE("parabolic interpolation recovers the vertex of a parabola", "[peak]") {
    // y = 3 - 2 (x - 4.3)^2 sampled at 3, 4, 5
    auto y = [](float x) { return 3.0f - 2.0f * (x - 4.3f) * (x - 4.3f); };
    const auto p = fft::parabolic_peak(y(3.0f), y(4.0f), y(5.0f), 4);
    CHECK(p.index == Approx(4.3f).margin(1e-5));
    CHECK(p.value == Approx(3.0f).margin(1e-5));
}

TEST_CASE("parabolic interpolation leaves flat and edge peaks unrefined", "[peak]") {
    const auto flat = fft::parabolic_peak(1.0f, 1.0f, 1.0f, 7);
    CHECK(flat.index == 7.0f);
    CHECK(flat.value == 1.0f);

    const float data[] = {5.0f, 4.0f, 3.0f};
    const auto edge = fft::parabolic_peak(data, 3, 0);
    CHECK(edge.index == 0.0f);
    CHECK(edge.value == 5.0f);
}
