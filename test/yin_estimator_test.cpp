#include <catch2/catch.hpp>

#include <cmath>

#include "dsp/analysis/yin_estimator.hpp"
#include "test_signals.hpp"

using namespace pitchtrack;
using dsp::YinConfig;
using dsp::YinEstimator;

TEST_CASE("lag range follows the frequency limits", "[yin]") {
    YinEstimator yin;
    CHECK(yin.max_lag() == 961);
    CHECK(yin.min_lag() == 23);

    YinConfig small;
    small.buffer_size = 1024;
    YinEstimator short_window(small);
    CHECK(short_window.max_lag() == 511);
}

TEST_CASE("pure tones are found with high confidence", "[yin]") {
    YinEstimator yin;
    for (float f : {82.41f, 220.0f, 440.0f, 1000.0f}) {
        const auto x = test_signals::sine(f, 48000.0f, 4096);
        auto e = yin.estimate(x.data(), static_cast<int>(x.size()));
        REQUIRE(e);
        CHECK(std::abs(test_signals::cents_between(e->frequency_hz, f)) < 2.0f);
        CHECK(e->confidence > 0.9f);
    }
}

TEST_CASE("the last buffer_size samples are used", "[yin]") {
    YinEstimator yin;
    auto x = test_signals::sine(330.0f, 48000.0f, 8192);
    // Garbage before the analyzed tail must not matter
    for (int i = 0; i < 4096; ++i) x[i] = (i % 7) * 0.1f;
    auto e = yin.estimate(x.data(), static_cast<int>(x.size()));
    REQUIRE(e);
    CHECK(std::abs(e->frequency_hz - 330.0f) < 0.5f);
}

TEST_CASE("silence, noise and short buffers give nothing useful", "[yin]") {
    YinEstimator yin;
    std::vector<float> zeros(4096, 0.0f);
    CHECK_FALSE(yin.estimate(zeros.data(), 4096));
    CHECK_FALSE(yin.estimate(zeros.data(), 100));
    CHECK_FALSE(yin.estimate(nullptr, 4096));

    test_signals::Lcg rng(7);
    std::vector<float> noise(4096);
    for (float& v : noise) v = rng.uniform() - 0.5f;
    auto e = yin.estimate(noise.data(), 4096);
    CHECK((!e || e->confidence < 0.5f));
}
