#include <catch2/catch.hpp>

#include <cmath>

#include "dsp/cqt/cqt_analyzer.hpp"
#include "test_signals.hpp"

using namespace pitchtrack;
using dsp::CqtAnalyzer;
using dsp::CqtConfig;

TEST_CASE("CQT bank geometry", "[cqt]") {
    CqtAnalyzer cqt;
    CHECK(cqt.num_bins() == 8 * 48);
    CHECK(cqt.quality_factor() == Approx(68.75f).epsilon(1e-3));
    CHECK(cqt.frequency_for_bin(0.0f) == Approx(27.5f));
    CHECK(cqt.frequency_for_bin(48.0f) == Approx(55.0f));
    CHECK(cqt.bin_for_frequency(440.0f) == Approx(192.0f).margin(1e-3));

    // Low bins need kernels longer than max_window and are never built
    CHECK(cqt.kernel_length(0) > cqt.config().max_window);
    CHECK(cqt.longest_kernel() <= cqt.config().max_window);
    CHECK(cqt.kernel_length(144) <= cqt.config().max_window);
}

TEST_CASE("a 220 Hz sine peaks at the 220 Hz bin", "[cqt]") {
    CqtAnalyzer cqt;
    const auto x = test_signals::sine(220.0f, 48000.0f, 16384);

    const int found = cqt.analyze(x.data(), static_cast<int>(x.size()));
    REQUIRE(found > 0);
    REQUIRE(found <= kMaxCqtPeaks);

    const CqtPeak& top = cqt.peaks()[0];
    const float expected_bin = cqt.bin_for_frequency(220.0f);
    CHECK(expected_bin == Approx(144.0f).margin(1e-3));
    CHECK(std::abs(top.bin - expected_bin) <= 1.0f);
    CHECK(std::abs(test_signals::cents_between(top.frequency_hz, 220.0f)) < 25.0f);

    for (int i = 1; i < found; ++i) {
        CHECK(cqt.peaks()[i - 1].magnitude >= cqt.peaks()[i].magnitude);
    }

    const auto diag = cqt.diagnostics();
    CHECK(diag.peak_count == found);
    CHECK(diag.peaks[0].bin == top.bin);
}

TEST_CASE("bins whose kernel does not fit the buffer read zero", "[cqt]") {
    CqtAnalyzer cqt;
    const auto x = test_signals::sine(220.0f, 48000.0f, 4096);
    cqt.analyze(x.data(), static_cast<int>(x.size()));

    REQUIRE(cqt.kernel_length(144) > 4096);
    CHECK(cqt.spectrum()[144] == 0.0f);
    for (int i = 0; i < cqt.peak_count(); ++i) {
        CHECK(cqt.kernel_length(static_cast<int>(std::lround(cqt.peaks()[i].bin))) <= 4096);
    }
}

TEST_CASE("silence produces no peaks", "[cqt]") {
    CqtAnalyzer cqt;
    std::vector<float> zeros(16384, 0.0f);
    CHECK(cqt.analyze(zeros.data(), static_cast<int>(zeros.size())) == 0);
    CHECK(cqt.analyze(nullptr, 0) == 0);
}

TEST_CASE("two tones give two ranked peaks", "[cqt]") {
    CqtConfig cfg;
    cfg.max_window = 8192;
    CqtAnalyzer cqt(cfg);

    auto x = test_signals::sine(880.0f, 48000.0f, 8192, 0.5f);
    const auto quiet = test_signals::sine(1760.0f * 1.5f, 48000.0f, 8192, 0.2f);
    for (std::size_t i = 0; i < x.size(); ++i) x[i] += quiet[i];

    REQUIRE(cqt.analyze(x.data(), static_cast<int>(x.size())) >= 2);
    CHECK(std::abs(test_signals::cents_between(cqt.peaks()[0].frequency_hz, 880.0f)) < 25.0f);
    CHECK(std::abs(test_signals::cents_between(cqt.peaks()[1].frequency_hz, 2640.0f)) < 25.0f);
}
