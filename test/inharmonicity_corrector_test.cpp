#include <catch2/catch.hpp>

#include <cmath>
#include <string>

#include "dsp/analysis/inharmonicity_corrector.hpp"

using pitchtrack::dsp::InharmonicityCorrector;
using pitchtrack::dsp::InharmonicityModel;

TEST_CASE("instrument table lookups", "[inharmonicity]") {
    REQUIRE(InharmonicityCorrector::model_count() >= 20);
    CHECK(std::string(InharmonicityCorrector::models()[0].name) == "default");
    CHECK(InharmonicityCorrector::find_instrument("piano").has_value());
    CHECK(InharmonicityCorrector::find_instrument("voice").has_value());
    CHECK_FALSE(InharmonicityCorrector::find_instrument("kazoo"));
    CHECK_FALSE(InharmonicityCorrector::find_instrument("Piano"));

    InharmonicityCorrector c;
    CHECK(std::string(c.instrument()) == "default");
    CHECK(c.set_instrument("cello"));
    CHECK_FALSE(c.set_instrument("kazoo"));
    CHECK(std::string(c.instrument()) == "cello");
}

TEST_CASE("band edges pick the right stiffness", "[inharmonicity]") {
    InharmonicityCorrector c;
    REQUIRE(c.set_instrument("piano"));
    CHECK(c.stiffness_for(20.0f) == 0.0004f);    // below the table
    CHECK(c.stiffness_for(27.5f) == 0.0004f);
    CHECK(c.stiffness_for(109.9f) == 0.0004f);
    CHECK(c.stiffness_for(110.0f) == 0.00012f);  // low band is half-open
    CHECK(c.stiffness_for(880.0f) == 0.00004f);
    CHECK(c.stiffness_for(4200.0f) == 0.00004f); // high band is closed
    CHECK(c.stiffness_for(6000.0f) == 0.00004f);
}

TEST_CASE("correction undoes the stiff-string stretch of the first partial", "[inharmonicity]") {
    InharmonicityCorrector c;
    for (int m = 0; m < InharmonicityCorrector::model_count(); ++m) {
        const InharmonicityModel& model = InharmonicityCorrector::models()[m];
        c.select(m);
        for (const auto& band : model.bands) {
            if (!band.has_range || band.b == 0.0f) continue;
            INFO(model.name << " band " << band.low_hz << "-" << band.high_hz);

            const float f0 = std::sqrt(band.low_hz * band.high_hz);
            const float measured = c.calculate_harmonic(f0, 1);
            CHECK(measured > f0);

            const auto corrected = c.correct(measured, 1.0f);
            CHECK(corrected.frequency_hz == Approx(f0).epsilon(1e-5));
            CHECK(corrected.stiffness_b == band.b);
            CHECK(corrected.offset_cents == Approx(corrected.raw_offset_cents));
            CHECK(corrected.raw_offset_cents > 0.0f);
        }
    }
}

TEST_CASE("instruments without stiffness pass through", "[inharmonicity]") {
    InharmonicityCorrector c;
    for (const char* name : {"default", "flute", "voice"}) {
        REQUIRE(c.set_instrument(name));
        const auto r = c.correct(440.0f, 1.0f);
        CHECK(r.frequency_hz == 440.0f);
        CHECK(r.offset_cents == 0.0f);
        CHECK(r.stiffness_b == 0.0f);
    }
}

TEST_CASE("low confidence scales the correction down", "[inharmonicity]") {
    InharmonicityCorrector c;
    REQUIRE(c.set_instrument("piano"));
    const auto full = c.correct(60.0f, 1.0f);
    const auto half = c.correct(60.0f, 0.5f);
    const auto none = c.correct(60.0f, 0.0f);

    CHECK(full.raw_offset_cents == Approx(600.0 * std::log2(1.0004)).epsilon(1e-4));
    CHECK(half.offset_cents == Approx(full.offset_cents * 0.5f));
    CHECK(half.raw_offset_cents == Approx(full.raw_offset_cents));
    CHECK(none.frequency_hz == Approx(60.0f));
    CHECK(half.frequency_hz > full.frequency_hz);
}

TEST_CASE("harmonic series follows n f0 sqrt(1 + B n^2)", "[inharmonicity]") {
    InharmonicityCorrector c;
    REQUIRE(c.set_instrument("piano"));
    CHECK(c.calculate_harmonic(100.0f, 2) == Approx(200.0 * std::sqrt(1.0 + 0.0004 * 4.0)));
    CHECK(c.calculate_harmonic(100.0f, 5) == Approx(500.0 * std::sqrt(1.0 + 0.0004 * 25.0)));

    REQUIRE(c.set_instrument("default"));
    CHECK(c.calculate_harmonic(100.0f, 3) == Approx(300.0f));
}

TEST_CASE("invalid frequencies are returned unchanged", "[inharmonicity]") {
    InharmonicityCorrector c;
    REQUIRE(c.set_instrument("piano"));
    CHECK(c.correct(0.0f, 1.0f).frequency_hz == 0.0f);
    CHECK(c.correct(-3.0f, 1.0f).offset_cents == 0.0f);
}
