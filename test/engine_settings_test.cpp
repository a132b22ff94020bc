#include <catch2/catch.hpp>

#include <cstdio>
#include <string>
#include <vector>

#include "pitchtrack/engine_settings.hpp"
#include "pitchtrack/engine_settings_io.hpp"

using namespace pitchtrack;

namespace {

// Scratch file in the working directory, removed on scope exit
struct TempFile {
    explicit TempFile(const char* name) : path(name) { std::remove(path.c_str()); }
    ~TempFile() { std::remove(path.c_str()); }
    void write(const char* text) const {
        FILE* f = std::fopen(path.c_str(), "wb");
        REQUIRE(f);
        std::fputs(text, f);
        std::fclose(f);
    }
    std::string path;
};

std::string reason_for(const EngineSettings& s) {
    std::string error;
    CHECK_FALSE(validate_settings(s, &error));
    return error;
}

}

TEST_CASE("defaults are valid", "[settings]") {
    std::string error;
    CHECK(validate_settings(EngineSettings{}, &error));
    CHECK(error.empty());
    CHECK(validate_settings(EngineSettings{}, nullptr));
}

TEST_CASE("invalid fields are named in the reason", "[settings]") {
    EngineSettings s;
    s.buffer_size = 1000;
    CHECK(reason_for(s).find("buffer_size") != std::string::npos);

    s = EngineSettings{};
    s.max_freq = 30000.0f;
    CHECK(reason_for(s).find("max_freq") != std::string::npos);

    s = EngineSettings{};
    s.min_freq = 2500.0f;
    CHECK(reason_for(s).find("max_freq") != std::string::npos);

    s = EngineSettings{};
    s.instrument = "kazoo";
    CHECK(reason_for(s) == "unknown instrument");

    s = EngineSettings{};
    s.a4_hz = 500.0f;
    CHECK(reason_for(s).find("a4_hz") != std::string::npos);

    s = EngineSettings{};
    s.smoothing_alpha = 0.0f;
    CHECK(reason_for(s).find("smoothing_alpha") != std::string::npos);

    s = EngineSettings{};
    s.noise_fft_size = 1000;
    CHECK(reason_for(s).find("noise_fft_size") != std::string::npos);
}

TEST_CASE("the first bad field wins", "[settings]") {
    EngineSettings s;
    s.a4_hz = 10.0f;
    s.buffer_size = 3;
    CHECK(reason_for(s).find("buffer_size") != std::string::npos);
}

TEST_CASE("partial updates only touch set fields", "[settings]") {
    EngineSettings s;
    EngineSettingsUpdate u;
    u.instrument = std::string("piano");
    u.input_gain = 2.0f;
    apply_update(s, u);

    CHECK(s.instrument == "piano");
    CHECK(s.input_gain == 2.0f);
    CHECK(s.buffer_size == 4096);
    CHECK(s.a4_hz == 440.0f);

    EngineSettings other;
    other.buffer_size = 2048;
    other.a4_hz = 442.0f;
    other.noise_bypass = true;
    EngineSettings copy;
    apply_update(copy, to_update(other));
    CHECK(copy.buffer_size == 2048);
    CHECK(copy.a4_hz == 442.0f);
    CHECK(copy.noise_bypass);
    CHECK_FALSE(to_update(other).noise_profile);
}

TEST_CASE("only structural fields need a rebuild", "[settings]") {
    const EngineSettings base;
    EngineSettings s = base;
    s.input_gain = 3.0f;
    s.instrument = "guitar";
    s.a4_hz = 445.0f;
    s.smoothing_alpha = 0.5f;
    s.over_subtraction = 2.0f;
    CHECK_FALSE(needs_rebuild(base, s));

    s = base;
    s.buffer_size = 8192;
    CHECK(needs_rebuild(base, s));
    s = base;
    s.sample_rate = 44100.0f;
    CHECK(needs_rebuild(base, s));
    s = base;
    s.cents_per_state = 5.0f;
    CHECK(needs_rebuild(base, s));
    s = base;
    s.noise_fft_size = 2048;
    CHECK(needs_rebuild(base, s));
}

TEST_CASE("settings and profile survive a save/load cycle", "[settings][io]") {
    TempFile file("pitchtrack_settings_roundtrip.json");

    EngineSettings out;
    out.sample_rate = 44100.0f;
    out.buffer_size = 8192;
    out.instrument = "cello";
    out.a4_hz = 441.5f;
    out.noise_bypass = true;
    out.over_subtraction = 1.25f;
    out.spectral_floor = 0.0035f;

    std::vector<float> profile(out.noise_fft_size / 2);
    for (std::size_t i = 0; i < profile.size(); ++i) profile[i] = 1e-4f * static_cast<float>(i % 17) + 3.3e-7f;

    REQUIRE(save_engine_settings(file.path.c_str(), out, &profile));

    EngineSettings in;
    std::vector<float> loaded;
    REQUIRE(load_engine_settings(file.path.c_str(), in, &loaded));
    CHECK(in.sample_rate == out.sample_rate);
    CHECK(in.buffer_size == out.buffer_size);
    CHECK(in.instrument == "cello");
    CHECK(in.a4_hz == out.a4_hz);
    CHECK(in.noise_bypass);
    CHECK(in.over_subtraction == out.over_subtraction);
    CHECK(in.spectral_floor == out.spectral_floor);
    CHECK(in.min_freq == out.min_freq);
    CHECK(in.cqt_min_freq == out.cqt_min_freq);
    CHECK(loaded == profile);
}

TEST_CASE("a file without a profile clears the caller's profile", "[settings][io]") {
    TempFile file("pitchtrack_settings_noprofile.json");
    REQUIRE(save_engine_settings(file.path.c_str(), EngineSettings{}));

    EngineSettings in;
    std::vector<float> profile(10, 1.0f);
    REQUIRE(load_engine_settings(file.path.c_str(), in, &profile));
    CHECK(profile.empty());
}

TEST_CASE("missing or invalid files leave settings untouched", "[settings][io]") {
    EngineSettings s;
    s.instrument = "violin";
    CHECK_FALSE(load_engine_settings("does/not/exist.json", s));
    CHECK(s.instrument == "violin");

    TempFile bad("pitchtrack_settings_invalid.json");
    bad.write("{\n  \"buffer_size\": 1000,\n  \"instrument\": \"piano\"\n}\n");
    CHECK_FALSE(load_engine_settings(bad.path.c_str(), s));
    CHECK(s.instrument == "violin");
    CHECK(s.buffer_size == 4096);
}

TEST_CASE("keys absent from the file keep their current value", "[settings][io]") {
    TempFile partial("pitchtrack_settings_partial.json");
    partial.write("{\n  \"cqt_min_freq\": 55.0,\n  \"instrument\": \"harp\"\n}\n");

    EngineSettings s;
    s.input_gain = 4.0f;
    REQUIRE(load_engine_settings(partial.path.c_str(), s));
    CHECK(s.instrument == "harp");
    CHECK(s.cqt_min_freq == 55.0f);
    CHECK(s.min_freq == 50.0f);
    CHECK(s.input_gain == 4.0f);
}

TEST_CASE("a stored profile of the wrong length is dropped", "[settings][io]") {
    TempFile file("pitchtrack_settings_shortprofile.json");
    const std::vector<float> short_profile(17, 0.5f);
    REQUIRE(save_engine_settings(file.path.c_str(), EngineSettings{}, &short_profile));

    EngineSettings s;
    std::vector<float> loaded;
    REQUIRE(load_engine_settings(file.path.c_str(), s, &loaded));
    CHECK(loaded.empty());
}
