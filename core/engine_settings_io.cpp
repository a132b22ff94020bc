#include "pitchtrack/engine_settings.hpp"
#include "pitchtrack/engine_settings_io.hpp"
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstring>

namespace pitchtrack {

// Minimal JSON (hand-rolled). Expects a well-formed file we wrote; keys are
// matched with their quotes so "min_freq" does not hit "cqt_min_freq".
static const char* find_value(const char* s, const char* key) {
    const char* p = std::strstr(s, key);
    if (!p) return nullptr;
    p = std::strchr(p, ':'); if (!p) return nullptr;
    return p + 1;
}
static bool parse_key_value(const char* s, const char* key, float& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    char* end = nullptr;
    const float v = std::strtof(p, &end);
    if (end == p) return false;
    out = v;
    return true;
}
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    char* end = nullptr;
    const long v = std::strtol(p, &end, 10);
    if (end == p) return false;
    out = static_cast<int>(v);
    return true;
}
static bool parse_key_value(const char* s, const char* key, bool& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (std::strncmp(p, "true", 4) == 0) { out = true; return true; }
    if (std::strncmp(p, "false", 5) == 0) { out = false; return true; }
    return false;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    if (*p != '"') return false;
    out.assign(start, p - start);
    return true;
}
static bool parse_float_array(const char* s, const char* key, std::vector<float>& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    p = std::strchr(p, '['); if (!p) return false; ++p;
    out.clear();
    while (*p) {
        while (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r' || *p == ',') ++p;
        if (*p == ']') return true;
        char* end = nullptr;
        const float v = std::strtof(p, &end);
        if (end == p) { out.clear(); return false; }
        out.push_back(v);
        p = end;
    }
    out.clear();
    return false;
}

bool load_engine_settings(const char* path, EngineSettings& st, std::vector<float>* profile) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<22) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    const char* s = buf.c_str();
    EngineSettings loaded = st;
    parse_key_value(s, "\"sample_rate\"", loaded.sample_rate);
    parse_key_value(s, "\"buffer_size\"", loaded.buffer_size);
    parse_key_value(s, "\"cqt_window\"", loaded.cqt_window);
    parse_key_value(s, "\"min_freq\"", loaded.min_freq);
    parse_key_value(s, "\"max_freq\"", loaded.max_freq);
    parse_key_value(s, "\"cents_per_state\"", loaded.cents_per_state);
    parse_key_value(s, "\"max_transition_cents\"", loaded.max_transition_cents);
    parse_key_value(s, "\"fast_passage_cents\"", loaded.fast_passage_cents);
    parse_key_value(s, "\"reacquire_frames\"", loaded.reacquire_frames);
    parse_key_value(s, "\"smoothing_alpha\"", loaded.smoothing_alpha);
    parse_key_value(s, "\"cqt_min_freq\"", loaded.cqt_min_freq);
    parse_key_value(s, "\"cqt_max_freq\"", loaded.cqt_max_freq);
    parse_key_value(s, "\"cqt_bins_per_octave\"", loaded.cqt_bins_per_octave);
    parse_key_value(s, "\"noise_fft_size\"", loaded.noise_fft_size);
    parse_key_value(s, "\"calibration_frames\"", loaded.calibration_frames);
    parse_key_value(s, "\"over_subtraction\"", loaded.over_subtraction);
    parse_key_value(s, "\"spectral_floor\"", loaded.spectral_floor);
    parse_key_value(s, "\"calibration_rms_gate\"", loaded.calibration_rms_gate);
    parse_key_value(s, "\"noise_bypass\"", loaded.noise_bypass);
    parse_key_value(s, "\"input_gain\"", loaded.input_gain);
    parse_key_value(s, "\"highpass_hz\"", loaded.highpass_hz);
    parse_key_value(s, "\"silence_rms\"", loaded.silence_rms);
    parse_key_value(s, "\"instrument\"", loaded.instrument);
    parse_key_value(s, "\"a4_hz\"", loaded.a4_hz);

    if (!validate_settings(loaded, nullptr)) return false;

    if (profile) {
        std::vector<float> stored;
        if (parse_float_array(s, "\"noise_profile\"", stored) &&
            static_cast<int>(stored.size()) == loaded.noise_fft_size / 2) {
            profile->swap(stored);
        } else {
            profile->clear();
        }
    }
    st = loaded;
    return true;
}

bool save_engine_settings(const char* path, const EngineSettings& st, const std::vector<float>* profile) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    std::fprintf(f,
        "{\n"
        "  \"sample_rate\": %.9g,\n"
        "  \"buffer_size\": %d,\n"
        "  \"cqt_window\": %d,\n"
        "  \"min_freq\": %.9g,\n"
        "  \"max_freq\": %.9g,\n"
        "  \"cents_per_state\": %.9g,\n"
        "  \"max_transition_cents\": %.9g,\n"
        "  \"fast_passage_cents\": %.9g,\n"
        "  \"reacquire_frames\": %d,\n"
        "  \"smoothing_alpha\": %.9g,\n"
        "  \"cqt_min_freq\": %.9g,\n"
        "  \"cqt_max_freq\": %.9g,\n"
        "  \"cqt_bins_per_octave\": %d,\n"
        "  \"noise_fft_size\": %d,\n"
        "  \"calibration_frames\": %d,\n"
        "  \"over_subtraction\": %.9g,\n"
        "  \"spectral_floor\": %.9g,\n"
        "  \"calibration_rms_gate\": %.9g,\n"
        "  \"noise_bypass\": %s,\n"
        "  \"input_gain\": %.9g,\n"
        "  \"highpass_hz\": %.9g,\n"
        "  \"silence_rms\": %.9g,\n"
        "  \"instrument\": \"%s\",\n"
        "  \"a4_hz\": %.9g",
        st.sample_rate,
        st.buffer_size,
        st.cqt_window,
        st.min_freq,
        st.max_freq,
        st.cents_per_state,
        st.max_transition_cents,
        st.fast_passage_cents,
        st.reacquire_frames,
        st.smoothing_alpha,
        st.cqt_min_freq,
        st.cqt_max_freq,
        st.cqt_bins_per_octave,
        st.noise_fft_size,
        st.calibration_frames,
        st.over_subtraction,
        st.spectral_floor,
        st.calibration_rms_gate,
        st.noise_bypass ? "true" : "false",
        st.input_gain,
        st.highpass_hz,
        st.silence_rms,
        st.instrument.c_str(),
        st.a4_hz);

    if (profile && !profile->empty()) {
        std::fprintf(f, ",\n  \"noise_profile\": [");
        for (size_t i = 0; i < profile->size(); ++i) {
            std::fprintf(f, "%s%.9g", i ? ", " : "", (*profile)[i]);
        }
        std::fprintf(f, "]");
    }
    std::fprintf(f, "\n}\n");
    const bool ok = std::ferror(f) == 0;
    return std::fclose(f) == 0 && ok;
}

} // namespace pitchtrack
