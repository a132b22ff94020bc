#pragma once

#include <array>
#include <optional>
#include <string>

namespace pitchtrack::dsp {

// Stiffness coefficient B for one register of an instrument. A band without a
// range (winds, voice) only carries B = 0.
struct StiffnessBand {
    float b = 0.0f;
    float low_hz = 0.0f;
    float high_hz = 0.0f;
    bool has_range = false;
};

struct InharmonicityModel {
    const char* name;
    std::array<StiffnessBand, 3> bands;  // low, mid, high
};

// Maps a measured (stretched) partial back to the fundamental using
// f_n = n * f0 * sqrt(1 + B * n^2).
class InharmonicityCorrector {
public:
    struct Correction {
        float frequency_hz = 0.0f;
        float offset_cents = 0.0f;       // after confidence scaling
        float raw_offset_cents = 0.0f;
        float stiffness_b = 0.0f;
    };

    InharmonicityCorrector();

    // Index into models(); empty for unknown names
    static std::optional<int> find_instrument(const std::string& name);
    static const InharmonicityModel* models();
    static int model_count();

    bool set_instrument(const std::string& name);
    void select(int index);
    const char* instrument() const { return models()[index_].name; }

    Correction correct(float measured_hz, float confidence) const;

    // Forward model: frequency of partial n above f0
    float calculate_harmonic(float f0_hz, int n) const;

    float stiffness_for(float freq_hz) const;

private:
    int index_ = 0;
};

} // namespace pitchtrack::dsp
