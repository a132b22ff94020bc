#include "inharmonicity_corrector.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace pitchtrack::dsp {

namespace {

constexpr StiffnessBand band(float b, float lo, float hi) { return {b, lo, hi, true}; }
constexpr StiffnessBand none() { return {0.0f, 0.0f, 0.0f, false}; }

// First entry is the fallback instrument.
constexpr InharmonicityModel kModels[] = {
    {"default",         {none(), none(), none()}},
    // Piano: wound bass strings are stiffest, plain treble wire the least
    {"piano",           {band(0.0004f,   27.5f,  110.0f), band(0.00012f,  110.0f,  880.0f), band(0.00004f,  880.0f, 4200.0f)}},
    {"guitar",          {band(0.00012f,  82.0f,  165.0f), band(0.00008f,  165.0f,  660.0f), band(0.00003f,  660.0f, 1320.0f)}},
    {"electric_guitar", {band(0.00010f,  82.0f,  165.0f), band(0.00006f,  165.0f,  660.0f), band(0.00002f,  660.0f, 1320.0f)}},
    {"bass",            {band(0.00025f,  41.0f,   82.0f), band(0.00015f,   82.0f,  330.0f), band(0.00005f,  330.0f,  660.0f)}},
    {"violin",          {band(0.000015f, 196.0f, 440.0f), band(0.00001f,  440.0f, 1760.0f), band(0.000005f, 1760.0f, 3520.0f)}},
    {"cello",           {band(0.00006f,  65.0f,  220.0f), band(0.00003f,  220.0f,  880.0f), band(0.00001f,  880.0f, 1760.0f)}},
    {"viola",           {band(0.00003f,  130.0f, 440.0f), band(0.000015f, 440.0f, 1320.0f), band(0.000008f, 1320.0f, 2640.0f)}},
    {"contrabass",      {band(0.0003f,   41.0f,   98.0f), band(0.00015f,   98.0f,  294.0f), band(0.00005f,  294.0f,  587.0f)}},
    {"harp",            {band(0.00008f,  32.0f,  131.0f), band(0.00004f,  131.0f, 1047.0f), band(0.00002f, 1047.0f, 3136.0f)}},
    {"flute",           {none(), none(), none()}},
    {"clarinet",        {none(), none(), none()}},
    {"oboe",            {none(), none(), none()}},
    {"bassoon",         {none(), none(), none()}},
    {"trumpet",         {none(), none(), none()}},
    {"trombone",        {none(), none(), none()}},
    {"french_horn",     {none(), none(), none()}},
    {"tuba",            {none(), none(), none()}},
    {"saxophone",       {none(), none(), none()}},
    {"voice",           {none(), none(), none()}},
};

constexpr int kModelCount = static_cast<int>(sizeof(kModels) / sizeof(kModels[0]));

} // namespace

InharmonicityCorrector::InharmonicityCorrector() = default;

const InharmonicityModel* InharmonicityCorrector::models() { return kModels; }

int InharmonicityCorrector::model_count() { return kModelCount; }

std::optional<int> InharmonicityCorrector::find_instrument(const std::string& name) {
    for (int i = 0; i < kModelCount; ++i) {
        if (name == kModels[i].name) return i;
    }
    return std::nullopt;
}

bool InharmonicityCorrector::set_instrument(const std::string& name) {
    auto idx = find_instrument(name);
    if (!idx) return false;
    index_ = *idx;
    return true;
}

void InharmonicityCorrector::select(int index) {
    if (index >= 0 && index < kModelCount) index_ = index;
}

float InharmonicityCorrector::stiffness_for(float freq_hz) const {
    const auto& bands = kModels[index_].bands;
    const StiffnessBand& low = bands[0];
    const StiffnessBand& mid = bands[1];
    const StiffnessBand& high = bands[2];

    if (low.has_range && freq_hz >= low.low_hz && freq_hz < low.high_hz) return low.b;
    if (mid.has_range && freq_hz >= mid.low_hz && freq_hz < mid.high_hz) return mid.b;
    if (high.has_range && freq_hz >= high.low_hz && freq_hz <= high.high_hz) return high.b;

    // Outside every band: use the nearest end of the table
    if (low.has_range && freq_hz < low.low_hz) return low.b;
    return high.b;
}

InharmonicityCorrector::Correction InharmonicityCorrector::correct(float measured_hz, float confidence) const {
    Correction c;
    c.frequency_hz = measured_hz;
    if (!(measured_hz > 0.0f) || !std::isfinite(measured_hz)) return c;

    const float B = stiffness_for(measured_hz);
    c.stiffness_b = B;
    if (B == 0.0f) return c;

    // Measured first partial is f0 * sqrt(1 + B)
    const double factor = std::sqrt(1.0 + static_cast<double>(B));
    const double raw_cents = 1200.0 * std::log2(factor);
    const double scaled = raw_cents * std::clamp(static_cast<double>(confidence), 0.0, 1.0);

    c.raw_offset_cents = static_cast<float>(raw_cents);
    c.offset_cents = static_cast<float>(scaled);
    c.frequency_hz = static_cast<float>(measured_hz / std::pow(2.0, scaled / 1200.0));
    return c;
}

float InharmonicityCorrector::calculate_harmonic(float f0_hz, int n) const {
    const double B = stiffness_for(f0_hz);
    const double nn = static_cast<double>(n);
    return static_cast<float>(nn * f0_hz * std::sqrt(1.0 + B * nn * nn));
}

} // namespace pitchtrack::dsp
