#include "candidate_fusion.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace pitchtrack::dsp {

namespace {

struct Candidate {
    PitchEstimate estimate;
    float weight;
    ObservationSource source;

    float strength() const { return estimate.confidence * weight; }
};

bool in_octave_window(float ratio, const FusionWeights& w) {
    return ratio >= w.octave_ratio_min && ratio <= w.octave_ratio_max;
}

// Finds a pair an octave apart, keeps the octave the spectrum supports and
// moves the candidates of the other one. Returns true when anything moved.
bool correct_octaves(Candidate* list, int n, const FusionCandidates& c, const FusionWeights& w) {
    float low = 0.0f;
    float high = 0.0f;
    for (int i = 0; i < n && low == 0.0f; ++i) {
        for (int j = 0; j < n; ++j) {
            if (in_octave_window(list[j].estimate.frequency_hz / list[i].estimate.frequency_hz, w)) {
                low = list[i].estimate.frequency_hz;
                high = list[j].estimate.frequency_hz;
                break;
            }
        }
    }
    if (low == 0.0f) return false;

    const bool keep_low = harmonic_score(low, c.peaks, c.peak_count, w) >=
                          harmonic_score(high, c.peaks, c.peak_count, w);
    bool moved = false;
    for (int i = 0; i < n; ++i) {
        float& f = list[i].estimate.frequency_hz;
        if (keep_low && in_octave_window(f / low, w)) {
            f *= 0.5f;
            moved = true;
        } else if (!keep_low && in_octave_window(high / f, w)) {
            f *= 2.0f;
            moved = true;
        }
    }
    return moved;
}

}

float cqt_confidence(float magnitude, const FusionWeights& w) {
    if (!(magnitude > 0.0f) || !(w.cqt_full_scale > 0.0f)) return 0.0f;
    return std::min(1.0f, magnitude / w.cqt_full_scale);
}

float harmonic_score(float f0_hz, const CqtPeak* peaks, int count, const FusionWeights& w) {
    if (!(f0_hz > 0.0f) || !peaks || count <= 0 || !(w.harmonic_tolerance > 0.0f)) return 0.0f;

    float max_magnitude = 0.0f;
    for (int i = 0; i < count; ++i) max_magnitude = std::max(max_magnitude, peaks[i].magnitude);
    if (!(max_magnitude > 0.0f)) return 0.0f;

    float score = 0.0f;
    for (int h = 1; h <= w.harmonics; ++h) {
        const float expected = f0_hz * h;
        const CqtPeak* match = nullptr;
        float match_error = w.harmonic_tolerance;
        for (int i = 0; i < count; ++i) {
            const float error = std::abs(peaks[i].frequency_hz - expected) / expected;
            if (error < match_error) {
                match_error = error;
                match = &peaks[i];
            }
        }
        if (!match) continue;
        score += (1.0f / h) * (match->magnitude / max_magnitude) * (1.0f - match_error / w.harmonic_tolerance);
    }
    return score;
}

FusionResult fuse_candidates(const FusionCandidates& c, const FusionWeights& w) {
    std::array<Candidate, 3> list{};
    int n = 0;
    auto add = [&](const std::optional<PitchEstimate>& e, float weight, ObservationSource source) {
        if (!e || !(e->frequency_hz > 0.0f) || !std::isfinite(e->frequency_hz)) return;
        if (e->confidence <= w.min_confidence) return;
        list[n++] = Candidate{*e, weight, source};
    };
    add(c.yin, w.yin, ObservationSource::Yin);
    add(c.nsdf, w.nsdf, ObservationSource::Nsdf);
    add(c.cqt, w.cqt, ObservationSource::Cqt);

    FusionResult out;
    out.candidates = n;
    if (n == 0) return out;

    if (n > 1 && c.peaks && c.peak_count > 0) out.octave_corrected = correct_octaves(list.data(), n, c, w);

    int best = 0;
    for (int i = 1; i < n; ++i) {
        if (list[i].strength() > list[best].strength()) best = i;
    }
    const float anchor = list[best].estimate.frequency_hz;

    double weighted = 0.0;
    double total = 0.0;
    float confidence = 0.0f;
    for (int i = 0; i < n; ++i) {
        const float cents = std::abs(1200.0f * std::log2(list[i].estimate.frequency_hz / anchor));
        if (cents > w.agreement_cents) continue;
        weighted += static_cast<double>(list[i].estimate.frequency_hz) * list[i].strength();
        total += list[i].strength();
        confidence = std::max(confidence, list[i].estimate.confidence);
        ++out.agreeing;
    }

    if (out.agreeing == 1) {
        out.observation.estimate = list[best].estimate;
        out.observation.source = list[best].source;
        return out;
    }
    PitchEstimate e;
    e.frequency_hz = static_cast<float>(weighted / total);
    e.confidence = confidence;
    out.observation.estimate = e;
    out.observation.source = ObservationSource::Fused;
    return out;
}

} // namespace pitchtrack::dsp
