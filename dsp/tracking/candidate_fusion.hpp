#pragma once

#include <optional>

#include "pitchtrack/types.hpp"

namespace pitchtrack::dsp {

struct FusionWeights {
    float yin = 1.5f;
    float nsdf = 1.5f;
    float cqt = 0.8f;
    float min_confidence = 0.1f;
    float agreement_cents = 50.0f;
    float cqt_full_scale = 0.1f;   // CQT magnitude that maps to confidence 1

    // Octave check
    float octave_ratio_min = 1.9f;
    float octave_ratio_max = 2.1f;
    int harmonics = 8;
    float harmonic_tolerance = 0.05f;   // relative frequency error
};

// Candidates of one frame. Spectral peaks are optional; without them the
// octave check is skipped.
struct FusionCandidates {
    std::optional<PitchEstimate> yin;
    std::optional<PitchEstimate> nsdf;
    std::optional<PitchEstimate> cqt;
    const CqtPeak* peaks = nullptr;
    int peak_count = 0;
};

struct FusionResult {
    PitchObservation observation;
    int candidates = 0;              // candidates above min_confidence
    int agreeing = 0;                // candidates merged into the estimate
    bool octave_corrected = false;
};

// CQT peak magnitude as a [0, 1] confidence
float cqt_confidence(float magnitude, const FusionWeights& w = FusionWeights{});

// How well the spectral peaks fit a harmonic series on f0: sum over the first
// `harmonics` partials of (1/h) x relative magnitude x (1 - error / tolerance).
float harmonic_score(float f0_hz, const CqtPeak* peaks, int count, const FusionWeights& w = FusionWeights{});

// Coarse estimate for the frame.
//  1. Candidates below min_confidence are dropped.
//  2. When two candidates sit an octave apart and peaks are given, the octave
//     with the better harmonic score wins and the others are moved onto it.
//  3. The strongest candidate (confidence x weight) is averaged with every
//     candidate within agreement_cents of it, weighted by confidence x weight;
//     the confidence is the largest among them.
FusionResult fuse_candidates(const FusionCandidates& candidates, const FusionWeights& w = FusionWeights{});

} // namespace pitchtrack::dsp
