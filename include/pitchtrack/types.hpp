#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <variant>

namespace pitchtrack {

// One block of mono samples handed to the engine. The engine does not keep the
// pointer past the submit() call.
struct SampleBlock {
    const float* samples = nullptr;
    int size = 0;
    float sample_rate = 48000.0f;
    double timestamp_ms = 0.0;
};

struct PitchEstimate {
    float frequency_hz = 0.0f;
    float confidence = 0.0f;
};

enum class ObservationSource { Yin, Nsdf, Cqt, PhaseVocoder, Fused };

// A per-analyzer observation. An empty estimate means the analyzer had nothing
// usable for this frame.
struct PitchObservation {
    std::optional<PitchEstimate> estimate;
    ObservationSource source = ObservationSource::Fused;

    bool valid() const { return estimate.has_value(); }
};

struct CqtPeak {
    float bin = 0.0f;          // fractional CQT bin
    float frequency_hz = 0.0f;
    float magnitude = 0.0f;
};

constexpr int kMaxCqtPeaks = 10;

struct CqtDiagnostics {
    std::array<CqtPeak, kMaxCqtPeaks> peaks{};
    int peak_count = 0;
};

struct FusionDiagnostics {
    ObservationSource source = ObservationSource::Fused;
    int candidates = 0;             // usable candidates this frame
    int agreeing = 0;               // merged into the coarse estimate
    bool octave_corrected = false;
};

struct RefinerDiagnostics {
    float frequency_hz = 0.0f;
    float confidence = 0.0f;
    float bin = 0.0f;          // parabolic FFT bin
    float magnitude = 0.0f;
    bool used_phase = false;   // false on the first frame (parabolic only)
    bool applied = false;      // replaced the coarse estimate
};

struct InharmonicityDiagnostics {
    float stiffness_b = 0.0f;
    float offset_cents = 0.0f;      // applied (confidence scaled)
    float raw_offset_cents = 0.0f;
};

struct DecoderDiagnostics {
    int state = -1;
    int frame_count = 0;
    float state_frequency_hz = 0.0f;
    bool reacquired = false;
};

struct VibratoState {
    bool detected = false;
    float rate_hz = 0.0f;
    float depth_cents = 0.0f;
};

// Raw per-block result assembled by the engine. Layers that did not run are
// left empty.
struct PitchResult {
    std::optional<float> frequency_hz;
    float confidence = 0.0f;
    float rms = 0.0f;
    double timestamp_ms = 0.0;
    float phase_velocity_hz_per_s = 0.0f;
    VibratoState vibrato;
    std::optional<CqtDiagnostics> cqt;
    std::optional<PitchEstimate> yin;
    std::optional<PitchEstimate> nsdf;
    std::optional<FusionDiagnostics> fusion;
    std::optional<RefinerDiagnostics> refiner;
    std::optional<InharmonicityDiagnostics> inharmonicity;
    std::optional<DecoderDiagnostics> decoder;
};

// Fused output record. Immutable once built by the dispatcher.
struct UnifiedPitchFrame {
    std::optional<float> frequency_hz;
    float confidence = 0.0f;
    float rms = 0.0f;
    double timestamp_ms = 0.0;

    const char* note = nullptr;         // "C", "C#", ... (static storage)
    std::optional<int> octave;
    std::optional<int> cents;           // -50..+50
    std::optional<float> precise_cents; // 0.1 cent resolution

    float phase_velocity_hz_per_s = 0.0f;
    float inharmonicity_offset_cents = 0.0f;
    VibratoState vibrato;

    std::optional<CqtDiagnostics> cqt;
    std::optional<PitchEstimate> yin;
    std::optional<PitchEstimate> nsdf;
    std::optional<FusionDiagnostics> fusion;
    std::optional<RefinerDiagnostics> refiner;
    std::optional<InharmonicityDiagnostics> inharmonicity;
    std::optional<DecoderDiagnostics> decoder;
};

enum class CalibrationPhase { Calibrating, Complete, Failed };

struct CalibrationStatus {
    CalibrationPhase phase = CalibrationPhase::Calibrating;
    float progress = 0.0f;            // 0..1
    int frames = 0;                   // frames accumulated so far
    const float* profile = nullptr;   // valid for the duration of the callback
    int profile_size = 0;
    const char* reason = nullptr;     // set when phase == Failed
};

using PitchEvent = std::variant<UnifiedPitchFrame, CalibrationStatus>;

} // namespace pitchtrack
