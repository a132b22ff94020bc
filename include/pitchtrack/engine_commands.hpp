#pragma once

#include <variant>
#include <vector>

namespace pitchtrack {

namespace detail { class Pipeline; }

// Parameters the processing thread can apply in place.
struct Tunables {
    float input_gain = 1.0f;
    float highpass_hz = 50.0f;
    float over_subtraction = 1.5f;
    float spectral_floor = 0.002f;
    float calibration_rms_gate = 0.01f;
    int calibration_frames = 30;
    bool noise_bypass = false;
    int instrument_index = 0;
    float a4_hz = 440.0f;
    float smoothing_alpha = 0.7f;
    float silence_rms = 0.003f;
};

// Ownership of every pointer moves to the processing thread with the command
// and comes back through the retire queue.
struct ApplyTunables {
    Tunables values;
    std::vector<float>* noise_profile = nullptr;   // optional replay
};
struct SwapPipeline { detail::Pipeline* pipeline = nullptr; };
struct StartCalibration {};
struct FinishCalibration {};
struct ResetPipeline {};
struct SetNoiseBypass { bool bypassed = false; };

using EngineCommand = std::variant<std::monostate, ApplyTunables, SwapPipeline, StartCalibration,
                                   FinishCalibration, ResetPipeline, SetNoiseBypass>;

// Storage handed back for destruction on the control thread.
using Retired = std::variant<std::monostate, detail::Pipeline*, std::vector<float>*>;

} // namespace pitchtrack
