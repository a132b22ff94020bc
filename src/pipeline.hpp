#pragma once

#include <array>
#include <optional>
#include <vector>

#include "dsp/analysis/inharmonicity_corrector.hpp"
#include "dsp/analysis/nsdf_estimator.hpp"
#include "dsp/analysis/vibrato_detector.hpp"
#include "dsp/analysis/yin_estimator.hpp"
#include "dsp/cqt/cqt_analyzer.hpp"
#include "dsp/noise/noise_suppressor.hpp"
#include "dsp/refine/phase_vocoder.hpp"
#include "dsp/tracking/candidate_fusion.hpp"
#include "dsp/tracking/kalman_filter.hpp"
#include "dsp/tracking/viterbi_decoder.hpp"
#include "fft/window.hpp"
#include "filters/input_conditioner.hpp"
#include "pitchtrack/engine_commands.hpp"
#include "pitchtrack/engine_settings.hpp"
#include "pitchtrack/frame_dispatcher.hpp"

namespace pitchtrack::detail {

// Processing-thread parameters carried by `settings`
Tunables make_tunables(const EngineSettings& settings);

// Everything the processing thread touches for one block. Built on the
// control thread with all buffers sized; process() does not allocate.
class Pipeline {
public:
    explicit Pipeline(const EngineSettings& settings);

    void apply(const Tunables& tunables, FrameDispatcher& dispatcher);
    // Carries the noise profile (or a running calibration) and recent samples
    // over from the pipeline being replaced. A calibration that cannot be
    // carried is reported as failed.
    void take_over(Pipeline& previous, FrameDispatcher& dispatcher);

    void start_calibration() { suppressor_.start_calibration(); }
    void finish_calibration(FrameDispatcher& dispatcher);
    void set_noise_bypass(bool bypassed);
    bool load_noise_profile(std::vector<float>& profile) { return suppressor_.swap_profile(profile); }
    void reset();

    // Always dispatches one frame. Returns false when the block was unusable
    // (empty, or recorded at another sample rate) and the held value was sent.
    bool process(const SampleBlock& block, FrameDispatcher& dispatcher);

    const EngineSettings& settings() const { return settings_; }
    const Tunables& tunables() const { return tunables_; }
    int history_size() const { return static_cast<int>(history_.size()); }

private:
    double condition(const float* in, int n, FrameDispatcher& dispatcher);
    void append_history(const float* x, int n);
    // RMS of the newest buffer_size conditioned samples
    float window_rms() const;
    void analyze(PitchResult& result, int block_size);
    // Post-smooths a decoded frequency; an empty input repeats the last output
    std::optional<float> smooth(std::optional<float> decoded, float confidence);

    EngineSettings settings_;
    Tunables tunables_;

    fft::WindowCache windows_;
    InputConditioner conditioner_;
    dsp::NoiseSuppressor suppressor_;
    dsp::CqtAnalyzer cqt_;
    dsp::YinEstimator yin_;
    dsp::NsdfEstimator nsdf_;
    dsp::PhaseVocoder vocoder_;
    dsp::InharmonicityCorrector corrector_;
    dsp::ViterbiDecoder decoder_;
    dsp::KalmanFilter kalman_;
    dsp::VibratoDetector vibrato_;
    dsp::FusionWeights fusion_;

    std::vector<float> scratch_;
    std::vector<float> history_;
    int samples_since_refine_ = 0;
    std::optional<float> output_hz_;
    std::array<PitchEstimate, kMaxCqtPeaks + 2> secondary_{};
};

} // namespace pitchtrack::detail
