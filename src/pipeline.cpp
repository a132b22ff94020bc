#include "pipeline.hpp"

#include <algorithm>
#include <cmath>

namespace pitchtrack::detail {

namespace {
constexpr float kRefineMinConfidence = 0.6f;   // coarse confidence needed to run the refiner
constexpr float kRefineAcceptConfidence = 0.5f;
constexpr float kRefineMaxCents = 50.0f;
// Above this the decoded value is mostly kept and the filter only nudges it
constexpr float kKalmanBlendConfidence = 0.7f;
constexpr float kKalmanBlendWeight = 0.1f;
// A block this far below the analysis window is a release tail
constexpr float kReleaseRatio = 0.05f;

dsp::NoiseSuppressorConfig noise_config(const EngineSettings& s) {
    dsp::NoiseSuppressorConfig c;
    c.fft_size = s.noise_fft_size;
    c.calibration_frames = s.calibration_frames;
    c.over_subtraction = s.over_subtraction;
    c.spectral_floor = s.spectral_floor;
    c.calibration_rms_gate = s.calibration_rms_gate;
    return c;
}

dsp::CqtConfig cqt_config(const EngineSettings& s) {
    dsp::CqtConfig c;
    c.sample_rate = s.sample_rate;
    c.min_freq = s.cqt_min_freq;
    c.max_freq = s.cqt_max_freq;
    c.bins_per_octave = s.cqt_bins_per_octave;
    c.max_window = std::max(s.buffer_size, s.cqt_window);
    return c;
}

dsp::YinConfig yin_config(const EngineSettings& s) {
    dsp::YinConfig c;
    c.sample_rate = s.sample_rate;
    c.buffer_size = s.buffer_size;
    c.min_freq = s.min_freq;
    c.max_freq = s.max_freq;
    return c;
}

dsp::NsdfConfig nsdf_config(const EngineSettings& s) {
    dsp::NsdfConfig c;
    c.sample_rate = s.sample_rate;
    c.buffer_size = s.buffer_size;
    c.min_freq = s.min_freq;
    c.max_freq = s.max_freq;
    return c;
}

dsp::PhaseVocoderConfig vocoder_config(const EngineSettings& s) {
    dsp::PhaseVocoderConfig c;
    c.sample_rate = s.sample_rate;
    c.fft_size = s.buffer_size;
    return c;
}

dsp::ViterbiConfig viterbi_config(const EngineSettings& s) {
    dsp::ViterbiConfig c;
    c.min_freq = s.min_freq;
    c.max_freq = s.max_freq;
    c.cents_per_state = s.cents_per_state;
    c.max_transition_cents = s.max_transition_cents;
    c.fast_passage_cents = s.fast_passage_cents;
    c.reacquire_frames = s.reacquire_frames;
    c.smoothing_alpha = s.smoothing_alpha;
    return c;
}
}

Tunables make_tunables(const EngineSettings& s) {
    Tunables t;
    t.input_gain = s.input_gain;
    t.highpass_hz = s.highpass_hz;
    t.over_subtraction = s.over_subtraction;
    t.spectral_floor = s.spectral_floor;
    t.calibration_rms_gate = s.calibration_rms_gate;
    t.calibration_frames = s.calibration_frames;
    t.noise_bypass = s.noise_bypass;
    t.instrument_index = dsp::InharmonicityCorrector::find_instrument(s.instrument).value_or(0);
    t.a4_hz = s.a4_hz;
    t.smoothing_alpha = s.smoothing_alpha;
    t.silence_rms = s.silence_rms;
    return t;
}

Pipeline::Pipeline(const EngineSettings& settings)
    : settings_(settings),
      tunables_(make_tunables(settings)),
      suppressor_(noise_config(settings)),
      cqt_(cqt_config(settings)),
      yin_(yin_config(settings)),
      nsdf_(nsdf_config(settings)),
      vocoder_(vocoder_config(settings), windows_),
      decoder_(viterbi_config(settings)),
      scratch_(settings.buffer_size, 0.0f),
      history_(std::max(settings.buffer_size, settings.cqt_window), 0.0f) {
    conditioner_.configure(settings.sample_rate, settings.highpass_hz);
    conditioner_.set_gain(settings.input_gain);
    suppressor_.set_bypassed(settings.noise_bypass);
    corrector_.select(tunables_.instrument_index);
}

void Pipeline::apply(const Tunables& t, FrameDispatcher& dispatcher) {
    conditioner_.set_gain(t.input_gain);
    if (t.highpass_hz != tunables_.highpass_hz) conditioner_.set_highpass(t.highpass_hz);
    suppressor_.set_parameters(t.over_subtraction, t.spectral_floor);
    suppressor_.set_calibration_gate(t.calibration_rms_gate);
    suppressor_.set_calibration_frames(t.calibration_frames);
    suppressor_.set_bypassed(t.noise_bypass);
    corrector_.select(t.instrument_index);
    decoder_.set_smoothing_alpha(t.smoothing_alpha);
    dispatcher.set_a4(t.a4_hz);
    tunables_ = t;
}

void Pipeline::take_over(Pipeline& previous, FrameDispatcher& dispatcher) {
    // A profile replayed with the rebuild wins over the old one
    const bool was_calibrating = previous.suppressor_.state() == dsp::CalibrationState::Calibrating;
    bool adopted = false;
    if (suppressor_.state() != dsp::CalibrationState::Calibrated) {
        adopted = suppressor_.adopt_calibration(previous.suppressor_);
    }
    if (was_calibrating && !adopted) {
        CalibrationStatus st;
        st.phase = CalibrationPhase::Failed;
        st.frames = previous.suppressor_.frames_collected();
        st.reason = "pipeline rebuilt";
        dispatcher.publish_status(st);
    }

    // Recent samples stay valid only at the same rate
    if (previous.settings_.sample_rate == settings_.sample_rate) {
        const std::size_t n = std::min(history_.size(), previous.history_.size());
        std::copy(previous.history_.end() - n, previous.history_.end(), history_.end() - n);
    }
}

void Pipeline::finish_calibration(FrameDispatcher& dispatcher) {
    if (auto status = suppressor_.finish_calibration()) dispatcher.publish_status(*status);
}

void Pipeline::set_noise_bypass(bool bypassed) {
    suppressor_.set_bypassed(bypassed);
    tunables_.noise_bypass = bypassed;
}

void Pipeline::reset() {
    conditioner_.reset();
    suppressor_.reset();
    vocoder_.reset();
    decoder_.reset();
    kalman_.reset();
    output_hz_.reset();
    vibrato_.reset();
    std::fill(history_.begin(), history_.end(), 0.0f);
    samples_since_refine_ = 0;
}

double Pipeline::condition(const float* in, int n, FrameDispatcher& dispatcher) {
    double sum_sq = 0.0;
    const int chunk = static_cast<int>(scratch_.size());
    for (int offset = 0; offset < n; offset += chunk) {
        const int len = std::min(chunk, n - offset);
        float* buf = scratch_.data();
        conditioner_.process(in + offset, buf, len);
        if (auto status = suppressor_.process(buf, buf, len)) dispatcher.publish_status(*status);
        for (int i = 0; i < len; ++i) sum_sq += static_cast<double>(buf[i]) * buf[i];
        append_history(buf, len);
    }
    return sum_sq;
}

float Pipeline::window_rms() const {
    const int n = std::min(settings_.buffer_size, static_cast<int>(history_.size()));
    double sum_sq = 0.0;
    for (auto it = history_.end() - n; it != history_.end(); ++it) sum_sq += static_cast<double>(*it) * *it;
    return static_cast<float>(std::sqrt(sum_sq / n));
}

void Pipeline::append_history(const float* x, int n) {
    const int size = static_cast<int>(history_.size());
    if (n >= size) {
        std::copy(x + (n - size), x + n, history_.begin());
        return;
    }
    std::copy(history_.begin() + n, history_.end(), history_.begin());
    std::copy(x, x + n, history_.end() - n);
}

bool Pipeline::process(const SampleBlock& block, FrameDispatcher& dispatcher) {
    PitchResult result;
    result.timestamp_ms = block.timestamp_ms;

    if (!block.samples || block.size <= 0 || block.sample_rate != settings_.sample_rate) {
        result.frequency_hz = smooth(decoder_.process(0.0f, 0.0f), 0.0f);
        result.vibrato = vibrato_.state();
        dispatcher.dispatch(result);
        return false;
    }

    const double sum_sq = condition(block.samples, block.size, dispatcher);
    result.rms = static_cast<float>(std::sqrt(sum_sq / block.size));

    if (result.rms < tunables_.silence_rms || result.rms < kReleaseRatio * window_rms()) {
        samples_since_refine_ += block.size;
        vibrato_.reset();
        result.frequency_hz = smooth(decoder_.process(0.0f, 0.0f), 0.0f);
        dispatcher.dispatch(result);
        return true;
    }

    analyze(result, block.size);
    dispatcher.dispatch(result);
    return true;
}

void Pipeline::analyze(PitchResult& result, int block_size) {
    samples_since_refine_ += block_size;
    const float* h = history_.data();
    const int size = static_cast<int>(history_.size());

    std::optional<PitchEstimate> cqt_top;
    const int peaks = cqt_.analyze(h, size);
    result.cqt = cqt_.diagnostics();
    if (peaks > 0) {
        const CqtPeak& top = cqt_.peaks()[0];
        cqt_top = PitchEstimate{top.frequency_hz, dsp::cqt_confidence(top.magnitude, fusion_)};
    }
    result.yin = yin_.estimate(h, size);
    result.nsdf = nsdf_.estimate(h, size);

    dsp::FusionCandidates candidates;
    candidates.yin = result.yin;
    candidates.nsdf = result.nsdf;
    candidates.cqt = cqt_top;
    candidates.peaks = cqt_.peaks().data();
    candidates.peak_count = peaks;
    const dsp::FusionResult fused = dsp::fuse_candidates(candidates, fusion_);
    const PitchObservation& coarse = fused.observation;
    if (coarse.valid()) {
        result.fusion = FusionDiagnostics{coarse.source, fused.candidates, fused.agreeing, fused.octave_corrected};
    } else {
        result.frequency_hz = smooth(decoder_.process(0.0f, 0.0f), 0.0f);
        result.vibrato = vibrato_.state();
        return;
    }

    float freq = coarse.estimate->frequency_hz;
    const float confidence = coarse.estimate->confidence;

    if (confidence > kRefineMinConfidence) {
        if (auto refined = vocoder_.refine(h, size, freq, samples_since_refine_)) {
            samples_since_refine_ = 0;
            RefinerDiagnostics diag;
            diag.frequency_hz = refined->frequency_hz;
            diag.confidence = refined->confidence;
            diag.bin = refined->bin;
            diag.magnitude = refined->magnitude;
            diag.used_phase = refined->used_phase;

            if (refined->confidence > kRefineAcceptConfidence && refined->frequency_hz > 0.0f &&
                std::abs(1200.0f * std::log2(refined->frequency_hz / freq)) <= kRefineMaxCents) {
                freq = refined->frequency_hz;
                diag.applied = true;
                result.phase_velocity_hz_per_s = refined->phase_velocity_hz_per_s;
            }
            result.refiner = diag;
        }
    }

    const auto corrected = corrector_.correct(freq, confidence);
    result.inharmonicity = InharmonicityDiagnostics{corrected.stiffness_b, corrected.offset_cents,
                                                    corrected.raw_offset_cents};
    freq = corrected.frequency_hz;

    // Everything else seen this frame
    int count = 0;
    for (int i = 1; i < peaks; ++i) {
        const CqtPeak& p = cqt_.peaks()[i];
        secondary_[count++] = PitchEstimate{p.frequency_hz, dsp::cqt_confidence(p.magnitude, fusion_)};
    }
    if (result.yin) secondary_[count++] = *result.yin;
    if (result.nsdf) secondary_[count++] = *result.nsdf;

    result.frequency_hz = smooth(decoder_.process(freq, confidence, secondary_.data(), count), confidence);
    result.confidence = confidence;

    const auto stats = decoder_.stats();
    DecoderDiagnostics diag;
    diag.state = stats.last_state;
    diag.frame_count = stats.frame_count;
    diag.state_frequency_hz = decoder_.state_to_freq(stats.last_state);
    diag.reacquired = stats.reacquired;
    result.decoder = diag;

    if (result.frequency_hz) result.vibrato = vibrato_.push(*result.frequency_hz, result.timestamp_ms);
}

std::optional<float> Pipeline::smooth(std::optional<float> decoded, float confidence) {
    if (!decoded || confidence <= 0.0f) return output_hz_;

    const auto filtered = kalman_.filter(*decoded, confidence);
    if (!filtered) return output_hz_;
    if (confidence > kKalmanBlendConfidence) {
        output_hz_ = *decoded * (1.0f - kKalmanBlendWeight) + *filtered * kKalmanBlendWeight;
    } else {
        output_hz_ = *filtered;
    }
    return output_hz_;
}

} // namespace pitchtrack::detail
