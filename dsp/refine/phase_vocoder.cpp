#include "phase_vocoder.hpp"

#include <algorithm>
#include <cmath>

#include "fft/peak_interp.hpp"

namespace pitchtrack::dsp {

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 6.28318530717958647692f;
}

PhaseVocoder::PhaseVocoder(const PhaseVocoderConfig& config, fft::WindowCache& windows)
    : config_(config),
      half_(config.fft_size / 2),
      bin_width_(config.sample_rate / static_cast<float>(config.fft_size)),
      plan_(config.fft_size),
      window_(windows.get(fft::WindowType::Hann, config.fft_size)),
      spectrum_(config.fft_size),
      magnitude_(config.fft_size / 2, 0.0f),
      phase_(config.fft_size / 2, 0.0f),
      prev_phase_(config.fft_size / 2, 0.0f) {}

float PhaseVocoder::wrap_phase(float phase) {
    phase = std::fmod(phase + kPi, kTwoPi);
    if (phase <= 0.0f) phase += kTwoPi;
    return phase - kPi;
}

std::optional<RefinedPitch> PhaseVocoder::refine(const float* frame, int length, float coarse_hz, int hop) {
    const int N = config_.fft_size;
    if (!frame || length < N || !(coarse_hz > 0.0f) || !std::isfinite(coarse_hz)) {
        return std::nullopt;
    }

    const float* x = frame + (length - N);
    for (int i = 0; i < N; ++i) spectrum_[i] = std::complex<float>(x[i] * window_[i], 0.0f);
    plan_.forward(spectrum_);
    for (int k = 0; k < half_; ++k) {
        magnitude_[k] = std::abs(spectrum_[k]);
        phase_[k] = std::arg(spectrum_[k]);
    }

    // Peak near the coarse estimate
    const int center = static_cast<int>(std::lround(coarse_hz / bin_width_));
    const int lo = std::max(1, center - config_.search_bins);
    const int hi = std::min(half_ - 2, center + config_.search_bins);
    if (lo > hi) return std::nullopt;

    int peak_bin = lo;
    float peak_mag = 0.0f;
    for (int k = lo; k <= hi; ++k) {
        if (magnitude_[k] > peak_mag) { peak_mag = magnitude_[k]; peak_bin = k; }
    }
    if (!(peak_mag > 0.0f)) return std::nullopt;

    const fft::ParabolicPeak p = fft::parabolic_peak(magnitude_.data(), half_, peak_bin);

    RefinedPitch out;
    out.bin = p.index;
    out.magnitude = peak_mag;
    out.frequency_hz = p.index * bin_width_;

    // Phase advance is ambiguous once the hop reaches the frame length
    if (has_prev_ && hop > 0 && hop < N) {
        const float expected = kTwoPi * static_cast<float>(peak_bin) * hop / N;
        const float residual = wrap_phase(phase_[peak_bin] - prev_phase_[peak_bin] - expected);
        const float deviation = residual * config_.sample_rate / (kTwoPi * hop);
        out.frequency_hz = peak_bin * bin_width_ + deviation;
        out.used_phase = true;

        if (prev_frequency_hz_ > 0.0f) {
            const float hop_seconds = hop / config_.sample_rate;
            out.phase_velocity_hz_per_s = (out.frequency_hz - prev_frequency_hz_) / hop_seconds;
        }
    }

    out.confidence = confidence_at(peak_bin, peak_mag);

    prev_phase_.swap(phase_);
    has_prev_ = true;
    prev_frequency_hz_ = out.frequency_hz;
    return out;
}

float PhaseVocoder::confidence_at(int peak_bin, float peak_mag) const {
    float sum = 0.0f;
    int count = 0;
    const int lo = std::max(0, peak_bin - config_.confidence_bins);
    const int hi = std::min(half_ - 1, peak_bin + config_.confidence_bins);
    for (int k = lo; k <= hi; ++k) {
        if (k == peak_bin) continue;
        sum += magnitude_[k];
        ++count;
    }
    const float mean = count > 0 ? sum / count : 0.0f;
    const float ratio = mean > 0.0f ? peak_mag / mean : 0.0f;
    return std::min(1.0f, ratio / 5.0f);
}

void PhaseVocoder::reset() {
    std::fill(prev_phase_.begin(), prev_phase_.end(), 0.0f);
    has_prev_ = false;
    prev_frequency_hz_ = 0.0f;
}

} // namespace pitchtrack::dsp
