#include "cqt_analyzer.hpp"

#include <algorithm>
#include <cmath>

#include "fft/peak_interp.hpp"
#include "fft/window.hpp"

namespace pitchtrack::dsp {

CqtAnalyzer::CqtAnalyzer(const CqtConfig& config) : config_(config) {
    const int octaves = static_cast<int>(std::ceil(std::log2(config_.max_freq / config_.min_freq)));
    num_bins_ = std::max(1, octaves) * config_.bins_per_octave;

    // Q = f_k / delta_f = 1 / (2^(1/B) - 1)
    q_ = static_cast<float>(1.0 / (std::pow(2.0, 1.0 / config_.bins_per_octave) - 1.0));

    kernel_offset_.assign(num_bins_, -1);
    kernel_size_.assign(num_bins_, 0);
    spectrum_.assign(num_bins_, 0.0f);

    std::size_t total = 0;
    for (int k = 0; k < num_bins_; ++k) {
        const double freq = frequency_for_bin(static_cast<float>(k));
        kernel_size_[k] = static_cast<int>(std::ceil(q_ * config_.sample_rate / freq));
        if (kernel_size_[k] <= config_.max_window) total += kernel_size_[k];
    }
    kernel_re_.resize(total);
    kernel_im_.resize(total);

    const double two_pi = 6.28318530717958647692;
    int offset = 0;
    for (int k = 0; k < num_bins_; ++k) {
        const int n = kernel_size_[k];
        if (n > config_.max_window) continue;

        const double freq = frequency_for_bin(static_cast<float>(k));
        const std::vector<float> window = fft::make_window(fft::WindowType::Hamming, n);
        const double norm = 1.0 / n;
        for (int i = 0; i < n; ++i) {
            const double phase = -two_pi * freq * i / config_.sample_rate;
            kernel_re_[offset + i] = static_cast<float>(window[i] * std::cos(phase) * norm);
            kernel_im_[offset + i] = static_cast<float>(window[i] * std::sin(phase) * norm);
        }
        kernel_offset_[k] = offset;
        offset += n;
        longest_kernel_ = std::max(longest_kernel_, n);
    }
}

int CqtAnalyzer::analyze(const float* buffer, int length) {
    peak_count_ = 0;
    if (!buffer || length <= 0) {
        std::fill(spectrum_.begin(), spectrum_.end(), 0.0f);
        return 0;
    }

    for (int k = 0; k < num_bins_; ++k) {
        const int n = kernel_size_[k];
        if (kernel_offset_[k] < 0 || n > length) {
            spectrum_[k] = 0.0f;
            continue;
        }

        // Most recent n samples
        const float* x = buffer + (length - n);
        const float* re = kernel_re_.data() + kernel_offset_[k];
        const float* im = kernel_im_.data() + kernel_offset_[k];
        float real_sum = 0.0f;
        float imag_sum = 0.0f;
        for (int i = 0; i < n; ++i) {
            real_sum += x[i] * re[i];
            imag_sum += x[i] * im[i];
        }
        spectrum_[k] = std::sqrt(real_sum * real_sum + imag_sum * imag_sum);
    }

    find_peaks();
    return peak_count_;
}

float CqtAnalyzer::threshold() const {
    float sum = 0.0f;
    float mx = 0.0f;
    for (float v : spectrum_) {
        sum += v;
        if (v > mx) mx = v;
    }
    const float mean = sum / static_cast<float>(spectrum_.size());
    return std::max(mean * 3.0f, mx * 0.1f);
}

void CqtAnalyzer::find_peaks() {
    const float thr = threshold();
    const float* s = spectrum_.data();

    for (int i = 2; i < num_bins_ - 2; ++i) {
        const float v = s[i];
        if (!(v > s[i - 1] && v > s[i + 1] && v > s[i - 2] && v > s[i + 2] && v > thr)) continue;

        const fft::ParabolicPeak p = fft::parabolic_peak(s[i - 1], v, s[i + 1], i);
        CqtPeak peak{p.index, frequency_for_bin(p.index), p.value};

        // Keep the top kMaxCqtPeaks sorted by magnitude, descending
        int pos = peak_count_;
        while (pos > 0 && peaks_[pos - 1].magnitude < peak.magnitude) --pos;
        if (pos >= kMaxCqtPeaks) continue;
        const int last = std::min(peak_count_, kMaxCqtPeaks - 1);
        for (int j = last; j > pos; --j) peaks_[j] = peaks_[j - 1];
        peaks_[pos] = peak;
        if (peak_count_ < kMaxCqtPeaks) ++peak_count_;
    }
}

CqtDiagnostics CqtAnalyzer::diagnostics() const {
    CqtDiagnostics d;
    d.peaks = peaks_;
    d.peak_count = peak_count_;
    return d;
}

float CqtAnalyzer::frequency_for_bin(float bin) const {
    return config_.min_freq * std::pow(2.0f, bin / static_cast<float>(config_.bins_per_octave));
}

float CqtAnalyzer::bin_for_frequency(float freq_hz) const {
    return static_cast<float>(config_.bins_per_octave) * std::log2(freq_hz / config_.min_freq);
}

} // namespace pitchtrack::dsp
