#pragma once

#include <array>
#include <vector>

#include "pitchtrack/types.hpp"

namespace pitchtrack::dsp {

struct CqtConfig {
    float sample_rate = 48000.0f;
    float min_freq = 27.5f;     // A0
    float max_freq = 4186.0f;   // C8
    int bins_per_octave = 48;   // quarter-semitone resolution
    int max_window = 16384;     // kernels longer than this are never built
};

// Constant-Q analyzer: one Hamming-windowed complex exponential kernel per
// log-spaced bin, correlated against the most recent samples.
class CqtAnalyzer {
public:
    explicit CqtAnalyzer(const CqtConfig& config = CqtConfig{});

    // Analyzes the tail of `buffer` and returns the number of peaks found.
    // Bins whose kernel does not fit in `length` samples read as zero.
    int analyze(const float* buffer, int length);

    const std::vector<float>& spectrum() const { return spectrum_; }
    const std::array<CqtPeak, kMaxCqtPeaks>& peaks() const { return peaks_; }
    int peak_count() const { return peak_count_; }
    CqtDiagnostics diagnostics() const;

    int num_bins() const { return num_bins_; }
    float quality_factor() const { return q_; }
    int kernel_length(int bin) const { return kernel_size_[bin]; }
    // Smallest buffer every built kernel fits in
    int longest_kernel() const { return longest_kernel_; }

    float frequency_for_bin(float bin) const;
    float bin_for_frequency(float freq_hz) const;

    const CqtConfig& config() const { return config_; }

private:
    void find_peaks();
    float threshold() const;

    CqtConfig config_;
    int num_bins_ = 0;
    float q_ = 0.0f;
    int longest_kernel_ = 0;

    // Kernels packed back to back; offset_[k] < 0 marks a bin that was not built
    std::vector<float> kernel_re_;
    std::vector<float> kernel_im_;
    std::vector<int> kernel_offset_;
    std::vector<int> kernel_size_;

    std::vector<float> spectrum_;
    std::array<CqtPeak, kMaxCqtPeaks> peaks_{};
    int peak_count_ = 0;
};

} // namespace pitchtrack::dsp
