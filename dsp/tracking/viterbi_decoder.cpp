#include "viterbi_decoder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pitchtrack::dsp {

namespace {
constexpr double kNegInf = -std::numeric_limits<double>::infinity();
constexpr double kEpsilon = 1e-10;
constexpr double kSeedSigma = 5.0;          // states
constexpr double kCandidateSigma = 3.0;     // states
constexpr double kCandidateWeight = 0.3;
constexpr int kCandidateRadius = 10;
constexpr int kWindowMargin = 5;
constexpr int kBestStateRadius = 20;
constexpr float kLargeJumpCents = 50.0f;
constexpr float kLargeJumpAlpha = 0.3f;

double gaussian(double diff, double sigma) {
    return std::exp(-diff * diff / (2.0 * sigma * sigma));
}
}

ViterbiDecoder::ViterbiDecoder(const ViterbiConfig& config) : config_(config) {
    total_cents_ = static_cast<int>(std::lround(1200.0 * std::log2(config_.max_freq / config_.min_freq)));
    // One extra state so max_freq itself sits on the grid
    num_states_ = static_cast<int>(std::ceil(total_cents_ / config_.cents_per_state)) + 1;

    state_freq_.resize(num_states_);
    for (int i = 0; i < num_states_; ++i) {
        state_freq_[i] = static_cast<float>(config_.min_freq * std::pow(2.0, i * config_.cents_per_state / 1200.0));
    }

    observation_.assign(num_states_, 0.0);
    prev_log_prob_.assign(num_states_, kNegInf);
    curr_log_prob_.assign(num_states_, kNegInf);
    back_pointer_.assign(num_states_, 0);

    build_transition_table();
}

void ViterbiDecoder::build_transition_table() {
    max_diff_ = std::max(1, static_cast<int>(std::ceil(config_.max_transition_cents / config_.cents_per_state)));
    transition_cost_.assign(2 * max_diff_ + 1, 0.0);

    const double factor = config_.transition_cost_factor;
    const double fast = config_.fast_passage_cents;
    for (int d = -max_diff_; d <= max_diff_; ++d) {
        const double cents = std::abs(d * static_cast<double>(config_.cents_per_state));
        double cost;
        if (cents <= fast) {
            cost = cents * factor * 0.01;
        } else if (cents <= config_.max_transition_cents) {
            cost = fast * factor * 0.01 + (cents - fast) * config_.fast_passage_penalty * 0.1;
        } else {
            cost = 1e6;
        }
        transition_cost_[d + max_diff_] = cost;
    }
}

float ViterbiDecoder::exact_state(float freq_hz) const {
    return static_cast<float>(1200.0 * std::log2(freq_hz / config_.min_freq) / config_.cents_per_state);
}

int ViterbiDecoder::freq_to_state(float freq_hz) const {
    if (!(freq_hz > config_.min_freq)) return 0;
    const int s = static_cast<int>(std::lround(exact_state(freq_hz)));
    return std::clamp(s, 0, num_states_ - 1);
}

float ViterbiDecoder::state_to_freq(int state) const {
    return state_freq_[std::clamp(state, 0, num_states_ - 1)];
}

void ViterbiDecoder::seed(float freq_hz, float confidence) {
    const int center = freq_to_state(freq_hz);
    for (int i = 0; i < num_states_; ++i) {
        prev_log_prob_[i] = std::log(gaussian(i - center, kSeedSigma) * confidence + kEpsilon);
    }
    initialized_ = true;
    last_state_ = center;
    last_freq_ = freq_hz;
    smoothed_ = freq_hz;
    has_smoothed_ = true;
    off_track_frames_ = 0;
}

void ViterbiDecoder::compute_observation(float observed_hz, float confidence,
                                         const PitchEstimate* candidates, int candidate_count) {
    const int observed = freq_to_state(observed_hz);
    const double sigma = std::max(2.0, (1.0 - confidence) * 10.0);
    for (int i = 0; i < num_states_; ++i) {
        observation_[i] = gaussian(i - observed, sigma) * confidence;
    }

    for (int c = 0; candidates && c < candidate_count; ++c) {
        const PitchEstimate& cand = candidates[c];
        if (!(cand.frequency_hz > 0.0f) || cand.confidence <= kMinConfidence) continue;
        const int s = freq_to_state(cand.frequency_hz);
        const double weight = cand.confidence * kCandidateWeight;
        const int lo = std::max(0, s - kCandidateRadius);
        const int hi = std::min(num_states_ - 1, s + kCandidateRadius);
        for (int i = lo; i <= hi; ++i) {
            observation_[i] += gaussian(i - s, kCandidateSigma) * weight;
        }
    }

    double sum = 0.0;
    for (double p : observation_) sum += p;
    if (sum > 0.0) {
        for (double& p : observation_) p /= sum;
    }
}

void ViterbiDecoder::step() {
    const int radius = max_diff_ + kWindowMargin;
    const int lo = std::max(0, last_state_ - radius);
    const int hi = std::min(num_states_ - 1, last_state_ + radius);

    std::fill(curr_log_prob_.begin(), curr_log_prob_.end(), kNegInf);

    double window_max = kNegInf;
    for (int curr = lo; curr <= hi; ++curr) {
        double best = kNegInf;
        int best_prev = last_state_;

        const int p_lo = std::max(0, curr - max_diff_);
        const int p_hi = std::min(num_states_ - 1, curr + max_diff_);
        for (int prev = p_lo; prev <= p_hi; ++prev) {
            const double v = prev_log_prob_[prev] - transition_cost_[curr - prev + max_diff_];
            if (v > best) {
                best = v;
                best_prev = prev;
            }
        }

        curr_log_prob_[curr] = best + std::log(observation_[curr] + kEpsilon);
        back_pointer_[curr] = best_prev;
        window_max = std::max(window_max, curr_log_prob_[curr]);
    }

    // Keep magnitudes bounded over long runs
    if (std::isfinite(window_max)) {
        for (int i = lo; i <= hi; ++i) curr_log_prob_[i] -= window_max;
    }
}

int ViterbiDecoder::best_state() const {
    const int lo = std::max(0, last_state_ - kBestStateRadius);
    const int hi = std::min(num_states_ - 1, last_state_ + kBestStateRadius);
    int best = last_state_;
    double best_prob = kNegInf;
    for (int i = lo; i <= hi; ++i) {
        if (curr_log_prob_[i] > best_prob) {
            best_prob = curr_log_prob_[i];
            best = i;
        }
    }
    return best;
}

void ViterbiDecoder::update_smoothed(float freq_hz) {
    if (!has_smoothed_) {
        smoothed_ = freq_hz;
        has_smoothed_ = true;
        return;
    }
    const float cents = std::abs(1200.0f * std::log2(freq_hz / smoothed_));
    const float alpha = cents > kLargeJumpCents ? kLargeJumpAlpha : config_.smoothing_alpha;
    smoothed_ = smoothed_ * (1.0f - alpha) + freq_hz * alpha;
}

std::optional<float> ViterbiDecoder::process(float observed_hz, float confidence,
                                             const PitchEstimate* candidates, int candidate_count) {
    if (!(observed_hz > 0.0f) || !std::isfinite(observed_hz) || confidence < kMinConfidence) {
        if (!has_smoothed_) return std::nullopt;
        return smoothed_;
    }
    confidence = std::min(confidence, 1.0f);

    ++frame_count_;
    reacquired_ = false;

    if (!initialized_) {
        seed(observed_hz, confidence);
        return smoothed_;
    }

    // The windowed search cannot follow a jump past the best-state radius;
    // a run of confident observations out there restarts the trajectory.
    const int observed_state = freq_to_state(observed_hz);
    if (confidence >= config_.reacquire_confidence &&
        std::abs(observed_state - last_state_) > kBestStateRadius) {
        if (++off_track_frames_ >= config_.reacquire_frames) {
            seed(observed_hz, confidence);
            reacquired_ = true;
            return smoothed_;
        }
    } else {
        off_track_frames_ = 0;
    }

    compute_observation(observed_hz, confidence, candidates, candidate_count);
    step();

    const int best = best_state();
    // Near the observation the grid only quantizes; report the observation
    // itself so a steady tone is not snapped to the nearest state.
    const float decoded = std::abs(exact_state(observed_hz) - static_cast<float>(best)) <= 1.0f
                              ? observed_hz
                              : state_freq_[best];

    update_smoothed(decoded);
    last_state_ = best;
    last_freq_ = decoded;
    prev_log_prob_.swap(curr_log_prob_);
    return smoothed_;
}

void ViterbiDecoder::reset() {
    std::fill(prev_log_prob_.begin(), prev_log_prob_.end(), kNegInf);
    std::fill(curr_log_prob_.begin(), curr_log_prob_.end(), kNegInf);
    std::fill(back_pointer_.begin(), back_pointer_.end(), 0);
    std::fill(observation_.begin(), observation_.end(), 0.0);
    initialized_ = false;
    frame_count_ = 0;
    last_state_ = -1;
    last_freq_ = 0.0f;
    has_smoothed_ = false;
    smoothed_ = 0.0f;
    off_track_frames_ = 0;
    reacquired_ = false;
}

ViterbiDecoder::Stats ViterbiDecoder::stats() const {
    Stats s;
    s.num_states = num_states_;
    s.total_cents = total_cents_;
    s.frame_count = frame_count_;
    s.last_state = last_state_;
    s.last_frequency_hz = last_freq_;
    s.smoothed_frequency_hz = smoothed_;
    s.reacquired = reacquired_;
    return s;
}

} // namespace pitchtrack::dsp
