#pragma once

#include <optional>
#include <vector>

#include "pitchtrack/types.hpp"

namespace pitchtrack::dsp {

struct ViterbiConfig {
    float min_freq = 50.0f;
    float max_freq = 2000.0f;
    float cents_per_state = 10.0f;

    float max_transition_cents = 100.0f;   // per frame; beyond this a jump is impossible
    float transition_cost_factor = 0.1f;
    float fast_passage_cents = 50.0f;      // cheap region of the transition cost
    float fast_passage_penalty = 0.5f;

    float smoothing_alpha = 0.7f;

    // Reseed when a confident observation stays outside the search window
    int reacquire_frames = 5;
    float reacquire_confidence = 0.8f;
};

// Online Viterbi tracker over a cents-spaced frequency grid. Probabilities are
// kept in the log domain; only a window around the last decoded state is
// evaluated each frame.
class ViterbiDecoder {
public:
    struct Stats {
        int num_states = 0;
        int total_cents = 0;
        int frame_count = 0;
        int last_state = -1;
        float last_frequency_hz = 0.0f;
        float smoothed_frequency_hz = 0.0f;
        bool reacquired = false;   // last frame reseeded the trajectory
    };

    explicit ViterbiDecoder(const ViterbiConfig& config = ViterbiConfig{});

    // Returns the smoothed frequency. Invalid observations (freq <= 0 or
    // confidence < 0.1) leave the decoder untouched and return the held
    // value, which is empty until the first valid observation.
    std::optional<float> process(float observed_hz, float confidence,
                                 const PitchEstimate* candidates = nullptr, int candidate_count = 0);

    void reset();
    void set_smoothing_alpha(float alpha) { config_.smoothing_alpha = alpha; }

    int freq_to_state(float freq_hz) const;
    float state_to_freq(int state) const;
    // Fractional grid position of freq_hz, not clamped
    float exact_state(float freq_hz) const;

    bool initialized() const { return initialized_; }
    int num_states() const { return num_states_; }
    int max_state_step() const { return max_diff_; }
    Stats stats() const;
    const ViterbiConfig& config() const { return config_; }

    static constexpr float kMinConfidence = 0.1f;

private:
    void build_transition_table();
    void seed(float freq_hz, float confidence);
    void compute_observation(float observed_hz, float confidence,
                             const PitchEstimate* candidates, int candidate_count);
    void step();
    int best_state() const;
    void update_smoothed(float freq_hz);

    ViterbiConfig config_;
    int total_cents_ = 0;
    int num_states_ = 0;
    int max_diff_ = 0;

    std::vector<double> transition_cost_;   // indexed by d + max_diff_
    std::vector<float> state_freq_;
    std::vector<double> observation_;
    std::vector<double> prev_log_prob_;
    std::vector<double> curr_log_prob_;
    std::vector<int> back_pointer_;

    bool initialized_ = false;
    int frame_count_ = 0;
    int last_state_ = -1;
    float last_freq_ = 0.0f;
    bool has_smoothed_ = false;
    float smoothed_ = 0.0f;
    int off_track_frames_ = 0;
    bool reacquired_ = false;
};

} // namespace pitchtrack::dsp
