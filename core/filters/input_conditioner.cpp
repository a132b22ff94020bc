#include "input_conditioner.hpp"

#include <cmath>

namespace pitchtrack {

InputConditioner::InputConditioner() {
    coeffs_ = design_highpass(sample_rate_, highpass_hz_);
    reset();
}

void InputConditioner::configure(float sample_rate, float highpass_hz) {
    sample_rate_ = sample_rate > 0.0f ? sample_rate : 48000.0f;
    set_highpass(highpass_hz);
    reset();
}

void InputConditioner::set_highpass(float cutoff_hz) {
    highpass_hz_ = cutoff_hz;
    highpass_enabled_ = cutoff_hz > 0.0f && cutoff_hz < 0.5f * sample_rate_;
    if (highpass_enabled_) {
        coeffs_ = design_highpass(sample_rate_, cutoff_hz);
    }
    // Keep filter state so a cutoff change does not click
}

InputConditioner::Coefficients InputConditioner::design_highpass(float sample_rate, float cutoff_hz) {
    const double w0 = 2.0 * M_PI * cutoff_hz / sample_rate;
    const double cos_w0 = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * 0.707);

    const double b0 = (1.0 + cos_w0) / 2.0;
    const double b1 = -(1.0 + cos_w0);
    const double b2 = (1.0 + cos_w0) / 2.0;
    const double a0 = 1.0 + alpha;
    const double a1 = -2.0 * cos_w0;
    const double a2 = 1.0 - alpha;

    return {static_cast<float>(b0 / a0), static_cast<float>(b1 / a0), static_cast<float>(b2 / a0),
            static_cast<float>(a1 / a0), static_cast<float>(a2 / a0)};
}

void InputConditioner::process(const float* in, float* out, int n) {
    for (int i = 0; i < n; ++i) {
        float x = in[i] * gain_;

        // DC removal
        const float dc = x - dc_prev_in_ + kDcPole * dc_prev_out_;
        dc_prev_in_ = x;
        dc_prev_out_ = dc;
        x = dc;

        if (highpass_enabled_) {
            // Direct Form II
            const float w = x - coeffs_.a1 * state_.z1 - coeffs_.a2 * state_.z2;
            x = coeffs_.b0 * w + coeffs_.b1 * state_.z1 + coeffs_.b2 * state_.z2;
            state_.z2 = state_.z1;
            state_.z1 = w;
        }

        out[i] = x;
    }
}

void InputConditioner::reset() {
    state_ = BiquadState{};
    dc_prev_in_ = 0.0f;
    dc_prev_out_ = 0.0f;
}

} // namespace pitchtrack
