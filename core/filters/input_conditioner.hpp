#pragma once

namespace pitchtrack {

// Gain, DC blocker and a 2nd-order high-pass ahead of the analyzers.
// Coefficient changes are applied by the processing thread between blocks.
class InputConditioner {
public:
    struct Coefficients {
        float b0, b1, b2;  // Numerator coefficients
        float a1, a2;      // Denominator coefficients (a0 = 1.0)
    };

    InputConditioner();

    void configure(float sample_rate, float highpass_hz);

    // 0 disables the high-pass section
    void set_highpass(float cutoff_hz);
    void set_gain(float gain) { gain_ = gain; }

    float gain() const { return gain_; }
    float highpass_hz() const { return highpass_hz_; }
    const Coefficients& coefficients() const { return coeffs_; }

    // in and out may alias
    void process(const float* in, float* out, int n);

    void reset();

    // RBJ cookbook high-pass, Q = 0.707
    static Coefficients design_highpass(float sample_rate, float cutoff_hz);

private:
    struct BiquadState {
        float z1 = 0.0f;
        float z2 = 0.0f;
    };

    float sample_rate_ = 48000.0f;
    float highpass_hz_ = 50.0f;
    float gain_ = 1.0f;
    bool highpass_enabled_ = true;

    // DC blocker: y[n] = x[n] - x[n-1] + R * y[n-1]
    static constexpr float kDcPole = 0.995f;
    float dc_prev_in_ = 0.0f;
    float dc_prev_out_ = 0.0f;

    Coefficients coeffs_{};
    BiquadState state_{};
};

} // namespace pitchtrack
