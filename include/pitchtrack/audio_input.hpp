#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "pitchtrack/types.hpp"

namespace pitchtrack {

struct CaptureConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 48000;
    unsigned int period_size = 1024;   // frames per delivered block
    unsigned int num_periods = 4;
    bool use_realtime_priority = true;
};

// Capture backend feeding mono blocks to a callback on its own thread.
class IAudioInput {
public:
    using BlockCallback = std::function<void(const SampleBlock& block)>;

    virtual ~IAudioInput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    // Set before start()
    virtual void set_block_callback(BlockCallback callback) = 0;
    // Negotiated values once started
    virtual const CaptureConfig& get_config() const = 0;

    // Callback time against the period length
    struct DeadlineStats {
        float budget_ms;         // one period
        float max_callback_ms;
        float avg_callback_ms;
        int overruns;            // callbacks longer than the budget
        int xruns;
        std::uint64_t blocks;
    };
    virtual DeadlineStats get_deadline_stats() const = 0;
};

std::unique_ptr<IAudioInput> create_audio_input(const CaptureConfig& config);

} // namespace pitchtrack
