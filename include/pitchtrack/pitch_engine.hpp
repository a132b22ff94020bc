#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "pitchtrack/engine_commands.hpp"
#include "pitchtrack/engine_settings.hpp"
#include "pitchtrack/frame_dispatcher.hpp"
#include "pitchtrack/ring_buffer.hpp"
#include "pitchtrack/types.hpp"

namespace pitchtrack {

// Real-time pitch tracking engine.
//
// Two threads talk to it:
//  - the control thread calls configure(), the calibration controls,
//    subscribe()/unsubscribe() and collect_retired();
//  - the processing thread calls submit() for every block.
// Control calls never touch the running pipeline. They queue commands that
// submit() applies before the next block; structural changes build a fresh
// pipeline here and hand it over whole. Subscription changes must not overlap
// a submit() call.
class PitchEngine {
public:
    explicit PitchEngine(const EngineSettings& settings = EngineSettings{});
    ~PitchEngine();

    PitchEngine(const PitchEngine&) = delete;
    PitchEngine& operator=(const PitchEngine&) = delete;

    // Control thread ------------------------------------------------------

    // Validates the merged settings; on the first bad field nothing changes
    // and false is returned with the reason.
    bool configure(const EngineSettingsUpdate& update, std::string* error = nullptr);

    // These return false only when the command queue is full.
    bool start_calibration();
    bool finish_calibration();
    bool reset();
    bool set_noise_bypass(bool bypassed);

    // Frees pipelines and profiles released by the processing thread.
    void collect_retired();

    // Settings as last accepted by configure()
    const EngineSettings& settings() const { return settings_; }

    FrameDispatcher::Token subscribe(FrameDispatcher::Callback callback);
    bool unsubscribe(FrameDispatcher::Token token);

    // Processing thread ---------------------------------------------------

    void submit(const SampleBlock& block);

    // Most recent frame; read from the processing thread or while idle.
    const std::optional<UnifiedPitchFrame>& last_frame() const { return dispatcher_.last_frame(); }
    const FrameDispatcher& dispatcher() const { return dispatcher_; }

    std::uint64_t blocks_processed() const { return blocks_processed_; }
    std::uint64_t blocks_rejected() const { return blocks_rejected_; }

    static constexpr std::size_t kCommandQueueSize = 64;

private:
    bool send(const EngineCommand& command);
    void drain_commands();
    void retire(const Retired& item);
    void dispose(const EngineCommand& command);

    EngineSettings settings_;
    FrameDispatcher dispatcher_;
    std::unique_ptr<detail::Pipeline> pipeline_;
    RingBuffer<EngineCommand> commands_;
    RingBuffer<Retired> retired_;

    std::uint64_t blocks_processed_ = 0;
    std::uint64_t blocks_rejected_ = 0;
};

} // namespace pitchtrack
