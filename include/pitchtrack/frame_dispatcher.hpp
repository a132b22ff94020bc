#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "pitchtrack/types.hpp"

namespace pitchtrack {

struct NoteInfo {
    const char* note = nullptr;
    int octave = 0;
    int cents = 0;
    float precise_cents = 0.0f;   // 0.1 cent resolution
};

// Builds UnifiedPitchFrame records and fans events out to subscribers, in
// registration order and synchronously. Owned by one engine; not thread safe:
// subscribe/unsubscribe must not run concurrently with dispatch. Callbacks may
// subscribe, unsubscribe or dispatch again; nested events reach the subscribers
// active at that moment.
class FrameDispatcher {
public:
    using Callback = std::function<void(const PitchEvent&)>;
    using Token = std::uint64_t;

    explicit FrameDispatcher(float a4_hz = 440.0f);

    Token subscribe(Callback callback);
    bool unsubscribe(Token token);

    // Builds the frame, stores it as the latest, delivers it.
    const UnifiedPitchFrame& dispatch(const PitchResult& result);
    void publish_status(const CalibrationStatus& status);

    const std::optional<UnifiedPitchFrame>& last_frame() const { return last_frame_; }

    void set_a4(float a4_hz) { a4_hz_ = a4_hz; }
    float a4() const { return a4_hz_; }

    std::size_t subscriber_count() const;
    std::uint64_t subscriber_fault_count() const { return fault_count_; }

    static NoteInfo note_info(float freq_hz, float a4_hz);

private:
    struct Subscriber {
        Token token;
        Callback callback;
        bool active;
    };

    void deliver(const PitchEvent& event);

    float a4_hz_;
    Token next_token_ = 1;
    std::vector<Subscriber> subscribers_;
    std::vector<Subscriber> pending_;   // added while delivering
    int delivering_ = 0;                // nesting depth of deliver()
    std::uint64_t fault_count_ = 0;
    std::optional<UnifiedPitchFrame> last_frame_;
};

} // namespace pitchtrack
