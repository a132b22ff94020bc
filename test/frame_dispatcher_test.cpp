#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "pitchtrack/frame_dispatcher.hpp"

using namespace pitchtrack;

namespace {
PitchResult result_at(float freq_hz, float confidence = 0.9f) {
    PitchResult r;
    r.frequency_hz = freq_hz;
    r.confidence = confidence;
    r.rms = 0.1f;
    r.timestamp_ms = 12.5;
    return r;
}

const UnifiedPitchFrame* as_frame(const PitchEvent& e) { return std::get_if<UnifiedPitchFrame>(&e); }
}

TEST_CASE("note naming against A4", "[dispatcher]") {
    auto a4 = FrameDispatcher::note_info(440.0f, 440.0f);
    CHECK(std::string(a4.note) == "A");
    CHECK(a4.octave == 4);
    CHECK(a4.cents == 0);
    CHECK(a4.precise_cents == Approx(0.0f).margin(1e-4));

    auto c4 = FrameDispatcher::note_info(261.63f, 440.0f);
    CHECK(std::string(c4.note) == "C");
    CHECK(c4.octave == 4);
    CHECK(c4.cents == 0);

    auto b3 = FrameDispatcher::note_info(246.94f, 440.0f);
    CHECK(std::string(b3.note) == "B");
    CHECK(b3.octave == 3);

    auto a0 = FrameDispatcher::note_info(27.5f, 440.0f);
    CHECK(std::string(a0.note) == "A");
    CHECK(a0.octave == 0);

    auto c8 = FrameDispatcher::note_info(4186.01f, 440.0f);
    CHECK(std::string(c8.note) == "C");
    CHECK(c8.octave == 8);

    CHECK(std::string(FrameDispatcher::note_info(466.16f, 440.0f).note) == "A#");
}

TEST_CASE("cents are signed and rounded", "[dispatcher]") {
    auto sharp = FrameDispatcher::note_info(445.0f, 440.0f);
    CHECK(std::string(sharp.note) == "A");
    CHECK(sharp.cents == 20);
    CHECK(sharp.precise_cents == Approx(19.6f).margin(1e-3));

    auto flat = FrameDispatcher::note_info(430.0f, 440.0f);
    CHECK(std::string(flat.note) == "A");
    CHECK(flat.cents == -40);
    CHECK(flat.precise_cents == Approx(-39.8f).margin(1e-3));

    auto shifted = FrameDispatcher::note_info(442.0f, 442.0f);
    CHECK(std::string(shifted.note) == "A");
    CHECK(shifted.cents == 0);
}

TEST_CASE("frames carry note fields only when a frequency is known", "[dispatcher]") {
    FrameDispatcher d;
    const auto& frame = d.dispatch(result_at(440.0f));
    REQUIRE(frame.frequency_hz);
    CHECK(std::string(frame.note) == "A");
    CHECK(frame.octave == 4);
    CHECK(frame.cents == 0);
    CHECK(frame.confidence == 0.9f);
    CHECK(frame.timestamp_ms == 12.5);

    PitchResult silent;
    silent.confidence = 0.0f;
    const auto& empty = d.dispatch(silent);
    CHECK_FALSE(empty.frequency_hz);
    CHECK(empty.note == nullptr);
    CHECK_FALSE(empty.octave);
    CHECK_FALSE(empty.cents);
    CHECK_FALSE(empty.precise_cents);

    REQUIRE(d.last_frame());
    CHECK_FALSE(d.last_frame()->frequency_hz);
}

TEST_CASE("diagnostic fields pass through", "[dispatcher]") {
    FrameDispatcher d;
    PitchResult r = result_at(220.0f);
    r.phase_velocity_hz_per_s = 3.0f;
    auto no_refiner = d.dispatch(r);
    CHECK(no_refiner.phase_velocity_hz_per_s == 0.0f);
    CHECK_FALSE(no_refiner.refiner);

    r.refiner = RefinerDiagnostics{};
    r.refiner->applied = true;
    r.inharmonicity = InharmonicityDiagnostics{0.0004f, 0.3f, 0.6f};
    r.decoder = DecoderDiagnostics{100, 7, 220.0f, false};
    r.nsdf = PitchEstimate{220.5f, 0.97f};
    r.fusion = FusionDiagnostics{ObservationSource::Fused, 3, 2, true};
    auto full = d.dispatch(r);
    REQUIRE(full.nsdf);
    CHECK(full.nsdf->frequency_hz == 220.5f);
    REQUIRE(full.fusion);
    CHECK(full.fusion->agreeing == 2);
    CHECK(full.fusion->octave_corrected);
    CHECK(full.phase_velocity_hz_per_s == 3.0f);
    CHECK(full.inharmonicity_offset_cents == 0.3f);
    REQUIRE(full.decoder);
    CHECK(full.decoder->frame_count == 7);
}

TEST_CASE("subscribers run in registration order", "[dispatcher]") {
    FrameDispatcher d;
    std::vector<int> order;
    d.subscribe([&](const PitchEvent&) { order.push_back(1); });
    d.subscribe([&](const PitchEvent&) { order.push_back(2); });
    d.subscribe([&](const PitchEvent&) { order.push_back(3); });
    CHECK(d.subscriber_count() == 3);

    d.dispatch(result_at(440.0f));
    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("a throwing subscriber does not stop the others", "[dispatcher]") {
    FrameDispatcher d;
    int delivered = 0;
    d.subscribe([](const PitchEvent&) { throw std::runtime_error("boom"); });
    d.subscribe([](const PitchEvent&) { throw 42; });
    d.subscribe([&](const PitchEvent& e) { if (as_frame(e)) ++delivered; });

    d.dispatch(result_at(440.0f));
    d.dispatch(result_at(441.0f));
    CHECK(delivered == 2);
    CHECK(d.subscriber_fault_count() == 4);
    REQUIRE(d.last_frame());
    CHECK(*d.last_frame()->frequency_hz == 441.0f);
}

TEST_CASE("unsubscribing during delivery", "[dispatcher]") {
    FrameDispatcher d;
    int self_calls = 0;
    int later_calls = 0;
    FrameDispatcher::Token self = 0;
    FrameDispatcher::Token later = 0;

    self = d.subscribe([&](const PitchEvent&) {
        ++self_calls;
        d.unsubscribe(self);
        d.unsubscribe(later);
    });
    later = d.subscribe([&](const PitchEvent&) { ++later_calls; });

    d.dispatch(result_at(440.0f));
    d.dispatch(result_at(440.0f));
    CHECK(self_calls == 1);
    CHECK(later_calls == 0);
    CHECK(d.subscriber_count() == 0);
    CHECK_FALSE(d.unsubscribe(self));
}

TEST_CASE("subscribing during delivery takes effect on the next event", "[dispatcher]") {
    FrameDispatcher d;
    int added_calls = 0;
    bool added = false;
    d.subscribe([&](const PitchEvent&) {
        if (added) return;
        added = true;
        d.subscribe([&](const PitchEvent&) { ++added_calls; });
    });

    d.dispatch(result_at(440.0f));
    CHECK(added_calls == 0);
    CHECK(d.subscriber_count() == 2);
    d.dispatch(result_at(440.0f));
    CHECK(added_calls == 1);
}

TEST_CASE("a subscriber can publish from its callback", "[dispatcher]") {
    FrameDispatcher d;
    int relay_calls = 0;
    FrameDispatcher::Token relay = 0;
    std::vector<std::string> seen;

    relay = d.subscribe([&](const PitchEvent& e) {
        ++relay_calls;
        if (std::holds_alternative<UnifiedPitchFrame>(e)) {
            CalibrationStatus st;
            st.phase = CalibrationPhase::Failed;
            st.reason = "relayed";
            d.publish_status(st);
        } else {
            d.unsubscribe(relay);
        }
    });
    d.subscribe([&](const PitchEvent& e) {
        seen.push_back(std::holds_alternative<UnifiedPitchFrame>(e) ? "frame" : "status");
    });

    d.dispatch(result_at(440.0f));
    CHECK(relay_calls == 2);
    CHECK(seen == std::vector<std::string>{"status", "frame"});
    CHECK(d.subscriber_count() == 1);

    d.dispatch(result_at(440.0f));
    CHECK(relay_calls == 2);
    CHECK(seen.size() == 3);
}

TEST_CASE("calibration status is delivered as its own event", "[dispatcher]") {
    FrameDispatcher d;
    std::vector<CalibrationPhase> phases;
    d.subscribe([&](const PitchEvent& e) {
        if (const auto* s = std::get_if<CalibrationStatus>(&e)) phases.push_back(s->phase);
    });

    CalibrationStatus st;
    st.phase = CalibrationPhase::Calibrating;
    st.progress = 0.5f;
    d.publish_status(st);
    st.phase = CalibrationPhase::Complete;
    d.publish_status(st);

    CHECK(phases == std::vector<CalibrationPhase>{CalibrationPhase::Calibrating, CalibrationPhase::Complete});
    CHECK_FALSE(d.last_frame());
}

TEST_CASE("unknown tokens are rejected", "[dispatcher]") {
    FrameDispatcher d;
    CHECK_FALSE(d.unsubscribe(99));
    auto t = d.subscribe([](const PitchEvent&) {});
    CHECK(d.unsubscribe(t));
    CHECK_FALSE(d.unsubscribe(t));
}
