#include "pitchtrack/frame_dispatcher.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace pitchtrack {

namespace {
const char* const kNoteNames[12] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

// Half-up rounding (-0.5 rounds to 0)
double round_half_up(double x) { return std::floor(x + 0.5); }
}

FrameDispatcher::FrameDispatcher(float a4_hz) : a4_hz_(a4_hz) {}

FrameDispatcher::Token FrameDispatcher::subscribe(Callback callback) {
    const Token token = next_token_++;
    if (delivering_ > 0) {
        pending_.push_back(Subscriber{token, std::move(callback), true});
    } else {
        subscribers_.push_back(Subscriber{token, std::move(callback), true});
    }
    return token;
}

bool FrameDispatcher::unsubscribe(Token token) {
    for (auto* list : {&subscribers_, &pending_}) {
        for (auto it = list->begin(); it != list->end(); ++it) {
            if (it->token != token || !it->active) continue;
            if (delivering_ > 0) {
                // The callback may be the one running; erase once delivery finishes
                it->active = false;
            } else {
                list->erase(it);
            }
            return true;
        }
    }
    return false;
}

std::size_t FrameDispatcher::subscriber_count() const {
    std::size_t n = 0;
    for (const auto& s : subscribers_) n += s.active ? 1 : 0;
    for (const auto& s : pending_) n += s.active ? 1 : 0;
    return n;
}

NoteInfo FrameDispatcher::note_info(float freq_hz, float a4_hz) {
    NoteInfo info;
    const double semitones = 12.0 * std::log2(static_cast<double>(freq_hz) / a4_hz);
    const int rounded = static_cast<int>(round_half_up(semitones));
    const double cents_raw = (semitones - rounded) * 100.0;

    const int note_index = ((rounded % 12) + 12 + 9) % 12;
    info.note = kNoteNames[note_index];
    info.octave = static_cast<int>(std::floor((rounded + 9) / 12.0)) + 4;
    info.cents = static_cast<int>(round_half_up(cents_raw));
    info.precise_cents = static_cast<float>(round_half_up(cents_raw * 10.0) / 10.0);
    return info;
}

const UnifiedPitchFrame& FrameDispatcher::dispatch(const PitchResult& result) {
    UnifiedPitchFrame frame;
    frame.confidence = result.confidence;
    frame.rms = result.rms;
    frame.timestamp_ms = result.timestamp_ms;
    frame.vibrato = result.vibrato;

    if (result.frequency_hz && *result.frequency_hz > 0.0f && std::isfinite(*result.frequency_hz)) {
        frame.frequency_hz = result.frequency_hz;
        const NoteInfo info = note_info(*result.frequency_hz, a4_hz_);
        frame.note = info.note;
        frame.octave = info.octave;
        frame.cents = info.cents;
        frame.precise_cents = info.precise_cents;
    }

    if (result.refiner) frame.phase_velocity_hz_per_s = result.phase_velocity_hz_per_s;
    if (result.inharmonicity) frame.inharmonicity_offset_cents = result.inharmonicity->offset_cents;

    frame.cqt = result.cqt;
    frame.yin = result.yin;
    frame.nsdf = result.nsdf;
    frame.fusion = result.fusion;
    frame.refiner = result.refiner;
    frame.inharmonicity = result.inharmonicity;
    frame.decoder = result.decoder;

    last_frame_ = frame;
    deliver(PitchEvent{*last_frame_});
    return *last_frame_;
}

void FrameDispatcher::publish_status(const CalibrationStatus& status) {
    deliver(PitchEvent{status});
}

void FrameDispatcher::deliver(const PitchEvent& event) {
    ++delivering_;
    const std::size_t count = subscribers_.size();
    for (std::size_t i = 0; i < count; ++i) {
        Subscriber& entry = subscribers_[i];
        if (!entry.active) continue;
        try {
            entry.callback(event);
        } catch (const std::exception& e) {
            ++fault_count_;
            std::cerr << "[dispatcher] subscriber " << entry.token << " threw: " << e.what() << std::endl;
        } catch (...) {
            ++fault_count_;
            std::cerr << "[dispatcher] subscriber " << entry.token << " threw a non-standard exception" << std::endl;
        }
    }
    // A subscriber may dispatch from its callback; the outermost delivery
    // owns the list
    if (--delivering_ > 0) return;

    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [](const Subscriber& s) { return !s.active; }),
                       subscribers_.end());
    if (!pending_.empty()) {
        for (auto& p : pending_) {
            if (p.active) subscribers_.push_back(std::move(p));
        }
        pending_.clear();
    }
}

} // namespace pitchtrack
