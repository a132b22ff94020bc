#include "pitchtrack/pitch_engine.hpp"

#include <iostream>
#include <type_traits>

#include "pipeline.hpp"

namespace pitchtrack {

PitchEngine::PitchEngine(const EngineSettings& settings)
    : settings_(settings),
      commands_(kCommandQueueSize),
      retired_(kCommandQueueSize) {
    std::string error;
    if (!validate_settings(settings_, &error)) {
        std::cerr << "[engine] invalid settings (" << error << "), using defaults" << std::endl;
        settings_ = EngineSettings{};
    }
    pipeline_ = std::make_unique<detail::Pipeline>(settings_);
    dispatcher_.set_a4(settings_.a4_hz);
}

PitchEngine::~PitchEngine() {
    EngineCommand cmd;
    while (commands_.pop(cmd)) dispose(cmd);
    collect_retired();
}

bool PitchEngine::configure(const EngineSettingsUpdate& update, std::string* error) {
    collect_retired();

    EngineSettings next = settings_;
    apply_update(next, update);

    std::string reason;
    if (!validate_settings(next, &reason)) {
        std::cerr << "[engine] configuration rejected: " << reason << std::endl;
        if (error) *error = reason;
        return false;
    }
    if (update.noise_profile && static_cast<int>(update.noise_profile->size()) != next.noise_fft_size / 2) {
        reason = "noise_profile length must be noise_fft_size / 2";
        std::cerr << "[engine] configuration rejected: " << reason << std::endl;
        if (error) *error = reason;
        return false;
    }

    EngineCommand cmd;
    if (needs_rebuild(settings_, next)) {
        auto fresh = std::make_unique<detail::Pipeline>(next);
        if (update.noise_profile) {
            std::vector<float> profile = *update.noise_profile;
            if (!fresh->load_noise_profile(profile)) {
                std::cerr << "[engine] noise profile not loaded into rebuilt pipeline" << std::endl;
            }
        }
        cmd = SwapPipeline{fresh.get()};
        if (!send(cmd)) {
            if (error) *error = "command queue full";
            return false;
        }
        fresh.release();
    } else {
        ApplyTunables apply;
        apply.values = detail::make_tunables(next);
        std::unique_ptr<std::vector<float>> profile;
        if (update.noise_profile) {
            profile = std::make_unique<std::vector<float>>(*update.noise_profile);
            apply.noise_profile = profile.get();
        }
        if (!send(apply)) {
            if (error) *error = "command queue full";
            return false;
        }
        profile.release();
    }

    settings_ = next;
    return true;
}

bool PitchEngine::start_calibration() { return send(StartCalibration{}); }

bool PitchEngine::finish_calibration() { return send(FinishCalibration{}); }

bool PitchEngine::reset() { return send(ResetPipeline{}); }

bool PitchEngine::set_noise_bypass(bool bypassed) {
    if (!send(SetNoiseBypass{bypassed})) return false;
    settings_.noise_bypass = bypassed;
    return true;
}

bool PitchEngine::send(const EngineCommand& command) {
    if (commands_.push(command)) return true;
    std::cerr << "[engine] command queue full, command dropped" << std::endl;
    return false;
}

FrameDispatcher::Token PitchEngine::subscribe(FrameDispatcher::Callback callback) {
    return dispatcher_.subscribe(std::move(callback));
}

bool PitchEngine::unsubscribe(FrameDispatcher::Token token) {
    return dispatcher_.unsubscribe(token);
}

namespace {
// Takes back ownership of whatever a retired entry points to
void free_retired(const Retired& item) {
    if (auto* p = std::get_if<detail::Pipeline*>(&item)) {
        std::unique_ptr<detail::Pipeline> owned(*p);
    } else if (auto* v = std::get_if<std::vector<float>*>(&item)) {
        std::unique_ptr<std::vector<float>> owned(*v);
    }
}
}

void PitchEngine::collect_retired() {
    Retired item;
    while (retired_.pop(item)) free_retired(item);
}

void PitchEngine::retire(const Retired& item) {
    if (retired_.push(item)) return;
    // Control thread is not collecting; free here rather than leak
    free_retired(item);
}

void PitchEngine::dispose(const EngineCommand& command) {
    if (auto* swap = std::get_if<SwapPipeline>(&command)) free_retired(Retired{swap->pipeline});
    else if (auto* apply = std::get_if<ApplyTunables>(&command)) free_retired(Retired{apply->noise_profile});
}

void PitchEngine::drain_commands() {
    EngineCommand cmd;
    while (commands_.pop(cmd)) {
        std::visit([this](auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, ApplyTunables>) {
                pipeline_->apply(c.values, dispatcher_);
                if (c.noise_profile) {
                    if (!pipeline_->load_noise_profile(*c.noise_profile)) {
                        std::cerr << "[engine] noise profile size mismatch, ignored" << std::endl;
                    }
                    retire(Retired{c.noise_profile});
                }
            } else if constexpr (std::is_same_v<T, SwapPipeline>) {
                c.pipeline->take_over(*pipeline_, dispatcher_);
                dispatcher_.set_a4(c.pipeline->tunables().a4_hz);
                retire(Retired{pipeline_.release()});
                pipeline_.reset(c.pipeline);
            } else if constexpr (std::is_same_v<T, StartCalibration>) {
                pipeline_->start_calibration();
            } else if constexpr (std::is_same_v<T, FinishCalibration>) {
                pipeline_->finish_calibration(dispatcher_);
            } else if constexpr (std::is_same_v<T, ResetPipeline>) {
                pipeline_->reset();
            } else if constexpr (std::is_same_v<T, SetNoiseBypass>) {
                pipeline_->set_noise_bypass(c.bypassed);
            }
        }, cmd);
    }
}

void PitchEngine::submit(const SampleBlock& block) {
    drain_commands();
    if (pipeline_->process(block, dispatcher_)) {
        ++blocks_processed_;
    } else {
        ++blocks_rejected_;
    }
}

} // namespace pitchtrack
