#include "pitchtrack/audio_input.hpp"

#include <alsa/asoundlib.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sched.h>
#include <sys/mman.h>
#include <thread>
#include <vector>

namespace pitchtrack {

namespace {

// Requested device first, then "default", then capture-capable plughw/hw
// devices reported by the hint API.
std::vector<std::string> capture_candidates(const std::string& requested) {
    std::vector<std::string> out;
    if (!requested.empty()) out.push_back(requested);
    if (requested != "default") out.push_back("default");

    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) != 0 || !hints) return out;

    std::vector<std::string> plughw;
    std::vector<std::string> hw;
    for (void** n = hints; *n != nullptr; ++n) {
        char* name = snd_device_name_get_hint(*n, "NAME");
        char* ioid = snd_device_name_get_hint(*n, "IOID");
        // No IOID means the device does both directions
        if (name && (!ioid || std::strcmp(ioid, "Input") == 0)) {
            const std::string s(name);
            if (s.rfind("plughw:", 0) == 0) plughw.push_back(s);
            else if (s.rfind("hw:", 0) == 0) hw.push_back(s);
        }
        std::free(name);
        std::free(ioid);
    }
    snd_device_name_free_hint(hints);

    out.insert(out.end(), plughw.begin(), plughw.end());
    out.insert(out.end(), hw.begin(), hw.end());
    return out;
}

} // namespace

class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const CaptureConfig& cfg) : config_(cfg) {}

    ~AlsaAudioInput() override { stop(); }

    bool start() override {
        if (running_.load()) return true;
        if (thread_.joinable()) {
            // Previous loop ended on a read error
            thread_.join();
            close_device();
        }
        if (!open_device() || !configure_hw()) {
            close_device();
            return false;
        }
        running_ = true;
        thread_ = std::thread(&AlsaAudioInput::capture_loop, this);
        if (config_.use_realtime_priority) raise_priority();
        return true;
    }

    void stop() override {
        running_ = false;
        if (thread_.joinable()) thread_.join();
        close_device();
    }

    bool is_running() const override { return running_.load(); }

    void set_block_callback(BlockCallback callback) override { callback_ = std::move(callback); }

    const CaptureConfig& get_config() const override { return config_; }

    DeadlineStats get_deadline_stats() const override {
        DeadlineStats s{};
        s.budget_ms = 1000.0f * config_.period_size / config_.sample_rate;
        s.max_callback_ms = max_callback_us_.load() / 1000.0f;
        const std::uint64_t blocks = blocks_.load();
        s.avg_callback_ms = blocks > 0 ? static_cast<float>(total_callback_us_.load()) / blocks / 1000.0f : 0.0f;
        s.overruns = overruns_.load();
        s.xruns = xruns_.load();
        s.blocks = blocks;
        return s;
    }

private:
    bool open_device() {
        const auto candidates = capture_candidates(config_.device_name);
        for (const auto& dev : candidates) {
            if (snd_pcm_open(&pcm_, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0) == 0) {
                if (dev != config_.device_name) {
                    std::cout << "[capture] using device " << dev << std::endl;
                    config_.device_name = dev;
                }
                return true;
            }
        }
        pcm_ = nullptr;
        std::cerr << "[capture] cannot open any capture device (tried " << candidates.size() << ")" << std::endl;
        return false;
    }

    bool check(int err, const char* what) {
        if (err >= 0) return true;
        std::cerr << "[capture] " << what << ": " << snd_strerror(err) << std::endl;
        return false;
    }

    bool configure_hw() {
        snd_pcm_hw_params_t* hw;
        snd_pcm_hw_params_alloca(&hw);

        if (!check(snd_pcm_hw_params_any(pcm_, hw), "cannot initialize hardware parameters")) return false;
        if (!check(snd_pcm_hw_params_set_access(pcm_, hw, SND_PCM_ACCESS_RW_INTERLEAVED), "cannot set access type"))
            return false;

        // Prefer float; 16-bit is converted on the capture thread
        format_ = SND_PCM_FORMAT_FLOAT_LE;
        if (snd_pcm_hw_params_set_format(pcm_, hw, format_) < 0) {
            format_ = SND_PCM_FORMAT_S16_LE;
            if (!check(snd_pcm_hw_params_set_format(pcm_, hw, format_), "cannot set sample format")) return false;
        }
        if (!check(snd_pcm_hw_params_set_channels(pcm_, hw, 1), "cannot set mono capture")) return false;

        unsigned int rate = config_.sample_rate;
        if (!check(snd_pcm_hw_params_set_rate_near(pcm_, hw, &rate, nullptr), "cannot set sample rate")) return false;

        snd_pcm_uframes_t period = config_.period_size;
        if (!check(snd_pcm_hw_params_set_period_size_near(pcm_, hw, &period, nullptr), "cannot set period size"))
            return false;

        unsigned int periods = config_.num_periods;
        if (!check(snd_pcm_hw_params_set_periods_near(pcm_, hw, &periods, nullptr), "cannot set period count"))
            return false;

        if (!check(snd_pcm_hw_params(pcm_, hw), "cannot apply hardware parameters")) return false;
        if (!check(snd_pcm_prepare(pcm_), "cannot prepare capture")) return false;

        snd_pcm_hw_params_get_period_size(hw, &period, nullptr);
        snd_pcm_hw_params_get_rate(hw, &rate, nullptr);
        if (rate != config_.sample_rate) std::cout << "[capture] sample rate adjusted to " << rate << " Hz" << std::endl;
        config_.sample_rate = rate;
        config_.period_size = static_cast<unsigned int>(period);

        float_buf_.assign(period, 0.0f);
        if (format_ == SND_PCM_FORMAT_S16_LE) s16_buf_.assign(period, 0);

        std::cout << "[capture] " << config_.device_name << ": " << rate << " Hz, " << period
                  << " frames/period (" << (1000.0f * period / rate) << " ms)" << std::endl;
        return true;
    }

    void close_device() {
        if (pcm_) {
            snd_pcm_close(pcm_);
            pcm_ = nullptr;
        }
    }

    void capture_loop() {
        if (config_.use_realtime_priority) mlockall(MCL_CURRENT | MCL_FUTURE);

        const auto epoch = std::chrono::steady_clock::now();
        const snd_pcm_uframes_t period = config_.period_size;
        const auto budget_us = static_cast<std::int64_t>(1e6 * period / config_.sample_rate);

        while (running_.load()) {
            const snd_pcm_sframes_t got = format_ == SND_PCM_FORMAT_FLOAT_LE
                                              ? snd_pcm_readi(pcm_, float_buf_.data(), period)
                                              : snd_pcm_readi(pcm_, s16_buf_.data(), period);
            if (got == -EPIPE) {
                ++xruns_;
                snd_pcm_prepare(pcm_);
                continue;
            }
            if (got == -EAGAIN) continue;
            if (got < 0) {
                std::cerr << "[capture] read error: " << snd_strerror(static_cast<int>(got)) << std::endl;
                break;
            }
            if (got == 0 || !callback_) continue;

            const int frames = static_cast<int>(got);
            if (format_ == SND_PCM_FORMAT_S16_LE) {
                constexpr float scale = 1.0f / 32768.0f;
                for (int i = 0; i < frames; ++i) float_buf_[i] = s16_buf_[i] * scale;
            }

            const auto t0 = std::chrono::steady_clock::now();
            SampleBlock block;
            block.samples = float_buf_.data();
            block.size = frames;
            block.sample_rate = static_cast<float>(config_.sample_rate);
            block.timestamp_ms = std::chrono::duration<double, std::milli>(t0 - epoch).count();
            callback_(block);

            const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                                std::chrono::steady_clock::now() - t0).count();
            if (us > budget_us) ++overruns_;
            std::int64_t prev_max = max_callback_us_.load();
            while (us > prev_max && !max_callback_us_.compare_exchange_weak(prev_max, us)) {}
            total_callback_us_ += us;
            ++blocks_;
        }

        if (config_.use_realtime_priority) munlockall();
        running_ = false;
    }

    void raise_priority() {
        sched_param param{};
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(thread_.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "[capture] warning: no realtime priority (check limits.conf)" << std::endl;
        }
    }

    CaptureConfig config_;
    snd_pcm_t* pcm_ = nullptr;
    snd_pcm_format_t format_ = SND_PCM_FORMAT_FLOAT_LE;
    std::atomic<bool> running_{false};
    std::thread thread_;
    BlockCallback callback_;

    std::vector<float> float_buf_;
    std::vector<int16_t> s16_buf_;

    std::atomic<std::int64_t> max_callback_us_{0};
    std::atomic<std::int64_t> total_callback_us_{0};
    std::atomic<std::uint64_t> blocks_{0};
    std::atomic<int> overruns_{0};
    std::atomic<int> xruns_{0};
};

std::unique_ptr<IAudioInput> create_audio_input(const CaptureConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace pitchtrack
