#include "audio_input.hpp"

#include <alsa/asoundlib.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sched.h>
#include <sys/mman.h>
#include <thread>
#include <vector>

namespace micviz {

class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const AudioConfig& cfg)
        : config(cfg), pcm_handle(nullptr), running(false), failed(false),
          min_latency_ms(1000.0f), max_latency_ms(0.0f), total_latency_ms(0.0f),
          latency_count(0), xrun_count(0), sample_format(SND_PCM_FORMAT_FLOAT_LE) {}

    ~AlsaAudioInput() override { close(); }

    bool open() override {
        if (running.load()) {
            return true;
        }
        error_text.clear();
        failed = false;
        if (!setup_alsa()) {
            return false;
        }
        running = true;
        capture_thread = std::thread(&AlsaAudioInput::capture_thread_func, this);
        if (config.use_realtime_priority) {
            set_realtime_priority();
        }
        return true;
    }

    void close() override {
        if (!running.load()) {
            return;
        }
        running = false;
        if (capture_thread.joinable()) {
            capture_thread.join();
        }
        cleanup_alsa();
        std::cout << "Capture device closed: " << config.device_name << std::endl;
    }

    bool is_open() const override { return running.load(); }
    bool stream_failed() const override { return failed.load(); }

    void set_process_callback(ProcessCallback callback) override { process_callback = callback; }

    const AudioConfig& get_config() const override { return config; }
    const std::string& last_error() const override { return error_text; }

    LatencyStats get_latency_stats() const override {
        LatencyStats stats{};
        stats.min_ms = min_latency_ms.load();
        stats.max_ms = max_latency_ms.load();
        int count = latency_count.load();
        stats.avg_ms = count > 0 ? total_latency_ms.load() / count : 0.0f;
        stats.xruns = xrun_count.load();
        return stats;
    }

private:
    AudioConfig config;
    snd_pcm_t* pcm_handle;
    std::atomic<bool> running;
    std::atomic<bool> failed;
    std::thread capture_thread;
    ProcessCallback process_callback;
    std::string error_text;

    mutable std::atomic<float> min_latency_ms;
    mutable std::atomic<float> max_latency_ms;
    mutable std::atomic<float> total_latency_ms;
    mutable std::atomic<int> latency_count;
    mutable std::atomic<int> xrun_count;

    snd_pcm_format_t sample_format;
    unsigned int channels = 1;

    bool fail(const char* what, int err) {
        error_text = std::string(what) + ": " + snd_strerror(err);
        std::cerr << error_text << std::endl;
        cleanup_alsa();
        return false;
    }

    bool setup_alsa() {
        int err = 0;
        std::vector<std::string> candidates;
        if (!config.device_name.empty()) candidates.push_back(config.device_name);
        if (config.device_name != "default") candidates.push_back("default");

        // Fall back to any capture-capable plughw/hw device the system reports
        void** hints = nullptr;
        if (snd_device_name_hint(-1, "pcm", &hints) == 0 && hints) {
            std::vector<std::string> plughw;
            std::vector<std::string> hw;
            for (void** n = hints; *n != nullptr; ++n) {
                char* name = snd_device_name_get_hint(*n, "NAME");
                char* ioid = snd_device_name_get_hint(*n, "IOID");
                if (name && (!ioid || std::strcmp(ioid, "Input") == 0)) {
                    std::string s(name);
                    if (s.rfind("plughw:", 0) == 0) plughw.push_back(s);
                    else if (s.rfind("hw:", 0) == 0) hw.push_back(s);
                }
                std::free(name);
                std::free(ioid);
            }
            for (auto& s : plughw) candidates.push_back(s);
            for (auto& s : hw) candidates.push_back(s);
            snd_device_name_free_hint(hints);
        }

        std::string opened_device;
        for (const auto& dev : candidates) {
            err = snd_pcm_open(&pcm_handle, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0);
            if (err == 0) { opened_device = dev; break; }
            pcm_handle = nullptr;
            // A permission problem will not go away by trying other devices
            if (err == -EACCES || err == -EPERM) break;
        }
        if (opened_device.empty()) {
            error_text = "Cannot open any audio capture device (last tried "
                       + (candidates.empty() ? std::string("<none>") : candidates.back())
                       + "): " + snd_strerror(err);
            std::cerr << error_text << std::endl;
            return false;
        }
        if (opened_device != config.device_name) {
            std::cout << "Using capture device: " << opened_device << std::endl;
            config.device_name = opened_device;
        }

        snd_pcm_hw_params_t* hw_params;
        snd_pcm_hw_params_alloca(&hw_params);

        err = snd_pcm_hw_params_any(pcm_handle, hw_params);
        if (err < 0) return fail("Cannot initialize hardware parameters", err);

        err = snd_pcm_hw_params_set_access(pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
        if (err < 0) return fail("Cannot set access type", err);

        sample_format = SND_PCM_FORMAT_FLOAT_LE;
        err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format);
        if (err < 0) {
            sample_format = SND_PCM_FORMAT_S16_LE;
            err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format);
            if (err < 0) return fail("Cannot set format", err);
        }

        // Prefer mono; hw: devices often only offer 2+ channels, which get downmixed
        channels = 1;
        err = snd_pcm_hw_params_set_channels_near(pcm_handle, hw_params, &channels);
        if (err < 0) return fail("Cannot set channels", err);
        if (channels != 1) {
            std::cout << "Device has no mono mode, downmixing " << channels << " channels" << std::endl;
        }

        unsigned int rate = config.sample_rate;
        err = snd_pcm_hw_params_set_rate_near(pcm_handle, hw_params, &rate, 0);
        if (err < 0) return fail("Cannot set sample rate", err);
        if (rate != config.sample_rate) {
            std::cout << "Sample rate adjusted to " << rate << " Hz" << std::endl;
        }

        snd_pcm_uframes_t period_size = config.period_size;
        err = snd_pcm_hw_params_set_period_size_near(pcm_handle, hw_params, &period_size, 0);
        if (err < 0) return fail("Cannot set period size", err);

        unsigned int periods = config.num_periods;
        err = snd_pcm_hw_params_set_periods_near(pcm_handle, hw_params, &periods, 0);
        if (err < 0) return fail("Cannot set periods", err);

        err = snd_pcm_hw_params(pcm_handle, hw_params);
        if (err < 0) return fail("Cannot set hardware parameters", err);

        err = snd_pcm_prepare(pcm_handle);
        if (err < 0) return fail("Cannot prepare audio interface", err);

        snd_pcm_hw_params_get_period_size(hw_params, &period_size, 0);
        snd_pcm_hw_params_get_rate(hw_params, &rate, 0);

        config.sample_rate = rate;
        config.period_size = static_cast<unsigned int>(period_size);

        std::cout << "ALSA capture configured: " << config.device_name << ", " << rate << " Hz, "
                  << period_size << " frames/period ("
                  << (1000.0f * period_size / rate) << " ms)" << std::endl;
        return true;
    }

    void cleanup_alsa() {
        if (pcm_handle) {
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
        }
    }

    // Interleaved frames of either sample format to mono floats
    void downmix(const void* raw, int frames, std::vector<float>& mono) const {
        const int ch = static_cast<int>(channels);
        const float gain = 1.0f / static_cast<float>(ch);
        if (sample_format == SND_PCM_FORMAT_FLOAT_LE) {
            const float* in = static_cast<const float*>(raw);
            if (ch == 1) { std::copy(in, in + frames, mono.begin()); return; }
            for (int i = 0; i < frames; ++i) {
                float acc = 0.0f;
                for (int c = 0; c < ch; ++c) acc += in[i * ch + c];
                mono[i] = acc * gain;
            }
        } else {
            const int16_t* in = static_cast<const int16_t*>(raw);
            const float scale = gain / 32768.0f;
            for (int i = 0; i < frames; ++i) {
                int acc = 0;
                for (int c = 0; c < ch; ++c) acc += in[i * ch + c];
                mono[i] = static_cast<float>(acc) * scale;
            }
        }
    }

    void record_latency(std::chrono::steady_clock::time_point start_time) {
        const auto elapsed = std::chrono::steady_clock::now() - start_time;
        const float ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0f;

        float lo = min_latency_ms.load();
        while (ms < lo && !min_latency_ms.compare_exchange_weak(lo, ms)) {}
        float hi = max_latency_ms.load();
        while (ms > hi && !max_latency_ms.compare_exchange_weak(hi, ms)) {}
        total_latency_ms.store(total_latency_ms.load() + ms);
        latency_count.fetch_add(1);
    }

    void capture_thread_func() {
        if (config.use_realtime_priority) {
            mlockall(MCL_CURRENT | MCL_FUTURE);
        }

        const snd_pcm_uframes_t frames_per_period = config.period_size;
        const size_t bytes_per_sample = sample_format == SND_PCM_FORMAT_FLOAT_LE ? sizeof(float) : sizeof(int16_t);
        std::vector<unsigned char> raw(frames_per_period * channels * bytes_per_sample);
        std::vector<float> mono(frames_per_period);

        while (running.load()) {
            const auto start_time = std::chrono::steady_clock::now();
            const snd_pcm_sframes_t got = snd_pcm_readi(pcm_handle, raw.data(), frames_per_period);

            if (got == -EAGAIN) continue;
            if (got == -EPIPE) {
                // Overrun: count it and carry on
                xrun_count.fetch_add(1);
                snd_pcm_prepare(pcm_handle);
                continue;
            }
            if (got < 0) {
                const int rec = snd_pcm_recover(pcm_handle, static_cast<int>(got), 1);
                if (rec == 0) continue;
                std::cerr << "Capture read error: " << snd_strerror(static_cast<int>(got)) << std::endl;
                failed = true;
                break;
            }
            if (got == 0) continue;

            const int n = static_cast<int>(got);
            if (process_callback) {
                downmix(raw.data(), n, mono);
                process_callback(mono.data(), n);
            }
            record_latency(start_time);
        }

        if (config.use_realtime_priority) {
            munlockall();
        }
    }

    void set_realtime_priority() {
        struct sched_param param;
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(capture_thread.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "Warning: Could not set realtime priority. Run with sudo or configure limits.conf" << std::endl;
        }
    }
};

std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace micviz
