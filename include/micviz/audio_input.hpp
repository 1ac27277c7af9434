#pragma once

#include <functional>
#include <memory>
#include <string>

namespace micviz {

struct AudioConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 44100;
    unsigned int period_size = 512;
    unsigned int num_periods = 4;
    bool use_realtime_priority = false;
};

// Mono capture stream. open() acquires the device, close() releases it;
// destroying the object disposes of it (closing first if needed).
class IAudioInput {
public:
    using ProcessCallback = std::function<void(const float* input, int num_samples)>;

    virtual ~IAudioInput() = default;

    // Returns false (and fills last_error()) when the device cannot be acquired.
    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    // True once the capture thread hit an unrecoverable read error.
    virtual bool stream_failed() const = 0;

    // Must be set before open(); called from the capture thread.
    virtual void set_process_callback(ProcessCallback callback) = 0;
    // After a successful open() this holds the negotiated rate and period.
    virtual const AudioConfig& get_config() const = 0;
    virtual const std::string& last_error() const = 0;

    struct LatencyStats {
        float min_ms;
        float max_ms;
        float avg_ms;
        int xruns;
    };
    virtual LatencyStats get_latency_stats() const = 0;
};

// Factory that returns the active platform backend
std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config);

} // namespace micviz
