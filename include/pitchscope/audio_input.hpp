#pragma once

#include <functional>
#include <memory>
#include <string>

namespace pitchscope {

struct AudioConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 44100;
    unsigned int period_size = 2048;
    unsigned int num_periods = 4;
    bool use_realtime_priority = true;
};

// Mono capture source delivering float periods on its own thread.
class IAudioInput {
public:
    using ProcessCallback = std::function<void(const float* input, int num_samples)>;

    virtual ~IAudioInput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    // False after stop() and after the source closed on its own (read error, end of tone)
    virtual bool is_running() const = 0;

    virtual void set_process_callback(ProcessCallback callback) = 0;
    // Holds the values the device actually accepted once start() succeeded
    virtual const AudioConfig& get_config() const = 0;

    struct LatencyStats {
        float min_ms;
        float max_ms;
        float avg_ms;
        int xruns;
    };
    virtual LatencyStats get_latency_stats() const = 0;
};

// ALSA capture backend
std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config);

// Synthetic sine source paced in real time. duration_seconds <= 0 runs until stopped.
std::unique_ptr<IAudioInput> createToneInput(const AudioConfig& config, float frequency_hz,
                                             float amplitude = 0.5f, float duration_seconds = 0.0f);

} // namespace pitchscope
