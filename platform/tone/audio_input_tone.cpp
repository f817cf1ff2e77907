#include "audio_input.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

namespace pitchscope {

// Generates a sine in period-sized chunks on its own thread, paced to the sample rate.
class ToneAudioInput : public IAudioInput {
public:
    ToneAudioInput(const AudioConfig& cfg, float frequency_hz, float amplitude, float duration_seconds)
        : config(cfg), frequency_hz(frequency_hz), amplitude(amplitude),
          duration_seconds(duration_seconds), running(false), generating(false),
          periods_generated(0) {}

    ~ToneAudioInput() override { stop(); }

    bool start() override {
        if (running.load()) {
            return true;
        }
        if (config.sample_rate == 0 || config.period_size == 0) {
            std::cerr << "Tone source needs a sample rate and period size" << std::endl;
            return false;
        }
        running = true;
        generating = true;
        tone_thread = std::thread(&ToneAudioInput::generate_loop, this);
        std::cout << "Tone source: " << frequency_hz << " Hz at " << config.sample_rate << " Hz, "
                  << config.period_size << " frames/period" << std::endl;
        return true;
    }

    void stop() override {
        if (!running.load()) {
            return;
        }
        running = false;
        if (tone_thread.joinable()) {
            tone_thread.join();
        }
        generating = false;
    }

    bool is_running() const override { return running.load() && generating.load(); }

    void set_process_callback(ProcessCallback callback) override { process_callback = std::move(callback); }

    const AudioConfig& get_config() const override { return config; }

    LatencyStats get_latency_stats() const override {
        LatencyStats stats{};
        const double period_ms = 1000.0 * config.period_size / config.sample_rate;
        stats.min_ms = stats.max_ms = stats.avg_ms = periods_generated.load() > 0 ? static_cast<float>(period_ms) : 0.0f;
        stats.xruns = 0;
        return stats;
    }

private:
    AudioConfig config;
    float frequency_hz;
    float amplitude;
    float duration_seconds;
    std::atomic<bool> running;
    std::atomic<bool> generating;
    std::atomic<long> periods_generated;
    std::thread tone_thread;
    ProcessCallback process_callback;

    void generate_loop() {
        const int n = static_cast<int>(config.period_size);
        const double fs = static_cast<double>(config.sample_rate);
        const double step = 2.0 * M_PI * frequency_hz / fs;
        const long max_periods = duration_seconds > 0.0f
            ? static_cast<long>(std::ceil(duration_seconds * fs / n)) : -1;
        const auto period = std::chrono::duration<double>(n / fs);

        std::vector<float> buffer(n);
        double phase = 0.0;
        auto next_deadline = std::chrono::steady_clock::now();

        while (running.load()) {
            if (max_periods >= 0 && periods_generated.load() >= max_periods) break;

            for (int i = 0; i < n; ++i) {
                buffer[i] = amplitude * static_cast<float>(std::sin(phase));
                phase += step;
                if (phase >= 2.0 * M_PI) phase -= 2.0 * M_PI;
            }
            if (process_callback) {
                process_callback(buffer.data(), n);
            }
            periods_generated.fetch_add(1);

            next_deadline += std::chrono::duration_cast<std::chrono::steady_clock::duration>(period);
            std::this_thread::sleep_until(next_deadline);
        }
        generating = false;
    }
};

std::unique_ptr<IAudioInput> createToneInput(const AudioConfig& config, float frequency_hz,
                                             float amplitude, float duration_seconds) {
    return std::make_unique<ToneAudioInput>(config, frequency_hz, amplitude, duration_seconds);
}

} // namespace pitchscope
