#include "audio_input.hpp"

#include <alsa/asoundlib.h>
#include <iostream>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <sys/mman.h>
#include <sched.h>
#include <atomic>
#include <thread>
#include <vector>

namespace pitchscope {

class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const AudioConfig& cfg)
        : config(cfg), pcm_handle(nullptr), running(false), capturing(false),
          min_latency_ms(1000.0f), max_latency_ms(0.0f), total_latency_ms(0.0f),
          latency_count(0), xrun_count(0), sample_format(SND_PCM_FORMAT_FLOAT_LE) {}

    ~AlsaAudioInput() override { stop(); }

    bool start() override {
        if (running.load()) {
            return true;
        }
        if (!open_device() || !configure_hw()) {
            cleanup_alsa();
            return false;
        }
        running = true;
        capturing = true;
        audio_thread = std::thread(&AlsaAudioInput::capture_loop, this);
        if (config.use_realtime_priority) {
            set_realtime_priority();
        }
        return true;
    }

    void stop() override {
        if (!running.load()) {
            return;
        }
        running = false;
        if (audio_thread.joinable()) {
            audio_thread.join();
        }
        capturing = false;
        cleanup_alsa();
    }

    bool is_running() const override { return running.load() && capturing.load(); }

    void set_process_callback(ProcessCallback callback) override { process_callback = std::move(callback); }

    const AudioConfig& get_config() const override { return config; }

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
    std::atomic<bool> capturing;
    std::thread audio_thread;
    ProcessCallback process_callback;

    // Time spent per period in read + callback
    std::atomic<float> min_latency_ms;
    std::atomic<float> max_latency_ms;
    std::atomic<float> total_latency_ms;
    std::atomic<int> latency_count;
    std::atomic<int> xrun_count;

    snd_pcm_format_t sample_format;

    // Configured name first, then "default", then enumerated capture devices
    std::vector<std::string> candidate_devices() const {
        std::vector<std::string> candidates;
        if (!config.device_name.empty()) candidates.push_back(config.device_name);
        if (config.device_name != "default") candidates.push_back("default");

        void** hints = nullptr;
        if (snd_device_name_hint(-1, "pcm", &hints) == 0 && hints) {
            std::vector<std::string> plughw;
            std::vector<std::string> hw;
            for (void** n = hints; *n != nullptr; ++n) {
                char* name = snd_device_name_get_hint(*n, "NAME");
                char* ioid = snd_device_name_get_hint(*n, "IOID");
                // A missing IOID means the device does both directions
                const bool is_input = !ioid || std::strcmp(ioid, "Input") == 0;
                if (name && is_input) {
                    std::string s(name);
                    if (s.rfind("plughw:", 0) == 0) plughw.push_back(s);
                    else if (s.rfind("hw:", 0) == 0) hw.push_back(s);
                }
                free(name);
                free(ioid);
            }
            snd_device_name_free_hint(hints);
            candidates.insert(candidates.end(), plughw.begin(), plughw.end());
            candidates.insert(candidates.end(), hw.begin(), hw.end());
        }
        return candidates;
    }

    bool open_device() {
        const auto candidates = candidate_devices();
        for (const auto& dev : candidates) {
            if (snd_pcm_open(&pcm_handle, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0) == 0) {
                if (dev != config.device_name) {
                    std::cout << "Using capture device: " << dev << std::endl;
                    config.device_name = dev;
                }
                return true;
            }
        }
        pcm_handle = nullptr;
        std::cerr << "Cannot open any audio capture device. Last tried: "
                  << (candidates.empty() ? std::string("<none>") : candidates.back())
                  << std::endl;
        return false;
    }

    static bool check(int err, const char* what) {
        if (err < 0) {
            std::cerr << "Cannot " << what << ": " << snd_strerror(err) << std::endl;
            return false;
        }
        return true;
    }

    bool configure_hw() {
        snd_pcm_hw_params_t* hw_params;
        snd_pcm_hw_params_alloca(&hw_params);

        if (!check(snd_pcm_hw_params_any(pcm_handle, hw_params), "initialize hardware parameters")) return false;
        if (!check(snd_pcm_hw_params_set_access(pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED),
                   "set access type")) return false;

        // Prefer float, fall back to S16 and convert in the capture loop
        sample_format = SND_PCM_FORMAT_FLOAT_LE;
        if (snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format) < 0) {
            sample_format = SND_PCM_FORMAT_S16_LE;
            if (!check(snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format), "set format")) return false;
        }

        if (!check(snd_pcm_hw_params_set_channels(pcm_handle, hw_params, 1), "set channels")) return false;

        unsigned int rate = config.sample_rate;
        if (!check(snd_pcm_hw_params_set_rate_near(pcm_handle, hw_params, &rate, 0), "set sample rate")) return false;
        if (rate != config.sample_rate) {
            std::cout << "Sample rate adjusted to " << rate << " Hz" << std::endl;
        }

        snd_pcm_uframes_t period_size = config.period_size;
        if (!check(snd_pcm_hw_params_set_period_size_near(pcm_handle, hw_params, &period_size, 0),
                   "set period size")) return false;
        if (period_size != config.period_size) {
            std::cout << "Period size adjusted to " << period_size << " frames" << std::endl;
        }

        unsigned int periods = config.num_periods;
        if (!check(snd_pcm_hw_params_set_periods_near(pcm_handle, hw_params, &periods, 0), "set periods")) return false;

        if (!check(snd_pcm_hw_params(pcm_handle, hw_params), "set hardware parameters")) return false;
        if (!check(snd_pcm_prepare(pcm_handle), "prepare audio interface")) return false;

        snd_pcm_hw_params_get_period_size(hw_params, &period_size, 0);
        snd_pcm_hw_params_get_rate(hw_params, &rate, 0);

        // Callers compare these against what they asked for
        config.sample_rate = rate;
        config.period_size = static_cast<unsigned int>(period_size);

        std::cout << "ALSA configured: " << rate << " Hz, "
                  << period_size << " frames/period ("
                  << (1000.0f * period_size / rate) << " ms), "
                  << (sample_format == SND_PCM_FORMAT_FLOAT_LE ? "float" : "s16") << std::endl;
        return true;
    }

    void cleanup_alsa() {
        if (pcm_handle) {
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
        }
    }

    void record_latency(std::chrono::high_resolution_clock::time_point start_time) {
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        float latency_ms = duration.count() / 1000.0f;

        float current_min = min_latency_ms.load();
        while (latency_ms < current_min && !min_latency_ms.compare_exchange_weak(current_min, latency_ms));

        float current_max = max_latency_ms.load();
        while (latency_ms > current_max && !max_latency_ms.compare_exchange_weak(current_max, latency_ms));

        total_latency_ms.store(total_latency_ms.load() + latency_ms);
        latency_count.store(latency_count.load() + 1);
    }

    void capture_loop() {
        if (config.use_realtime_priority) {
            mlockall(MCL_CURRENT | MCL_FUTURE);
        }

        const snd_pcm_uframes_t period_size = config.period_size;
        std::vector<float> buffer_f(period_size);
        std::vector<int16_t> buffer_s16;
        if (sample_format == SND_PCM_FORMAT_S16_LE) {
            buffer_s16.resize(period_size);
        }

        while (running.load()) {
            auto start_time = std::chrono::high_resolution_clock::now();

            snd_pcm_sframes_t frames_read = 0;
            if (sample_format == SND_PCM_FORMAT_FLOAT_LE) {
                frames_read = snd_pcm_readi(pcm_handle, buffer_f.data(), period_size);
            } else {
                frames_read = snd_pcm_readi(pcm_handle, buffer_s16.data(), period_size);
            }

            if (frames_read == -EPIPE) {
                xrun_count++;
                snd_pcm_prepare(pcm_handle);
                continue;
            }
            if (frames_read == -EAGAIN) {
                continue;
            }
            if (frames_read < 0) {
                std::cerr << "Read error: " << snd_strerror(static_cast<int>(frames_read)) << std::endl;
                break;
            }
            if (frames_read == 0) {
                continue;
            }

            const int n = static_cast<int>(frames_read);
            if (sample_format == SND_PCM_FORMAT_S16_LE) {
                const float scale = 1.0f / 32768.0f;
                for (int i = 0; i < n; ++i) buffer_f[i] = static_cast<float>(buffer_s16[i]) * scale;
            }
            if (process_callback) {
                process_callback(buffer_f.data(), n);
            }
            record_latency(start_time);
        }

        capturing = false;
        if (config.use_realtime_priority) {
            munlockall();
        }
    }

    void set_realtime_priority() {
        struct sched_param param;
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(audio_thread.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "Warning: Could not set realtime priority. Run with sudo or configure limits.conf" << std::endl;
        }
    }
};

std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace pitchscope
