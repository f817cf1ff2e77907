#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "block_queue.hpp"
#include "calibration.hpp"
#include "pitch_mapper.hpp"
#include "ring_buffer.hpp"
#include "spectral_analyzer.hpp"

namespace pitchscope::dsp {

// What the display sees while the input is silent
enum class SilencePolicy {
    Blank,  // publish "none" on the first silent block
    Hold    // keep the last reading for up to silence_hold_seconds
};

struct PipelineConfig {
    int sample_rate = 44100;
    int block_size = 2048;
    float display_window_seconds = 2.0f;
    int queue_capacity = 8;
    float noise_floor = 0.001f;
    float min_frequency_hz = 0.0f;
    InterpolationScale interpolation = InterpolationScale::Linear;
    CalibrationParams calibration{};
    SilencePolicy silence_policy = SilencePolicy::Blank;
    float silence_hold_seconds = 0.5f;
};

struct PipelineStats {
    uint64_t pushed = 0;     // blocks accepted from capture
    uint64_t dropped = 0;    // oldest blocks discarded on a full queue
    uint64_t rejected = 0;   // blocks of the wrong length
    uint64_t processed = 0;  // blocks analyzed by the worker
    uint64_t silent = 0;     // processed blocks without a peak
};

// Capture -> bounded queue -> worker -> {ring buffer, analyzer -> calibration -> mapper}.
// Producer calls (push_samples/push_block) come from the capture thread and never
// wait on the worker. Display calls may come from any thread.
class BlockPipeline {
public:
    explicit BlockPipeline(const PipelineConfig& config);
    ~BlockPipeline();

    BlockPipeline(const BlockPipeline&) = delete;
    BlockPipeline& operator=(const BlockPipeline&) = delete;

    static bool validate(const PipelineConfig& config, std::string* error = nullptr);

    bool start(std::string* error = nullptr);
    void stop();
    bool is_running() const { return running_.load(); }

    // Capture thread. Accepts any period length and cuts it into blocks.
    void push_samples(const float* input, int count);
    // Capture thread. `count` must equal block_size; returns false when rejected or
    // when the oldest queued block was dropped to make room.
    bool push_block(const float* input, int count);

    // Display thread
    std::vector<float> current_waveform() const { return waveform_.snapshot(); }
    std::vector<float> current_waveform(size_t count) const { return waveform_.snapshot_latest(count); }
    std::shared_ptr<const PitchReading> current_pitch() const;
    PipelineStats stats() const;

    const PipelineConfig& config() const { return cfg_; }

private:
    const PipelineConfig cfg_;
    const Calibration calibration_;
    RingBuffer waveform_;
    BlockQueue queue_;
    SpectralAnalyzer analyzer_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    std::shared_ptr<const PitchReading> latest_;

    // Producer-side assembly of fixed-size blocks
    std::vector<float> pending_;
    size_t pending_count_ = 0;
    uint64_t next_sequence_ = 0;

    // Worker-side silence tracking
    uint64_t silence_run_ = 0;
    uint64_t hold_blocks_ = 0;

    std::atomic<uint64_t> pushed_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> silent_{0};

    void worker_func();
    void process_block(const AudioBlock& block);
    void publish(std::shared_ptr<const PitchReading> reading);
    void handle_silence();
};

} // namespace pitchscope::dsp
