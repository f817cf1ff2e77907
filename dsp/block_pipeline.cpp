#include "block_pipeline.hpp"

#include <algorithm>
#include <cmath>

namespace pitchscope::dsp {

static size_t waveform_capacity(const PipelineConfig& cfg) {
    const double samples = static_cast<double>(cfg.display_window_seconds) * cfg.sample_rate;
    if (!(samples > 0.0) || !std::isfinite(samples)) return 0;
    return static_cast<size_t>(std::lround(samples));
}

BlockPipeline::BlockPipeline(const PipelineConfig& config)
    : cfg_(config),
      calibration_(config.calibration),
      waveform_(waveform_capacity(config)),
      queue_(static_cast<size_t>(std::max(1, config.queue_capacity)),
             static_cast<size_t>(std::max(0, config.block_size))),
      pending_(static_cast<size_t>(std::max(0, config.block_size)), 0.0f) {}

BlockPipeline::~BlockPipeline() {
    stop();
}

bool BlockPipeline::validate(const PipelineConfig& config, std::string* error) {
    if (config.sample_rate <= 0) {
        if (error) *error = "sample rate must be > 0";
        return false;
    }
    if (config.block_size <= 0) {
        if (error) *error = "block size must be > 0";
        return false;
    }
    if (waveform_capacity(config) == 0) {
        if (error) *error = "display window must hold at least one sample";
        return false;
    }
    if (config.queue_capacity < 1) {
        if (error) *error = "queue capacity must be >= 1";
        return false;
    }
    if (!std::isfinite(config.silence_hold_seconds) || config.silence_hold_seconds < 0.0f) {
        if (error) *error = "silence hold must be finite and >= 0";
        return false;
    }
    if (!Calibration::valid(config.calibration, error)) return false;

    AnalyzerConfig ac;
    ac.sample_rate = config.sample_rate;
    ac.block_size = config.block_size;
    ac.noise_floor = config.noise_floor;
    ac.min_frequency_hz = config.min_frequency_hz;
    ac.scale = config.interpolation;
    SpectralAnalyzer probe;
    return probe.configure(ac, error);
}

bool BlockPipeline::start(std::string* error) {
    if (running_.load()) {
        return true;
    }
    if (!validate(cfg_, error)) {
        return false;
    }

    AnalyzerConfig ac;
    ac.sample_rate = cfg_.sample_rate;
    ac.block_size = cfg_.block_size;
    ac.noise_floor = cfg_.noise_floor;
    ac.min_frequency_hz = cfg_.min_frequency_hz;
    ac.scale = cfg_.interpolation;
    if (!analyzer_.configure(ac, error)) {
        return false;
    }

    const double hold = static_cast<double>(cfg_.silence_hold_seconds) * cfg_.sample_rate / cfg_.block_size;
    hold_blocks_ = cfg_.silence_policy == SilencePolicy::Hold
                       ? static_cast<uint64_t>(std::ceil(hold)) : 0;
    silence_run_ = 0;
    pending_count_ = 0;

    queue_.reset();
    running_ = true;
    worker_ = std::thread(&BlockPipeline::worker_func, this);
    return true;
}

void BlockPipeline::stop() {
    if (!running_.load()) {
        return;
    }
    running_ = false;
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void BlockPipeline::push_samples(const float* input, int count) {
    if (!input || count <= 0 || !running_.load()) return;
    const size_t block = pending_.size();
    int offset = 0;
    while (offset < count) {
        const size_t take = std::min(block - pending_count_, static_cast<size_t>(count - offset));
        std::copy(input + offset, input + offset + take, pending_.begin() + pending_count_);
        pending_count_ += take;
        offset += static_cast<int>(take);
        if (pending_count_ == block) {
            push_block(pending_.data(), static_cast<int>(block));
            pending_count_ = 0;
        }
    }
}

bool BlockPipeline::push_block(const float* input, int count) {
    if (!input || !running_.load()) return false;
    if (count != cfg_.block_size) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    pushed_.fetch_add(1, std::memory_order_relaxed);
    return queue_.push(input, static_cast<size_t>(count), next_sequence_++);
}

std::shared_ptr<const PitchReading> BlockPipeline::current_pitch() const {
    return std::atomic_load(&latest_);
}

PipelineStats BlockPipeline::stats() const {
    PipelineStats s;
    s.pushed = pushed_.load(std::memory_order_relaxed);
    s.dropped = queue_.dropped();
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.processed = processed_.load(std::memory_order_relaxed);
    s.silent = silent_.load(std::memory_order_relaxed);
    return s;
}

void BlockPipeline::worker_func() {
    AudioBlock block;
    block.samples.assign(queue_.block_size(), 0.0f);
    while (queue_.pop_wait(block)) {
        process_block(block);
    }
}

void BlockPipeline::publish(std::shared_ptr<const PitchReading> reading) {
    std::atomic_store(&latest_, std::move(reading));
}

void BlockPipeline::handle_silence() {
    silent_.fetch_add(1, std::memory_order_relaxed);
    ++silence_run_;
    if (silence_run_ > hold_blocks_) {
        publish(nullptr);
    }
}

void BlockPipeline::process_block(const AudioBlock& block) {
    waveform_.push(block.samples);

    SpectrumPeak peak;
    const AnalysisStatus status = analyzer_.analyze(block.samples.data(),
                                                    static_cast<int>(block.samples.size()), peak);
    if (status == AnalysisStatus::InvalidInput) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    processed_.fetch_add(1, std::memory_order_relaxed);

    if (status == AnalysisStatus::NoPeak) {
        handle_silence();
        return;
    }

    auto reading = std::make_shared<PitchReading>();
    const double calibrated = calibration_.apply(peak.refined_frequency_hz);
    if (!PitchMapper::map(calibrated, *reading)) {
        // DC-only or miscalibrated peaks have no pitch
        handle_silence();
        return;
    }
    silence_run_ = 0;
    publish(std::move(reading));
}

} // namespace pitchscope::dsp
