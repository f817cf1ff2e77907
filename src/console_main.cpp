#include "app_settings_io.hpp"
#include "capture.hpp"
#include "cli.hpp"
#include "pitch_mapper.hpp"
#include "dsp/block_pipeline.hpp"
#include <iostream>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <signal.h>

using namespace pitchscope;

std::atomic<bool> g_running(true);

void signal_handler(int) {
    g_running = false;
}

// [----------|----------] with the marker at the cents offset
static std::string cents_meter(double cents) {
    const int meter_width = 21;
    int meter_pos = meter_width / 2 + static_cast<int>(cents / 50.0 * (meter_width / 2));
    meter_pos = std::max(0, std::min(meter_width - 1, meter_pos));
    std::string meter = "[";
    for (int i = 0; i < meter_width; ++i) {
        if (i == meter_pos) meter += "#";
        else if (i == meter_width / 2) meter += "|";
        else meter += "-";
    }
    return meter + "]";
}

int main(int argc, char* argv[]) {
    AppSettings settings;
    CliOptions options;
    int code = resolve_settings(argc, argv, settings, options);
    if (code >= 0) return code;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    dsp::BlockPipeline pipeline(to_pipeline_config(settings));
    std::string error;
    if (!pipeline.start(&error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        return 1;
    }

    auto audio = start_capture(settings, options, pipeline, &error);
    if (!audio) {
        std::cerr << "Configuration error: " << error << std::endl;
        return 1;
    }

    std::cout << "PitchScope console\n"
              << "Source: " << (options.tone_hz > 0.0f ? "tone" : audio->get_config().device_name) << "\n"
              << "Sample rate: " << settings.sample_rate << " Hz, block: " << settings.block_size
              << " (" << static_cast<double>(settings.sample_rate) / settings.block_size << " Hz/bin)\n"
              << "Press Ctrl+C to exit\n" << std::endl;

    uint64_t reported_drops = 0;
    int reported_xruns = 0;
    while (g_running.load() && audio->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto reading = pipeline.current_pitch();
        std::cout << "\r\033[K";
        if (reading) {
            std::cout << format_title(*reading) << " " << cents_meter(reading->cents);
        } else {
            std::cout << format_no_signal_title();
        }
        std::cout << std::flush;

        auto stats = pipeline.stats();
        if (stats.dropped != reported_drops) {
            std::cout << "\nWarning: analysis fell behind, " << stats.dropped << " blocks dropped" << std::endl;
            reported_drops = stats.dropped;
        }
        auto latency = audio->get_latency_stats();
        if (latency.xruns != reported_xruns) {
            std::cout << "\nWarning: " << latency.xruns << " buffer overruns detected" << std::endl;
            reported_xruns = latency.xruns;
        }
    }

    audio->stop();
    pipeline.stop();

    auto stats = pipeline.stats();
    auto latency = audio->get_latency_stats();
    std::cout << "\n\nFinal Statistics:\n"
              << "Blocks processed: " << stats.processed << " (silent " << stats.silent
              << ", dropped " << stats.dropped << ", rejected " << stats.rejected << ")\n"
              << "Capture latency: min=" << latency.min_ms << "ms, max=" << latency.max_ms
              << "ms, avg=" << latency.avg_ms << "ms\n"
              << "Buffer overruns: " << latency.xruns << std::endl;
    return 0;
}
