#pragma once

#include <string>

namespace pitchscope {

struct AppSettings {
    // Capture
    std::string device_name = "default";
    int sample_rate = 44100;
    int block_size = 2048;          // analysis block and capture period, frames
    int capture_periods = 4;
    bool use_realtime_priority = true;

    // Waveform display
    float display_window_seconds = 2.0f;
    float plot_seconds = 0.1f;      // tail of the window that gets drawn

    // Analysis
    float noise_floor = 0.001f;
    float min_frequency_hz = 0.0f;
    int interpolation_mode = 0;     // 0: linear magnitude, 1: log magnitude
    int queue_capacity = 8;

    // Calibration (derive offline with --calibrate)
    double calibration_scale = 1.0;
    double calibration_offset_hz = 0.0;

    // 0: blank on silence, 1: hold last reading for silence_hold_seconds
    int silence_policy = 0;
    float silence_hold_seconds = 0.5f;
};

} // namespace pitchscope
