#pragma once

#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

namespace pitchscope::test {

inline std::vector<float> make_sine(double frequency_hz, double sample_rate, int num_samples,
                                    float amplitude = 0.5f, double phase = 0.0) {
    std::vector<float> out(num_samples);
    for (int i = 0; i < num_samples; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * frequency_hz * i / sample_rate + phase));
    }
    return out;
}

// Polls `pred` until it holds or the timeout expires
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace pitchscope::test
