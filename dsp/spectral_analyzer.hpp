#pragma once

#include <string>
#include <vector>

namespace pitchscope::dsp {

enum class InterpolationScale { Linear, Log };

struct AnalyzerConfig {
    int sample_rate = 44100;
    int block_size = 2048;
    float noise_floor = 0.001f;      // normalized magnitude (full-scale sine ~ 1.0)
    float min_frequency_hz = 0.0f;   // 0 = only DC excluded
    InterpolationScale scale = InterpolationScale::Linear;
};

struct SpectrumPeak {
    int bin_index = 0;
    double bin_frequency_hz = 0.0;
    double refined_frequency_hz = 0.0;
    float magnitude = 0.0f;
};

enum class AnalysisStatus { Peak, NoPeak, InvalidInput };

// Hann window -> real DFT magnitudes -> dominant bin -> parabolic refinement.
// Not thread safe; owned by the pipeline worker.
class SpectralAnalyzer {
public:
    SpectralAnalyzer() = default;

    bool configure(const AnalyzerConfig& config, std::string* error = nullptr);
    bool configured() const { return configured_; }
    const AnalyzerConfig& config() const { return cfg_; }
    double bin_spacing_hz() const;

    // `count` must equal the configured block size.
    AnalysisStatus analyze(const float* samples, int count, SpectrumPeak& out);

    // Normalized magnitudes of the last analyzed block (block_size/2 + 1 bins)
    const std::vector<float>& magnitudes() const { return mags_; }

    // Vertex offset of the parabola through three magnitudes, in [-0.5, 0.5].
    // Degenerate curvature or non-finite input gives 0.
    static double parabolic_offset(double left, double center, double right);

    // Builds the peak for bin k; edge bins (0 and the last) skip interpolation.
    static SpectrumPeak refine_peak(const std::vector<float>& magnitudes, int k,
                                    int block_size, int sample_rate,
                                    InterpolationScale scale);

private:
    AnalyzerConfig cfg_{};
    bool configured_ = false;
    int first_bin_ = 1;
    float magnitude_norm_ = 1.0f;
    std::vector<float> window_;
    std::vector<float> windowed_;
    std::vector<float> mags_;
};

} // namespace pitchscope::dsp
