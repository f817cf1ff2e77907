#include "spectral_analyzer.hpp"

#include "fft/fft_utils.hpp"

#include <algorithm>
#include <cmath>

namespace pitchscope::dsp {

bool SpectralAnalyzer::configure(const AnalyzerConfig& config, std::string* error) {
    configured_ = false;
    if (config.sample_rate <= 0) {
        if (error) *error = "sample rate must be > 0";
        return false;
    }
    if (config.block_size <= 0) {
        if (error) *error = "block size must be > 0";
        return false;
    }
    if (!std::isfinite(config.noise_floor) || config.noise_floor < 0.0f) {
        if (error) *error = "noise floor must be finite and >= 0";
        return false;
    }
    if (!std::isfinite(config.min_frequency_hz) || config.min_frequency_hz < 0.0f) {
        if (error) *error = "minimum frequency must be finite and >= 0";
        return false;
    }

    const int n = config.block_size;
    const int last_bin = n / 2;
    int first = n > 1 ? 1 : 0;
    if (config.min_frequency_hz > 0.0f) {
        const double bin = static_cast<double>(config.min_frequency_hz) * n / config.sample_rate;
        first = std::max(first, static_cast<int>(std::ceil(bin)));
    }
    if (first > last_bin) {
        if (error) *error = "minimum frequency is above Nyquist";
        return false;
    }

    cfg_ = config;
    first_bin_ = first;
    window_.assign(n, 1.0f);
    if (n > 1) {
        for (int i = 0; i < n; ++i) {
            window_[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * M_PI * i / static_cast<double>(n - 1)));
        }
    }
    double sum = 0.0;
    for (float w : window_) sum += w;
    // Coherent-gain normalization: a sine of amplitude A peaks near A
    magnitude_norm_ = sum > 0.0 ? static_cast<float>(2.0 / sum) : 1.0f;
    windowed_.assign(n, 0.0f);
    mags_.assign(last_bin + 1, 0.0f);
    configured_ = true;
    return true;
}

double SpectralAnalyzer::bin_spacing_hz() const {
    return cfg_.block_size > 0 ? static_cast<double>(cfg_.sample_rate) / cfg_.block_size : 0.0;
}

double SpectralAnalyzer::parabolic_offset(double left, double center, double right) {
    const double denominator = left - 2.0 * center + right;
    if (!std::isfinite(denominator) || std::fabs(denominator) < 1e-12) return 0.0;
    const double delta = 0.5 * (left - right) / denominator;
    if (!std::isfinite(delta)) return 0.0;
    return std::clamp(delta, -0.5, 0.5);
}

SpectrumPeak SpectralAnalyzer::refine_peak(const std::vector<float>& magnitudes, int k,
                                           int block_size, int sample_rate,
                                           InterpolationScale scale) {
    SpectrumPeak peak;
    const int last = static_cast<int>(magnitudes.size()) - 1;
    if (last < 0 || block_size <= 0 || sample_rate <= 0) return peak;
    k = std::clamp(k, 0, last);

    const double bin_hz = static_cast<double>(sample_rate) / block_size;
    peak.bin_index = k;
    peak.magnitude = magnitudes[k];
    peak.bin_frequency_hz = k * bin_hz;
    peak.refined_frequency_hz = peak.bin_frequency_hz;
    if (k == 0 || k == last) return peak;

    double a = magnitudes[k - 1];
    double b = magnitudes[k];
    double c = magnitudes[k + 1];
    if (scale == InterpolationScale::Log) {
        const double floor = 1e-20;
        a = std::log(std::max(a, floor));
        b = std::log(std::max(b, floor));
        c = std::log(std::max(c, floor));
    }
    const double delta = parabolic_offset(a, b, c);
    peak.refined_frequency_hz = (k + delta) * bin_hz;
    return peak;
}

AnalysisStatus SpectralAnalyzer::analyze(const float* samples, int count, SpectrumPeak& out) {
    if (!configured_ || !samples || count != cfg_.block_size) return AnalysisStatus::InvalidInput;

    for (int i = 0; i < count; ++i) windowed_[i] = samples[i] * window_[i];
    fft::compute_real_magnitudes(windowed_, mags_);
    for (float& m : mags_) m *= magnitude_norm_;

    const int last = static_cast<int>(mags_.size()) - 1;
    int k = first_bin_;
    float best = mags_[k];
    for (int i = first_bin_ + 1; i <= last; ++i) {
        if (mags_[i] > best) { best = mags_[i]; k = i; }
    }
    if (!std::isfinite(best) || best <= cfg_.noise_floor) return AnalysisStatus::NoPeak;

    out = refine_peak(mags_, k, cfg_.block_size, cfg_.sample_rate, cfg_.scale);
    return AnalysisStatus::Peak;
}

} // namespace pitchscope::dsp
