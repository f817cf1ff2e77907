#include "fft/fft_utils.hpp"
#include <unordered_map>
#include <cmath>

namespace pitchscope::fft {

static thread_local std::unordered_map<int, std::vector<int>> g_bitrev;
static thread_local std::unordered_map<int, std::vector<std::vector<std::complex<float>>>> g_twiddles;
static thread_local std::unordered_map<int, std::vector<std::complex<double>>> g_dft_roots;
static thread_local std::vector<std::complex<float>> g_scratch;

static const std::vector<int>& get_or_build_bitrev(int n) {
    auto it = g_bitrev.find(n);
    if (it != g_bitrev.end()) return it->second;
    int bits = 0; while ((1 << bits) < n) ++bits;
    std::vector<int> br(n);
    for (int i = 0; i < n; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        br[i] = static_cast<int>(r);
    }
    auto [ins, _] = g_bitrev.emplace(n, std::move(br));
    return ins->second;
}

static const std::vector<std::vector<std::complex<float>>>& get_or_build_twiddles(int n) {
    auto it = g_twiddles.find(n);
    if (it != g_twiddles.end()) return it->second;
    std::vector<std::vector<std::complex<float>>> stages;
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        std::vector<std::complex<float>> stage(half);
        // Direct evaluation per entry; repeated multiplication drifts at 2^14 and up
        for (int k = 0; k < half; ++k) {
            const double angle = -2.0 * M_PI * static_cast<double>(k) / static_cast<double>(len);
            stage[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
        }
        stages.push_back(std::move(stage));
    }
    auto [ins, _] = g_twiddles.emplace(n, std::move(stages));
    return ins->second;
}

static const std::vector<std::complex<double>>& get_or_build_dft_roots(int n) {
    auto it = g_dft_roots.find(n);
    if (it != g_dft_roots.end()) return it->second;
    std::vector<std::complex<double>> roots(n);
    for (int i = 0; i < n; ++i) {
        const double angle = -2.0 * M_PI * static_cast<double>(i) / static_cast<double>(n);
        roots[i] = std::complex<double>(std::cos(angle), std::sin(angle));
    }
    auto [ins, _] = g_dft_roots.emplace(n, std::move(roots));
    return ins->second;
}

bool is_power_of_two(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

void compute_fft_inplace(std::vector<std::complex<float>>& data) {
    const int n = static_cast<int>(data.size());
    if (n <= 1) return;

    // Bit-reversal
    const auto& br = get_or_build_bitrev(n);
    g_scratch.resize(n);
    for (int i = 0; i < n; ++i) g_scratch[br[i]] = data[i];
    data.swap(g_scratch);

    // Iterative radix-2
    const auto& stages = get_or_build_twiddles(n);
    int stageIndex = 0;
    for (int len = 2; len <= n; len <<= 1, ++stageIndex) {
        const auto& W = stages[stageIndex];
        for (int i = 0; i < n; i += len) {
            for (int k = 0; k < len / 2; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + len / 2] * W[k];
                data[i + k] = u + v;
                data[i + k + len / 2] = u - v;
            }
        }
    }
}

void compute_real_magnitudes(const std::vector<float>& input, std::vector<float>& magnitudes) {
    const int n = static_cast<int>(input.size());
    magnitudes.assign(n > 0 ? n / 2 + 1 : 0, 0.0f);
    if (n == 0) return;

    if (is_power_of_two(n)) {
        std::vector<std::complex<float>> X(n);
        for (int i = 0; i < n; ++i) X[i] = std::complex<float>(input[i], 0.0f);
        compute_fft_inplace(X);
        for (int k = 0; k <= n / 2; ++k) magnitudes[k] = std::hypot(X[k].real(), X[k].imag());
        return;
    }

    // Direct DFT over the non-negative half; index arithmetic keeps the root table exact
    const auto& roots = get_or_build_dft_roots(n);
    for (int k = 0; k <= n / 2; ++k) {
        std::complex<double> acc(0.0, 0.0);
        long long idx = 0;
        for (int i = 0; i < n; ++i) {
            acc += static_cast<double>(input[i]) * roots[static_cast<size_t>(idx)];
            idx += k;
            if (idx >= n) idx -= n;
        }
        magnitudes[k] = static_cast<float>(std::abs(acc));
    }
}

} // namespace pitchscope::fft
