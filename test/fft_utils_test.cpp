#include <catch2/catch.hpp>

#include "fft/fft_utils.hpp"

#include <cmath>
#include <complex>
#include <vector>

using namespace pitchscope;

static std::vector<float> direct_magnitudes(const std::vector<float>& x) {
    const int n = static_cast<int>(x.size());
    std::vector<float> out(n / 2 + 1);
    for (int k = 0; k <= n / 2; ++k) {
        std::complex<double> acc(0.0, 0.0);
        for (int i = 0; i < n; ++i) {
            const double angle = -2.0 * M_PI * k * i / n;
            acc += static_cast<double>(x[i]) * std::complex<double>(std::cos(angle), std::sin(angle));
        }
        out[k] = static_cast<float>(std::abs(acc));
    }
    return out;
}

TEST_CASE("Power-of-two detection", "[fft]") {
    CHECK(fft::is_power_of_two(1));
    CHECK(fft::is_power_of_two(2));
    CHECK(fft::is_power_of_two(4096));
    CHECK_FALSE(fft::is_power_of_two(0));
    CHECK_FALSE(fft::is_power_of_two(-8));
    CHECK_FALSE(fft::is_power_of_two(1000));
}

TEST_CASE("Real magnitudes agree with a direct DFT", "[fft]") {
    for (int n : {1, 2, 8, 64, 256, 12, 100, 441}) {
        std::vector<float> x(n);
        for (int i = 0; i < n; ++i) {
            x[i] = static_cast<float>(std::sin(0.37 * i) + 0.25 * std::cos(1.9 * i) + 0.1);
        }
        std::vector<float> mags;
        fft::compute_real_magnitudes(x, mags);
        const auto expected = direct_magnitudes(x);
        INFO("n = " << n);
        REQUIRE(mags.size() == expected.size());
        for (size_t k = 0; k < mags.size(); ++k) {
            CHECK(mags[k] == Approx(expected[k]).margin(1e-3));
        }
    }
}

TEST_CASE("Empty input gives no bins", "[fft]") {
    std::vector<float> mags = {1.0f, 2.0f};
    fft::compute_real_magnitudes({}, mags);
    CHECK(mags.empty());
}

TEST_CASE("FFT of an impulse is flat", "[fft]") {
    std::vector<std::complex<float>> data(16, {0.0f, 0.0f});
    data[0] = {1.0f, 0.0f};
    fft::compute_fft_inplace(data);
    for (const auto& v : data) {
        CHECK(std::abs(v) == Approx(1.0f));
    }
}
