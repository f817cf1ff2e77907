#pragma once

#include <vector>
#include <complex>

namespace pitchscope::fft {

bool is_power_of_two(int n);

// In-place iterative radix-2 FFT using cached bit-reversal and twiddles.
// Size must be a power of two. Caches are per thread.
void compute_fft_inplace(std::vector<std::complex<float>>& data);

// Magnitude spectrum of a real signal: input.size()/2 + 1 bins.
// Power-of-two sizes go through the radix-2 path, anything else through a direct DFT.
void compute_real_magnitudes(const std::vector<float>& input, std::vector<float>& magnitudes);

} // namespace pitchscope::fft
