#pragma once

#include <string>

namespace pitchscope {

// Affine correction for sample-rate drift and fixed offsets.
// If a 1000 Hz tone reads 990 Hz, scale = 1000/990.
struct CalibrationParams {
    double scale = 1.0;
    double offset_hz = 0.0;
};

class Calibration {
public:
    Calibration() = default;
    explicit Calibration(const CalibrationParams& params) : params_(params) {}

    double apply(double raw_hz) const { return raw_hz * params_.scale + params_.offset_hz; }
    const CalibrationParams& params() const { return params_; }

    // Finite, strictly positive scale and finite offset
    static bool valid(const CalibrationParams& params, std::string* error = nullptr);

    // Two-tone derivation: known tones f1, f2 measured uncalibrated as m1, m2.
    // Fails when m1 == m2 or any value is non-finite.
    static bool derive_two_tone(double f1, double m1, double f2, double m2,
                                CalibrationParams& out, std::string* error = nullptr);

private:
    CalibrationParams params_{};
};

} // namespace pitchscope
