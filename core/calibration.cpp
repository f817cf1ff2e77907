#include "calibration.hpp"

#include <cmath>

namespace pitchscope {

bool Calibration::valid(const CalibrationParams& params, std::string* error) {
    if (!std::isfinite(params.scale) || params.scale <= 0.0) {
        if (error) *error = "calibration scale must be finite and > 0";
        return false;
    }
    if (!std::isfinite(params.offset_hz)) {
        if (error) *error = "calibration offset must be finite";
        return false;
    }
    return true;
}

bool Calibration::derive_two_tone(double f1, double m1, double f2, double m2,
                                  CalibrationParams& out, std::string* error) {
    if (!std::isfinite(f1) || !std::isfinite(m1) || !std::isfinite(f2) || !std::isfinite(m2)) {
        if (error) *error = "two-tone calibration values must be finite";
        return false;
    }
    if (m2 == m1) {
        if (error) *error = "two-tone calibration needs two distinct measured frequencies";
        return false;
    }
    CalibrationParams p;
    p.scale = (f2 - f1) / (m2 - m1);
    p.offset_hz = f1 - p.scale * m1;
    if (!valid(p, error)) return false;
    out = p;
    return true;
}

} // namespace pitchscope
