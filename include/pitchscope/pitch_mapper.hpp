#pragma once

#include <array>
#include <string>

namespace pitchscope {

struct PitchReading {
    double frequency_hz = 0.0;
    double midi_float = 0.0;
    int midi_int = 0;
    std::string note_name;
    int octave = 0;
    double cents = 0.0;   // [-50, 50)
};

// Equal temperament, A4 = MIDI 69 = 440 Hz, sharps spelling.
class PitchMapper {
public:
    static constexpr double kReferenceHz = 440.0;
    static constexpr int kReferenceMidi = 69;
    static const std::array<const char*, 12> kNoteNames;

    // Defined for finite frequency > 0 only; returns false otherwise.
    static bool map(double calibrated_hz, PitchReading& out);
};

// "440.1 Hz – A4 (+0.3 cents)"
std::string format_title(const PitchReading& reading);
std::string format_no_signal_title();

} // namespace pitchscope
