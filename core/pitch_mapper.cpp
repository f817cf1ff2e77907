#include "pitch_mapper.hpp"

#include <cmath>
#include <cstdio>

namespace pitchscope {

const std::array<const char*, 12> PitchMapper::kNoteNames = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

bool PitchMapper::map(double calibrated_hz, PitchReading& out) {
    if (!(calibrated_hz > 0.0) || !std::isfinite(calibrated_hz)) return false;

    const double midi_float = kReferenceMidi + 12.0 * std::log2(calibrated_hz / kReferenceHz);
    // floor(x + 0.5) keeps midi_float - midi_int in [-0.5, 0.5) for negative numbers too
    const int midi_int = static_cast<int>(std::floor(midi_float + 0.5));
    const int note_index = ((midi_int % 12) + 12) % 12;
    const int octave_base = midi_int >= 0 ? midi_int / 12 : -((-midi_int + 11) / 12);

    out.frequency_hz = calibrated_hz;
    out.midi_float = midi_float;
    out.midi_int = midi_int;
    out.note_name = kNoteNames[note_index];
    out.octave = octave_base - 1;
    out.cents = (midi_float - static_cast<double>(midi_int)) * 100.0;
    return true;
}

std::string format_title(const PitchReading& reading) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "%.1f Hz \xE2\x80\x93 %s%d (%+.1f cents)",
                  reading.frequency_hz, reading.note_name.c_str(), reading.octave, reading.cents);
    return std::string(buf);
}

std::string format_no_signal_title() {
    return "-- Hz \xE2\x80\x93 no signal";
}

} // namespace pitchscope
