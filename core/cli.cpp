#include "cli.hpp"
#include "app_settings_io.hpp"
#include "calibration.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace pitchscope {

static bool to_double(const char* s, double& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

static bool to_int(const char* s, int& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (errno != 0 || *end != '\0' || v < -2147483647L || v > 2147483647L) return false;
    out = static_cast<int>(v);
    return true;
}

std::string find_settings_path(int argc, char** argv) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--settings") == 0) return argv[i + 1];
    }
    return kDefaultSettingsPath;
}

bool parse_command_line(int argc, char** argv, AppSettings& st, CliOptions& opt, std::string* error) {
    auto fail = [&](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        double d = 0.0;
        int n = 0;

        if (arg == "--help" || arg == "-h") {
            opt.help = true;
        } else if (arg == "--save") {
            opt.save = true;
        } else if (arg == "--hold") {
            st.silence_policy = 1;
        } else if (arg == "--log-interp") {
            st.interpolation_mode = 1;
        } else if (arg == "--settings") {
            if (!has_value) return fail("--settings needs a path");
            opt.settings_path = argv[++i];
        } else if (arg == "--device") {
            if (!has_value) return fail("--device needs a name");
            st.device_name = argv[++i];
        } else if (arg == "--rate") {
            if (!has_value || !to_int(argv[++i], n)) return fail("--rate needs an integer");
            st.sample_rate = n;
        } else if (arg == "--block") {
            if (!has_value || !to_int(argv[++i], n)) return fail("--block needs an integer");
            st.block_size = n;
        } else if (arg == "--scale") {
            if (!has_value || !to_double(argv[++i], d)) return fail("--scale needs a number");
            st.calibration_scale = d;
        } else if (arg == "--offset") {
            if (!has_value || !to_double(argv[++i], d)) return fail("--offset needs a number");
            st.calibration_offset_hz = d;
        } else if (arg == "--noise-floor") {
            if (!has_value || !to_double(argv[++i], d)) return fail("--noise-floor needs a number");
            st.noise_floor = static_cast<float>(d);
        } else if (arg == "--min-freq") {
            if (!has_value || !to_double(argv[++i], d)) return fail("--min-freq needs a number");
            st.min_frequency_hz = static_cast<float>(d);
        } else if (arg == "--tone") {
            if (!has_value || !to_double(argv[++i], d) || d <= 0.0) return fail("--tone needs a frequency > 0");
            opt.tone_hz = static_cast<float>(d);
        } else if (arg == "--tone-seconds") {
            if (!has_value || !to_double(argv[++i], d) || d < 0.0) return fail("--tone-seconds needs a number >= 0");
            opt.tone_seconds = static_cast<float>(d);
        } else if (arg == "--calibrate") {
            if (i + 4 >= argc) return fail("--calibrate needs f1 m1 f2 m2");
            for (int k = 0; k < 4; ++k) {
                if (!to_double(argv[++i], opt.calibrate_values[k])) return fail("--calibrate values must be numbers");
            }
            opt.calibrate = true;
        } else {
            return fail("unknown option: " + arg);
        }
    }
    return true;
}

void print_usage(const char* argv0, std::ostream& os) {
    os << "Usage: " << argv0 << " [options]\n"
       << "Options:\n"
       << "  --settings <path>     Settings file (default: " << kDefaultSettingsPath << ")\n"
       << "  --device <name>       ALSA capture device (default: 'default')\n"
       << "  --rate <hz>           Sample rate (default: 44100)\n"
       << "  --block <frames>      Analysis block size (default: 2048)\n"
       << "  --scale <x>           Calibration scale (default: 1.0)\n"
       << "  --offset <hz>         Calibration offset (default: 0.0)\n"
       << "  --noise-floor <x>     Minimum peak magnitude, full scale = 1.0 (default: 0.001)\n"
       << "  --min-freq <hz>       Ignore peaks below this frequency (default: 0)\n"
       << "  --log-interp          Interpolate on log magnitudes\n"
       << "  --hold                Keep the last reading through short silences\n"
       << "  --tone <hz>           Use a synthetic tone instead of the microphone\n"
       << "  --tone-seconds <s>    Stop the tone after this long (default: never)\n"
       << "  --calibrate f1 m1 f2 m2\n"
       << "                        Print scale/offset for two known tones f1,f2 measured as m1,m2\n"
       << "  --save                Write the effective settings back to the settings file\n"
       << "  --help                Show this help\n";
}

int resolve_settings(int argc, char** argv, AppSettings& st, CliOptions& opt) {
    const std::string path = find_settings_path(argc, argv);
    if (!load_settings(path.c_str(), st)) {
        std::cout << "No settings at " << path << ", using defaults" << std::endl;
    }

    std::string error;
    if (!parse_command_line(argc, argv, st, opt, &error)) {
        std::cerr << "Error: " << error << "\n";
        print_usage(argv[0], std::cerr);
        return 1;
    }
    if (opt.help) {
        print_usage(argv[0], std::cout);
        return 0;
    }

    if (opt.calibrate) {
        CalibrationParams params;
        const double* v = opt.calibrate_values;
        if (!Calibration::derive_two_tone(v[0], v[1], v[2], v[3], params, &error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }
        std::cout.precision(9);
        std::cout << "calibration_scale: " << params.scale << "\n"
                  << "calibration_offset_hz: " << params.offset_hz << std::endl;
        if (opt.save) {
            st.calibration_scale = params.scale;
            st.calibration_offset_hz = params.offset_hz;
            if (!save_settings(opt.settings_path.c_str(), st)) {
                std::cerr << "Cannot write settings to " << opt.settings_path << std::endl;
                return 1;
            }
            std::cout << "Saved to " << opt.settings_path << std::endl;
        }
        return 0;
    }

    if (!validate_settings(st, &error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        return 1;
    }
    if (opt.save) {
        if (!save_settings(opt.settings_path.c_str(), st)) {
            std::cerr << "Cannot write settings to " << opt.settings_path << std::endl;
            return 1;
        }
        std::cout << "Saved settings to " << opt.settings_path << std::endl;
    }
    return -1;
}

} // namespace pitchscope
