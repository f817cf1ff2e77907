#pragma once

#include <ostream>
#include <string>

#include "app_settings.hpp"

namespace pitchscope {

constexpr const char* kDefaultSettingsPath = "pitchscope_settings.json";

struct CliOptions {
    std::string settings_path = kDefaultSettingsPath;
    float tone_hz = 0.0f;            // > 0 replaces the microphone with a synthetic tone
    float tone_amplitude = 0.5f;
    float tone_seconds = 0.0f;       // 0 = until stopped
    bool save = false;
    bool help = false;
    bool calibrate = false;
    double calibrate_values[4] = {0.0, 0.0, 0.0, 0.0};  // f1 m1 f2 m2
};

// Only looks for --settings so the file can be loaded before other flags override it
std::string find_settings_path(int argc, char** argv);

// Applies flag overrides to `st`. Unknown flags and malformed values fail.
bool parse_command_line(int argc, char** argv, AppSettings& st, CliOptions& opt,
                        std::string* error = nullptr);

void print_usage(const char* argv0, std::ostream& os);

// Settings file, flag overrides, --help, --calibrate, validation and --save in one step.
// Returns -1 when the caller should go on running, otherwise the process exit code.
int resolve_settings(int argc, char** argv, AppSettings& st, CliOptions& opt);

} // namespace pitchscope
