#include "app_settings.hpp"
#include "app_settings_io.hpp"
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstring>

namespace pitchscope {

// Minimal JSON (hand-rolled). Expects a flat object like the one save_settings writes.
static const char* find_value(const char* s, const char* key) {
    const char* p = std::strstr(s, key);
    if (!p) return nullptr;
    p = std::strchr(p + std::strlen(key), ':');
    return p ? p + 1 : nullptr;
}
static bool parse_key_value(const char* s, const char* key, float& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = std::strtof(p, nullptr);
    return true;
}
static bool parse_key_value(const char* s, const char* key, double& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = std::strtod(p, nullptr);
    return true;
}
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = static_cast<int>(std::strtol(p, nullptr, 10));
    return true;
}
static bool parse_key_value(const char* s, const char* key, bool& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (std::strncmp(p, "true", 4) == 0) { out = true; return true; }
    if (std::strncmp(p, "false", 5) == 0) { out = false; return true; }
    return false;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    out.assign(start, p - start);
    return true;
}

bool load_settings(const char* path, AppSettings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    const char* s = buf.c_str();
    parse_key_value(s, "\"device_name\"", st.device_name);
    parse_key_value(s, "\"sample_rate\"", st.sample_rate);
    parse_key_value(s, "\"block_size\"", st.block_size);
    parse_key_value(s, "\"capture_periods\"", st.capture_periods);
    parse_key_value(s, "\"use_realtime_priority\"", st.use_realtime_priority);
    parse_key_value(s, "\"display_window_seconds\"", st.display_window_seconds);
    parse_key_value(s, "\"plot_seconds\"", st.plot_seconds);
    parse_key_value(s, "\"noise_floor\"", st.noise_floor);
    parse_key_value(s, "\"min_frequency_hz\"", st.min_frequency_hz);
    parse_key_value(s, "\"interpolation_mode\"", st.interpolation_mode);
    parse_key_value(s, "\"queue_capacity\"", st.queue_capacity);
    parse_key_value(s, "\"calibration_scale\"", st.calibration_scale);
    parse_key_value(s, "\"calibration_offset_hz\"", st.calibration_offset_hz);
    parse_key_value(s, "\"silence_policy\"", st.silence_policy);
    parse_key_value(s, "\"silence_hold_seconds\"", st.silence_hold_seconds);
    return true;
}

bool save_settings(const char* path, const AppSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    std::fprintf(f,
        "{\n"
        "  \"device_name\": \"%s\",\n"
        "  \"sample_rate\": %d,\n"
        "  \"block_size\": %d,\n"
        "  \"capture_periods\": %d,\n"
        "  \"use_realtime_priority\": %s,\n"
        "  \"display_window_seconds\": %.3f,\n"
        "  \"plot_seconds\": %.3f,\n"
        "  \"noise_floor\": %.6g,\n"
        "  \"min_frequency_hz\": %.3f,\n"
        "  \"interpolation_mode\": %d,\n"
        "  \"queue_capacity\": %d,\n"
        "  \"calibration_scale\": %.9g,\n"
        "  \"calibration_offset_hz\": %.9g,\n"
        "  \"silence_policy\": %d,\n"
        "  \"silence_hold_seconds\": %.3f\n"
        "}\n",
        st.device_name.c_str(),
        st.sample_rate,
        st.block_size,
        st.capture_periods,
        st.use_realtime_priority ? "true" : "false",
        st.display_window_seconds,
        st.plot_seconds,
        st.noise_floor,
        st.min_frequency_hz,
        st.interpolation_mode,
        st.queue_capacity,
        st.calibration_scale,
        st.calibration_offset_hz,
        st.silence_policy,
        st.silence_hold_seconds);
    const bool ok = std::ferror(f) == 0;
    return std::fclose(f) == 0 && ok;
}

bool validate_settings(const AppSettings& st, std::string* error) {
    if (st.capture_periods < 2) {
        if (error) *error = "capture_periods must be >= 2";
        return false;
    }
    if (st.interpolation_mode != 0 && st.interpolation_mode != 1) {
        if (error) *error = "interpolation_mode must be 0 (linear) or 1 (log)";
        return false;
    }
    if (st.silence_policy != 0 && st.silence_policy != 1) {
        if (error) *error = "silence_policy must be 0 (blank) or 1 (hold)";
        return false;
    }
    if (!(st.plot_seconds > 0.0f) || st.plot_seconds > st.display_window_seconds) {
        if (error) *error = "plot_seconds must be > 0 and within display_window_seconds";
        return false;
    }
    return dsp::BlockPipeline::validate(to_pipeline_config(st), error);
}

dsp::PipelineConfig to_pipeline_config(const AppSettings& st) {
    dsp::PipelineConfig cfg;
    cfg.sample_rate = st.sample_rate;
    cfg.block_size = st.block_size;
    cfg.display_window_seconds = st.display_window_seconds;
    cfg.queue_capacity = st.queue_capacity;
    cfg.noise_floor = st.noise_floor;
    cfg.min_frequency_hz = st.min_frequency_hz;
    cfg.interpolation = st.interpolation_mode == 1 ? dsp::InterpolationScale::Log
                                                   : dsp::InterpolationScale::Linear;
    cfg.calibration.scale = st.calibration_scale;
    cfg.calibration.offset_hz = st.calibration_offset_hz;
    cfg.silence_policy = st.silence_policy == 1 ? dsp::SilencePolicy::Hold
                                                : dsp::SilencePolicy::Blank;
    cfg.silence_hold_seconds = st.silence_hold_seconds;
    return cfg;
}

} // namespace pitchscope
