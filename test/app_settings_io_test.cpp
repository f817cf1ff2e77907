#include <catch2/catch.hpp>

#include "app_settings_io.hpp"
#include "cli.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace pitchscope;

namespace {

std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// argv-style view over a list of strings
struct Args {
    explicit Args(std::vector<std::string> a) : storage(std::move(a)) {
        for (auto& s : storage) ptrs.push_back(&s[0]);
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

} // namespace

TEST_CASE("Settings survive a save and load", "[settings]") {
    const std::string path = temp_path("pitchscope_settings_roundtrip.json");
    AppSettings out;
    out.device_name = "plughw:1,0";
    out.sample_rate = 48000;
    out.block_size = 4096;
    out.use_realtime_priority = false;
    out.noise_floor = 0.005f;
    out.interpolation_mode = 1;
    out.calibration_scale = 1.0101;
    out.calibration_offset_hz = -0.25;
    out.silence_policy = 1;
    out.silence_hold_seconds = 0.75f;
    REQUIRE(save_settings(path.c_str(), out));

    AppSettings in;
    REQUIRE(load_settings(path.c_str(), in));
    CHECK(in.device_name == "plughw:1,0");
    CHECK(in.sample_rate == 48000);
    CHECK(in.block_size == 4096);
    CHECK_FALSE(in.use_realtime_priority);
    CHECK(in.noise_floor == Approx(0.005f));
    CHECK(in.interpolation_mode == 1);
    CHECK(in.calibration_scale == Approx(1.0101));
    CHECK(in.calibration_offset_hz == Approx(-0.25));
    CHECK(in.silence_policy == 1);
    CHECK(in.silence_hold_seconds == Approx(0.75f));
    std::remove(path.c_str());
}

TEST_CASE("Missing keys keep their defaults", "[settings]") {
    const std::string path = temp_path("pitchscope_settings_partial.json");
    {
        std::ofstream f(path);
        f << "{\n  \"block_size\": 1024,\n  \"min_frequency_hz\": 60.0\n}\n";
    }
    AppSettings st;
    REQUIRE(load_settings(path.c_str(), st));
    CHECK(st.block_size == 1024);
    CHECK(st.min_frequency_hz == Approx(60.0f));
    CHECK(st.sample_rate == 44100);
    CHECK(st.device_name == "default");
    std::remove(path.c_str());

    CHECK_FALSE(load_settings(temp_path("pitchscope_no_such_file.json").c_str(), st));
}

TEST_CASE("Settings validation", "[settings]") {
    std::string error;
    AppSettings st;
    CHECK(validate_settings(st, &error));

    st.block_size = 0;
    CHECK_FALSE(validate_settings(st, &error));
    CHECK_FALSE(error.empty());

    st = AppSettings{};
    st.calibration_scale = -2.0;
    CHECK_FALSE(validate_settings(st));

    st = AppSettings{};
    st.interpolation_mode = 3;
    CHECK_FALSE(validate_settings(st));

    st = AppSettings{};
    st.plot_seconds = 5.0f;
    CHECK_FALSE(validate_settings(st));

    st = AppSettings{};
    st.capture_periods = 1;
    CHECK_FALSE(validate_settings(st));
}

TEST_CASE("Settings map onto the pipeline configuration", "[settings]") {
    AppSettings st;
    st.interpolation_mode = 1;
    st.silence_policy = 1;
    st.calibration_scale = 1.5;
    auto cfg = to_pipeline_config(st);
    CHECK(cfg.sample_rate == st.sample_rate);
    CHECK(cfg.block_size == st.block_size);
    CHECK(cfg.interpolation == dsp::InterpolationScale::Log);
    CHECK(cfg.silence_policy == dsp::SilencePolicy::Hold);
    CHECK(cfg.calibration.scale == 1.5);
}

TEST_CASE("Command line overrides settings", "[cli]") {
    AppSettings st;
    CliOptions opt;
    std::string error;

    SECTION("flags with values") {
        Args args({"pitchscope", "--rate", "48000", "--block", "4096", "--scale", "1.01",
                   "--offset", "-0.5", "--device", "hw:1", "--hold", "--log-interp",
                   "--tone", "330", "--tone-seconds", "2"});
        REQUIRE(parse_command_line(args.argc(), args.argv(), st, opt, &error));
        CHECK(st.sample_rate == 48000);
        CHECK(st.block_size == 4096);
        CHECK(st.calibration_scale == Approx(1.01));
        CHECK(st.calibration_offset_hz == Approx(-0.5));
        CHECK(st.device_name == "hw:1");
        CHECK(st.silence_policy == 1);
        CHECK(st.interpolation_mode == 1);
        CHECK(opt.tone_hz == Approx(330.0f));
        CHECK(opt.tone_seconds == Approx(2.0f));
    }

    SECTION("two-tone calibration values") {
        Args args({"pitchscope", "--calibrate", "440", "436", "880", "872"});
        REQUIRE(parse_command_line(args.argc(), args.argv(), st, opt, &error));
        CHECK(opt.calibrate);
        CHECK(opt.calibrate_values[1] == 436.0);
        CHECK(opt.calibrate_values[3] == 872.0);
    }

    SECTION("settings path") {
        Args args({"pitchscope", "--save", "--settings", "/tmp/x.json"});
        CHECK(find_settings_path(args.argc(), args.argv()) == "/tmp/x.json");
        REQUIRE(parse_command_line(args.argc(), args.argv(), st, opt, &error));
        CHECK(opt.save);
        CHECK(opt.settings_path == "/tmp/x.json");
    }

    SECTION("malformed input fails") {
        Args unknown({"pitchscope", "--bogus"});
        CHECK_FALSE(parse_command_line(unknown.argc(), unknown.argv(), st, opt, &error));
        CHECK(error.find("--bogus") != std::string::npos);

        Args bad_number({"pitchscope", "--rate", "44k"});
        CHECK_FALSE(parse_command_line(bad_number.argc(), bad_number.argv(), st, opt, &error));

        Args missing({"pitchscope", "--scale"});
        CHECK_FALSE(parse_command_line(missing.argc(), missing.argv(), st, opt, &error));

        Args short_calibrate({"pitchscope", "--calibrate", "440", "436", "880"});
        CHECK_FALSE(parse_command_line(short_calibrate.argc(), short_calibrate.argv(), st, opt, &error));

        Args zero_tone({"pitchscope", "--tone", "0"});
        CHECK_FALSE(parse_command_line(zero_tone.argc(), zero_tone.argv(), st, opt, &error));
    }
}

TEST_CASE("Equal measured tones stop the program with an error", "[cli]") {
    AppSettings st;
    CliOptions opt;
    const std::string path = temp_path("pitchscope_no_settings_here.json");
    Args args({"pitchscope", "--settings", path, "--calibrate", "440", "500", "880", "500"});
    CHECK(resolve_settings(args.argc(), args.argv(), st, opt) == 1);
}
