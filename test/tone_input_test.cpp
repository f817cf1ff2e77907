#include <catch2/catch.hpp>

#include "audio_input.hpp"
#include "dsp/block_pipeline.hpp"
#include "test_signals.hpp"

#include <atomic>

using namespace pitchscope;

TEST_CASE("Tone source drives the pipeline end to end", "[tone]") {
    dsp::PipelineConfig cfg;
    cfg.sample_rate = 44100;
    cfg.block_size = 2048;
    dsp::BlockPipeline pipeline(cfg);
    REQUIRE(pipeline.start());

    AudioConfig audio;
    audio.sample_rate = 44100;
    audio.period_size = 512;
    audio.use_realtime_priority = false;
    auto tone = createToneInput(audio, 440.0f, 0.5f, 0.2f);
    std::atomic<int> callbacks(0);
    tone->set_process_callback([&](const float* samples, int n) {
        ++callbacks;
        pipeline.push_samples(samples, n);
    });

    REQUIRE(tone->start());
    CHECK(tone->get_config().sample_rate == 44100);

    // 0.2 s at 512 frames per period is 18 periods, 4 whole blocks
    REQUIRE(test::wait_until([&] { return !tone->is_running(); }));
    CHECK(callbacks.load() == 18);
    REQUIRE(test::wait_until([&] { return pipeline.stats().processed >= 4; }));

    auto reading = pipeline.current_pitch();
    REQUIRE(reading);
    CHECK(reading->note_name == "A");
    CHECK(reading->octave == 4);
    CHECK(tone->get_latency_stats().xruns == 0);

    tone->stop();
    pipeline.stop();
    CHECK(pipeline.stats().pushed == 4);
}

TEST_CASE("Tone source rejects an unusable configuration", "[tone]") {
    AudioConfig audio;
    audio.period_size = 0;
    auto tone = createToneInput(audio, 440.0f);
    CHECK_FALSE(tone->start());
    CHECK_FALSE(tone->is_running());
}
