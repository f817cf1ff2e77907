#include "capture.hpp"

namespace pitchscope {

std::unique_ptr<IAudioInput> start_capture(const AppSettings& st, const CliOptions& opt,
                                           dsp::BlockPipeline& pipeline, std::string* error) {
    AudioConfig audio_config;
    audio_config.device_name = st.device_name;
    audio_config.sample_rate = static_cast<unsigned int>(st.sample_rate);
    audio_config.period_size = static_cast<unsigned int>(st.block_size);
    audio_config.num_periods = static_cast<unsigned int>(st.capture_periods);
    audio_config.use_realtime_priority = st.use_realtime_priority;

    std::unique_ptr<IAudioInput> input = opt.tone_hz > 0.0f
        ? createToneInput(audio_config, opt.tone_hz, opt.tone_amplitude, opt.tone_seconds)
        : createAudioInput(audio_config);

    // Periods of any length are cut into analysis blocks by the pipeline
    input->set_process_callback([&pipeline](const float* samples, int num_samples) {
        pipeline.push_samples(samples, num_samples);
    });

    if (!input->start()) {
        if (error) *error = "failed to start audio capture";
        return nullptr;
    }

    const unsigned int actual_rate = input->get_config().sample_rate;
    if (actual_rate != audio_config.sample_rate) {
        input->stop();
        if (error) {
            *error = "capture runs at " + std::to_string(actual_rate) + " Hz but " +
                     std::to_string(audio_config.sample_rate) + " Hz is configured";
        }
        return nullptr;
    }
    return input;
}

} // namespace pitchscope
