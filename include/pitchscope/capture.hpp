#pragma once

#include <memory>
#include <string>

#include "app_settings.hpp"
#include "audio_input.hpp"
#include "cli.hpp"
#include "dsp/block_pipeline.hpp"

namespace pitchscope {

// Opens the tone source or the ALSA device, wires it to the pipeline and starts it.
// A device that will not run at the configured sample rate is a configuration error.
std::unique_ptr<IAudioInput> start_capture(const AppSettings& st, const CliOptions& opt,
                                           dsp::BlockPipeline& pipeline, std::string* error = nullptr);

} // namespace pitchscope
