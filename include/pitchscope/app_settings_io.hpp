#pragma once

#include <string>

#include "app_settings.hpp"
#include "dsp/block_pipeline.hpp"

namespace pitchscope {

bool load_settings(const char* path, AppSettings& st);
bool save_settings(const char* path, const AppSettings& st);

bool validate_settings(const AppSettings& st, std::string* error = nullptr);
dsp::PipelineConfig to_pipeline_config(const AppSettings& st);

}
