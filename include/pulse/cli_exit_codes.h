#pragma once

#include <pulse/report_pipeline.h>

namespace pulse {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUsageError = 1;
inline constexpr int kExitPipelineFailed = 2;

int PipelineExitCode(const PipelineResult &result);

} // namespace pulse
