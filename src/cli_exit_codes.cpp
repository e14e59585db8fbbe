#include <pulse/cli_exit_codes.h>

namespace pulse {

int PipelineExitCode(const PipelineResult &result) {
  if (result.Succeeded()) {
    return kExitSuccess;
  }
  return kExitPipelineFailed;
}

} // namespace pulse
