#include <pulse/pipeline_state.h>

#include <stdexcept>
#include <string>

namespace pulse {

bool IsTerminal(PipelineState state) {
  return state == PipelineState::kDone || state == PipelineState::kFailed;
}

PipelineState NextState(PipelineState state, PipelineEvent event) {
  if (IsTerminal(state)) {
    throw std::logic_error(std::string("Pipeline already finished in state ") +
                           ToString(state));
  }
  if (event == PipelineEvent::kStageFailed) {
    return PipelineState::kFailed;
  }
  if (event == PipelineEvent::kStart) {
    if (state != PipelineState::kIdle) {
      throw std::logic_error(std::string("Pipeline cannot start from state ") +
                             ToString(state));
    }
    return PipelineState::kHarvesting;
  }

  switch (state) {
  case PipelineState::kHarvesting:
    return PipelineState::kAnalyzing;
  case PipelineState::kAnalyzing:
    return PipelineState::kSummarizing;
  case PipelineState::kSummarizing:
    return PipelineState::kDone;
  case PipelineState::kIdle:
  case PipelineState::kDone:
  case PipelineState::kFailed:
    break;
  }
  throw std::logic_error(std::string("No stage completes in state ") +
                         ToString(state));
}

PipelineStage StageFor(PipelineState state) {
  switch (state) {
  case PipelineState::kHarvesting:
    return PipelineStage::kHarvest;
  case PipelineState::kAnalyzing:
    return PipelineStage::kAnalyze;
  case PipelineState::kSummarizing:
    return PipelineStage::kSummarize;
  case PipelineState::kIdle:
  case PipelineState::kDone:
  case PipelineState::kFailed:
    break;
  }
  throw std::logic_error(std::string("No stage runs in state ") +
                         ToString(state));
}

const char *ToString(PipelineState state) {
  switch (state) {
  case PipelineState::kIdle:
    return "idle";
  case PipelineState::kHarvesting:
    return "harvesting";
  case PipelineState::kAnalyzing:
    return "analyzing";
  case PipelineState::kSummarizing:
    return "summarizing";
  case PipelineState::kDone:
    return "done";
  case PipelineState::kFailed:
    return "failed";
  }
  return "unknown";
}

const char *ToString(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::kHarvest:
    return "harvest";
  case PipelineStage::kAnalyze:
    return "analyze";
  case PipelineStage::kSummarize:
    return "summarize";
  }
  return "unknown";
}

} // namespace pulse
