#pragma once

namespace pulse {

enum class PipelineState {
  kIdle,
  kHarvesting,
  kAnalyzing,
  kSummarizing,
  kDone,
  kFailed
};

enum class PipelineStage { kHarvest, kAnalyze, kSummarize };

enum class PipelineEvent { kStart, kStageSucceeded, kStageFailed };

bool IsTerminal(PipelineState state);

// Throws std::logic_error for transitions the state machine does not allow,
// including any event delivered to a terminal state.
PipelineState NextState(PipelineState state, PipelineEvent event);

// Stage executed while the pipeline is in the given working state. Throws
// std::logic_error for kIdle and terminal states.
PipelineStage StageFor(PipelineState state);

const char *ToString(PipelineState state);
const char *ToString(PipelineStage stage);

} // namespace pulse
