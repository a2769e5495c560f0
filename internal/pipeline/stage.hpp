#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/pipeline/run_paths.hpp"

namespace miner::pipeline {

enum class StageKind {
  kMetadata,
  kAudio,
  kVideo,
  kEmotions,
};

// Execution order; never reordered by the requested set.
inline constexpr std::array<StageKind, 4> kStageOrder = {
    StageKind::kMetadata,
    StageKind::kAudio,
    StageKind::kVideo,
    StageKind::kEmotions,
};

/*
  Static description of a stage.

  artifact points at the RunPaths member holding the stage's output file.
  soft_dependency names a stage whose artifact is read if present when
  this stage starts; it never gates execution.
*/
struct StageDescriptor {
  StageKind                        kind;
  std::string_view                 name;  // CLI / sidecar name
  std::string_view                 label; // progress label
  std::filesystem::path RunPaths::*artifact;
  std::optional<StageKind>         soft_dependency;
};

const StageDescriptor& Describe(StageKind kind);

std::string_view StageName(StageKind kind);
std::string_view StageLabel(StageKind kind);

std::optional<StageKind> ParseStageName(std::string_view name);

// Flattens repeatable, comma-separated values. Empty input or "all"
// selects every stage; unknown names are ignored with a warning.
std::set<StageKind> ParseStageSelection(const std::vector<std::string>& values);

} // namespace miner::pipeline
