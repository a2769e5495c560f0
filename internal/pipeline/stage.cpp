#include "stage.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace miner::pipeline {

namespace {

const std::array<StageDescriptor, 4> kDescriptors = {{
    {StageKind::kMetadata, "metadata", "Metadata", &RunPaths::metadata, std::nullopt},
    {StageKind::kAudio, "audio", "Audio", &RunPaths::transcript, std::nullopt},
    {StageKind::kVideo, "video", "Video", &RunPaths::narrative, std::nullopt},
    {StageKind::kEmotions, "emotions", "Emotions", &RunPaths::emotions, StageKind::kVideo},
}};

} // namespace

const StageDescriptor& Describe(StageKind kind) {
  return kDescriptors[static_cast<std::size_t>(kind)];
}

std::string_view StageName(StageKind kind) {
  return Describe(kind).name;
}

std::string_view StageLabel(StageKind kind) {
  return Describe(kind).label;
}

std::optional<StageKind> ParseStageName(std::string_view name) {
  const auto normalized = util::ToLower(util::Trim(name));
  for (const auto& descriptor : kDescriptors) {
    if (descriptor.name == normalized) return descriptor.kind;
  }
  return std::nullopt;
}

std::set<StageKind> ParseStageSelection(const std::vector<std::string>& values) {
  std::set<StageKind> selected;
  bool                all = values.empty();

  for (const auto& value : values) {
    for (const auto& piece : util::Split(value, ',')) {
      const auto name = util::ToLower(util::Trim(piece));
      if (name.empty()) continue;
      if (name == "all") {
        all = true;
        continue;
      }
      if (auto kind = ParseStageName(name)) {
        selected.insert(*kind);
      } else {
        MINER_LOG_WARN("ignoring unknown stage", {observability::StringField("stage", name)});
      }
    }
  }

  if (all) {
    selected.insert(kStageOrder.begin(), kStageOrder.end());
  }
  return selected;
}

} // namespace miner::pipeline
