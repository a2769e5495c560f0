#include "video_stage.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace miner::stages {

v1::Narrative NarrateVideo(collaborators::VisionNarrator& narrator, const std::filesystem::path& video, pipeline::ProgressReporter& progress) {
  if (!std::filesystem::exists(video)) {
    throw util::CollaboratorError("video file missing: " + video.string());
  }

  progress.Emit("Video", "Analyzing Scenes...");

  v1::Narrative narrative;
  narrative.set_text(util::Trim(narrator.Narrate(video)));

  MINER_LOG_INFO("narrated video", {observability::IntField("chars", static_cast<std::int64_t>(narrative.text().size()))});
  return narrative;
}

} // namespace miner::stages
