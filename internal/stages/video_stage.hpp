#pragma once

#include <filesystem>

#include "internal/collaborators/collaborators.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::stages {

// Video stage: scene narrative of the downloaded video. A missing video
// file is a stage error.
v1::Narrative NarrateVideo(collaborators::VisionNarrator& narrator, const std::filesystem::path& video, pipeline::ProgressReporter& progress);

} // namespace miner::stages
