#pragma once

#include <string>

#include "internal/collaborators/collaborators.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::stages {

// Title plus, when present, the video narrative.
std::string BuildEmotionContext(const std::string& title, const std::string& narrative);

/*
  Emotions stage.

  A context shorter than 10 characters yields no tags without calling the
  generator. The first [...] block of the answer is parsed; string tags
  are trimmed and lower-cased, anything else is dropped.
*/
v1::EmotionTags DeriveEmotions(collaborators::TextGenerator& generator, const std::string& context, pipeline::ProgressReporter& progress);

} // namespace miner::stages
