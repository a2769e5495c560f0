#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "internal/collaborators/collaborators.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::stages {

// Record used whenever the generator is unreachable or its answer cannot
// be parsed.
v1::MediaMetadata FallbackMetadata(const std::string& title, const std::string& description);

// Overlays the fields present in a parsed generator answer on top of the
// fallback record.
v1::MediaMetadata MergeGeneratedMetadata(const google::protobuf::Struct& parsed, const std::string& title, const std::string& description);

/*
  Metadata stage.

  Never fails: any generator problem yields FallbackMetadata(). id, title
  and duration are left for the coordinator to stamp from the source.
*/
v1::MediaMetadata ExtractMetadata(collaborators::TextGenerator& generator, const v1::SourceInfo& source, pipeline::ProgressReporter& progress);

} // namespace miner::stages
