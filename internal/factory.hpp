#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/collaborators/collaborators.hpp"
#include "internal/collaborators/command_template.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/progress_reporter.hpp"

namespace miner::factory {

/*
  Composition root.

  The ONLY place allowed to know concrete DB and collaborator types.
*/

// Opens the configured store and bootstraps its schema. Throws
// util::StoreUnavailable when no backend is configured, the backend is
// not compiled in, or the store cannot be opened.
std::shared_ptr<db::Repository> BuildRepository(const miner::runtime::config::RuntimeConfig& config);

// Command-backed collaborators for every external tool.
collaborators::Collaborators BuildCollaborators(const miner::runtime::config::RuntimeConfig& config, const collaborators::CommandContext& context,
                                                pipeline::ProgressReporter& progress);

} // namespace miner::factory
