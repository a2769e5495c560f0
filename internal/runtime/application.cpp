#include "application.hpp"

#include <chrono>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/pipeline_coordinator.hpp"
#include "internal/pipeline/run_key.hpp"
#include "internal/pipeline/run_paths.hpp"
#include "internal/pipeline/stage.hpp"

namespace miner::runtime {

namespace {

constexpr const char* kSyncPlaceholderTitle = "Synced Video";

void MergeMetadata(v1::SourceInfo& source, const v1::MediaMetadata& metadata) {
  if (!metadata.id().empty()) source.set_id(metadata.id());
  if (!metadata.title().empty()) source.set_title(metadata.title());
  if (metadata.duration() > 0) source.set_duration(metadata.duration());
}

void MergeInfo(v1::SourceInfo& source, const v1::SourceInfo& info) {
  if (!info.id().empty()) source.set_id(info.id());
  if (!info.title().empty()) source.set_title(info.title());
  if (info.duration() > 0) source.set_duration(info.duration());
  if (!info.description().empty()) source.set_description(info.description());
}

} // namespace

collaborators::CommandContext BuildCommandContext(const CliOptions& options) {
  collaborators::CommandContext context;
  context.vars["models_dir"] = options.models_dir;
  context.vars["cookies"]    = "";

  if (!options.models_dir.empty()) {
    context.env["HF_HOME"]          = options.models_dir;
    context.env["MINER_CACHE_ROOT"] = options.models_dir;
  }

  if (!options.cookies.empty()) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(options.cookies, ec)) {
      context.vars["cookies"] = options.cookies;
    } else {
      MINER_LOG_WARN("cookie file not found, continuing without it", {observability::StringField("path", options.cookies)});
    }
  }
  return context;
}

Application::Application(miner::runtime::config::RuntimeConfig config, CliOptions options, collaborators::Collaborators collaborators,
                         sync::RepositoryProvider repositories, pipeline::ProgressReporter& progress, pipeline::CancellationToken& token)
    : config_(std::move(config)),
      options_(std::move(options)),
      collaborators_(std::move(collaborators)),
      repositories_(std::move(repositories)),
      progress_(progress),
      token_(token) {
}

int Application::Run() {
  return options_.sync_only ? SyncOnly() : RunPipeline();
}

int Application::RunPipeline() {
  const auto& pipeline_config = config_.pipeline();

  pipeline::CoordinatorOptions coordinator_options;
  coordinator_options.output_root              = pipeline_config.output_root();
  coordinator_options.executor.poll_interval   = std::chrono::milliseconds(pipeline_config.cancel_poll_interval_ms());
  coordinator_options.executor.terminate_grace = std::chrono::milliseconds(pipeline_config.terminate_grace_ms());

  pipeline::PipelineCoordinator coordinator(collaborators_, progress_, token_, coordinator_options);
  auto                          report = coordinator.Run(options_.url, pipeline::ParseStageSelection(options_.process));

  if (options_.mode != RunMode::kDb) {
    return 0;
  }
  return SyncAndCleanup(pipeline::ArtifactCache(report.paths), report.source) ? 0 : 1;
}

int Application::SyncOnly() {
  progress_.Emit("Sync", "Checking Files", 10);

  const auto key = pipeline::ResolveRunKey(options_.url);
  pipeline::ArtifactCache cache(pipeline::RunPaths::For(config_.pipeline().output_root(), key));

  auto source = pipeline::PlaceholderSource(key, kSyncPlaceholderTitle);
  if (auto metadata = cache.ReadMetadata()) {
    MergeMetadata(source, *metadata);
  }

  if (source.title() == kSyncPlaceholderTitle && collaborators_.source_fetcher) {
    try {
      MergeInfo(source, collaborators_.source_fetcher->FetchInfo(options_.url));
    } catch (const std::exception& e) {
      MINER_LOG_WARN("source info unavailable, syncing with placeholder title", {observability::StringField("error", e.what())});
    }
  }

  return SyncAndCleanup(cache, source) ? 0 : 1;
}

bool Application::SyncAndCleanup(const pipeline::ArtifactCache& cache, const v1::SourceInfo& source) {
  sync::SyncEngine engine(repositories_, collaborators_.embedder, progress_);
  if (!engine.Sync(cache, source)) {
    return false;
  }

  if (options_.cleanup) {
    std::error_code ec;
    std::filesystem::remove_all(cache.Paths().folder, ec);
    if (ec) {
      MINER_LOG_WARN("cannot remove run directory", {observability::StringField("path", cache.Paths().folder.string()), observability::StringField("error", ec.message())});
    } else {
      MINER_LOG_INFO("removed run directory", {observability::StringField("path", cache.Paths().folder.string())});
    }
  }
  return true;
}

} // namespace miner::runtime
