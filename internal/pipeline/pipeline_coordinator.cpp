#include "pipeline_coordinator.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/run_key.hpp"
#include "internal/stages/audio_stage.hpp"
#include "internal/stages/emotion_stage.hpp"
#include "internal/stages/metadata_stage.hpp"
#include "internal/stages/video_stage.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace miner::pipeline {

namespace {

constexpr std::uintmax_t kMinReusableVideoBytes = 1024;

bool HasReusableVideo(const RunPaths& paths) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(paths.video, ec)) return false;
  auto size = std::filesystem::file_size(paths.video, ec);
  return !ec && size > kMinReusableVideoBytes;
}

void StampSource(v1::MediaMetadata& metadata, const v1::SourceInfo& source) {
  metadata.set_id(source.id());
  metadata.set_title(source.title());
  metadata.set_duration(source.duration());
}

} // namespace

const char* StageStatusName(StageStatus status) {
  switch (status) {
    case StageStatus::kCompleted:
      return "completed";
    case StageStatus::kCached:
      return "cached";
    case StageStatus::kSkipped:
      return "skipped";
    case StageStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

v1::SourceInfo PlaceholderSource(const std::string& run_key, const std::string& title) {
  v1::SourceInfo source;
  source.set_id(run_key);
  source.set_title(title);
  source.set_duration(0);
  return source;
}

PipelineCoordinator::PipelineCoordinator(collaborators::Collaborators collaborators, ProgressReporter& progress, CancellationToken& token,
                                         CoordinatorOptions options)
    : collaborators_(std::move(collaborators)), progress_(progress), token_(token), options_(std::move(options)), executor_(progress, token, options_.executor) {
}

RunReport PipelineCoordinator::Run(const std::string& url, const std::set<StageKind>& stages) {
  observability::SpanScope span("miner.run");

  RunReport report;
  report.run_key = ResolveRunKey(url);
  report.paths   = RunPaths::For(options_.output_root, report.run_key);
  span.SetAttribute("run_key", report.run_key);

  std::error_code ec;
  std::filesystem::create_directories(report.paths.folder, ec);
  if (ec) {
    throw util::FatalRunError("cannot create run directory " + report.paths.folder.string() + ": " + ec.message());
  }

  MINER_LOG_INFO("run started", {observability::StringField("run_key", report.run_key), observability::IntField("stages", static_cast<std::int64_t>(stages.size()))});

  ArtifactCache cache(report.paths);
  report.source = AcquireSource(url, report.run_key, cache);

  for (StageKind kind : kStageOrder) {
    if (!stages.contains(kind)) continue;
    report.stages[kind] = RunStage(kind, report.source, cache);
  }

  MINER_LOG_INFO("run finished", {observability::StringField("run_key", report.run_key)});
  return report;
}

v1::SourceInfo PipelineCoordinator::AcquireSource(const std::string& url, const std::string& run_key, const ArtifactCache& cache) {
  const auto& paths = cache.Paths();

  if (HasReusableVideo(paths)) {
    progress_.Emit("Downloading", "Local File Found", 100);

    if (auto metadata = cache.ReadMetadata(); metadata && !metadata->title().empty()) {
      v1::SourceInfo source;
      source.set_id(metadata->id().empty() ? run_key : metadata->id());
      source.set_title(metadata->title());
      source.set_duration(metadata->duration());
      return source;
    }

    try {
      auto source = collaborators_.source_fetcher->FetchInfo(url);
      if (source.id().empty()) source.set_id(run_key);
      return source;
    } catch (const std::exception& e) {
      MINER_LOG_WARN("source info unavailable for local file, using placeholder", {observability::StringField("error", e.what())});
      return PlaceholderSource(run_key, "Video " + run_key);
    }
  }

  observability::SpanScope span("miner.download");
  try {
    auto source = collaborators_.source_fetcher->Download(url, paths);
    if (source.id().empty()) source.set_id(run_key);
    MINER_LOG_INFO("downloaded source", {observability::StringField("id", source.id()), observability::StringField("title", source.title())});
    return source;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    progress_.Emit("Downloading", "Failed", 100);
    throw util::FatalRunError("download failed: " + std::string(e.what()));
  }
}

StageStatus PipelineCoordinator::RunStage(StageKind kind, const v1::SourceInfo& source, const ArtifactCache& cache) {
  const auto& descriptor = Describe(kind);
  auto&       metrics    = observability::Metrics::Instance();

  observability::SpanScope span("miner.stage");
  span.SetAttribute("stage", descriptor.name);

  if (cache.IsComplete(kind)) {
    progress_.Emit(descriptor.label, "Cached", 100);
    metrics.RecordStageOutcome(descriptor.name, StageStatusName(StageStatus::kCached));
    return StageStatus::kCached;
  }

  // arm before announcing the stage
  token_.Arm();
  progress_.Emit(descriptor.label, "Initializing...", 0);

  const auto started = std::chrono::steady_clock::now();
  auto       result  = executor_.Execute(descriptor.label, ComputationFor(kind, source, cache));
  metrics.ObserveStageDurationMs(descriptor.name, util::ElapsedMs(started));

  StageStatus status = StageStatus::kFailed;
  switch (result.outcome) {
    case StageOutcome::kSkipped:
      status = StageStatus::kSkipped;
      span.AddEvent("skipped");
      break;

    case StageOutcome::kFailed:
      progress_.Emit(descriptor.label, "Failed", 100);
      span.RecordException("stage produced no result");
      break;

    case StageOutcome::kCompleted: {
      auto& output = *result.output;
      if (output.has_metadata()) StampSource(*output.mutable_metadata(), source);

      try {
        cache.Persist(kind, output);
        progress_.Emit(descriptor.label, 100, 100);
        status = StageStatus::kCompleted;
      } catch (const std::exception& e) {
        MINER_LOG_ERROR("cannot persist artifact", {observability::StringField("stage", descriptor.name), observability::StringField("error", e.what())});
        progress_.Emit(descriptor.label, "Failed", 100);
        span.RecordException(e.what());
      }
      break;
    }
  }

  metrics.RecordStageOutcome(descriptor.name, StageStatusName(status));
  MINER_LOG_INFO("stage finished", {observability::StringField("stage", descriptor.name), observability::StringField("status", StageStatusName(status))});
  return status;
}

StageComputation PipelineCoordinator::ComputationFor(StageKind kind, const v1::SourceInfo& source, const ArtifactCache& cache) {
  auto& c        = collaborators_;
  auto& progress = progress_;

  switch (kind) {
    case StageKind::kMetadata:
      return [&c, &progress, source]() {
        v1::StageOutput output;
        *output.mutable_metadata() = stages::ExtractMetadata(*c.text_generator, source, progress);
        return output;
      };

    case StageKind::kAudio:
      return [&c, &progress, &cache]() {
        v1::StageOutput output;
        auto            transcript = stages::ProcessAudio(*c.speech_to_text, *c.text_generator, cache.Paths().audio, progress);
        if (!transcript.text().empty()) *output.mutable_transcript() = std::move(transcript);
        return output;
      };

    case StageKind::kVideo:
      return [&c, &progress, &cache]() {
        v1::StageOutput output;
        auto            narrative = stages::NarrateVideo(*c.vision_narrator, cache.Paths().video, progress);
        if (!narrative.text().empty()) *output.mutable_narrative() = std::move(narrative);
        return output;
      };

    case StageKind::kEmotions:
      return [&c, &progress, &cache, source, dependency = Describe(kind).soft_dependency]() {
        // optional input, read if complete when the stage starts
        std::string narrative;
        if (dependency) narrative = cache.ReadArtifact(*dependency).value_or("");
        MINER_LOG_DEBUG("emotion context", {observability::BoolField("has_dependency_input", !narrative.empty())});

        v1::StageOutput output;
        auto tags = stages::DeriveEmotions(*c.text_generator, stages::BuildEmotionContext(source.title(), narrative), progress);
        if (tags.tags_size() > 0) *output.mutable_emotions() = std::move(tags);
        return output;
      };
  }
  throw util::InvalidArgument("unknown stage kind");
}

} // namespace miner::pipeline
