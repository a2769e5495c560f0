#include "sync_engine.hpp"

#include <chrono>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace miner::sync {

namespace {

constexpr const char* kLabel = "DB Sync";

std::string FirstNonEmpty(const std::string& preferred, const std::string& fallback) {
  return preferred.empty() ? fallback : preferred;
}

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& field) {
  return std::vector<std::string>(field.begin(), field.end());
}

// An artifact file that exists but cannot be read is treated as absent.
void WarnIfUnreadable(const std::filesystem::path& path, bool parsed) {
  if (!parsed && std::filesystem::exists(path)) {
    MINER_LOG_WARN("ignoring unreadable artifact", {observability::StringField("path", path.string())});
  }
}

void CheckDimension(const db::model::Embedding& vector, std::size_t& dimension, const char* name) {
  if (vector.empty()) {
    throw util::CollaboratorError(std::string("empty ") + name + " embedding");
  }
  if (dimension == 0) {
    dimension = vector.size();
  } else if (vector.size() != dimension) {
    throw util::CollaboratorError(std::string(name) + " embedding has " + std::to_string(vector.size()) + " dimensions, expected " +
                                  std::to_string(dimension));
  }
}

void Require(const db::Result& result, const char* what) {
  if (!result) {
    throw std::runtime_error(std::string(what) + " failed (" + db::ErrorCodeName(result.code) + "): " + result.message);
  }
}

} // namespace

SyncEngine::SyncEngine(RepositoryProvider repositories, std::shared_ptr<collaborators::Embedder> embedder, pipeline::ProgressReporter& progress)
    : repositories_(std::move(repositories)), embedder_(std::move(embedder)), progress_(progress) {
}

std::string SyncEngine::CombinedText(const std::string& title, const std::string& summary, const std::string& narrative, const std::string& transcript) {
  return "Title: " + title + "\nSummary: " + summary + "\nVisuals: " + narrative + "\nLyrics: " + transcript;
}

SyncPlan SyncEngine::Plan(const pipeline::ArtifactCache& cache, const v1::SourceInfo& source) {
  const auto& paths = cache.Paths();

  auto metadata   = cache.ReadMetadata();
  auto transcript = cache.ReadTranscript();
  auto narrative  = cache.ReadNarrative();
  auto emotions   = cache.ReadEmotions();

  WarnIfUnreadable(paths.metadata, metadata.has_value());
  WarnIfUnreadable(paths.emotions, emotions.has_value());

  const v1::MediaMetadata meta = metadata.value_or(v1::MediaMetadata{});

  SyncPlan plan;

  auto& song            = plan.song;
  song.yt_video_id      = FirstNonEmpty(meta.id(), source.id());
  song.title            = FirstNonEmpty(meta.title(), source.title());
  song.duration_seconds = meta.duration() > 0 ? meta.duration() : source.duration();
  song.album            = meta.movie();
  song.movie            = meta.movie();
  song.language         = meta.language();
  song.country          = meta.country();
  song.cast             = ToVector(meta.cast());
  song.music_director   = meta.music_director();
  song.lyricist         = meta.lyricist();
  song.official_lyrics  = meta.official_lyrics();
  song.singers          = ToVector(meta.singers());
  if (song.singers.empty()) song.singers = {"Unknown"};
  song.summary = FirstNonEmpty(meta.summary(), source.description());

  plan.artist.name = song.singers.front();

  plan.context.visual_description = narrative.value_or("");
  plan.context.transcript         = transcript.value_or("");
  plan.context.emotional_tags     = emotions.value_or(std::vector<std::string>{});

  if (song.yt_video_id.empty()) {
    throw util::InvalidArgument("cannot sync a run without an external id");
  }
  return plan;
}

void SyncEngine::Embed(SyncPlan& plan, const std::string& summary) {
  if (!embedder_) {
    throw util::CollaboratorError("no embedding collaborator configured");
  }

  auto&       context   = plan.context;
  std::size_t dimension = 0;

  if (!context.visual_description.empty()) {
    context.visual_vector = embedder_->Embed(context.visual_description);
    CheckDimension(*context.visual_vector, dimension, "narrative");
  }
  if (!context.transcript.empty()) {
    context.transcript_vector = embedder_->Embed(context.transcript);
    CheckDimension(*context.transcript_vector, dimension, "transcript");
  }

  context.combined_vector = embedder_->Embed(CombinedText(plan.song.title, summary, context.visual_description, context.transcript));
  CheckDimension(context.combined_vector, dimension, "combined");
}

void SyncEngine::Write(db::Repository& repository, SyncPlan& plan) {
  auto tx = repository.Begin();

  Require(repository.UpsertArtist(*tx, plan.artist), "artist upsert");

  plan.song.artist_id = plan.artist.id;
  Require(repository.UpsertSong(*tx, plan.song), "song upsert");

  plan.context.song_id       = plan.song.id;
  plan.context.updated_at_ms = util::NowMs();
  Require(repository.UpsertSongContext(*tx, plan.context), "context upsert");

  tx->Commit();
}

bool SyncEngine::Sync(const pipeline::ArtifactCache& cache, const v1::SourceInfo& source) {
  observability::SpanScope span("miner.sync");
  auto&                    metrics = observability::Metrics::Instance();
  const auto               started = std::chrono::steady_clock::now();

  bool ok = false;
  try {
    progress_.Emit(kLabel, "Connecting...", 10);
    auto repository = repositories_ ? repositories_() : nullptr;
    if (!repository) {
      throw util::StoreUnavailable("no database configured");
    }

    auto plan = Plan(cache, source);
    span.SetAttribute("yt_video_id", plan.song.yt_video_id);

    progress_.Emit(kLabel, "Loading AI Model...", 20);
    progress_.Emit(kLabel, "Generating Vectors...", 50);
    Embed(plan, plan.song.summary);

    Write(*repository, plan);

    progress_.Emit(kLabel, "Complete", 100);
    MINER_LOG_INFO("synced run", {observability::StringField("yt_video_id", plan.song.yt_video_id), observability::IntField("song_id", plan.song.id),
                                  observability::StringField("artist", plan.artist.name)});
    ok = true;
  } catch (const std::exception& e) {
    MINER_LOG_ERROR("sync failed", {observability::StringField("error", e.what())});
    span.RecordException(e.what());
    progress_.Emit(kLabel, "Failed", 100);
  }

  metrics.RecordSync(ok);
  metrics.ObserveSyncDurationMs(util::ElapsedMs(started));
  return ok;
}

} // namespace miner::sync
