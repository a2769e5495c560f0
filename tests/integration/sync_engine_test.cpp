#include "internal/sync/sync_engine.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_collaborators.hpp"

namespace {

using miner::db::Repository;
using miner::pipeline::ArtifactCache;
using miner::pipeline::ProgressReporter;
using miner::pipeline::RunPaths;
using miner::pipeline::StageKind;
using miner::sync::SyncEngine;
using miner::testing::FakeEmbedder;
using miner::testing::FreshDirectory;
using miner::testing::ProgressLog;

constexpr const char* kSuite = "miner_sync_engine_tests";

/*
  Forwards to a real repository but fails every context upsert, after
  the artist and song rows were already written in the transaction.
*/
class FailingContextRepository final : public Repository {
 public:
  explicit FailingContextRepository(std::shared_ptr<Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<miner::db::Transaction> Begin() override {
    return inner_->Begin();
  }

  miner::db::Result UpsertArtist(miner::db::Transaction& tx, miner::db::model::ArtistRecord& r) override {
    return inner_->UpsertArtist(tx, r);
  }

  std::optional<miner::db::model::ArtistRecord> GetArtistByName(miner::db::Transaction& tx, const std::string& name) override {
    return inner_->GetArtistByName(tx, name);
  }

  miner::db::Result UpsertSong(miner::db::Transaction& tx, miner::db::model::SongRecord& r) override {
    return inner_->UpsertSong(tx, r);
  }

  std::optional<miner::db::model::SongRecord> GetSongByVideoId(miner::db::Transaction& tx, const std::string& id) override {
    return inner_->GetSongByVideoId(tx, id);
  }

  miner::db::Result UpsertSongContext(miner::db::Transaction&, const miner::db::model::SongContextRecord&) override {
    return miner::db::Result::Err(miner::db::ErrorCode::IOError, "injected context failure");
  }

  std::optional<miner::db::model::SongContextRecord> GetSongContext(miner::db::Transaction& tx, std::int64_t song_id) override {
    return inner_->GetSongContext(tx, song_id);
  }

 private:
  std::shared_ptr<Repository> inner_;
};

std::vector<std::shared_ptr<Repository>> Stores(const std::filesystem::path& dir) {
  std::vector<std::shared_ptr<Repository>> stores;

  miner::runtime::config::RuntimeConfig memory;
  memory.mutable_database()->mutable_memory();
  stores.push_back(miner::factory::BuildRepository(memory));

#if MINER_DB_SQLITE
  miner::runtime::config::RuntimeConfig sqlite;
  sqlite.mutable_database()->mutable_sqlite()->set_path((dir / "miner.db").string());
  stores.push_back(miner::factory::BuildRepository(sqlite));
#else
  (void)dir;
#endif

  return stores;
}

miner::v1::SourceInfo MakeSource(const std::string& id) {
  miner::v1::SourceInfo source;
  source.set_id(id);
  source.set_title("Channa Mereya");
  source.set_duration(289);
  source.set_description("From the movie Ae Dil Hai Mushkil");
  return source;
}

// metadata + transcript + emotions; no narrative
ArtifactCache WriteArtifacts(const std::filesystem::path& root, const std::string& id) {
  ArtifactCache cache(RunPaths::For(root, id));

  miner::v1::StageOutput metadata;
  auto*                  meta = metadata.mutable_metadata();
  meta->set_id(id);
  meta->set_title("Channa Mereya");
  meta->set_duration(289);
  meta->set_movie("Ae Dil Hai Mushkil");
  meta->add_singers("Arijit Singh");
  meta->set_language("hi");
  meta->set_summary("A farewell song.");
  cache.Persist(StageKind::kMetadata, metadata);

  miner::v1::StageOutput transcript;
  transcript.mutable_transcript()->set_text("channa mereya mereya");
  cache.Persist(StageKind::kAudio, transcript);

  miner::v1::StageOutput emotions;
  emotions.mutable_emotions()->add_tags("heartbreak");
  emotions.mutable_emotions()->add_tags("longing");
  cache.Persist(StageKind::kEmotions, emotions);

  return cache;
}

void TestCombinedText() {
  assert(SyncEngine::CombinedText("T", "S", "V", "L") == "Title: T\nSummary: S\nVisuals: V\nLyrics: L");
}

void TestPlanFillsGapsFromSource() {
  const auto    dir = FreshDirectory(kSuite, "plan_gaps");
  ArtifactCache cache(RunPaths::For(dir, "k1"));

  miner::v1::StageOutput metadata;
  metadata.mutable_metadata()->set_movie("Unknown");
  cache.Persist(StageKind::kMetadata, metadata);

  const auto plan = SyncEngine::Plan(cache, MakeSource("k1"));
  assert(plan.song.yt_video_id == "k1");
  assert(plan.song.title == "Channa Mereya");
  assert(plan.song.duration_seconds == 289);
  assert(plan.song.album == "Unknown" && plan.song.movie == "Unknown");
  assert(plan.song.singers == std::vector<std::string>{"Unknown"});
  assert(plan.artist.name == "Unknown");
  assert(plan.song.summary == "From the movie Ae Dil Hai Mushkil");
  assert(plan.context.visual_description.empty());
  assert(plan.context.transcript.empty());
  assert(plan.context.emotional_tags.empty());

  bool threw = false;
  try {
    SyncEngine::Plan(ArtifactCache(RunPaths::For(dir, "k2")), MakeSource(""));
  } catch (const miner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSyncWritesAllRows() {
  const auto dir = FreshDirectory(kSuite, "sync_success");

  for (const auto& store : Stores(dir)) {
    ProgressLog      log(dir / "progress.log");
    ProgressReporter progress(log.Fd());

    auto       embedder = std::make_shared<FakeEmbedder>();
    auto       cache    = WriteArtifacts(dir / "runs", "abc123");
    SyncEngine engine([store]() { return store; }, embedder, progress);

    assert(engine.Sync(cache, MakeSource("abc123")));
    assert(log.Lines() == (std::vector<std::string>{"PRG:DB Sync:Connecting...:10", "PRG:DB Sync:Loading AI Model...:20",
                                                    "PRG:DB Sync:Generating Vectors...:50", "PRG:DB Sync:Complete:100"}));

    // transcript and combined text; no narrative to embed
    assert(embedder->inputs.size() == 2);
    assert(embedder->inputs[0] == "channa mereya mereya");
    assert(embedder->inputs[1] == SyncEngine::CombinedText("Channa Mereya", "A farewell song.", "", "channa mereya mereya"));

    auto tx     = store->Begin();
    auto artist = store->GetArtistByName(*tx, "Arijit Singh");
    auto song   = store->GetSongByVideoId(*tx, "abc123");
    assert(artist.has_value());
    assert(song.has_value());
    assert(song->artist_id == artist->id);
    assert(song->album == "Ae Dil Hai Mushkil");
    assert(song->summary == "A farewell song.");

    auto context = store->GetSongContext(*tx, song->id);
    assert(context.has_value());
    assert(context->transcript == "channa mereya mereya");
    assert(context->emotional_tags == (std::vector<std::string>{"heartbreak", "longing"}));
    assert(!context->visual_vector.has_value());
    assert(context->transcript_vector.has_value() && context->transcript_vector->size() == 4);
    assert(context->combined_vector.size() == 4);
    tx->Commit();

    // re-sync with a narrative: same song row, context replaced
    const auto first_song_id = song->id;
    miner::v1::StageOutput narrative;
    narrative.mutable_narrative()->set_text("rain on a terrace at night");
    cache.Persist(StageKind::kVideo, narrative);
    assert(engine.Sync(cache, MakeSource("abc123")));

    auto tx2      = store->Begin();
    auto resynced = store->GetSongByVideoId(*tx2, "abc123");
    assert(resynced.has_value() && resynced->id == first_song_id);
    auto updated = store->GetSongContext(*tx2, first_song_id);
    assert(updated.has_value());
    assert(updated->visual_description == "rain on a terrace at night");
    assert(updated->visual_vector.has_value());
    tx2->Commit();

    std::filesystem::remove_all(dir / "runs");
  }
}

void TestContextFailureRollsBackSongAndArtist() {
  const auto dir = FreshDirectory(kSuite, "sync_rollback");

  for (const auto& store : Stores(dir)) {
    ProgressLog      log(dir / "progress.log");
    ProgressReporter progress(log.Fd());

    auto       failing = std::make_shared<FailingContextRepository>(store);
    auto       cache   = WriteArtifacts(dir / "runs", "rollback1");
    SyncEngine engine([failing]() -> std::shared_ptr<Repository> { return failing; }, std::make_shared<FakeEmbedder>(), progress);

    assert(!engine.Sync(cache, MakeSource("rollback1")));
    assert(log.Contains("PRG:DB Sync:Failed:100"));
    assert(!log.Contains("PRG:DB Sync:Complete:100"));

    auto tx = store->Begin();
    assert(!store->GetSongByVideoId(*tx, "rollback1").has_value());
    assert(!store->GetArtistByName(*tx, "Arijit Singh").has_value());
    tx->Commit();

    std::filesystem::remove_all(dir / "runs");
  }
}

void TestEmbeddingProblemsFailTheSync() {
  const auto dir   = FreshDirectory(kSuite, "sync_embedding");
  auto       store = Stores(dir).front();
  auto       cache = WriteArtifacts(dir / "runs", "embed1");

  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  auto mismatched   = std::make_shared<FakeEmbedder>();
  int  calls        = 0;
  mismatched->embed = [&calls](const std::string&) { return std::vector<float>(++calls == 1 ? 4 : 8, 0.5f); };
  assert(!SyncEngine([store]() { return store; }, mismatched, progress).Sync(cache, MakeSource("embed1")));

  auto empty   = std::make_shared<FakeEmbedder>();
  empty->embed = [](const std::string&) { return std::vector<float>{}; };
  assert(!SyncEngine([store]() { return store; }, empty, progress).Sync(cache, MakeSource("embed1")));

  assert(!SyncEngine([store]() { return store; }, nullptr, progress).Sync(cache, MakeSource("embed1")));

  auto tx = store->Begin();
  assert(!store->GetSongByVideoId(*tx, "embed1").has_value());
  tx->Commit();
}

void TestUnavailableStoreFailsTheSync() {
  const auto    dir = FreshDirectory(kSuite, "sync_no_store");
  ArtifactCache cache(RunPaths::For(dir, "k1"));

  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  assert(!SyncEngine(nullptr, std::make_shared<FakeEmbedder>(), progress).Sync(cache, MakeSource("k1")));
  assert(!SyncEngine([]() -> std::shared_ptr<Repository> { throw miner::util::StoreUnavailable("connection refused"); },
                     std::make_shared<FakeEmbedder>(), progress)
              .Sync(cache, MakeSource("k1")));

  assert(log.Lines() == (std::vector<std::string>{"PRG:DB Sync:Connecting...:10", "PRG:DB Sync:Failed:100", "PRG:DB Sync:Connecting...:10",
                                                  "PRG:DB Sync:Failed:100"}));
}

} // namespace

int main() {
  TestCombinedText();
  TestPlanFillsGapsFromSource();
  TestSyncWritesAllRows();
  TestContextFailureRollsBackSongAndArtist();
  TestEmbeddingProblemsFailTheSync();
  TestUnavailableStoreFailsTheSync();

  std::cout << "miner_integration_sync_engine: pass\n";
  return 0;
}
