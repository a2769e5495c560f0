#include "internal/pipeline/artifact_cache.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/file_io.hpp"

namespace {

using miner::pipeline::ArtifactCache;
using miner::pipeline::RunPaths;
using miner::pipeline::StageKind;

std::filesystem::path FreshRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "miner_artifact_cache_tests" / test_name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root;
}

void WriteRaw(const std::filesystem::path& path, const std::string& contents) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

miner::v1::StageOutput TranscriptOutput(const std::string& text) {
  miner::v1::StageOutput output;
  output.mutable_transcript()->set_text(text);
  return output;
}

void TestMissingArtifactsAreIncomplete() {
  ArtifactCache cache(RunPaths::For(FreshRoot("missing"), "k1"));
  for (auto kind : miner::pipeline::kStageOrder) {
    assert(!cache.IsComplete(kind));
  }
  assert(!cache.ReadMetadata());
  assert(!cache.ReadTranscript());
  assert(!cache.ReadEmotions());
}

void TestPersistWritesArtifactAndSidecar() {
  ArtifactCache cache(RunPaths::For(FreshRoot("persist"), "k1"));

  cache.Persist(StageKind::kAudio, TranscriptOutput("line one\nline two"));

  assert(cache.IsComplete(StageKind::kAudio));
  assert(cache.ReadTranscript() == std::string("line one\nline two"));
  assert(std::filesystem::exists(ArtifactCache::SidecarPath(cache.Paths().transcript)));
  assert(!std::filesystem::exists(cache.Paths().transcript.string() + ".tmp"));
}

void TestEmptyTextArtifactIsIncomplete() {
  ArtifactCache cache(RunPaths::For(FreshRoot("empty_text"), "k1"));
  WriteRaw(cache.Paths().narrative, "");
  assert(!cache.IsComplete(StageKind::kVideo));

  WriteRaw(cache.Paths().narrative, "a crowd dancing");
  assert(cache.IsComplete(StageKind::kVideo));
}

void TestUnparseableJsonIsIncomplete() {
  ArtifactCache cache(RunPaths::For(FreshRoot("bad_json"), "k1"));

  WriteRaw(cache.Paths().metadata, "{\"title\": ");
  WriteRaw(cache.Paths().emotions, "not json");
  assert(!cache.IsComplete(StageKind::kMetadata));
  assert(!cache.IsComplete(StageKind::kEmotions));
  assert(!cache.ReadMetadata());

  WriteRaw(cache.Paths().emotions, "[\"joy\", \"nostalgia\"]");
  assert(cache.IsComplete(StageKind::kEmotions));
  const auto tags = cache.ReadEmotions();
  assert(tags && tags->size() == 2 && (*tags)[1] == "nostalgia");
}

void TestSidecarMismatchInvalidatesArtifact() {
  ArtifactCache cache(RunPaths::For(FreshRoot("sidecar"), "k1"));
  cache.Persist(StageKind::kAudio, TranscriptOutput("original"));
  assert(cache.IsComplete(StageKind::kAudio));

  // same-length edit: only the checksum catches it
  WriteRaw(cache.Paths().transcript, "0riginal");
  assert(!cache.IsComplete(StageKind::kAudio));

  WriteRaw(ArtifactCache::SidecarPath(cache.Paths().transcript), "garbage");
  assert(!cache.IsComplete(StageKind::kAudio));

  std::filesystem::remove(ArtifactCache::SidecarPath(cache.Paths().transcript));
  assert(cache.IsComplete(StageKind::kAudio));
}

void TestReadArtifactOnlyReturnsCompleteArtifacts() {
  ArtifactCache cache(RunPaths::For(FreshRoot("read_artifact"), "k1"));
  assert(!cache.ReadArtifact(StageKind::kVideo));

  miner::v1::StageOutput narrative;
  narrative.mutable_narrative()->set_text("boats drifting at dusk");
  cache.Persist(StageKind::kVideo, narrative);
  assert(cache.ReadArtifact(StageKind::kVideo) == std::string("boats drifting at dusk"));

  WriteRaw(cache.Paths().narrative, "boats drifting at dawn");
  assert(!cache.ReadArtifact(StageKind::kVideo));
}

void TestMetadataRoundTripKeepsOnDiskNames() {
  ArtifactCache cache(RunPaths::For(FreshRoot("metadata"), "k1"));

  miner::v1::StageOutput output;
  auto*                  meta = output.mutable_metadata();
  meta->set_id("k1");
  meta->set_title("Song");
  meta->set_music_director("Composer");
  meta->set_summary("A summary");
  meta->add_singers("Singer A");
  cache.Persist(StageKind::kMetadata, output);

  const auto raw = miner::util::ReadFile(cache.Paths().metadata);
  assert(raw);
  assert(raw->find("\"musicDirector\"") != std::string::npos);
  assert(raw->find("\"Summary\"") != std::string::npos);

  const auto read = cache.ReadMetadata();
  assert(read);
  assert(read->title() == "Song");
  assert(read->summary() == "A summary");
  assert(read->singers_size() == 1);
}

void TestPersistRejectsMismatchedPayload() {
  ArtifactCache cache(RunPaths::For(FreshRoot("mismatch"), "k1"));

  bool threw = false;
  try {
    cache.Persist(StageKind::kVideo, TranscriptOutput("wrong kind"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(cache.Paths().narrative));
}

} // namespace

int main() {
  TestMissingArtifactsAreIncomplete();
  TestPersistWritesArtifactAndSidecar();
  TestEmptyTextArtifactIsIncomplete();
  TestUnparseableJsonIsIncomplete();
  TestSidecarMismatchInvalidatesArtifact();
  TestReadArtifactOnlyReturnsCompleteArtifacts();
  TestMetadataRoundTripKeepsOnDiskNames();
  TestPersistRejectsMismatchedPayload();

  std::cout << "miner_unit_artifact_cache: pass\n";
  return 0;
}
