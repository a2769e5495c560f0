#include "artifact_cache.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/file_io.hpp"
#include "internal/util/time.hpp"

namespace miner::pipeline {

namespace {

google::protobuf::util::JsonPrintOptions PrettyJson() {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  return options;
}

std::string SerializeArtifact(StageKind kind, const v1::StageOutput& output) {
  switch (kind) {
    case StageKind::kMetadata:
      return EncodeMetadataJson(output.metadata());
    case StageKind::kAudio:
      return output.transcript().text();
    case StageKind::kVideo:
      return output.narrative().text();
    case StageKind::kEmotions:
      return EncodeEmotionsJson({output.emotions().tags().begin(), output.emotions().tags().end()});
  }
  throw std::logic_error("unknown stage kind");
}

} // namespace

std::string EncodeMetadataJson(const v1::MediaMetadata& metadata) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json, PrettyJson());
  if (!status.ok()) {
    throw std::runtime_error("cannot encode metadata: " + status.ToString());
  }
  return json;
}

std::optional<v1::MediaMetadata> DecodeMetadataJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  v1::MediaMetadata metadata;
  if (!google::protobuf::util::JsonStringToMessage(json, &metadata, options).ok()) {
    return std::nullopt;
  }
  return metadata;
}

std::string EncodeEmotionsJson(const std::vector<std::string>& tags) {
  google::protobuf::ListValue list;
  for (const auto& tag : tags) {
    list.add_values()->set_string_value(tag);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json, PrettyJson());
  if (!status.ok()) {
    throw std::runtime_error("cannot encode emotions: " + status.ToString());
  }
  return json;
}

std::optional<std::vector<std::string>> DecodeEmotionsJson(const std::string& json) {
  google::protobuf::ListValue list;
  if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
    return std::nullopt;
  }

  std::vector<std::string> tags;
  for (const auto& value : list.values()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      tags.push_back(value.string_value());
    }
  }
  return tags;
}

bool PayloadMatches(StageKind kind, const v1::StageOutput& output) {
  switch (kind) {
    case StageKind::kMetadata:
      return output.has_metadata();
    case StageKind::kAudio:
      return output.has_transcript();
    case StageKind::kVideo:
      return output.has_narrative();
    case StageKind::kEmotions:
      return output.has_emotions();
  }
  return false;
}

ArtifactCache::ArtifactCache(RunPaths paths) : paths_(std::move(paths)) {
}

std::filesystem::path ArtifactCache::ArtifactPath(StageKind kind) const {
  return paths_.*(Describe(kind).artifact);
}

std::filesystem::path ArtifactCache::SidecarPath(const std::filesystem::path& artifact) {
  return artifact.string() + ".done.json";
}

bool ArtifactCache::SidecarMatches(const std::filesystem::path& artifact, const std::string& contents) const {
  auto sidecar = util::ReadFile(SidecarPath(artifact));
  if (!sidecar) return true;

  v1::ArtifactRecord record;
  if (!google::protobuf::util::JsonStringToMessage(*sidecar, &record).ok()) {
    return false;
  }
  return record.size_bytes() == contents.size() && record.fnv1a64() == util::Fnv1a64Hex(contents);
}

bool ArtifactCache::IsComplete(StageKind kind) const {
  const auto path     = ArtifactPath(kind);
  auto       contents = util::ReadFile(path);
  if (!contents) return false;

  bool valid = false;
  switch (kind) {
    case StageKind::kMetadata:
      valid = DecodeMetadataJson(*contents).has_value();
      break;
    case StageKind::kEmotions:
      valid = DecodeEmotionsJson(*contents).has_value();
      break;
    case StageKind::kAudio:
    case StageKind::kVideo:
      valid = !contents->empty();
      break;
  }

  return valid && SidecarMatches(path, *contents);
}

void ArtifactCache::Persist(StageKind kind, const v1::StageOutput& output) const {
  if (!PayloadMatches(kind, output)) {
    throw std::runtime_error("stage output does not match stage " + std::string(StageName(kind)));
  }

  std::filesystem::create_directories(paths_.folder);

  const auto path     = ArtifactPath(kind);
  const auto contents = SerializeArtifact(kind, output);

  // a stale sidecar would otherwise vouch for the old file
  std::filesystem::remove(SidecarPath(path));
  util::WriteFileAtomic(path, contents);

  v1::ArtifactRecord record;
  record.set_stage(std::string(StageName(kind)));
  record.set_size_bytes(contents.size());
  record.set_fnv1a64(util::Fnv1a64Hex(contents));
  record.set_written_at_ms(util::NowMs());

  std::string sidecar;
  auto        status = google::protobuf::util::MessageToJsonString(record, &sidecar, PrettyJson());
  if (!status.ok()) {
    throw std::runtime_error("cannot encode artifact record: " + status.ToString());
  }
  util::WriteFileAtomic(SidecarPath(path), sidecar);
}

std::optional<std::string> ArtifactCache::ReadArtifact(StageKind kind) const {
  if (!IsComplete(kind)) return std::nullopt;
  return util::ReadFile(ArtifactPath(kind));
}

std::optional<v1::MediaMetadata> ArtifactCache::ReadMetadata() const {
  auto contents = util::ReadFile(paths_.metadata);
  if (!contents) return std::nullopt;
  return DecodeMetadataJson(*contents);
}

std::optional<std::string> ArtifactCache::ReadTranscript() const {
  return util::ReadFile(paths_.transcript);
}

std::optional<std::string> ArtifactCache::ReadNarrative() const {
  return util::ReadFile(paths_.narrative);
}

std::optional<std::vector<std::string>> ArtifactCache::ReadEmotions() const {
  auto contents = util::ReadFile(paths_.emotions);
  if (!contents) return std::nullopt;
  return DecodeEmotionsJson(*contents);
}

} // namespace miner::pipeline
