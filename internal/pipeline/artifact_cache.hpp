#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/pipeline/run_paths.hpp"
#include "internal/pipeline/stage.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::pipeline {

/*
  Artifact cache for one run directory.

  Completion marker is the artifact file itself:
    - text artifacts: exists and non-empty
    - JSON artifacts: exists and parses

  A sidecar <artifact>.done.json (ArtifactRecord) is written after the
  artifact lands. When present it must match the file's size and
  checksum, otherwise the artifact counts as incomplete. Artifacts from
  older runs without a sidecar fall back to the plain check.
*/
class ArtifactCache {
 public:
  explicit ArtifactCache(RunPaths paths);

  const RunPaths& Paths() const {
    return paths_;
  }

  std::filesystem::path ArtifactPath(StageKind kind) const;

  bool IsComplete(StageKind kind) const;

  // Atomically writes the artifact for `kind` plus its sidecar. Throws
  // std::runtime_error on I/O failure or when `output` carries a payload
  // of the wrong kind.
  void Persist(StageKind kind, const v1::StageOutput& output) const;

  // Raw contents of the artifact of `kind`, only when it is complete.
  // Used for optional inputs declared through a soft dependency.
  std::optional<std::string> ReadArtifact(StageKind kind) const;

  // Readers return nullopt for absent or unparseable artifacts.
  std::optional<v1::MediaMetadata>        ReadMetadata() const;
  std::optional<std::string>              ReadTranscript() const;
  std::optional<std::string>              ReadNarrative() const;
  std::optional<std::vector<std::string>> ReadEmotions() const;

  static std::filesystem::path SidecarPath(const std::filesystem::path& artifact);

 private:
  bool SidecarMatches(const std::filesystem::path& artifact, const std::string& contents) const;

  RunPaths paths_;
};

// On-disk encodings, shared with the sync engine.
std::string                             EncodeMetadataJson(const v1::MediaMetadata& metadata);
std::optional<v1::MediaMetadata>        DecodeMetadataJson(const std::string& json);
std::string                             EncodeEmotionsJson(const std::vector<std::string>& tags);
std::optional<std::vector<std::string>> DecodeEmotionsJson(const std::string& json);

// True when `output` carries the payload kind produced by `kind`.
bool PayloadMatches(StageKind kind, const v1::StageOutput& output);

} // namespace miner::pipeline
