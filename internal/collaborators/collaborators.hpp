#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/pipeline/run_paths.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::collaborators {

/*
  External collaborators, contract only.

  Implementations throw util::CollaboratorError when the tool cannot be
  run or returns garbage. Stage computations run inside worker processes,
  so an implementation may hold large state: it is released when the
  worker exits.
*/

class SourceFetcher {
 public:
  virtual ~SourceFetcher() = default;

  // id, title, duration, description without downloading
  virtual v1::SourceInfo FetchInfo(const std::string& url) = 0;

  // Downloads paths.video and extracts paths.audio. Returns the source
  // information of the downloaded media.
  virtual v1::SourceInfo Download(const std::string& url, const pipeline::RunPaths& paths) = 0;
};

struct TranscriptionResult {
  std::string text;
  std::string language; // ISO 639-1 as detected
};

class SpeechToText {
 public:
  virtual ~SpeechToText() = default;

  virtual TranscriptionResult Transcribe(const std::filesystem::path& audio) = 0;
};

using ChunkCallback = std::function<void(std::string_view chunk)>;

class TextGenerator {
 public:
  virtual ~TextGenerator() = default;

  // Cheap reachability check.
  virtual bool Available() = 0;

  // Streams output chunks to on_chunk as they arrive; returns the
  // accumulated text.
  virtual std::string Generate(const std::string& prompt, const ChunkCallback& on_chunk = {}) = 0;
};

class VisionNarrator {
 public:
  virtual ~VisionNarrator() = default;

  virtual std::string Narrate(const std::filesystem::path& video) = 0;
};

class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> Embed(const std::string& text) = 0;
};

struct Collaborators {
  std::shared_ptr<SourceFetcher>  source_fetcher;
  std::shared_ptr<SpeechToText>   speech_to_text;
  std::shared_ptr<TextGenerator>  text_generator;
  std::shared_ptr<VisionNarrator> vision_narrator;
  std::shared_ptr<Embedder>       embedder;
};

} // namespace miner::collaborators
