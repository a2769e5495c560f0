#pragma once

#include <optional>
#include <string_view>

#include "config/config.pb.h"
#include "internal/collaborators/collaborators.hpp"
#include "internal/collaborators/command_template.hpp"
#include "internal/pipeline/progress_reporter.hpp"

namespace miner::collaborators {

/*
  Collaborators backed by external command-line tools (yt-dlp, ffmpeg,
  ollama, model runner scripts). Each call is one util::Subprocess.
*/

class CommandSourceFetcher final : public SourceFetcher {
 public:
  CommandSourceFetcher(miner::runtime::config::SourceFetchConfig config, CommandContext context, pipeline::ProgressReporter& progress);

  v1::SourceInfo FetchInfo(const std::string& url) override;
  v1::SourceInfo Download(const std::string& url, const pipeline::RunPaths& paths) override;

 private:
  miner::runtime::config::SourceFetchConfig config_;
  CommandContext                            context_;
  pipeline::ProgressReporter&               progress_;
};

class CommandSpeechToText final : public SpeechToText {
 public:
  CommandSpeechToText(miner::runtime::config::CommandConfig command, CommandContext context);

  TranscriptionResult Transcribe(const std::filesystem::path& audio) override;

 private:
  miner::runtime::config::CommandConfig command_;
  CommandContext                        context_;
};

class CommandTextGenerator final : public TextGenerator {
 public:
  CommandTextGenerator(miner::runtime::config::TextGenerationConfig config, CommandContext context);

  bool        Available() override;
  std::string Generate(const std::string& prompt, const ChunkCallback& on_chunk) override;

 private:
  miner::runtime::config::TextGenerationConfig config_;
  CommandContext                               context_;
};

class CommandVisionNarrator final : public VisionNarrator {
 public:
  CommandVisionNarrator(miner::runtime::config::CommandConfig command, CommandContext context);

  std::string Narrate(const std::filesystem::path& video) override;

 private:
  miner::runtime::config::CommandConfig command_;
  CommandContext                        context_;
};

class CommandEmbedder final : public Embedder {
 public:
  CommandEmbedder(miner::runtime::config::CommandConfig command, CommandContext context);

  std::vector<float> Embed(const std::string& text) override;

 private:
  miner::runtime::config::CommandConfig command_;
  CommandContext                        context_;
};

// yt-dlp -J output (or any JSON object with id/title/duration/description)
v1::SourceInfo ParseSourceInfoJson(const std::string& json);

// "[download]  45.3% of ..." -> "45.3"
std::optional<std::string> ParseDownloadPercent(std::string_view line);

} // namespace miner::collaborators
