#include "command_collaborators.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <cmath>
#include <map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace miner::collaborators {

using miner::runtime::config::CommandConfig;
using miner::runtime::config::SourceFetchConfig;
using miner::runtime::config::TextGenerationConfig;

namespace {

constexpr std::size_t kStderrTail = 400;

std::string Tail(const std::string& s) {
  return s.size() <= kStderrTail ? s : s.substr(s.size() - kStderrTail);
}

util::SubprocessResult RunChecked(const std::string& what, util::SubprocessOptions options, const util::OutputCallback& on_stdout = {}) {
  const std::string tool   = options.argv.front();
  auto              result = util::RunCommand(std::move(options), on_stdout);
  if (!result.Ok()) {
    throw util::CollaboratorError(what + " failed (" + tool + " exit " + std::to_string(result.exit_code) + "): " + util::Trim(Tail(result.stderr_data)));
  }
  return result;
}

void RequireAdapter(const CommandConfig& command, const std::string& section) {
  if (command.argv_size() == 0) {
    throw util::CollaboratorError("no " + section + " adapter configured (set collaborators." + section + ".argv)");
  }
}

google::protobuf::Struct ParseObject(const std::string& what, const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object, options);
  if (!status.ok()) {
    throw util::CollaboratorError(what + " returned invalid JSON: " + status.ToString());
  }
  return object;
}

std::string StringField(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return {};
  return it->second.string_value();
}

// Assembles stdout chunks into lines.
class LineSplitter {
 public:
  explicit LineSplitter(std::function<void(std::string_view)> on_line) : on_line_(std::move(on_line)) {
  }

  void Feed(std::string_view chunk) {
    buffer_.append(chunk);
    for (auto pos = buffer_.find_first_of("\r\n"); pos != std::string::npos; pos = buffer_.find_first_of("\r\n")) {
      if (pos > 0) on_line_(std::string_view(buffer_).substr(0, pos));
      buffer_.erase(0, pos + 1);
    }
  }

 private:
  std::function<void(std::string_view)> on_line_;
  std::string                           buffer_;
};

} // namespace

v1::SourceInfo ParseSourceInfoJson(const std::string& json) {
  auto object = ParseObject("source info", json);

  v1::SourceInfo info;
  info.set_id(StringField(object, "id"));
  info.set_title(StringField(object, "title"));
  info.set_description(StringField(object, "description"));

  auto duration = object.fields().find("duration");
  if (duration != object.fields().end() && duration->second.kind_case() == google::protobuf::Value::kNumberValue) {
    info.set_duration(static_cast<std::int32_t>(std::lround(duration->second.number_value())));
  }
  return info;
}

std::optional<std::string> ParseDownloadPercent(std::string_view line) {
  constexpr std::string_view kPrefix = "[download]";
  if (line.substr(0, kPrefix.size()) != kPrefix) return std::nullopt;

  auto percent = line.find('%');
  if (percent == std::string_view::npos) return std::nullopt;

  auto start = percent;
  while (start > 0 && (std::isdigit(static_cast<unsigned char>(line[start - 1])) || line[start - 1] == '.')) --start;
  if (start == percent) return std::nullopt;
  return std::string(line.substr(start, percent - start));
}

// ------------------------------------------------------------------
// Source fetch
// ------------------------------------------------------------------

CommandSourceFetcher::CommandSourceFetcher(SourceFetchConfig config, CommandContext context, pipeline::ProgressReporter& progress)
    : config_(std::move(config)), context_(std::move(context)), progress_(progress) {
}

v1::SourceInfo CommandSourceFetcher::FetchInfo(const std::string& url) {
  auto result = RunChecked("source info", BuildCommand(config_.info(), context_, {{"url", url}}));
  return ParseSourceInfoJson(result.stdout_data);
}

v1::SourceInfo CommandSourceFetcher::Download(const std::string& url, const pipeline::RunPaths& paths) {
  auto info = FetchInfo(url);

  progress_.Emit("Downloading", "Starting...", 0);
  std::filesystem::create_directories(paths.folder);

  LineSplitter lines([this](std::string_view line) {
    if (auto percent = ParseDownloadPercent(line)) {
      progress_.Emit("Downloading", *percent, 100);
    }
  });

  const std::map<std::string, std::string> vars = {
      {"url", url},
      {"output_dir", paths.folder.string()},
      {"video", paths.video.string()},
      {"audio", paths.audio.string()},
  };
  RunChecked("download", BuildCommand(config_.download(), context_, vars), [&lines](std::string_view chunk) { lines.Feed(chunk); });

  if (!std::filesystem::exists(paths.video)) {
    for (const auto& entry : std::filesystem::directory_iterator(paths.folder)) {
      const auto name = entry.path().filename().string();
      if (entry.is_regular_file() && name.rfind("video.", 0) == 0 && entry.path().extension() != ".tmp") {
        std::filesystem::rename(entry.path(), paths.video);
        break;
      }
    }
  }
  if (!std::filesystem::exists(paths.video)) {
    throw util::CollaboratorError("download finished without producing " + paths.video.string());
  }

  progress_.Emit("Audio Extraction", 50, 100);
  RunChecked("audio extraction", BuildCommand(config_.extract_audio(), context_, vars));
  progress_.Emit("Audio Extraction", 100, 100);

  return info;
}

// ------------------------------------------------------------------
// Speech to text
// ------------------------------------------------------------------

CommandSpeechToText::CommandSpeechToText(CommandConfig command, CommandContext context) : command_(std::move(command)), context_(std::move(context)) {
}

TranscriptionResult CommandSpeechToText::Transcribe(const std::filesystem::path& audio) {
  RequireAdapter(command_, "speech_to_text");
  auto result = RunChecked("speech to text", BuildCommand(command_, context_, {{"audio", audio.string()}}));
  auto object = ParseObject("speech to text", result.stdout_data);

  TranscriptionResult transcription;
  transcription.text     = StringField(object, "text");
  transcription.language = util::ToLower(util::Trim(StringField(object, "language")));
  return transcription;
}

// ------------------------------------------------------------------
// Text generation
// ------------------------------------------------------------------

CommandTextGenerator::CommandTextGenerator(TextGenerationConfig config, CommandContext context) : config_(std::move(config)), context_(std::move(context)) {
  context_.vars["model"] = config_.model();
}

bool CommandTextGenerator::Available() {
  if (config_.health_check().argv_size() == 0) return true;

  try {
    return util::RunCommand(BuildCommand(config_.health_check(), context_)).Ok();
  } catch (const util::CollaboratorError& e) {
    MINER_LOG_WARN("text generator health check failed", {observability::StringField("error", e.what())});
    return false;
  }
}

std::string CommandTextGenerator::Generate(const std::string& prompt, const ChunkCallback& on_chunk) {
  auto options       = BuildCommand(config_.command(), context_);
  options.stdin_data = prompt;
  auto result        = RunChecked("text generation", std::move(options), on_chunk);
  return result.stdout_data;
}

// ------------------------------------------------------------------
// Vision
// ------------------------------------------------------------------

CommandVisionNarrator::CommandVisionNarrator(CommandConfig command, CommandContext context) : command_(std::move(command)), context_(std::move(context)) {
}

std::string CommandVisionNarrator::Narrate(const std::filesystem::path& video) {
  RequireAdapter(command_, "vision");
  auto result = RunChecked("vision narrative", BuildCommand(command_, context_, {{"video", video.string()}}));
  return util::Trim(result.stdout_data);
}

// ------------------------------------------------------------------
// Embedding
// ------------------------------------------------------------------

CommandEmbedder::CommandEmbedder(CommandConfig command, CommandContext context) : command_(std::move(command)), context_(std::move(context)) {
}

std::vector<float> CommandEmbedder::Embed(const std::string& text) {
  RequireAdapter(command_, "embedding");
  auto options       = BuildCommand(command_, context_);
  options.stdin_data = text;
  auto result        = RunChecked("embedding", std::move(options));

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(result.stdout_data, &list);
  if (!status.ok()) {
    throw util::CollaboratorError("embedding returned invalid JSON: " + status.ToString());
  }

  std::vector<float> vector;
  vector.reserve(list.values_size());
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue) {
      throw util::CollaboratorError("embedding returned a non-numeric component");
    }
    vector.push_back(static_cast<float>(value.number_value()));
  }
  if (vector.empty()) {
    throw util::CollaboratorError("embedding returned an empty vector");
  }
  return vector;
}

} // namespace miner::collaborators
