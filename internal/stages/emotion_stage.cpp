#include "emotion_stage.hpp"

#include "internal/observability/logging.hpp"
#include "internal/stages/json_extract.hpp"
#include "internal/stages/stream_progress.hpp"
#include "internal/util/strings.hpp"

namespace miner::stages {

namespace {

constexpr const char* kLabel = "Emotions";

constexpr std::size_t kMinContext       = 10;
constexpr std::size_t kMaxPromptContext = 4000;
constexpr double      kEstimatedChunks  = 50;
constexpr int         kReportEvery      = 2;

std::string BuildPrompt(const std::string& context) {
  std::string prompt;
  prompt += "You are an emotional analysis AI. Output JSON only.\n\n";
  prompt += "Task: Analyze the following content and extract 5-8 precise emotional tags.\n\n";
  prompt += "INPUT CONTEXT:\n\"" + context.substr(0, kMaxPromptContext) + "\"\n\n";
  prompt += "INSTRUCTIONS:\n";
  prompt += "1. Identify the core mood (e.g. \"Melancholic\", \"Energetic\", \"Romantic\").\n";
  prompt += "2. Identify specific feelings (e.g. \"Heartbreak\", \"Hopeful\", \"Aggressive\").\n";
  prompt += "3. Output ONLY a JSON list of strings.\n";
  prompt += "4. Do not output broad genres like \"Pop\" or \"Rock\". Focus on emotion.\n\n";
  prompt += "OUTPUT FORMAT:\n[\"Emotion1\", \"Emotion2\", \"Emotion3\"]\n";
  return prompt;
}

} // namespace

std::string BuildEmotionContext(const std::string& title, const std::string& narrative) {
  if (narrative.empty()) return title;
  return title + "\n" + narrative;
}

v1::EmotionTags DeriveEmotions(collaborators::TextGenerator& generator, const std::string& context, pipeline::ProgressReporter& progress) {
  v1::EmotionTags tags;
  if (context.size() < kMinContext) {
    MINER_LOG_INFO("emotion context too short, no tags derived", {observability::IntField("chars", static_cast<std::int64_t>(context.size()))});
    return tags;
  }

  progress.Emit(kLabel, "Analyzing Context...");
  progress.Emit(kLabel, 0, 100);

  StreamProgress stream(progress, kLabel, kEstimatedChunks, kReportEvery);
  const auto     answer = generator.Generate(BuildPrompt(context), stream.Callback());

  auto list = ParseListBlock(answer);
  if (!list) {
    MINER_LOG_WARN("emotion answer carried no JSON list");
    return tags;
  }

  for (const auto& value : list->values()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) continue;
    tags.add_tags(util::ToLower(util::Trim(value.string_value())));
  }
  return tags;
}

} // namespace miner::stages
