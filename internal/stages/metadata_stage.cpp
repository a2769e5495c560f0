#include "metadata_stage.hpp"

#include "internal/observability/logging.hpp"
#include "internal/stages/json_extract.hpp"
#include "internal/stages/stream_progress.hpp"

namespace miner::stages {

namespace {

constexpr const char* kLabel = "Metadata";

constexpr double kEstimatedChunks = 800;
constexpr int    kReportEvery     = 10;

std::string BuildPrompt(const v1::SourceInfo& source) {
  std::string prompt;
  prompt += "You are a precise data extractor. You never summarize large text fields. You output valid JSON.\n\n";
  prompt += "Task: Extract structured metadata from this video.\n\n";
  prompt += "INPUT DATA:\n";
  prompt += "Title: \"" + source.title() + "\"\n";
  prompt += "Description: \"" + source.description() + "\"\n\n";
  prompt += "INSTRUCTIONS:\n";
  prompt += "1. \"singers\": List main vocalists.\n";
  prompt += "2. \"movie\": Movie/album name.\n";
  prompt += "3. \"cast\": List of actors.\n";
  prompt += "4. \"language\": Main language code (e.g. \"hi\", \"en\", \"es\").\n";
  prompt += "5. \"country\": Country of origin (e.g. \"India\", \"USA\").\n";
  prompt += "6. \"musicDirector\": Composer/music director.\n";
  prompt += "7. \"lyricist\": Song writer/lyricist.\n";
  prompt += "8. \"officialLyrics\": The full lyrics verbatim. Do not summarize or truncate. Use \\n for newlines. "
            "If no lyrics exist, output \"Not Available\".\n";
  prompt += "9. \"Summary\": Detailed summary/synopsis.\n\n";
  prompt += "OUTPUT FORMAT (JSON ONLY):\n";
  prompt += "{\"movie\": \"String\", \"singers\": [\"Name\"], \"cast\": [\"Name\"], \"language\": \"String\", "
            "\"country\": \"String\", \"musicDirector\": \"String\", \"lyricist\": \"String\", "
            "\"officialLyrics\": \"String\", \"Summary\": \"String\"}\n";
  return prompt;
}

const google::protobuf::Value* Field(const google::protobuf::Struct& parsed, const char* key) {
  auto it = parsed.fields().find(key);
  return it == parsed.fields().end() ? nullptr : &it->second;
}

void OverlayString(const google::protobuf::Struct& parsed, const char* key, std::string* target) {
  if (const auto* value = Field(parsed, key)) {
    auto text = ValueAsString(*value);
    if (!text.empty()) *target = std::move(text);
  }
}

void OverlayList(const google::protobuf::Struct& parsed, const char* key, google::protobuf::RepeatedPtrField<std::string>* target) {
  if (const auto* value = Field(parsed, key)) {
    if (value->kind_case() != google::protobuf::Value::kListValue && value->kind_case() != google::protobuf::Value::kStringValue) return;
    target->Clear();
    for (auto& item : ValueAsStringList(*value)) target->Add(std::move(item));
  }
}

} // namespace

v1::MediaMetadata FallbackMetadata(const std::string& title, const std::string& description) {
  v1::MediaMetadata metadata;
  metadata.set_movie("Unknown");
  metadata.add_singers("Unknown");
  metadata.set_language("Unknown");
  metadata.set_country("Unknown");
  metadata.set_music_director("Unknown");
  metadata.set_lyricist("Unknown");
  metadata.set_official_lyrics(description.empty() ? "Not Available" : description);
  metadata.set_summary("Auto-generated summary for " + title);
  return metadata;
}

v1::MediaMetadata MergeGeneratedMetadata(const google::protobuf::Struct& parsed, const std::string& title, const std::string& description) {
  auto metadata = FallbackMetadata(title, description);

  OverlayString(parsed, "movie", metadata.mutable_movie());
  OverlayList(parsed, "singers", metadata.mutable_singers());
  OverlayList(parsed, "cast", metadata.mutable_cast());
  OverlayString(parsed, "language", metadata.mutable_language());
  OverlayString(parsed, "country", metadata.mutable_country());
  OverlayString(parsed, "musicDirector", metadata.mutable_music_director());
  OverlayString(parsed, "lyricist", metadata.mutable_lyricist());
  OverlayString(parsed, "officialLyrics", metadata.mutable_official_lyrics());
  OverlayString(parsed, "Summary", metadata.mutable_summary());

  if (metadata.official_lyrics().find("Too long to fit") != std::string::npos) {
    metadata.set_official_lyrics(description);
  }
  return metadata;
}

v1::MediaMetadata ExtractMetadata(collaborators::TextGenerator& generator, const v1::SourceInfo& source, pipeline::ProgressReporter& progress) {
  progress.Emit(kLabel, "Checking Generator...");
  if (!generator.Available()) {
    MINER_LOG_WARN("text generator unreachable, using fallback metadata", {observability::StringField("id", source.id())});
    return FallbackMetadata(source.title(), source.description());
  }

  try {
    progress.Emit(kLabel, "AI Generating...");

    StreamProgress stream(progress, kLabel, kEstimatedChunks, kReportEvery);
    const auto     answer = generator.Generate(BuildPrompt(source), stream.Callback());

    auto parsed = ParseLenientObject(answer);
    if (!parsed || parsed->fields().empty()) {
      MINER_LOG_WARN("metadata answer carried no JSON object, using fallback", {observability::IntField("chars", static_cast<std::int64_t>(answer.size()))});
      return FallbackMetadata(source.title(), source.description());
    }
    return MergeGeneratedMetadata(*parsed, source.title(), source.description());
  } catch (const std::exception& e) {
    MINER_LOG_WARN("metadata generation failed, using fallback", {observability::StringField("error", e.what())});
    return FallbackMetadata(source.title(), source.description());
  }
}

} // namespace miner::stages
