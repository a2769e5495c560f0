#include "audio_stage.hpp"

#include "internal/observability/logging.hpp"
#include "internal/stages/stream_progress.hpp"
#include "internal/stages/transcript_cleaner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace miner::stages {

namespace {

constexpr const char* kLabel = "Audio";

constexpr double kChunksPerWord = 1.5;
constexpr int    kReportEvery   = 10;

std::string BuildTransliterationPrompt(const std::string& language, const std::string& transcript) {
  std::string prompt;
  prompt += "You are a raw data converter. You output ONLY the processed text. You are NOT a chat assistant.\n\n";
  prompt += "Task: Convert these " + language + " lyrics to Roman/Latin script (phonetic style).\n\n";
  prompt += "INPUT:\n\"" + transcript + "\"\n\n";
  prompt += "RULES:\n";
  prompt += "1. OUTPUT ONLY THE LYRICS. NO \"Here is...\" or \"Transliteration:\".\n";
  prompt += "2. Fix repetitions/loops.\n";
  prompt += "3. Use simple English letters (no diacritics).\n";
  prompt += "4. START DIRECTLY with the first word.\n";
  return prompt;
}

std::size_t CountWords(const std::string& text) {
  std::size_t words   = 0;
  bool        in_word = false;
  for (char c : text) {
    const bool space = c == ' ' || c == '\n' || c == '\t' || c == '\r';
    if (!space && !in_word) ++words;
    in_word = !space;
  }
  return words;
}

std::string Transliterate(collaborators::TextGenerator& generator, const std::string& language, const std::string& transcript,
                          pipeline::ProgressReporter& progress) {
  progress.Emit(kLabel, "Romanizing...");
  progress.Emit(kLabel, 0, 100);

  StreamProgress stream(progress, kLabel, static_cast<double>(CountWords(transcript)) * kChunksPerWord, kReportEvery);
  const auto     answer = generator.Generate(BuildTransliterationPrompt(language, transcript), stream.Callback());
  return StripTransliterationFiller(answer);
}

} // namespace

v1::Transcript ProcessAudio(collaborators::SpeechToText& speech, collaborators::TextGenerator& generator, const std::filesystem::path& audio,
                            pipeline::ProgressReporter& progress) {
  if (!std::filesystem::exists(audio)) {
    throw util::CollaboratorError("audio file missing: " + audio.string());
  }

  progress.Emit(kLabel, "Transcribing...");
  auto result = speech.Transcribe(audio);

  v1::Transcript transcript;
  transcript.set_language(result.language);
  transcript.set_text(CleanHallucinations(util::Trim(result.text)));

  MINER_LOG_INFO("transcribed audio",
                 {observability::StringField("language", result.language), observability::IntField("chars", static_cast<std::int64_t>(transcript.text().size()))});

  if (transcript.text().empty() || result.language.empty() || IsLatinScriptLanguage(result.language)) {
    return transcript;
  }

  try {
    auto romanized = Transliterate(generator, result.language, transcript.text(), progress);
    if (romanized.empty()) {
      MINER_LOG_WARN("transliteration came back empty, keeping raw transcript");
    } else {
      transcript.set_text(std::move(romanized));
    }
  } catch (const std::exception& e) {
    MINER_LOG_WARN("transliteration failed, keeping raw transcript", {observability::StringField("error", e.what())});
  }
  return transcript;
}

} // namespace miner::stages
