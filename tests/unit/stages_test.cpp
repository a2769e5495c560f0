#include <cassert>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/stages/audio_stage.hpp"
#include "internal/stages/emotion_stage.hpp"
#include "internal/stages/metadata_stage.hpp"
#include "internal/stages/stream_progress.hpp"
#include "internal/stages/video_stage.hpp"
#include "tests/support/fake_collaborators.hpp"

namespace {

using miner::pipeline::ProgressReporter;
using miner::testing::FakeSpeechToText;
using miner::testing::FakeTextGenerator;
using miner::testing::FakeVisionNarrator;
using miner::testing::FreshDirectory;
using miner::testing::ProgressLog;

constexpr const char* kSuite = "miner_stages_tests";

miner::v1::SourceInfo MakeSource() {
  miner::v1::SourceInfo source;
  source.set_id("abc123");
  source.set_title("Tum Hi Ho");
  source.set_description("Official lyrical video");
  source.set_duration(262);
  return source;
}

std::filesystem::path TouchFile(const std::filesystem::path& dir, const std::string& name) {
  const auto path = dir / name;
  std::ofstream(path, std::ios::binary) << "data";
  return path;
}

bool ThrowsCollaboratorError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const miner::util::CollaboratorError&) {
    return true;
  }
  return false;
}

void TestStreamProgressIsCappedBelowCompletion() {
  const auto       dir = FreshDirectory(kSuite, "stream_progress");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  miner::stages::StreamProgress stream(progress, "Emotions", 4, 1);
  auto                          callback = stream.Callback();
  for (int i = 0; i < 6; ++i) callback("chunk");

  assert(stream.Chunks() == 6);
  assert(log.Lines() ==
         (std::vector<std::string>{"PRG:Emotions:25:100", "PRG:Emotions:50:100", "PRG:Emotions:75:100", "PRG:Emotions:99:100", "PRG:Emotions:99:100",
                                   "PRG:Emotions:99:100"}));
}

void TestMetadataFallbackWhenGeneratorUnavailable() {
  const auto       dir = FreshDirectory(kSuite, "metadata_unavailable");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeTextGenerator generator;
  generator.available = false;

  const auto metadata = miner::stages::ExtractMetadata(generator, MakeSource(), progress);

  assert(generator.prompts.empty());
  assert(metadata.movie() == "Unknown");
  assert(metadata.singers_size() == 1 && metadata.singers(0) == "Unknown");
  assert(metadata.cast_size() == 0);
  assert(metadata.official_lyrics() == "Official lyrical video");
  assert(metadata.summary() == "Auto-generated summary for Tum Hi Ho");
  assert(log.Lines() == std::vector<std::string>{"PRG:Metadata:Checking Generator...:100"});
}

void TestMetadataOverlaysLenientAnswer() {
  const auto       dir = FreshDirectory(kSuite, "metadata_lenient");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeTextGenerator generator;
  generator.chunks = 20;
  generator.answer = "Here you go:\n{'movie': 'Aashiqui 2', 'singers': 'Arijit Singh', 'cast': ['Aditya', 'Shraddha'], "
                     "'musicDirector': 'Mithoon', 'lyricist': None, 'officialLyrics': 'Too long to fit here', 'Summary': ''}";

  const auto metadata = miner::stages::ExtractMetadata(generator, MakeSource(), progress);

  assert(generator.prompts.size() == 1);
  assert(generator.prompts[0].find("Tum Hi Ho") != std::string::npos);
  assert(metadata.movie() == "Aashiqui 2");
  assert(metadata.singers_size() == 1 && metadata.singers(0) == "Arijit Singh");
  assert(metadata.cast_size() == 2 && metadata.cast(1) == "Shraddha");
  assert(metadata.music_director() == "Mithoon");
  assert(metadata.lyricist() == "Unknown");
  assert(metadata.language() == "Unknown");
  assert(metadata.official_lyrics() == "Official lyrical video");
  assert(metadata.summary() == "Auto-generated summary for Tum Hi Ho");

  assert(log.ContainsInOrder({"PRG:Metadata:Checking Generator...:100", "PRG:Metadata:AI Generating...:100", "PRG:Metadata:1:100",
                              "PRG:Metadata:2:100"}));
}

void TestMetadataFallbackOnUnusableAnswers() {
  const auto       dir = FreshDirectory(kSuite, "metadata_unusable");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  for (const char* answer : {"I cannot help with that.", "{}", "{\"movie\": "}) {
    FakeTextGenerator generator;
    generator.answer    = answer;
    const auto metadata = miner::stages::ExtractMetadata(generator, MakeSource(), progress);
    assert(metadata.movie() == "Unknown");
    assert(metadata.summary() == "Auto-generated summary for Tum Hi Ho");
  }

  FakeTextGenerator failing;
  failing.fail = true;
  assert(miner::stages::ExtractMetadata(failing, MakeSource(), progress).movie() == "Unknown");

  auto source = MakeSource();
  source.clear_description();
  FakeTextGenerator offline;
  offline.available = false;
  assert(miner::stages::ExtractMetadata(offline, source, progress).official_lyrics() == "Not Available");
}

void TestAudioKeepsLatinTranscripts() {
  const auto       dir = FreshDirectory(kSuite, "audio_latin");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeSpeechToText speech;
  speech.result = {"  hello there my friend\nThanks for watching  \n", "en"};
  FakeTextGenerator generator;

  const auto transcript = miner::stages::ProcessAudio(speech, generator, TouchFile(dir, "audio.mp3"), progress);

  assert(transcript.text() == "hello there my friend");
  assert(transcript.language() == "en");
  assert(generator.prompts.empty());
  assert(log.Lines() == std::vector<std::string>{"PRG:Audio:Transcribing...:100"});
}

void TestAudioTransliteratesOtherScripts() {
  const auto       dir = FreshDirectory(kSuite, "audio_transliterate");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeSpeechToText speech;
  speech.result = {"नमस्ते दोस्तों कैसे हो आप", "hi"};
  FakeTextGenerator generator;
  generator.answer = "Here is the transliteration: namaste doston kaise ho aap";

  const auto transcript = miner::stages::ProcessAudio(speech, generator, TouchFile(dir, "audio.mp3"), progress);

  assert(transcript.text() == "namaste doston kaise ho aap");
  assert(transcript.language() == "hi");
  assert(generator.prompts.size() == 1);
  assert(generator.prompts[0].find("hi lyrics") != std::string::npos);
  assert(log.ContainsInOrder({"PRG:Audio:Transcribing...:100", "PRG:Audio:Romanizing...:100", "PRG:Audio:0:100"}));
}

void TestAudioKeepsRawTranscriptWhenTransliterationFails() {
  const auto       dir = FreshDirectory(kSuite, "audio_transliterate_fail");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeSpeechToText speech;
  speech.result = {"नमस्ते दोस्तों कैसे हो आप", "hi"};

  FakeTextGenerator failing;
  failing.fail = true;
  assert(miner::stages::ProcessAudio(speech, failing, TouchFile(dir, "audio.mp3"), progress).text() == "नमस्ते दोस्तों कैसे हो आप");

  FakeTextGenerator filler_only;
  filler_only.answer = "Transliteration:   ";
  assert(miner::stages::ProcessAudio(speech, filler_only, TouchFile(dir, "audio.mp3"), progress).text() == "नमस्ते दोस्तों कैसे हो आप");
}

void TestAudioErrors() {
  const auto       dir = FreshDirectory(kSuite, "audio_errors");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeSpeechToText  speech;
  FakeTextGenerator generator;
  assert(ThrowsCollaboratorError([&] { miner::stages::ProcessAudio(speech, generator, dir / "missing.mp3", progress); }));

  speech.fail = true;
  assert(ThrowsCollaboratorError([&] { miner::stages::ProcessAudio(speech, generator, TouchFile(dir, "audio.mp3"), progress); }));

  // nothing recognisable: empty transcript, no transliteration attempt
  speech.fail   = false;
  speech.result = {"Subscribe to the channel", "hi"};
  assert(miner::stages::ProcessAudio(speech, generator, TouchFile(dir, "audio.mp3"), progress).text().empty());
  assert(generator.prompts.empty());
}

void TestVideoNarrative() {
  const auto       dir = FreshDirectory(kSuite, "video");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeVisionNarrator narrator;
  narrator.text = "  A couple walks through rain in Mumbai.\n";

  assert(ThrowsCollaboratorError([&] { miner::stages::NarrateVideo(narrator, dir / "missing.mp4", progress); }));

  const auto narrative = miner::stages::NarrateVideo(narrator, TouchFile(dir, "video.mp4"), progress);
  assert(narrative.text() == "A couple walks through rain in Mumbai.");
  assert(log.Lines() == std::vector<std::string>{"PRG:Video:Analyzing Scenes...:100"});
}

void TestEmotionContext() {
  assert(miner::stages::BuildEmotionContext("Title", "") == "Title");
  assert(miner::stages::BuildEmotionContext("Title", "Rain scene") == "Title\nRain scene");
}

void TestEmotionsFromGeneratorAnswer() {
  const auto       dir = FreshDirectory(kSuite, "emotions");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeTextGenerator generator;
  generator.chunks = 4;
  generator.answer = "Tags: [\" Melancholic \", 3, \"Heartbreak\"]";

  const auto tags = miner::stages::DeriveEmotions(generator, "Tum Hi Ho\nA couple walks through rain.", progress);

  assert(tags.tags_size() == 2);
  assert(tags.tags(0) == "melancholic");
  assert(tags.tags(1) == "heartbreak");
  assert(log.ContainsInOrder({"PRG:Emotions:Analyzing Context...:100", "PRG:Emotions:0:100", "PRG:Emotions:4:100", "PRG:Emotions:8:100"}));
}

void TestEmotionsEdgeCases() {
  const auto       dir = FreshDirectory(kSuite, "emotions_edges");
  ProgressLog      log(dir / "progress.log");
  ProgressReporter progress(log.Fd());

  FakeTextGenerator generator;
  generator.answer = "[\"joy\"]";

  // too little context: no generator call at all
  assert(miner::stages::DeriveEmotions(generator, "Short", progress).tags_size() == 0);
  assert(generator.prompts.empty());
  assert(log.Lines().empty());

  // the prompt carries at most 4000 characters of context
  miner::stages::DeriveEmotions(generator, std::string(4000, 'a') + "TAILMARK", progress);
  assert(generator.prompts.size() == 1);
  assert(generator.prompts[0].find("TAILMARK") == std::string::npos);

  generator.answer = "no list here";
  assert(miner::stages::DeriveEmotions(generator, "A long enough context", progress).tags_size() == 0);

  generator.fail = true;
  assert(ThrowsCollaboratorError([&] { miner::stages::DeriveEmotions(generator, "A long enough context", progress); }));
}

} // namespace

int main() {
  TestStreamProgressIsCappedBelowCompletion();
  TestMetadataFallbackWhenGeneratorUnavailable();
  TestMetadataOverlaysLenientAnswer();
  TestMetadataFallbackOnUnusableAnswers();
  TestAudioKeepsLatinTranscripts();
  TestAudioTransliteratesOtherScripts();
  TestAudioKeepsRawTranscriptWhenTransliterationFails();
  TestAudioErrors();
  TestVideoNarrative();
  TestEmotionContext();
  TestEmotionsFromGeneratorAnswer();
  TestEmotionsEdgeCases();

  std::cout << "miner_unit_stages: pass\n";
  return 0;
}
