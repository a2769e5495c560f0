#include "internal/stages/transcript_cleaner.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

namespace {

using miner::stages::CleanHallucinations;
using miner::stages::IsLatinScriptLanguage;
using miner::stages::SimilarityRatio;
using miner::stages::StripTransliterationFiller;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestSimilarityRatio() {
  assert(Near(SimilarityRatio("", ""), 1.0));
  assert(Near(SimilarityRatio("abc", "abc"), 1.0));
  assert(Near(SimilarityRatio("abcd", "bcde"), 0.75));
  assert(Near(SimilarityRatio("abc", "xyz"), 0.0));
  // code points, not bytes: one differing character out of three
  assert(Near(SimilarityRatio("नमस", "नमक"), 2.0 * 2 / 6));
}

void TestSimilarityIgnoresPopularElementsOfLongLines() {
  // 'a' fills more than 1% of a 200-element b, so it cannot seed a match
  const std::string long_run(200, 'a');
  const std::string short_run = "c" + std::string(10, 'a');
  assert(Near(SimilarityRatio(short_run, long_run), 0.0));
  assert(Near(SimilarityRatio(long_run, short_run), 2.0 * 10 / 211));

  // popular elements still extend a block seeded elsewhere
  assert(Near(SimilarityRatio("x" + long_run, "x" + long_run), 1.0));
}

void TestLoopDetectionSplitsOnAnyWhitespace() {
  const auto cleaned = CleanHallucinations("la\tla la\t\tla la\t\t\tla la\nthe night is young and so are we");
  assert(cleaned == "the night is young and so are we");
}

void TestCleanerDropsSpamLoopsAndDuplicates() {
  const auto cleaned = CleanHallucinations("  Thanks for watching! \n"
                                           "hello my dear friend how are you\n"
                                           "hello my dear friend how are you!\n"
                                           "na na na na na na\n"
                                           "short\n"
                                           "The river flows toward the old town\n"
                                           "Please SUBSCRIBE TO my channel");

  assert(cleaned == "hello my dear friend how are you\nshort\nThe river flows toward the old town");
}

void TestCleanerCountsCodePoints() {
  // six code points, eighteen bytes: too short to be a loop
  assert(CleanHallucinations("नमस्ते") == "नमस्ते");
  // thirteen code points, two distinct words
  assert(CleanHallucinations("नमस्ते दुनिया").empty());
}

void TestCleanerKeepsDistinctLines() {
  const std::string text = "first line of the song\nsecond verse is different\nthird one comes again";
  assert(CleanHallucinations(text) == text);
  assert(CleanHallucinations("").empty());
}

void TestStripTransliterationFiller() {
  assert(StripTransliterationFiller("Here is the transliteration: main hoon") == "main hoon");
  assert(StripTransliterationFiller("HERE ARE THE LYRICS:\n\ntera mera") == "tera mera");
  assert(StripTransliterationFiller("Sure, here is the romanized output:\nmain hoon") == "main hoon");
  assert(StripTransliterationFiller("  plain text  ") == "plain text");
}

void TestLatinScriptLanguages() {
  assert(IsLatinScriptLanguage("en"));
  assert(IsLatinScriptLanguage(" PT "));
  assert(!IsLatinScriptLanguage("hi"));
  assert(!IsLatinScriptLanguage("ta"));
  assert(!IsLatinScriptLanguage(""));
}

} // namespace

int main() {
  TestSimilarityRatio();
  TestSimilarityIgnoresPopularElementsOfLongLines();
  TestLoopDetectionSplitsOnAnyWhitespace();
  TestCleanerDropsSpamLoopsAndDuplicates();
  TestCleanerCountsCodePoints();
  TestCleanerKeepsDistinctLines();
  TestStripTransliterationFiller();
  TestLatinScriptLanguages();

  std::cout << "miner_unit_transcript_cleaner: pass\n";
  return 0;
}
