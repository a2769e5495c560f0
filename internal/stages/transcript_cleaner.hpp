#pragma once

#include <string>
#include <string_view>

namespace miner::stages {

/*
  Deterministic clean-up of speech-to-text output.

  A line is dropped when it
    - contains a known channel-spam phrase (case-insensitive)
    - is longer than 10 characters but has fewer than 4 distinct words
    - is more than 85% similar to the previously kept line
  Lines are trimmed; surviving lines are joined with '\n'.
*/
std::string CleanHallucinations(std::string_view text);

// Ratcliff/Obershelp similarity in [0, 1], computed over code points.
double SimilarityRatio(std::string_view a, std::string_view b);

// Drops "Here is the transliteration:" style prefixes a generator adds
// in front of the converted text.
std::string StripTransliterationFiller(std::string_view text);

// Languages whose transcripts are already in Latin script.
bool IsLatinScriptLanguage(std::string_view language);

} // namespace miner::stages
