#include "transcript_cleaner.hpp"

#include <array>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/util/strings.hpp"

namespace miner::stages {

namespace {

constexpr std::array<std::string_view, 13> kSpamPhrases = {
    "subscribe to",  "subscribe channel",   "like and share", "comment below", "thanks for watching",
    "copyright",     "all rights reserved", "follow us on",   "press the bell icon",
    "prastutra",     "video by",            "audio by",       "praastuti",
};

constexpr std::array<std::string_view, 7> kLatinLanguages = {"en", "es", "fr", "de", "it", "pt", "nl"};

constexpr double kSimilarityThreshold = 0.85;

// Lenient UTF-8 decode; invalid bytes map to themselves.
std::u32string DecodeUtf8(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());

  for (std::size_t i = 0; i < s.size();) {
    const auto lead = static_cast<unsigned char>(s[i]);
    int        len  = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xe ? 3 : (lead >> 3) == 0x1e ? 4 : 0;

    if (len == 0 || i + len > s.size()) {
      out.push_back(lead);
      ++i;
      continue;
    }

    char32_t cp = len == 1 ? lead : lead & (0xff >> (len + 1));
    bool     ok = true;
    for (int k = 1; k < len; ++k) {
      const auto cont = static_cast<unsigned char>(s[i + k]);
      if ((cont & 0xc0) != 0x80) {
        ok = false;
        break;
      }
      cp = (cp << 6) | (cont & 0x3f);
    }

    if (!ok) {
      out.push_back(lead);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += len;
  }
  return out;
}

struct Match {
  std::size_t a;
  std::size_t b;
  std::size_t size;
};

// b elements that may not start a match. Mirrors difflib's autojunk:
// for b of 200+ elements, anything occurring more than 1% (+1) is popular.
std::unordered_set<char32_t> PopularElements(const std::u32string& b) {
  std::unordered_set<char32_t> popular;
  if (b.size() < 200) return popular;

  std::unordered_map<char32_t, std::size_t> counts;
  for (char32_t c : b) ++counts[c];

  const std::size_t limit = b.size() / 100 + 1;
  for (const auto& [c, n] : counts) {
    if (n > limit) popular.insert(c);
  }
  return popular;
}

// Longest common block in a[alo, ahi) x b[blo, bhi); earliest wins ties.
// Blocks are seeded from non-popular elements only, then extended over
// equal elements on both sides.
Match LongestMatch(const std::u32string& a, std::size_t alo, std::size_t ahi, const std::u32string& b, std::size_t blo, std::size_t bhi,
                   const std::unordered_set<char32_t>& popular) {
  Match                    best{alo, blo, 0};
  std::vector<std::size_t> prev(bhi - blo + 1, 0);
  std::vector<std::size_t> cur(bhi - blo + 1, 0);

  for (std::size_t i = alo; i < ahi; ++i) {
    for (std::size_t j = blo; j < bhi; ++j) {
      const std::size_t col = j - blo + 1;
      cur[col]              = a[i] == b[j] && !popular.contains(b[j]) ? prev[col - 1] + 1 : 0;
      if (cur[col] > best.size) {
        best = {i + 1 - cur[col], j + 1 - cur[col], cur[col]};
      }
    }
    std::swap(prev, cur);
  }

  while (best.a > alo && best.b > blo && a[best.a - 1] == b[best.b - 1]) {
    --best.a;
    --best.b;
    ++best.size;
  }
  while (best.a + best.size < ahi && best.b + best.size < bhi && a[best.a + best.size] == b[best.b + best.size]) {
    ++best.size;
  }
  return best;
}

std::size_t MatchingCharacters(const std::u32string& a, const std::u32string& b) {
  const auto  popular = PopularElements(b);
  std::size_t total   = 0;

  std::vector<std::array<std::size_t, 4>> queue{{0, a.size(), 0, b.size()}};
  while (!queue.empty()) {
    auto [alo, ahi, blo, bhi] = queue.back();
    queue.pop_back();
    if (alo >= ahi || blo >= bhi) continue;

    auto m = LongestMatch(a, alo, ahi, b, blo, bhi, popular);
    if (m.size == 0) continue;

    total += m.size;
    queue.push_back({alo, m.a, blo, m.b});
    queue.push_back({m.a + m.size, ahi, m.b + m.size, bhi});
  }
  return total;
}

bool ContainsSpam(const std::string& lower_line) {
  for (auto phrase : kSpamPhrases) {
    if (lower_line.find(phrase) != std::string::npos) return true;
  }
  return false;
}

bool IsRepetitiveLoop(const std::string& line) {
  if (DecodeUtf8(line).size() <= 10) return false;

  std::set<std::string> words;
  std::istringstream    in(line);
  for (std::string word; in >> word;) words.insert(std::move(word));
  return words.size() < 4;
}

} // namespace

double SimilarityRatio(std::string_view a, std::string_view b) {
  const auto ua = DecodeUtf8(a);
  const auto ub = DecodeUtf8(b);

  const std::size_t length = ua.size() + ub.size();
  if (length == 0) return 1.0;
  return 2.0 * static_cast<double>(MatchingCharacters(ua, ub)) / static_cast<double>(length);
}

std::string CleanHallucinations(std::string_view text) {
  std::vector<std::string> kept;

  for (const auto& raw : util::Split(text, '\n')) {
    auto line = util::Trim(raw);

    if (ContainsSpam(util::ToLower(line))) continue;
    if (IsRepetitiveLoop(line)) continue;
    if (!kept.empty() && SimilarityRatio(line, kept.back()) > kSimilarityThreshold) continue;

    kept.push_back(std::move(line));
  }

  std::string out;
  for (std::size_t i = 0; i < kept.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += kept[i];
  }
  return out;
}

std::string StripTransliterationFiller(std::string_view text) {
  static const std::array<std::regex, 7> kFiller = {
      std::regex(R"(^here is the transliterated text[:\s]*)", std::regex::icase),
      std::regex(R"(^here is the transliteration[:\s]*)", std::regex::icase),
      std::regex(R"(^here are the lyrics[:\s]*)", std::regex::icase),
      std::regex(R"(^sure,? here is .*[:\s]*)", std::regex::icase),
      std::regex(R"(^transliteration[:\s]*)", std::regex::icase),
      std::regex(R"(^romanized text[:\s]*)", std::regex::icase),
      std::regex(R"(^output[:\s]*)", std::regex::icase),
  };

  std::string out(text);
  for (const auto& pattern : kFiller) {
    out = util::Trim(std::regex_replace(out, pattern, "", std::regex_constants::format_first_only));
  }
  return out;
}

bool IsLatinScriptLanguage(std::string_view language) {
  const auto lower = util::ToLower(util::Trim(language));
  for (auto code : kLatinLanguages) {
    if (lower == code) return true;
  }
  return false;
}

} // namespace miner::stages
