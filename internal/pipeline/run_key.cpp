#include "run_key.hpp"

#include "internal/util/errors.hpp"

namespace miner::pipeline {

namespace {

std::string_view StripAt(std::string_view s, std::string_view delims) {
  auto pos = s.find_first_of(delims);
  return pos == std::string_view::npos ? s : s.substr(0, pos);
}

void ValidateRunKey(std::string_view key, std::string_view url) {
  if (key.empty() || key == "." || key == ".." || key.find('/') != std::string_view::npos || key.find('\\') != std::string_view::npos) {
    throw util::FatalRunError("cannot derive a run key from url '" + std::string(url) + "'");
  }
}

} // namespace

std::string ResolveRunKey(std::string_view url) {
  std::string_view key;

  if (auto pos = url.rfind("v="); pos != std::string_view::npos) {
    key = StripAt(url.substr(pos + 2), "&#");
  } else {
    auto path = StripAt(url, "?#");
    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    auto slash = path.rfind('/');
    key        = slash == std::string_view::npos ? path : path.substr(slash + 1);
  }

  ValidateRunKey(key, url);
  return std::string(key);
}

} // namespace miner::pipeline
