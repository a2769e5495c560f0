#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace miner::util {

std::string Trim(std::string_view s);
std::string ToLower(std::string_view s);

// Splits on `delim`, keeping empty pieces.
std::vector<std::string> Split(std::string_view s, char delim);

std::string ReplaceAll(std::string s, std::string_view from, std::string_view to);

// Replaces every "{name}" in `tmpl` with vars.at(name). Unknown
// placeholders are left untouched.
std::string Substitute(const std::string& tmpl, const std::map<std::string, std::string>& vars);

} // namespace miner::util
