#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace miner::stages {

/*
  Helpers for pulling JSON out of free-form generator output.

  The span runs from the first opening delimiter to the last closing
  one, so prose around the block is ignored.
*/

std::optional<std::string_view> ExtractDelimited(std::string_view text, char open, char close);

// Strict parse first; then retried with single quotes turned into double
// quotes and None/True/False mapped to their JSON spelling.
std::optional<google::protobuf::Struct> ParseLenientObject(std::string_view text);

// Strict parse of the first [...] block.
std::optional<google::protobuf::ListValue> ParseListBlock(std::string_view text);

// Scalars are rendered as text; anything else yields "".
std::string ValueAsString(const google::protobuf::Value& value);

// A list keeps its string members; a lone string becomes a one-element list.
std::vector<std::string> ValueAsStringList(const google::protobuf::Value& value);

} // namespace miner::stages
