#include "json_extract.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "internal/util/strings.hpp"

namespace miner::stages {

namespace {

// Some protobuf releases accept 'single quoted' strings; strict JSON does not.
bool HasSingleQuoteOutsideStrings(std::string_view json) {
  bool in_string = false;
  for (std::size_t i = 0; i < json.size(); ++i) {
    const char c = json[i];
    if (in_string) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_string = false;
      }
    } else if (c == '"') {
      in_string = true;
    } else if (c == '\'') {
      return true;
    }
  }
  return false;
}

template <typename Message>
std::optional<Message> ParseStrict(std::string_view json) {
  if (HasSingleQuoteOutsideStrings(json)) return std::nullopt;

  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(std::string(json), &message);
  if (!status.ok()) return std::nullopt;
  return message;
}

std::string NormaliseLiterals(std::string_view json) {
  std::string fixed(json);
  fixed = util::ReplaceAll(std::move(fixed), "'", "\"");
  fixed = util::ReplaceAll(std::move(fixed), "None", "null");
  fixed = util::ReplaceAll(std::move(fixed), "True", "true");
  fixed = util::ReplaceAll(std::move(fixed), "False", "false");
  return fixed;
}

} // namespace

std::optional<std::string_view> ExtractDelimited(std::string_view text, char open, char close) {
  auto first = text.find(open);
  auto last  = text.rfind(close);
  if (first == std::string_view::npos || last == std::string_view::npos || last < first) {
    return std::nullopt;
  }
  return text.substr(first, last - first + 1);
}

std::optional<google::protobuf::Struct> ParseLenientObject(std::string_view text) {
  auto block = ExtractDelimited(text, '{', '}');
  if (!block) return std::nullopt;

  if (auto parsed = ParseStrict<google::protobuf::Struct>(*block)) {
    return parsed;
  }
  return ParseStrict<google::protobuf::Struct>(NormaliseLiterals(*block));
}

std::optional<google::protobuf::ListValue> ParseListBlock(std::string_view text) {
  auto block = ExtractDelimited(text, '[', ']');
  if (!block) return std::nullopt;
  return ParseStrict<google::protobuf::ListValue>(*block);
}

std::string ValueAsString(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNumberValue: {
      double number = value.number_value();
      if (std::floor(number) == number && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
      }
      return std::to_string(number);
    }
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      return {};
  }
}

std::vector<std::string> ValueAsStringList(const google::protobuf::Value& value) {
  std::vector<std::string> out;
  if (value.kind_case() == google::protobuf::Value::kStringValue) {
    if (!value.string_value().empty()) out.push_back(value.string_value());
    return out;
  }
  if (value.kind_case() != google::protobuf::Value::kListValue) return out;

  for (const auto& item : value.list_value().values()) {
    if (item.kind_case() == google::protobuf::Value::kStringValue) {
      out.push_back(item.string_value());
    }
  }
  return out;
}

} // namespace miner::stages
