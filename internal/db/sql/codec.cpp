#include "codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace miner::db::sql {

namespace {

std::string ListToJson(const google::protobuf::ListValue& list) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    return "[]";
  }
  return json;
}

std::optional<google::protobuf::ListValue> JsonToList(const std::string& json) {
  if (json.empty()) {
    return google::protobuf::ListValue{};
  }

  google::protobuf::ListValue list;
  if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
    return std::nullopt;
  }
  return list;
}

} // namespace

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }
  return ListToJson(list);
}

std::optional<std::vector<std::string>> DecodeStringList(const std::string& json) {
  auto list = JsonToList(json);
  if (!list) return std::nullopt;

  std::vector<std::string> out;
  out.reserve(list->values_size());
  for (const auto& value : list->values()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) return std::nullopt;
    out.push_back(value.string_value());
  }
  return out;
}

std::string EncodeEmbedding(const model::Embedding& values) {
  google::protobuf::ListValue list;
  for (float value : values) {
    list.add_values()->set_number_value(static_cast<double>(value));
  }
  return ListToJson(list);
}

std::optional<model::Embedding> DecodeEmbedding(const std::string& json) {
  auto list = JsonToList(json);
  if (!list) return std::nullopt;

  model::Embedding out;
  out.reserve(list->values_size());
  for (const auto& value : list->values()) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue) return std::nullopt;
    out.push_back(static_cast<float>(value.number_value()));
  }
  return out;
}

std::string EncodePgTextArray(const std::vector<std::string>& values) {
  std::string out = "{";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += ',';
    out += '"';
    for (char c : values[i]) {
      if (c == '"' || c == '\\') out += '\\';
      out += c;
    }
    out += '"';
  }
  out += '}';
  return out;
}

std::optional<std::vector<std::string>> DecodePgTextArray(const std::string& literal) {
  if (literal.size() < 2 || literal.front() != '{' || literal.back() != '}') {
    return std::nullopt;
  }

  std::vector<std::string> out;
  const std::string        body = literal.substr(1, literal.size() - 2);
  if (body.empty()) return out;

  std::string current;
  bool        quoted  = false;
  bool        escaped = false;
  for (char c : body) {
    if (escaped) {
      current += c;
      escaped = false;
    } else if (c == '\\') {
      escaped = true;
    } else if (c == '"') {
      quoted = !quoted;
    } else if (c == ',' && !quoted) {
      out.push_back(std::move(current));
      current.clear();
    } else {
      current += c;
    }
  }
  if (quoted || escaped) return std::nullopt;
  out.push_back(std::move(current));
  return out;
}

} // namespace miner::db::sql
