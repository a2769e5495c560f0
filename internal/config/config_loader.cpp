#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

namespace miner::config {

using miner::runtime::config::CommandConfig;
using miner::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars carry the non-specific tag "!" and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static void SetArgvIfEmpty(CommandConfig* command, std::initializer_list<const char*> argv) {
  if (command->argv_size() > 0) return;
  for (const char* arg : argv) {
    command->add_argv(arg);
  }
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  return config;
}

RuntimeConfig ConfigLoader::Load(const std::string& path) {
  RuntimeConfig config = path.empty() ? RuntimeConfig{} : LoadFromYaml(path);
  ApplyEnvironment(config);
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* pipeline = config.mutable_pipeline();
  if (pipeline->output_root().empty()) pipeline->set_output_root("output");
  if (pipeline->cancel_poll_interval_ms() == 0) pipeline->set_cancel_poll_interval_ms(100);
  if (pipeline->terminate_grace_ms() == 0) pipeline->set_terminate_grace_ms(2000);

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    config.mutable_database()->mutable_sqlite()->set_path(pipeline->output_root() + "/miner.db");
  }

  auto* collaborators = config.mutable_collaborators();
  auto* fetch         = collaborators->mutable_source_fetch();

  // an element that is a lone empty placeholder is dropped together with
  // the flag before it, so "--cookies {cookies}" vanishes without a cookie file
  SetArgvIfEmpty(fetch->mutable_info(), {"yt-dlp", "-J", "--no-warnings", "--no-check-certificate", "--no-playlist", "--cookies", "{cookies}", "{url}"});
  SetArgvIfEmpty(fetch->mutable_download(),
                 {"yt-dlp", "--newline", "--no-warnings", "--no-check-certificate", "--no-playlist", "-f",
                  "bestvideo[height<=720][ext=mp4]+bestaudio[ext=m4a]/best[ext=mp4]/best", "--recode-video", "mp4", "-o",
                  "{output_dir}/video.%(ext)s", "--cookies", "{cookies}", "{url}"});
  SetArgvIfEmpty(fetch->mutable_extract_audio(), {"ffmpeg", "-y", "-loglevel", "error", "-i", "{video}", "-vn", "-acodec", "libmp3lame", "{audio}"});

  auto* text = collaborators->mutable_text_generation();
  if (text->model().empty()) text->set_model("llama3");
  SetArgvIfEmpty(text->mutable_command(), {"ollama", "run", "{model}"});
  SetArgvIfEmpty(text->mutable_health_check(), {"ollama", "list"});

  // speech_to_text, vision and embedding wrap site-specific model
  // adapters and have no default
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  if (const char* url = std::getenv("MINER_DB_URL"); url && *url) {
    ApplyDatabaseUrl(config, url);
  } else if (const char* fallback_url = std::getenv("DATABASE_URL"); fallback_url && *fallback_url) {
    ApplyDatabaseUrl(config, fallback_url);
  }

  if (const char* level = std::getenv("MINER_LOG_LEVEL"); level && *level) {
    config.mutable_logging()->set_level(level);
  }
  if (const char* pattern = std::getenv("MINER_LOG_PATTERN"); pattern && *pattern) {
    config.mutable_logging()->set_pattern(pattern);
  }
  if (const char* root = std::getenv("MINER_OUTPUT_ROOT"); root && *root) {
    config.mutable_pipeline()->set_output_root(root);
  }
}

void ConfigLoader::ApplyDatabaseUrl(RuntimeConfig& config, const std::string& url) {
  auto* database = config.mutable_database();

  if (StartsWith(url, "postgres://") || StartsWith(url, "postgresql://")) {
    const auto query = url.find('?');
    database->mutable_postgres()->set_connection_uri(query == std::string::npos ? url : url.substr(0, query));
    return;
  }

  const std::string kSqliteScheme = "sqlite://";
  database->mutable_sqlite()->set_path(StartsWith(url, kSqliteScheme) ? url.substr(kSqliteScheme.size()) : url);
  database->mutable_sqlite()->set_wal_mode(true);
}

} // namespace miner::config
