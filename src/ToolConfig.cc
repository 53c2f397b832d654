#include "ToolConfig.hh"

#include <filesystem>
#include <format>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Envelope.hh"
#include "Loggers.hh"

using namespace std;

static const char* DEFAULT_CONFIG_FILENAME = "system/config.json";

static LongRowPolicy long_row_policy_for_name(const string& name) {
  return phosg::enum_for_name<LongRowPolicy>(phosg::toupper(name).c_str());
}

ToolConfig::ToolConfig()
    : chunk_size(DEFAULT_ENVELOPE_CHUNK_SIZE),
      long_row_policy(LongRowPolicy::REJECT),
      required_tables({"Savegame", "Youtuber", "Channel"}) {}

ToolConfig::ToolConfig(const phosg::JSON& json) : ToolConfig() {
  int64_t chunk_size = json.get_int("ChunkSize", this->chunk_size);
  if (chunk_size < 1) {
    throw runtime_error(std::format("ChunkSize must be at least 1 (got {})", chunk_size));
  }
  this->chunk_size = chunk_size;

  try {
    this->long_row_policy = long_row_policy_for_name(json.at("LongRowPolicy").as_string());
  } catch (const out_of_range&) {
  }

  try {
    const auto& tables_json = json.at("RequiredTables");
    this->required_tables.clear();
    for (const auto& item : tables_json.as_list()) {
      this->required_tables.emplace_back(item->as_string());
    }
  } catch (const out_of_range&) {
  }

  try {
    set_log_levels_from_json(json.at("LogLevels"));
  } catch (const out_of_range&) {
  }
}

void apply_log_level_arguments(phosg::Arguments& args) {
  if (args.get<bool>("verbose")) {
    set_all_log_levels(phosg::LogLevel::L_DEBUG);
  } else if (args.get<bool>("quiet")) {
    set_all_log_levels(phosg::LogLevel::L_WARNING);
  }
}

void ToolConfig::apply_arguments(phosg::Arguments& args) {
  apply_log_level_arguments(args);
  size_t chunk_size = args.get<size_t>("chunk-size", 0);
  if (chunk_size) {
    this->chunk_size = chunk_size;
  }
  string long_rows = args.get<string>("long-rows");
  if (!long_rows.empty()) {
    this->long_row_policy = long_row_policy_for_name(long_rows);
  }
}

TableParseOptions ToolConfig::parse_options() const {
  TableParseOptions ret;
  ret.long_row_policy = this->long_row_policy;
  return ret;
}

phosg::JSON ToolConfig::json() const {
  auto tables_json = phosg::JSON::list();
  for (const auto& name : this->required_tables) {
    tables_json.emplace_back(name);
  }
  return phosg::JSON::dict({
      {"ChunkSize", static_cast<int64_t>(this->chunk_size)},
      {"LongRowPolicy", phosg::name_for_enum(this->long_row_policy)},
      {"RequiredTables", std::move(tables_json)},
  });
}

ToolConfig load_tool_config(phosg::Arguments& args) {
  string filename = args.get<string>("config");
  if (filename.empty() && std::filesystem::is_regular_file(DEFAULT_CONFIG_FILENAME)) {
    filename = DEFAULT_CONFIG_FILENAME;
  }

  ToolConfig config;
  if (!filename.empty()) {
    config_log.debug_f("Loading configuration from {}", filename);
    config = ToolConfig(phosg::JSON::parse(phosg::load_file(filename)));
  }
  config.apply_arguments(args);
  config_log.debug_f("Chunk size: {}; long row policy: {}", config.chunk_size, phosg::name_for_enum(config.long_row_policy));
  return config;
}
