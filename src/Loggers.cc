#include "Loggers.hh"

#include <phosg/Strings.hh>

using namespace std;

phosg::PrefixedLogger cli_log("", phosg::LogLevel::L_USE_DEFAULT);
phosg::PrefixedLogger config_log("[Config] ", phosg::LogLevel::L_USE_DEFAULT);
phosg::PrefixedLogger envelope_log("[Envelope] ", phosg::LogLevel::L_USE_DEFAULT);
phosg::PrefixedLogger tables_log("[Tables] ", phosg::LogLevel::L_USE_DEFAULT);

static void set_log_level_from_json(
    phosg::PrefixedLogger& log, const phosg::JSON& d, const char* json_key) {
  try {
    string name = phosg::toupper(d.at(json_key).as_string());
    log.min_level = phosg::enum_for_name<phosg::LogLevel>(name.c_str());
  } catch (const out_of_range&) {
  }
}

void set_all_log_levels(phosg::LogLevel level) {
  cli_log.min_level = level;
  config_log.min_level = level;
  envelope_log.min_level = level;
  tables_log.min_level = level;
}

void set_log_levels_from_json(const phosg::JSON& json) {
  set_log_level_from_json(cli_log, json, "CLI");
  set_log_level_from_json(config_log, json, "Config");
  set_log_level_from_json(envelope_log, json, "Envelope");
  set_log_level_from_json(tables_log, json, "Tables");
}
