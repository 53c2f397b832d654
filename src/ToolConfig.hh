#pragma once

#include <stddef.h>

#include <phosg/Arguments.hh>
#include <phosg/JSON.hh>
#include <string>
#include <vector>

#include "SaveTables.hh"

struct ToolConfig {
  size_t chunk_size;
  LongRowPolicy long_row_policy;
  std::vector<std::string> required_tables;

  ToolConfig();
  explicit ToolConfig(const phosg::JSON& json);
  ~ToolConfig() = default;

  // Applies command-line overrides (--chunk-size, --long-rows, --verbose and
  // --quiet). This must happen after the config file's LogLevels are applied.
  void apply_arguments(phosg::Arguments& args);

  TableParseOptions parse_options() const;
  phosg::JSON json() const;
};

// Sets all loggers to DEBUG for --verbose or WARNING for --quiet
void apply_log_level_arguments(phosg::Arguments& args);

// Loads the configuration from the file named by --config, or from
// system/config.json if --config isn't given and that file exists; otherwise
// uses the defaults. Log levels from the file are applied immediately, then
// command-line overrides are applied to the result.
ToolConfig load_tool_config(phosg::Arguments& args);
