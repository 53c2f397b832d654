#pragma once

#include <phosg/JSON.hh>
#include <phosg/Strings.hh>

extern phosg::PrefixedLogger cli_log;
extern phosg::PrefixedLogger config_log;
extern phosg::PrefixedLogger envelope_log;
extern phosg::PrefixedLogger tables_log;

void set_all_log_levels(phosg::LogLevel level);
void set_log_levels_from_json(const phosg::JSON& json);
