#include "SaveTables.hh"

#include <string.h>

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "FormatError.hh"
#include "Loggers.hh"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
// TableSet

Table& TableSet::emplace(const string& name) {
  auto it = this->name_to_index.find(name);
  if (it != this->name_to_index.end()) {
    auto& table = this->tables[it->second].second;
    table.clear();
    return table;
  }
  this->name_to_index.emplace(name, this->tables.size());
  return this->tables.emplace_back(name, Table()).second;
}

Table& TableSet::at(const string& name) {
  return this->tables[this->name_to_index.at(name)].second;
}

const Table& TableSet::at(const string& name) const {
  return this->tables[this->name_to_index.at(name)].second;
}

Table* TableSet::get(const string& name) {
  auto it = this->name_to_index.find(name);
  return (it == this->name_to_index.end()) ? nullptr : &this->tables[it->second].second;
}

const Table* TableSet::get(const string& name) const {
  auto it = this->name_to_index.find(name);
  return (it == this->name_to_index.end()) ? nullptr : &this->tables[it->second].second;
}

bool TableSet::contains(const string& name) const {
  return this->name_to_index.count(name);
}

vector<string> TableSet::names() const {
  vector<string> ret;
  for (const auto& it : this->tables) {
    ret.emplace_back(it.first);
  }
  return ret;
}

bool TableSet::operator==(const TableSet& other) const {
  return this->tables == other.tables;
}

bool TableSet::operator!=(const TableSet& other) const {
  return !this->operator==(other);
}

phosg::JSON TableSet::json() const {
  // Tables are written as a list rather than a dict so their order survives
  auto ret = phosg::JSON::list();
  for (const auto& [name, table] : this->tables) {
    auto rows_json = phosg::JSON::list();
    for (const auto& row : table) {
      auto row_json = phosg::JSON::dict();
      for (const auto& [column, cell] : row) {
        row_json.emplace(column, cell.json());
      }
      rows_json.emplace_back(std::move(row_json));
    }
    ret.emplace_back(phosg::JSON::dict({{"Name", name}, {"Rows", std::move(rows_json)}}));
  }
  return ret;
}

////////////////////////////////////////////////////////////////////////////////
// LongRowPolicy

template <>
const char* phosg::name_for_enum<LongRowPolicy>(LongRowPolicy policy) {
  switch (policy) {
    case LongRowPolicy::REJECT:
      return "REJECT";
    case LongRowPolicy::TRUNCATE:
      return "TRUNCATE";
    case LongRowPolicy::SKIP:
      return "SKIP";
    default:
      throw runtime_error("invalid long row policy");
  }
}

template <>
LongRowPolicy phosg::enum_for_name<LongRowPolicy>(const char* name) {
  if (!strcmp(name, "REJECT")) {
    return LongRowPolicy::REJECT;
  } else if (!strcmp(name, "TRUNCATE")) {
    return LongRowPolicy::TRUNCATE;
  } else if (!strcmp(name, "SKIP")) {
    return LongRowPolicy::SKIP;
  } else {
    throw runtime_error("invalid long row policy");
  }
}

////////////////////////////////////////////////////////////////////////////////
// Parsing and formatting

static bool is_blank_line(const string& line) {
  for (char ch : line) {
    if ((ch != ' ') && (ch != '\t') && (ch != '\v') && (ch != '\f')) {
      return false;
    }
  }
  return true;
}

ParsedTables parse_tables(const string& text, const TableParseOptions& options) {
  ParsedTables ret;

  bool in_table = false;
  string table_name;
  vector<string> headers;
  size_t num_rows = 0;

  auto lines = phosg::split(text, '\n');
  size_t line_num = 0;
  for (auto& line : lines) {
    line_num++;
    if (!line.empty() && (line.back() == '\r')) {
      line.pop_back();
    }
    // Whitespace-only lines are blank, except that once a table has a header,
    // a line containing tabs is a row of empty cells
    if (is_blank_line(line) && (headers.empty() || (line.find('\t') == string::npos))) {
      continue;
    }

    size_t content_offset = line.find_first_not_of(" \t\v\f");
    if ((content_offset != string::npos) &&
        (line.compare(content_offset, strlen(TABLE_MARKER), TABLE_MARKER) == 0)) {
      table_name = line.substr(content_offset + strlen(TABLE_MARKER));
      phosg::strip_trailing_whitespace(table_name);
      if (ret.tables.contains(table_name)) {
        tables_log.warning_f("(line {}) Table {} appears more than once; discarding earlier rows", line_num, table_name);
      }
      ret.tables.emplace(table_name);
      ret.header_order.erase(table_name);
      headers.clear();
      in_table = true;
      continue;
    }

    if (!in_table) {
      continue;
    }

    auto fields = phosg::split(line, '\t');
    if (headers.empty()) {
      if (fields.size() > 1) {
        headers = std::move(fields);
        ret.header_order[table_name] = headers;
      }
      continue;
    }

    if (fields.size() > headers.size()) {
      switch (options.long_row_policy) {
        case LongRowPolicy::REJECT:
          throw FormatError(FormatError::Stage::TABLE_STRUCTURE, std::format(
              "(line {}) row in table {} has {} fields, but the header has only {} columns",
              line_num, table_name, fields.size(), headers.size()));
        case LongRowPolicy::TRUNCATE:
          tables_log.warning_f("(line {}) Row in table {} has {} fields, but the header has only {} columns; truncating row",
              line_num, table_name, fields.size(), headers.size());
          fields.resize(headers.size());
          break;
        case LongRowPolicy::SKIP:
          tables_log.warning_f("(line {}) Row in table {} has {} fields, but the header has only {} columns; skipping row",
              line_num, table_name, fields.size(), headers.size());
          continue;
        default:
          throw logic_error("invalid long row policy");
      }
    }

    auto& row = ret.tables.at(table_name).emplace_back();
    for (size_t z = 0; z < headers.size(); z++) {
      row[headers[z]] = (z < fields.size()) ? infer_cell(fields[z]) : Cell();
    }
    num_rows++;
  }

  tables_log.debug_f("Parsed {} tables containing {} rows", ret.tables.size(), num_rows);
  return ret;
}

string format_tables(const TableSet& tables, const HeaderOrder& header_order) {
  string ret;
  for (const auto& [name, table] : tables) {
    ret += TABLE_MARKER;
    ret += name;
    ret += '\n';

    if (!table.empty()) {
      vector<string> columns;
      auto order_it = header_order.find(name);
      if ((order_it != header_order.end()) && !order_it->second.empty()) {
        columns = order_it->second;
      } else {
        for (const auto& it : table.front()) {
          columns.emplace_back(it.first);
        }
      }

      ret += phosg::join(columns, "\t");
      ret += '\n';
      for (const auto& row : table) {
        for (size_t z = 0; z < columns.size(); z++) {
          if (z > 0) {
            ret += '\t';
          }
          auto cell_it = row.find(columns[z]);
          if (cell_it != row.end()) {
            ret += format_cell(cell_it->second);
          }
        }
        ret += '\n';
      }
    }

    ret += '\n';
  }
  return ret;
}

vector<string> find_missing_tables(const TableSet& tables, const vector<string>& required_names) {
  vector<string> ret;
  for (const auto& name : required_names) {
    if (!tables.contains(name)) {
      ret.emplace_back(name);
    }
  }
  return ret;
}
