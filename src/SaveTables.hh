#pragma once

#include <stddef.h>

#include <map>
#include <phosg/JSON.hh>
#include <phosg/Types.hh>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Cell.hh"

// The decoded contents of a save file are a sequence of tables in this form:
//   ###TableName
//   Column1<TAB>Column2<TAB>...
//   Value1<TAB>Value2<TAB>...
//   ...
//   <blank line>
// There is no schema; each table's columns are defined only by its header line,
// and each cell's type is inferred from its text.

constexpr const char* TABLE_MARKER = "###";

// A row maps column names to values. Its iteration order is lexicographic,
// which in general is not the order of the columns in the file; the original
// order is kept separately (see HeaderOrder).
using Row = std::map<std::string, Cell>;
using Table = std::vector<Row>;

// Table name -> column names, in the order they appear in the header line
using HeaderOrder = std::map<std::string, std::vector<std::string>>;

// An ordered collection of named tables. Tables are kept in the order their
// names were first added.
class TableSet {
public:
  TableSet() = default;
  ~TableSet() = default;

  // Adds an empty table with the given name and returns it. If the name
  // already exists, the existing table is emptied but keeps its position.
  Table& emplace(const std::string& name);

  // These throw std::out_of_range if the table doesn't exist.
  Table& at(const std::string& name);
  const Table& at(const std::string& name) const;

  // Returns nullptr if the table doesn't exist.
  Table* get(const std::string& name);
  const Table* get(const std::string& name) const;

  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;

  inline size_t size() const {
    return this->tables.size();
  }
  inline bool empty() const {
    return this->tables.empty();
  }
  inline std::vector<std::pair<std::string, Table>>::const_iterator begin() const {
    return this->tables.begin();
  }
  inline std::vector<std::pair<std::string, Table>>::const_iterator end() const {
    return this->tables.end();
  }

  bool operator==(const TableSet& other) const;
  bool operator!=(const TableSet& other) const;

  phosg::JSON json() const;

private:
  std::vector<std::pair<std::string, Table>> tables;
  std::unordered_map<std::string, size_t> name_to_index;
};

// What to do with a data row that has more fields than its table's header
enum class LongRowPolicy {
  REJECT = 0, // Throw FormatError (TABLE_STRUCTURE stage)
  TRUNCATE, // Keep the first N fields and log a warning
  SKIP, // Drop the row and log a warning
};

template <>
const char* phosg::name_for_enum<LongRowPolicy>(LongRowPolicy policy);
template <>
LongRowPolicy phosg::enum_for_name<LongRowPolicy>(const char* name);

struct TableParseOptions {
  LongRowPolicy long_row_policy = LongRowPolicy::REJECT;
};

struct ParsedTables {
  TableSet tables;
  HeaderOrder header_order;
};

// Parses decoded save text. Blank lines are ignored, as are any lines before
// the first table marker. Within a table, the first line with more than one
// field is the header; single-field and whitespace-only lines before it are
// ignored. After the header, a line of only tabs is a row of empty cells. Data
// rows with fewer fields than the header are padded with empty TEXT cells.
// Table markers may be indented. Whitespace after the table name is not part
// of the name, so names with trailing spaces don't survive format_tables
// followed by parse_tables.
ParsedTables parse_tables(const std::string& text, const TableParseOptions& options = TableParseOptions());

// Produces save text from a table set. Each table's header line uses the
// column order from header_order if present, or the first row's iteration order
// otherwise; values for columns missing from a row are written as empty
// strings. Empty tables are written as just the marker line. Every table is
// followed by a blank line.
std::string format_tables(const TableSet& tables, const HeaderOrder& header_order = HeaderOrder());

// Returns the names in required_names that are not present in tables, in the
// order they appear in required_names.
std::vector<std::string> find_missing_tables(
    const TableSet& tables, const std::vector<std::string>& required_names);
