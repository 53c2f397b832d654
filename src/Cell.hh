#pragma once

#include <stdint.h>

#include <phosg/JSON.hh>
#include <phosg/Types.hh>
#include <string>
#include <variant>

// A single value in a save table. Save tables have no schema, so each cell's
// type is inferred independently from its text (see infer_cell).
class Cell {
public:
  enum class Type {
    INT = 0,
    FLOAT,
    TEXT,
  };

  // The default-constructed cell is an empty TEXT cell
  Cell();
  explicit Cell(int64_t v);
  explicit Cell(int v);
  explicit Cell(double v);
  explicit Cell(const std::string& v);
  explicit Cell(std::string&& v);
  explicit Cell(const char* v);
  Cell(const Cell&) = default;
  Cell(Cell&&) = default;
  Cell& operator=(const Cell&) = default;
  Cell& operator=(Cell&&) = default;
  ~Cell() = default;

  bool operator==(const Cell& other) const;
  bool operator!=(const Cell& other) const;

  Type type() const;
  inline bool is_int() const {
    return this->type() == Type::INT;
  }
  inline bool is_float() const {
    return this->type() == Type::FLOAT;
  }
  inline bool is_text() const {
    return this->type() == Type::TEXT;
  }

  // These throw std::bad_variant_access if the cell is of a different type.
  int64_t as_int() const;
  double as_float() const;
  const std::string& as_text() const;

  // Returns the text this cell is written as in a save table
  std::string str() const;

  phosg::JSON json() const;

private:
  std::variant<int64_t, double, std::string> value;
};

template <>
const char* phosg::name_for_enum<Cell::Type>(Cell::Type type);

// Infers a cell's type from its text. The rules are applied in this order:
// 1. If the text contains a '.', and removing one leading '-' (if present)
//    and that '.' leaves only digits (at least one), it's a FLOAT.
// 2. If the text is all digits, optionally preceded by a single '-', it's an
//    INT. Values that don't fit in 64 bits are left as TEXT.
// 3. Anything else is TEXT, including the empty string.
Cell infer_cell(const std::string& text);

// Renders a cell's value as text. INTs are written in decimal; FLOATs are
// written with the fewest digits that read back as the same value, always in
// fixed notation and always with a '.', so that infer_cell returns a FLOAT
// with the same value; TEXT is written verbatim.
std::string format_cell(const Cell& cell);
