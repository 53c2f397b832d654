#include "Cell.hh"

#include <stdlib.h>

#include <charconv>
#include <stdexcept>
#include <system_error>

using namespace std;

Cell::Cell() : value(string()) {}
Cell::Cell(int64_t v) : value(v) {}
Cell::Cell(int v) : value(static_cast<int64_t>(v)) {}
Cell::Cell(double v) : value(v) {}
Cell::Cell(const string& v) : value(v) {}
Cell::Cell(string&& v) : value(std::move(v)) {}
Cell::Cell(const char* v) : value(string(v)) {}

bool Cell::operator==(const Cell& other) const {
  return this->value == other.value;
}

bool Cell::operator!=(const Cell& other) const {
  return !this->operator==(other);
}

Cell::Type Cell::type() const {
  switch (this->value.index()) {
    case 0:
      return Type::INT;
    case 1:
      return Type::FLOAT;
    case 2:
      return Type::TEXT;
    default:
      throw logic_error("cell has no value");
  }
}

int64_t Cell::as_int() const {
  return std::get<int64_t>(this->value);
}

double Cell::as_float() const {
  return std::get<double>(this->value);
}

const string& Cell::as_text() const {
  return std::get<string>(this->value);
}

string Cell::str() const {
  return format_cell(*this);
}

phosg::JSON Cell::json() const {
  switch (this->type()) {
    case Type::INT:
      return phosg::JSON(this->as_int());
    case Type::FLOAT:
      return phosg::JSON(this->as_float());
    case Type::TEXT:
      return phosg::JSON(this->as_text());
    default:
      throw logic_error("invalid cell type");
  }
}

template <>
const char* phosg::name_for_enum<Cell::Type>(Cell::Type type) {
  switch (type) {
    case Cell::Type::INT:
      return "INT";
    case Cell::Type::FLOAT:
      return "FLOAT";
    case Cell::Type::TEXT:
      return "TEXT";
    default:
      throw logic_error("invalid cell type");
  }
}

static bool is_digits(const string& text, size_t start, size_t end) {
  for (size_t z = start; z < end; z++) {
    if ((text[z] < '0') || (text[z] > '9')) {
      return false;
    }
  }
  return true;
}

Cell infer_cell(const string& text) {
  size_t start = (!text.empty() && (text[0] == '-')) ? 1 : 0;

  size_t dot_offset = text.find('.', start);
  if (dot_offset != string::npos) {
    // At least one digit is required, on either side of the '.'
    if ((text.size() - start > 1) &&
        is_digits(text, start, dot_offset) &&
        is_digits(text, dot_offset + 1, text.size())) {
      // Out-of-range values still produce a FLOAT: strtod returns the nearest
      // subnormal, zero, or infinity in that case
      return Cell(strtod(text.c_str(), nullptr));
    }
    return Cell(text);
  }

  if ((text.size() > start) && is_digits(text, start, text.size())) {
    try {
      return Cell(static_cast<int64_t>(stoll(text)));
    } catch (const out_of_range&) {
    }
  }
  return Cell(text);
}

string format_cell(const Cell& cell) {
  switch (cell.type()) {
    case Cell::Type::INT:
      return to_string(cell.as_int());

    case Cell::Type::FLOAT: {
      // Fixed notation of the smallest subnormal double needs a bit over 320
      // characters, so this is always large enough
      char buf[0x200];
      auto res = to_chars(buf, buf + sizeof(buf), cell.as_float(), chars_format::fixed);
      if (res.ec != errc()) {
        throw logic_error("cannot format floating-point value");
      }
      string ret(buf, res.ptr);
      if ((ret.find('.') == string::npos) &&
          (ret.find_first_of("0123456789") != string::npos) &&
          (ret.find_first_not_of("-0123456789") == string::npos)) {
        ret += ".0";
      }
      return ret;
    }

    case Cell::Type::TEXT:
      return cell.as_text();

    default:
      throw logic_error("invalid cell type");
  }
}
