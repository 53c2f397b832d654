#include "FormatError.hh"

#include <format>

using namespace std;

FormatError::FormatError(Stage stage, const string& what)
    : runtime_error(std::format("({}) {}", phosg::name_for_enum(stage), what)),
      error_stage(stage) {}

template <>
const char* phosg::name_for_enum<FormatError::Stage>(FormatError::Stage stage) {
  switch (stage) {
    case FormatError::Stage::BASE64:
      return "base64";
    case FormatError::Stage::GZIP:
      return "gzip";
    case FormatError::Stage::TABLE_STRUCTURE:
      return "table-structure";
    default:
      throw logic_error("invalid format error stage");
  }
}
