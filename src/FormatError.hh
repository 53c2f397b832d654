#pragma once

#include <phosg/Tools.hh>
#include <phosg/Types.hh>
#include <stdexcept>
#include <string>

// Raised when envelope or table data is malformed. The stage identifies which
// layer rejected the input; callers can use it to tell a damaged file apart
// from a file that simply isn't an envelope.
class FormatError : public std::runtime_error {
public:
  enum class Stage {
    BASE64 = 0,
    GZIP,
    TABLE_STRUCTURE,
  };

  FormatError(Stage stage, const std::string& what);
  ~FormatError() = default;

  inline Stage stage() const {
    return this->error_stage;
  }

private:
  Stage error_stage;
};

template <>
const char* phosg::name_for_enum<FormatError::Stage>(FormatError::Stage stage);
