#include "Base64.hh"

#include <format>
#include <phosg/Encoding.hh>
#include <stdexcept>

#include "FormatError.hh"

using namespace std;

bool is_base64_char(char ch) {
  return ((ch >= 'A') && (ch <= 'Z')) ||
      ((ch >= 'a') && (ch <= 'z')) ||
      ((ch >= '0') && (ch <= '9')) ||
      (ch == '+') ||
      (ch == '/');
}

static string describe_char(char ch) {
  if ((ch >= 0x20) && (ch < 0x7F)) {
    return std::format("\'{}\'", ch);
  }
  return std::format("0x{:02X}", static_cast<uint8_t>(ch));
}

string base64_encode_groups(const void* data, size_t size, bool pad) {
  if (!pad && (size % 3)) {
    throw logic_error("unpadded base64 input must be a multiple of 3 bytes");
  }
  if (size == 0) {
    return "";
  }
  return phosg::base64_encode(string(reinterpret_cast<const char*>(data), size));
}

string base64_encode_groups(const string& data, bool pad) {
  return base64_encode_groups(data.data(), data.size(), pad);
}

size_t base64_padding_in_group(const char* group) {
  if (group[2] == '=') {
    return 2;
  } else if (group[3] == '=') {
    return 1;
  }
  return 0;
}

static void validate_group(const char* group, size_t offset, bool is_last, bool allow_padding) {
  // The first two characters of a group always carry data; the third may be
  // padding only if the fourth is also padding
  for (size_t z = 0; z < 4; z++) {
    char ch = group[z];
    if (is_base64_char(ch)) {
      if ((z == 3) && (group[2] == '=')) {
        throw FormatError(FormatError::Stage::BASE64, std::format(
            "invalid padding at offset {}", offset + z));
      }
      continue;
    }
    if ((ch == '=') && (z >= 2)) {
      if (!is_last || !allow_padding) {
        throw FormatError(FormatError::Stage::BASE64, std::format(
            "padding before end of data at offset {}", offset + z));
      }
      continue;
    }
    throw FormatError(FormatError::Stage::BASE64, std::format(
        "invalid character {} at offset {}", describe_char(ch), offset + z));
  }
}

string base64_decode_groups(const char* data, size_t size, bool allow_padding, size_t base_offset) {
  if (size % 4) {
    throw FormatError(FormatError::Stage::BASE64, std::format(
        "incomplete group of {} characters at offset {}", size % 4, base_offset + size - (size % 4)));
  }
  if (size == 0) {
    return "";
  }
  for (size_t offset = 0; offset < size; offset += 4) {
    validate_group(data + offset, base_offset + offset, (offset + 4 == size), allow_padding);
  }
  string decoded = phosg::base64_decode(string(data, size));

  size_t expected_size = (size / 4) * 3 - base64_padding_in_group(data + size - 4);
  if (decoded.size() != expected_size) {
    throw logic_error(std::format(
        "base64 decoder produced {} bytes; expected {} bytes", decoded.size(), expected_size));
  }
  return decoded;
}

string base64_decode_groups(const string& data, bool allow_padding, size_t base_offset) {
  return base64_decode_groups(data.data(), data.size(), allow_padding, base_offset);
}
