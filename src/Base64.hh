#pragma once

#include <stddef.h>

#include <string>

// Base64 helpers for the standard (RFC 4648, non-URL-safe) alphabet with '='
// padding. Decoding is strict: characters outside the alphabet and misplaced
// padding are rejected with FormatError (BASE64 stage) rather than skipped.

bool is_base64_char(char ch);

// Encodes a buffer. If pad is false, size must be a multiple of 3 so that the
// output contains no padding; this is used when encoding a stream in pieces.
std::string base64_encode_groups(const void* data, size_t size, bool pad);
std::string base64_encode_groups(const std::string& data, bool pad);

// Decodes a whole number of 4-character groups. Only the last group in the
// buffer may contain padding; if allow_padding is false, no group may. Throws
// FormatError if size is not a multiple of 4. base_offset is added to the
// offsets reported in error messages, for callers decoding a larger stream in
// pieces.
std::string base64_decode_groups(const char* data, size_t size, bool allow_padding = true, size_t base_offset = 0);
std::string base64_decode_groups(const std::string& data, bool allow_padding = true, size_t base_offset = 0);

// Returns the number of padding characters (0, 1, or 2) in a valid final
// group. The group must already have been validated.
size_t base64_padding_in_group(const char* group);
