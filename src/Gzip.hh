#pragma once

#include <stddef.h>
#include <zlib.h>

#include <string>

////////////////////////////////////////////////////////////////////////////////
// Incremental gzip compression
////////////////////////////////////////////////////////////////////////////////

// Use this class if you need to compress from multiple input buffers without
// holding the entire input in memory. To use it, instantiate it, then call
// .add() one or more times, then call .close(). Each call returns whatever
// compressed data became available during that call; the concatenation of all
// returned strings is a single complete gzip member. The output does not
// depend on how the input is divided between .add() calls.
class GzipCompressor {
public:
  explicit GzipCompressor(int compression_level = Z_DEFAULT_COMPRESSION);
  GzipCompressor(const GzipCompressor&) = delete;
  GzipCompressor(GzipCompressor&&) = delete;
  GzipCompressor& operator=(const GzipCompressor&) = delete;
  GzipCompressor& operator=(GzipCompressor&&) = delete;
  ~GzipCompressor();

  // Adds more input data, which logically comes after all previous data
  // provided via add() calls. Cannot be called after close() is called.
  std::string add(const void* data, size_t size);
  std::string add(const std::string& data);

  // Ends compression and returns the remaining compressed data, including the
  // gzip trailer.
  std::string close();

  inline size_t input_size() const {
    return this->input_bytes;
  }
  inline size_t output_size() const {
    return this->output_bytes;
  }

private:
  std::string run(int flush);

  z_stream stream;
  bool closed;
  size_t input_bytes;
  size_t output_bytes;
};

////////////////////////////////////////////////////////////////////////////////
// Incremental gzip decompression
////////////////////////////////////////////////////////////////////////////////

// The inverse of GzipCompressor. The stream is expected to be gzip-wrapped
// (not raw deflate or zlib-wrapped). Decompression ends at the end of the
// first gzip member; any input after that point is ignored. All errors are
// reported as FormatError with the GZIP stage, and after an error the object
// refuses further input.
class GzipDecompressor {
public:
  GzipDecompressor();
  GzipDecompressor(const GzipDecompressor&) = delete;
  GzipDecompressor(GzipDecompressor&&) = delete;
  GzipDecompressor& operator=(const GzipDecompressor&) = delete;
  GzipDecompressor& operator=(GzipDecompressor&&) = delete;
  ~GzipDecompressor();

  // Adds more compressed input and returns any decompressed data that became
  // available as a result.
  std::string add(const void* data, size_t size);
  std::string add(const std::string& data);

  // Ends decompression. Throws if the end of the gzip member was not reached
  // (that is, if the input was truncated).
  void close();

  // Returns true if the end of the gzip member has been reached.
  inline bool is_complete() const {
    return this->member_complete;
  }
  inline size_t input_size() const {
    return this->input_bytes;
  }
  inline size_t output_size() const {
    return this->output_bytes;
  }
  inline size_t ignored_input_size() const {
    return this->ignored_bytes;
  }

private:
  void check_usable() const;

  z_stream stream;
  bool closed;
  bool failed;
  bool member_complete;
  size_t input_bytes;
  size_t output_bytes;
  size_t ignored_bytes;
};

// These functions are shortcuts for constructing a GzipCompressor or
// GzipDecompressor, calling .add() on it once, then calling .close().
std::string gzip_compress(const void* data, size_t size, int compression_level = Z_DEFAULT_COMPRESSION);
std::string gzip_compress(const std::string& data, int compression_level = Z_DEFAULT_COMPRESSION);
std::string gzip_decompress(const void* data, size_t size);
std::string gzip_decompress(const std::string& data);
