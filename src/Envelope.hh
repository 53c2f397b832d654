#pragma once

#include <stddef.h>
#include <stdio.h>

#include <functional>
#include <string>

#include "Gzip.hh"

// An envelope is base64(gzip(data)): a single gzip member, base64-encoded with
// the standard alphabet and '=' padding, with no line breaks. Save files are
// stored in this form.

constexpr size_t DEFAULT_ENVELOPE_CHUNK_SIZE = 0x2000;

// Reads up to max_size bytes; returning an empty string means end of input.
typedef std::function<std::string(size_t max_size)> StreamReadFunction;
typedef std::function<void(const void* data, size_t size)> StreamWriteFunction;

// Incrementally converts raw bytes into envelope text. Call .add() any number
// of times, then .close(); the concatenation of all returned strings is the
// complete envelope. Text returned from .add() never contains padding, so it
// can be written out immediately. The result is identical to
// encode_envelope() on the concatenated input, however the input is split.
class EnvelopeEncoder {
public:
  explicit EnvelopeEncoder(int compression_level = Z_DEFAULT_COMPRESSION);
  ~EnvelopeEncoder() = default;

  std::string add(const void* data, size_t size);
  std::string add(const std::string& data);
  std::string close();

  inline size_t input_size() const {
    return this->compressor.input_size();
  }
  inline size_t output_size() const {
    return this->output_chars;
  }

private:
  std::string encode_pending(bool is_final);

  GzipCompressor compressor;
  // Compressed bytes not yet base64-encoded (always fewer than 3 between calls)
  std::string pending;
  size_t output_chars;
  bool closed;
};

// Incrementally converts envelope text back into raw bytes. ASCII whitespace
// anywhere in the input is skipped. Characters are decoded in whole 4-character
// groups; a partial group is held until more input arrives. .close() fails if
// a partial group remains or if the gzip member is incomplete. Any error is
// fatal to the decoder.
class EnvelopeDecoder {
public:
  EnvelopeDecoder();
  ~EnvelopeDecoder() = default;

  std::string add(const void* data, size_t size);
  std::string add(const std::string& data);
  void close();

  inline size_t input_size() const {
    return this->input_chars;
  }
  inline size_t output_size() const {
    return this->decompressor.output_size();
  }

private:
  GzipDecompressor decompressor;
  // Base64 characters not yet decoded (always fewer than 4 between calls)
  std::string pending;
  size_t input_chars;
  size_t decoded_chars;
  bool padding_seen;
  bool closed;
  bool failed;
};

// Whole-buffer conversions. decode_envelope trims surrounding whitespace
// before decoding.
std::string encode_envelope(const void* data, size_t size);
std::string encode_envelope(const std::string& data);
std::string decode_envelope(const std::string& text);

// Streaming conversions. Memory use is proportional to chunk_size, not to the
// size of the data. chunk_size must be at least 1.
void envelope_encode_stream(
    const StreamReadFunction& read_fn,
    const StreamWriteFunction& write_fn,
    size_t chunk_size = DEFAULT_ENVELOPE_CHUNK_SIZE);
void envelope_decode_stream(
    const StreamReadFunction& read_fn,
    const StreamWriteFunction& write_fn,
    size_t chunk_size = DEFAULT_ENVELOPE_CHUNK_SIZE);

// Same as above, but for already-open C streams. The streams are not closed.
void envelope_encode_stream(FILE* in, FILE* out, size_t chunk_size = DEFAULT_ENVELOPE_CHUNK_SIZE);
void envelope_decode_stream(FILE* in, FILE* out, size_t chunk_size = DEFAULT_ENVELOPE_CHUNK_SIZE);
