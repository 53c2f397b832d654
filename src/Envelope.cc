#include "Envelope.hh"

#include <errno.h>
#include <string.h>

#include <format>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "Base64.hh"
#include "FormatError.hh"
#include "Loggers.hh"

using namespace std;

static bool is_envelope_whitespace(char ch) {
  return (ch == ' ') || (ch == '\t') || (ch == '\r') || (ch == '\n') || (ch == '\v') || (ch == '\f');
}

////////////////////////////////////////////////////////////////////////////////
// EnvelopeEncoder

EnvelopeEncoder::EnvelopeEncoder(int compression_level)
    : compressor(compression_level),
      output_chars(0),
      closed(false) {}

string EnvelopeEncoder::add(const void* data, size_t size) {
  if (this->closed) {
    throw logic_error("EnvelopeEncoder::add called after close");
  }
  this->pending += this->compressor.add(data, size);
  return this->encode_pending(false);
}

string EnvelopeEncoder::add(const string& data) {
  return this->add(data.data(), data.size());
}

string EnvelopeEncoder::close() {
  if (this->closed) {
    throw logic_error("EnvelopeEncoder::close called twice");
  }
  this->closed = true;
  this->pending += this->compressor.close();
  return this->encode_pending(true);
}

string EnvelopeEncoder::encode_pending(bool is_final) {
  // Mid-stream, only whole 3-byte groups are encoded so the output never
  // contains padding; the final call encodes everything that's left
  size_t encode_bytes = is_final ? this->pending.size() : (this->pending.size() / 3) * 3;
  if (encode_bytes == 0) {
    return "";
  }
  string ret = base64_encode_groups(this->pending.data(), encode_bytes, is_final);
  this->pending.erase(0, encode_bytes);
  this->output_chars += ret.size();
  return ret;
}

////////////////////////////////////////////////////////////////////////////////
// EnvelopeDecoder

EnvelopeDecoder::EnvelopeDecoder()
    : input_chars(0),
      decoded_chars(0),
      padding_seen(false),
      closed(false),
      failed(false) {}

string EnvelopeDecoder::add(const void* data, size_t size) {
  if (this->closed) {
    throw logic_error("EnvelopeDecoder::add called after close");
  }
  if (this->failed) {
    throw logic_error("EnvelopeDecoder::add called after a decoding error");
  }

  try {
    const char* chars = reinterpret_cast<const char*>(data);
    for (size_t z = 0; z < size; z++) {
      if (is_envelope_whitespace(chars[z])) {
        continue;
      }
      if (this->padding_seen) {
        throw FormatError(FormatError::Stage::BASE64, std::format(
            "data after final padded group at offset {}", this->decoded_chars + this->pending.size()));
      }
      this->pending.push_back(chars[z]);
      this->input_chars++;

      // A complete group that ends with padding must be the last group in the
      // stream, so it's decoded immediately to catch any data after it
      if ((this->pending.size() % 4 == 0) && (this->pending.back() == '=')) {
        this->padding_seen = true;
      }
    }

    size_t decode_chars = (this->pending.size() / 4) * 4;
    if (decode_chars == 0) {
      return "";
    }
    string decoded = base64_decode_groups(this->pending.data(), decode_chars, this->padding_seen, this->decoded_chars);
    this->pending.erase(0, decode_chars);
    this->decoded_chars += decode_chars;
    return this->decompressor.add(decoded);

  } catch (const FormatError&) {
    this->failed = true;
    throw;
  }
}

string EnvelopeDecoder::add(const string& data) {
  return this->add(data.data(), data.size());
}

void EnvelopeDecoder::close() {
  if (this->closed) {
    throw logic_error("EnvelopeDecoder::close called twice");
  }
  if (this->failed) {
    throw logic_error("EnvelopeDecoder::close called after a decoding error");
  }
  this->closed = true;
  if (!this->pending.empty()) {
    throw FormatError(FormatError::Stage::BASE64, std::format(
        "incomplete group of {} characters at end of data (offset {})",
        this->pending.size(), this->decoded_chars));
  }
  this->decompressor.close();
}

////////////////////////////////////////////////////////////////////////////////
// Whole-buffer conversions

string encode_envelope(const void* data, size_t size) {
  EnvelopeEncoder enc;
  string ret = enc.add(data, size);
  ret += enc.close();
  return ret;
}

string encode_envelope(const string& data) {
  return encode_envelope(data.data(), data.size());
}

string decode_envelope(const string& text) {
  string stripped = text;
  phosg::strip_whitespace(stripped);

  EnvelopeDecoder dec;
  string ret = dec.add(stripped);
  dec.close();
  return ret;
}

////////////////////////////////////////////////////////////////////////////////
// Streaming conversions

void envelope_encode_stream(
    const StreamReadFunction& read_fn,
    const StreamWriteFunction& write_fn,
    size_t chunk_size) {
  if (chunk_size == 0) {
    throw invalid_argument("chunk size must be at least 1");
  }

  EnvelopeEncoder enc;
  size_t num_chunks = 0;
  for (;;) {
    string chunk = read_fn(chunk_size);
    if (chunk.empty()) {
      break;
    }
    num_chunks++;
    string text = enc.add(chunk);
    if (!text.empty()) {
      write_fn(text.data(), text.size());
    }
  }
  string text = enc.close();
  if (!text.empty()) {
    write_fn(text.data(), text.size());
  }
  envelope_log.debug_f("Encoded {} bytes ({} chunks) into {} characters",
      enc.input_size(), num_chunks, enc.output_size());
}

void envelope_decode_stream(
    const StreamReadFunction& read_fn,
    const StreamWriteFunction& write_fn,
    size_t chunk_size) {
  if (chunk_size == 0) {
    throw invalid_argument("chunk size must be at least 1");
  }

  EnvelopeDecoder dec;
  size_t num_chunks = 0;
  for (;;) {
    string chunk = read_fn(chunk_size);
    if (chunk.empty()) {
      break;
    }
    num_chunks++;
    string data = dec.add(chunk);
    if (!data.empty()) {
      write_fn(data.data(), data.size());
    }
  }
  dec.close();
  envelope_log.debug_f("Decoded {} characters ({} chunks) into {} bytes",
      dec.input_size(), num_chunks, dec.output_size());
}

static StreamReadFunction file_read_function(FILE* in) {
  return [in](size_t max_size) -> string {
    string ret(max_size, '\0');
    size_t bytes_read = fread(ret.data(), 1, max_size, in);
    if ((bytes_read < max_size) && ferror(in)) {
      throw runtime_error("cannot read input: " + phosg::string_for_error(errno));
    }
    ret.resize(bytes_read);
    return ret;
  };
}

static StreamWriteFunction file_write_function(FILE* out) {
  return [out](const void* data, size_t size) -> void {
    phosg::fwritex(out, data, size);
  };
}

void envelope_encode_stream(FILE* in, FILE* out, size_t chunk_size) {
  envelope_encode_stream(file_read_function(in), file_write_function(out), chunk_size);
  fflush(out);
}

void envelope_decode_stream(FILE* in, FILE* out, size_t chunk_size) {
  envelope_decode_stream(file_read_function(in), file_write_function(out), chunk_size);
  fflush(out);
}
