#include "Gzip.hh"

#include <string.h>

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "FormatError.hh"
#include "Loggers.hh"

using namespace std;

// windowBits values above 15 select the gzip wrapper instead of the zlib
// wrapper; 15 is the largest window size.
static constexpr int GZIP_WINDOW_BITS = 15 + 16;
static constexpr int GZIP_MEM_LEVEL = 8;
static constexpr size_t OUTPUT_BLOCK_SIZE = 0x4000;

static string zlib_error_message(const z_stream& stream, int ret) {
  if (stream.msg) {
    return std::format("{} (zlib error {})", stream.msg, ret);
  }
  return std::format("zlib error {}", ret);
}

GzipCompressor::GzipCompressor(int compression_level)
    : closed(false),
      input_bytes(0),
      output_bytes(0) {
  memset(&this->stream, 0, sizeof(this->stream));
  int ret = deflateInit2(&this->stream, compression_level, Z_DEFLATED, GZIP_WINDOW_BITS, GZIP_MEM_LEVEL, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw runtime_error("cannot initialize gzip compressor: " + zlib_error_message(this->stream, ret));
  }
}

GzipCompressor::~GzipCompressor() {
  deflateEnd(&this->stream);
}

string GzipCompressor::add(const void* data, size_t size) {
  if (this->closed) {
    throw logic_error("GzipCompressor::add called after close");
  }
  if (size == 0) {
    return "";
  }
  // zlib counts input in uInt, so very large buffers are fed in pieces
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
  phosg::StringWriter w;
  while (size > 0) {
    uInt piece_size = (size > 0x40000000) ? 0x40000000 : static_cast<uInt>(size);
    this->stream.next_in = const_cast<Bytef*>(bytes);
    this->stream.avail_in = piece_size;
    w.write(this->run(Z_NO_FLUSH));
    bytes += piece_size;
    size -= piece_size;
    this->input_bytes += piece_size;
  }
  return std::move(w.str());
}

string GzipCompressor::add(const string& data) {
  return this->add(data.data(), data.size());
}

string GzipCompressor::close() {
  if (this->closed) {
    throw logic_error("GzipCompressor::close called twice");
  }
  this->stream.next_in = nullptr;
  this->stream.avail_in = 0;
  string ret = this->run(Z_FINISH);
  this->closed = true;
  return ret;
}

string GzipCompressor::run(int flush) {
  phosg::StringWriter w;
  uint8_t buf[OUTPUT_BLOCK_SIZE];
  for (;;) {
    this->stream.next_out = buf;
    this->stream.avail_out = sizeof(buf);
    int ret = deflate(&this->stream, flush);
    size_t produced = sizeof(buf) - this->stream.avail_out;
    w.write(buf, produced);
    this->output_bytes += produced;

    if (ret == Z_STREAM_END) {
      break;
    } else if (ret == Z_BUF_ERROR) {
      // No progress was possible; all input has been consumed
      break;
    } else if (ret != Z_OK) {
      throw runtime_error("gzip compression failed: " + zlib_error_message(this->stream, ret));
    }
    // With Z_FINISH, deflate must be called until it returns Z_STREAM_END.
    // Otherwise, we're done when the input is exhausted and the output buffer
    // wasn't filled (meaning there's nothing more pending).
    if ((flush != Z_FINISH) && (this->stream.avail_in == 0) && (this->stream.avail_out != 0)) {
      break;
    }
  }
  return std::move(w.str());
}

GzipDecompressor::GzipDecompressor()
    : closed(false),
      failed(false),
      member_complete(false),
      input_bytes(0),
      output_bytes(0),
      ignored_bytes(0) {
  memset(&this->stream, 0, sizeof(this->stream));
  int ret = inflateInit2(&this->stream, GZIP_WINDOW_BITS);
  if (ret != Z_OK) {
    throw runtime_error("cannot initialize gzip decompressor: " + zlib_error_message(this->stream, ret));
  }
}

GzipDecompressor::~GzipDecompressor() {
  inflateEnd(&this->stream);
}

void GzipDecompressor::check_usable() const {
  if (this->closed) {
    throw logic_error("GzipDecompressor used after close");
  }
  if (this->failed) {
    throw logic_error("GzipDecompressor used after a decompression error");
  }
}

string GzipDecompressor::add(const void* data, size_t size) {
  this->check_usable();
  if (size == 0) {
    return "";
  }
  if (this->member_complete) {
    this->ignored_bytes += size;
    return "";
  }

  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
  phosg::StringWriter w;
  uint8_t buf[OUTPUT_BLOCK_SIZE];
  while ((size > 0) && !this->member_complete) {
    uInt piece_size = (size > 0x40000000) ? 0x40000000 : static_cast<uInt>(size);
    this->stream.next_in = const_cast<Bytef*>(bytes);
    this->stream.avail_in = piece_size;

    for (;;) {
      this->stream.next_out = buf;
      this->stream.avail_out = sizeof(buf);
      int ret = inflate(&this->stream, Z_NO_FLUSH);
      size_t produced = sizeof(buf) - this->stream.avail_out;
      w.write(buf, produced);
      this->output_bytes += produced;

      if (ret == Z_STREAM_END) {
        this->member_complete = true;
        break;
      } else if (ret == Z_BUF_ERROR) {
        break;
      } else if (ret != Z_OK) {
        this->failed = true;
        throw FormatError(FormatError::Stage::GZIP, zlib_error_message(this->stream, ret));
      }
      if ((this->stream.avail_in == 0) && (this->stream.avail_out != 0)) {
        break;
      }
    }

    size_t consumed = piece_size - this->stream.avail_in;
    this->input_bytes += consumed;
    bytes += piece_size;
    size -= piece_size;
    if (this->member_complete) {
      this->ignored_bytes += this->stream.avail_in + size;
    }
  }

  if (this->member_complete && this->ignored_bytes) {
    envelope_log.debug_f("Ignoring {} bytes after end of gzip member", this->ignored_bytes);
  }
  return std::move(w.str());
}

string GzipDecompressor::add(const string& data) {
  return this->add(data.data(), data.size());
}

void GzipDecompressor::close() {
  this->check_usable();
  this->closed = true;
  if (!this->member_complete) {
    throw FormatError(FormatError::Stage::GZIP, std::format(
        "gzip stream is truncated ({} bytes consumed, {} bytes produced)",
        this->input_bytes, this->output_bytes));
  }
}

string gzip_compress(const void* data, size_t size, int compression_level) {
  GzipCompressor c(compression_level);
  string ret = c.add(data, size);
  ret += c.close();
  return ret;
}

string gzip_compress(const string& data, int compression_level) {
  return gzip_compress(data.data(), data.size(), compression_level);
}

string gzip_decompress(const void* data, size_t size) {
  GzipDecompressor d;
  string ret = d.add(data, size);
  d.close();
  return ret;
}

string gzip_decompress(const string& data) {
  return gzip_decompress(data.data(), data.size());
}
