#include "util/gzip.hpp"

#include <limits>

#include <zlib.h>

namespace kasstamp::util {

namespace {

constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kInflateStep = 64 * 1024;

void SetError(std::string* error, const char* step, const z_stream& stream, int rc) {
  if (error) {
    *error = std::string(step) + " failed (" + std::to_string(rc) + ")";
    if (stream.msg != nullptr) {
      *error += ": ";
      *error += stream.msg;
    }
  }
}

}  // namespace

bool GzipCompress(std::span<const std::uint8_t> input, std::vector<std::uint8_t>* out,
                  std::string* error) {
  out->clear();
  if (input.size() > std::numeric_limits<uInt>::max()) {
    if (error) *error = "gzip input too large";
    return false;
  }
  z_stream stream{};
  int rc = deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                        Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    SetError(error, "deflateInit2", stream, rc);
    return false;
  }
  out->resize(deflateBound(&stream, static_cast<uLong>(input.size())));
  stream.next_in = const_cast<Bytef*>(input.data());
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = out->data();
  stream.avail_out = static_cast<uInt>(out->size());
  rc = deflate(&stream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    SetError(error, "deflate", stream, rc);
    deflateEnd(&stream);
    out->clear();
    return false;
  }
  out->resize(stream.total_out);
  deflateEnd(&stream);
  return true;
}

bool GzipDecompress(std::span<const std::uint8_t> input, std::vector<std::uint8_t>* out,
                    std::size_t max_output, std::string* error) {
  out->clear();
  if (input.size() > std::numeric_limits<uInt>::max()) {
    if (error) *error = "gzip input too large";
    return false;
  }
  z_stream stream{};
  int rc = inflateInit2(&stream, kGzipWindowBits);
  if (rc != Z_OK) {
    SetError(error, "inflateInit2", stream, rc);
    return false;
  }
  stream.next_in = const_cast<Bytef*>(input.data());
  stream.avail_in = static_cast<uInt>(input.size());
  do {
    const std::size_t offset = out->size();
    if (offset >= max_output) {
      if (error) *error = "gzip output exceeds limit";
      inflateEnd(&stream);
      out->clear();
      return false;
    }
    out->resize(offset + kInflateStep);
    stream.next_out = out->data() + offset;
    stream.avail_out = static_cast<uInt>(kInflateStep);
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      SetError(error, "inflate", stream, rc);
      inflateEnd(&stream);
      out->clear();
      return false;
    }
    out->resize(offset + (kInflateStep - stream.avail_out));
    if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      if (error) *error = "gzip stream truncated";
      inflateEnd(&stream);
      out->clear();
      return false;
    }
  } while (rc != Z_STREAM_END);
  inflateEnd(&stream);
  if (out->size() > max_output) {
    if (error) *error = "gzip output exceeds limit";
    out->clear();
    return false;
  }
  return true;
}

}  // namespace kasstamp::util
