/**
 * @file codec.cpp
 * @brief Miniz-backed zlib compression and decompression of single chunks.
 */
#include "codec.hpp"

// Keep Miniz from defining zlib-style macros such as compress/uncompress,
// which would rewrite Codec::compress in this translation unit.
#ifndef MINIZ_NO_ZLIB_COMPATIBLE_NAMES
#define MINIZ_NO_ZLIB_COMPATIBLE_NAMES
#endif
#include "miniz.h"

#include <algorithm>
#include <climits>
#include <new>

namespace Codec {

namespace {

// Miniz rejects null stream pointers even for zero-length buffers.
const unsigned char EMPTY_INPUT[1] = {0};

constexpr size_t INFLATE_MIN_CAPACITY = 4096;

// Upper bound of the first allocation; larger outputs grow by doubling as
// inflate actually produces bytes.
constexpr size_t INFLATE_MAX_INITIAL = 4 * 1024 * 1024;

/**
 * @brief RAII guard that releases an initialized inflate stream.
 */
class InflateStream {
  mz_stream stream_{};
  bool initialized_ = false;

public:
  InflateStream() = default;
  InflateStream(const InflateStream &) = delete;
  InflateStream &operator=(const InflateStream &) = delete;
  ~InflateStream() noexcept {
    if (initialized_)
      mz_inflateEnd(&stream_);
  }

  int init() {
    int res = mz_inflateInit(&stream_);
    initialized_ = (res == MZ_OK);
    return res;
  }

  mz_stream &get() { return stream_; }
};

} // namespace

bool is_valid_level(int level) {
  return level == LEVEL_DEFAULT || (level >= LEVEL_MIN && level <= LEVEL_MAX);
}

bool compress_buffer(const unsigned char *data, size_t size, int level,
                     std::vector<unsigned char> &out, std::string &error) {
  if (!is_valid_level(level)) {
    error = "invalid compression level " + std::to_string(level);
    return false;
  }
  const unsigned char *src = size > 0 ? data : EMPTY_INPUT;

  mz_ulong bound = mz_compressBound(static_cast<mz_ulong>(size));
  try {
    out.resize(bound);
  } catch (const std::bad_alloc &) {
    error = "cannot allocate " + std::to_string(bound) + " bytes";
    return false;
  }

  mz_ulong out_len = bound;
  int res = mz_compress2(out.data(), &out_len, src,
                         static_cast<mz_ulong>(size), level);
  if (res != MZ_OK) {
    out.clear();
    error = mz_error(res);
    return false;
  }
  out.resize(out_len);
  return true;
}

bool decompress_buffer(const unsigned char *data, size_t size,
                       size_t size_hint, std::vector<unsigned char> &out,
                       std::string &error) {
  out.clear();
  if (size == 0) {
    error = "empty compressed block";
    return false;
  }
  if (size > UINT_MAX) {
    error = "compressed block too large for a single inflate call";
    return false;
  }

  InflateStream inflater;
  int res = inflater.init();
  if (res != MZ_OK) {
    error = mz_error(res);
    return false;
  }
  mz_stream &stream = inflater.get();
  stream.next_in = data;
  stream.avail_in = static_cast<unsigned int>(size);

  try {
    out.resize(std::max(std::min(size_hint, INFLATE_MAX_INITIAL),
                        std::max(size * 2, INFLATE_MIN_CAPACITY)));
    for (;;) {
      size_t produced = static_cast<size_t>(stream.total_out);
      if (produced == out.size())
        out.resize(out.size() * 2);
      stream.next_out = out.data() + produced;
      stream.avail_out = static_cast<unsigned int>(
          std::min<size_t>(out.size() - produced, UINT_MAX));

      res = mz_inflate(&stream, MZ_NO_FLUSH);
      if (res == MZ_STREAM_END)
        break;
      if (res != MZ_OK) {
        // MZ_BUF_ERROR here means the input ran out before the stream end.
        error = res == MZ_BUF_ERROR ? "truncated zlib stream" : mz_error(res);
        out.clear();
        return false;
      }
    }
  } catch (const std::bad_alloc &) {
    error = "cannot allocate decompression buffer";
    out.clear();
    return false;
  }

  if (stream.avail_in != 0) {
    error = "trailing bytes after end of zlib stream";
    out.clear();
    return false;
  }
  out.resize(static_cast<size_t>(stream.total_out));
  return true;
}

CodecResult compress(const Chunk &chunk, int level) {
  CodecResult result;
  result.index = chunk.index;
  if (!compress_buffer(chunk.bytes.data(), chunk.bytes.size(), level,
                       result.payload, result.reason)) {
    result.error = ErrorKind::CompressionFailure;
  }
  return result;
}

CodecResult decompress(const Chunk &chunk, size_t size_hint) {
  CodecResult result;
  result.index = chunk.index;
  if (!decompress_buffer(chunk.bytes.data(), chunk.bytes.size(), size_hint,
                         result.payload, result.reason)) {
    result.error = ErrorKind::CorruptChunk;
  }
  return result;
}

} // namespace Codec
