/**
 * @file codec.hpp
 * @brief Stateless per-chunk zlib codec built on Miniz.
 *
 * Both functions are pure: they share no state between calls and may be
 * invoked concurrently from any number of workers.
 */
#ifndef CHUNKZP_CODEC_HPP
#define CHUNKZP_CODEC_HPP

#include "chunk.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace Codec {

/** @brief zlib default level (maps to 6). */
constexpr int LEVEL_DEFAULT = -1;
constexpr int LEVEL_MIN = 0;
constexpr int LEVEL_MAX = 9;

/** @brief True for LEVEL_DEFAULT and [LEVEL_MIN, LEVEL_MAX]. */
bool is_valid_level(int level);

/**
 * @brief Compresses a buffer into a zlib stream.
 * @param data Input bytes (may be null when size is 0).
 * @param size Input length.
 * @param level Compression level (see is_valid_level).
 * @param[out] out Receives the compressed stream.
 * @param[out] error Miniz diagnostic on failure.
 * @return true on success. Fails only on allocation errors or an invalid
 * level.
 */
bool compress_buffer(const unsigned char *data, size_t size, int level,
                     std::vector<unsigned char> &out, std::string &error);

/**
 * @brief Inflates a complete zlib stream.
 *
 * Rejects bad headers, invalid deflate data, Adler-32 mismatches, truncated
 * streams and trailing bytes after the end of the stream.
 *
 * @param data Compressed bytes.
 * @param size Compressed length.
 * @param size_hint Expected decompressed size, used only to size the first
 * allocation (0 if unknown). That allocation never exceeds 4 MiB.
 * @param[out] out Receives the decompressed bytes.
 * @param[out] error Miniz diagnostic on failure.
 * @return true on success.
 */
bool decompress_buffer(const unsigned char *data, size_t size,
                       size_t size_hint, std::vector<unsigned char> &out,
                       std::string &error);

/**
 * @brief Compresses one chunk. The result carries the chunk's index and,
 * on failure, ErrorKind::CompressionFailure.
 */
CodecResult compress(const Chunk &chunk, int level = LEVEL_DEFAULT);

/**
 * @brief Decompresses one chunk. The result carries the chunk's index and,
 * on failure, ErrorKind::CorruptChunk.
 */
CodecResult decompress(const Chunk &chunk, size_t size_hint = 0);

} // namespace Codec

#endif // CHUNKZP_CODEC_HPP
