/**
 * @file chunker.hpp
 * @brief Splits an input byte range into fixed-size, index-ordered chunks.
 */
#ifndef CHUNKZP_CHUNKER_HPP
#define CHUNKZP_CHUNKER_HPP

#include "chunk.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Chunker {

/**
 * @brief Number of chunks produced for an input of @p input_size bytes.
 * @param chunk_size Must be positive.
 */
uint64_t chunk_count(size_t input_size, size_t chunk_size);

/**
 * @brief Splits @p data into chunks of @p chunk_size bytes.
 *
 * Chunk i covers [i * chunk_size, min((i + 1) * chunk_size, size)). Every
 * chunk but the last is exactly chunk_size long. An empty input yields no
 * chunks.
 *
 * @param data Start of the input (may be null when size is 0).
 * @param size Input length in bytes.
 * @param chunk_size Nominal chunk size; non-positive values are rejected.
 * @param[out] chunks_out Cleared and filled with the chunks in order.
 * @return false if chunk_size is not positive, true otherwise.
 */
bool split(const unsigned char *data, size_t size, long chunk_size,
           std::vector<Chunk> &chunks_out);

} // namespace Chunker

#endif // CHUNKZP_CHUNKER_HPP
