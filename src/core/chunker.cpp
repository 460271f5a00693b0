/**
 * @file chunker.cpp
 * @brief Fixed-size input splitting.
 */
#include "chunker.hpp"

#include <algorithm>
#include <utility>

namespace Chunker {

uint64_t chunk_count(size_t input_size, size_t chunk_size) {
  if (chunk_size == 0)
    return 0;
  return (static_cast<uint64_t>(input_size) + chunk_size - 1) / chunk_size;
}

bool split(const unsigned char *data, size_t size, long chunk_size,
           std::vector<Chunk> &chunks_out) {
  chunks_out.clear();
  if (chunk_size <= 0)
    return false;

  const size_t block = static_cast<size_t>(chunk_size);
  const uint64_t num_chunks = chunk_count(size, block);
  chunks_out.reserve(num_chunks);

  for (uint64_t i = 0; i < num_chunks; ++i) {
    size_t offset = i * block;
    size_t len = std::min(block, size - offset);
    Chunk chunk;
    chunk.index = i;
    chunk.bytes.assign(data + offset, data + offset + len);
    chunks_out.push_back(std::move(chunk));
  }
  return true;
}

} // namespace Chunker
