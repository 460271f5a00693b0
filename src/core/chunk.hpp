/**
 * @file chunk.hpp
 * @brief Per-run transient units of work: the raw chunk handed to a worker
 * and the codec result it produces.
 */
#ifndef CHUNKZP_CHUNK_HPP
#define CHUNKZP_CHUNK_HPP

#include "status.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Contiguous span of the pipeline input, identified by its position in
 * split order. The bytes are owned by whoever holds the Chunk.
 */
struct Chunk {
  uint64_t index = 0;
  std::vector<unsigned char> bytes;
};

/**
 * @brief Output of one codec invocation, correlated to its Chunk by index.
 */
struct CodecResult {
  uint64_t index = 0;
  std::vector<unsigned char> payload; /**< Empty when the call failed. */
  ErrorKind error = ErrorKind::None;  /**< None means Ok. */
  std::string reason;                 /**< Codec diagnostic on failure. */

  bool ok() const { return error == ErrorKind::None; }
};

#endif // CHUNKZP_CHUNK_HPP
