/**
 * @file pipeline.hpp
 * @brief Compression and decompression entry points: Chunker -> WorkerPool
 * (Codec) -> Assembler -> Container, and the reverse.
 *
 * Each call is independent; no state survives between invocations. Output is
 * produced only when the whole run succeeds.
 */
#ifndef CHUNKZP_PIPELINE_HPP
#define CHUNKZP_PIPELINE_HPP

#include "config.hpp"
#include "status.hpp"
#include "worker_pool.hpp"
#include <cstddef>
#include <istream>
#include <ostream>
#include <vector>

namespace Pipeline {

/**
 * @brief Parameters of one pipeline invocation.
 */
struct PipelineOptions {
  /** @brief Nominal chunk size. Informational when decompressing. */
  long chunk_size = static_cast<long>(BLOCK_SIZE_DEFAULT);

  /** @brief Number of pool workers. */
  long worker_count = 1;

  /** @brief zlib level, -1 for the default. Ignored when decompressing. */
  int compression_level = -1;

  /** @brief 2 or more prints stage transitions to std::cout. */
  int verbosity = 1;

  /** @brief Per-chunk progress, forwarded to the worker pool. */
  WorkerPool::ProgressCallback progress;
};

/**
 * @brief Rejects non-positive chunk sizes and worker counts and invalid
 * compression levels.
 */
PipelineStatus validate(const PipelineOptions &opts);

/**
 * @brief Compresses @p size bytes at @p data into a serialized container.
 *
 * Idle -> Chunking -> Dispatching -> ContainerWrite -> Done. The pool both
 * runs and reorders the chunks inside Dispatching.
 *
 * @param[out] out Serialized container; empty on failure.
 */
PipelineStatus compress_buffer(const unsigned char *data, size_t size,
                               const PipelineOptions &opts,
                               std::vector<unsigned char> &out);

/**
 * @brief Restores the original bytes from a serialized container.
 *
 * Idle -> ContainerRead -> Dispatching -> Concatenating -> Done.
 * Chunk boundaries come from the container index; opts.chunk_size is not
 * used for slicing.
 *
 * @param[out] out Restored bytes; empty on failure.
 */
PipelineStatus decompress_buffer(const unsigned char *data, size_t size,
                                 const PipelineOptions &opts,
                                 std::vector<unsigned char> &out);

/**
 * @brief Reads @p input to the end, compresses it and writes the container to
 * @p output. Nothing is written unless compression succeeds.
 */
PipelineStatus compress(std::istream &input, std::ostream &output,
                        const PipelineOptions &opts);

/**
 * @brief Reads a container from @p input and writes the restored bytes to
 * @p output. Nothing is written unless every chunk decompresses.
 */
PipelineStatus decompress(std::istream &input, std::ostream &output,
                          const PipelineOptions &opts);

PipelineStatus compress(std::istream &input, std::ostream &output,
                        long chunk_size, long worker_count);

PipelineStatus decompress(std::istream &input, std::ostream &output,
                          long chunk_size, long worker_count);

} // namespace Pipeline

#endif // CHUNKZP_PIPELINE_HPP
