/**
 * @file status.hpp
 * @brief Error kinds, pipeline stages and the status value returned by the
 * compression pipeline.
 */
#ifndef CHUNKZP_STATUS_HPP
#define CHUNKZP_STATUS_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @enum ErrorKind
 * @brief Failure categories reported by the pipeline.
 */
enum class ErrorKind {
  None = 0,              /**< No error. */
  InvalidConfiguration,  /**< chunk_size, worker_count or level out of range. */
  CorruptChunk,          /**< A single chunk failed to decompress. */
  MalformedContainer,    /**< Header/index inconsistent with the buffer. */
  PartialDecompression,  /**< One or more chunks failed during a run. */
  CompressionFailure,    /**< The codec compress path failed. */
  IoError,               /**< Byte source or sink could not be used. */
  WorkerFailure          /**< Pool threads could not start or lost results. */
};

/**
 * @enum PipelineStage
 * @brief States of a single compress or decompress invocation.
 */
enum class PipelineStage {
  Idle = 0,
  Chunking,
  ContainerRead,
  Dispatching,
  Reordering,
  ContainerWrite,
  Concatenating,
  Done
};

/**
 * @struct PipelineStatus
 * @brief Outcome of a pipeline operation.
 *
 * @var PipelineStatus::error
 * ErrorKind::None on success.
 * @var PipelineStatus::stage
 * Last stage reached; for failures, the stage that failed.
 * @var PipelineStatus::message
 * Human-readable detail for failures.
 * @var PipelineStatus::failed_indices
 * Chunk indices that failed (CorruptChunk, PartialDecompression,
 * CompressionFailure), ascending.
 */
struct PipelineStatus {
  ErrorKind error = ErrorKind::None;
  PipelineStage stage = PipelineStage::Idle;
  std::string message;
  std::vector<uint64_t> failed_indices;

  bool ok() const { return error == ErrorKind::None; }

  static PipelineStatus failure(ErrorKind kind, PipelineStage at,
                                std::string msg,
                                std::vector<uint64_t> indices = {}) {
    PipelineStatus s;
    s.error = kind;
    s.stage = at;
    s.message = std::move(msg);
    s.failed_indices = std::move(indices);
    return s;
  }
};

/**
 * @brief Returns a stable name for an error kind (e.g. "MalformedContainer").
 */
const char *error_kind_name(ErrorKind kind);

/**
 * @brief Returns a stable name for a pipeline stage (e.g. "ContainerRead").
 */
const char *stage_name(PipelineStage stage);

/**
 * @brief Formats a status as a single diagnostic line, including up to the
 * first few failed indices.
 */
std::string describe(const PipelineStatus &status);

#endif // CHUNKZP_STATUS_HPP
