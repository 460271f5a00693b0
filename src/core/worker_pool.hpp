/**
 * @file worker_pool.hpp
 * @brief Bounded thread pool that maps a codec operation over chunks and
 * returns the results in chunk index order.
 */
#ifndef CHUNKZP_WORKER_POOL_HPP
#define CHUNKZP_WORKER_POOL_HPP

#include "chunk.hpp"
#include "status.hpp"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace WorkerPool {

using ChunkOperation = std::function<CodecResult(const Chunk &)>;
using ProgressCallback = std::function<void(size_t completed, size_t total)>;

/**
 * @brief Codec step applied by the pool to every chunk.
 */
struct Operation {
  const char *name = "";     /**< Used in diagnostics ("compress"). */
  ChunkOperation apply;      /**< Must be safe to call concurrently. */
  ErrorKind failure_kind = ErrorKind::CorruptChunk; /**< Recorded when apply
                                                       throws. */
};

/**
 * @brief Thread-safe FIFO of pending chunks with a fixed capacity.
 *
 * push() blocks while the queue is full and pop() blocks while it is empty,
 * so the producer can never run more than `capacity` chunks ahead of the
 * workers.
 */
class ChunkQueue {
public:
  explicit ChunkQueue(size_t capacity);

  ChunkQueue(const ChunkQueue &) = delete;
  ChunkQueue &operator=(const ChunkQueue &) = delete;

  /**
   * @brief Enqueues a chunk, waiting for free space.
   * @return false if the queue was closed; the chunk is discarded.
   */
  bool push(Chunk chunk);

  /**
   * @brief Dequeues the oldest chunk, waiting until one is available.
   * @return std::nullopt once the queue is closed and drained.
   */
  std::optional<Chunk> pop();

  /**
   * @brief Rejects further pushes and wakes every waiting thread.
   */
  void close();

  size_t capacity() const { return capacity_; }

private:
  std::queue<Chunk> queue_;
  std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  const size_t capacity_;
  bool closed_ = false;
};

/**
 * @brief Fan-in point for worker results. Stores results in completion order
 * and reports progress.
 */
class ResultCollector {
public:
  ResultCollector(size_t expected, ProgressCallback progress);

  ResultCollector(const ResultCollector &) = delete;
  ResultCollector &operator=(const ResultCollector &) = delete;

  void add(CodecResult result);

  /** @brief Moves out everything collected so far. */
  std::vector<CodecResult> take();

private:
  std::vector<CodecResult> completed_;
  std::mutex mutex_;
  const size_t expected_;
  ProgressCallback progress_;
};

/**
 * @brief Restores index order from results collected in completion order.
 *
 * @param completed Results in arbitrary order.
 * @param expected_count Number of chunks dispatched; indices must be exactly
 * 0..expected_count-1, each once.
 * @param[out] ordered_out Results placed at their index.
 * @return false on a missing, duplicate or out-of-range index.
 */
bool reorder_by_index(std::vector<CodecResult> completed,
                      size_t expected_count,
                      std::vector<CodecResult> &ordered_out);

/**
 * @brief Runs @p op over every chunk on @p worker_count threads.
 *
 * Each chunk is processed by exactly one worker. At most worker_count chunks
 * are being processed and at most worker_count more are queued at any time.
 * A failing chunk does not stop the others; its result is returned with a
 * non-None error at its index. The call blocks until every chunk is done.
 *
 * @param tasks Chunks in index order; ownership moves into the pool.
 * @param worker_count Number of worker threads; must be positive.
 * @param op Operation applied to each chunk.
 * @param[out] results_out Results ordered by chunk index.
 * @param progress Optional callback, called once per completed chunk and
 * never concurrently with itself.
 * @return InvalidConfiguration for a non-positive worker count, WorkerFailure if
 * the workers could not be started or the fan-in found inconsistent indices,
 * OK otherwise (even when individual chunks failed).
 */
PipelineStatus run(std::vector<Chunk> tasks, long worker_count,
                   const Operation &op, std::vector<CodecResult> &results_out,
                   const ProgressCallback &progress = nullptr);

} // namespace WorkerPool

#endif // CHUNKZP_WORKER_POOL_HPP
