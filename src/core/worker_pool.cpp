/**
 * @file worker_pool.cpp
 * @brief Bounded queue, worker threads and index-ordered fan-in.
 */
#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace WorkerPool {

//----------------------------------------------------------------------------
// ChunkQueue
//----------------------------------------------------------------------------

ChunkQueue::ChunkQueue(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

bool ChunkQueue::push(Chunk chunk) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock,
                   [this] { return queue_.size() < capacity_ || closed_; });
    if (closed_) {
      return false;
    }
    queue_.push(std::move(chunk));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<Chunk> ChunkQueue::pop() {
  std::optional<Chunk> chunk;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });
    // Empty here means closed and drained.
    if (queue_.empty()) {
      return std::nullopt;
    }
    chunk = std::move(queue_.front());
    queue_.pop();
  }
  not_full_.notify_one();
  return chunk;
}

void ChunkQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

//----------------------------------------------------------------------------
// ResultCollector
//----------------------------------------------------------------------------

ResultCollector::ResultCollector(size_t expected, ProgressCallback progress)
    : expected_(expected), progress_(std::move(progress)) {
  completed_.reserve(expected);
}

void ResultCollector::add(CodecResult result) {
  std::lock_guard<std::mutex> lock(mutex_);
  completed_.push_back(std::move(result));
  if (progress_) {
    progress_(completed_.size(), expected_);
  }
}

std::vector<CodecResult> ResultCollector::take() {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::move(completed_);
}

//----------------------------------------------------------------------------
// Fan-in
//----------------------------------------------------------------------------

bool reorder_by_index(std::vector<CodecResult> completed,
                      size_t expected_count,
                      std::vector<CodecResult> &ordered_out) {
  ordered_out.clear();
  if (completed.size() != expected_count) {
    return false;
  }
  std::vector<bool> seen(expected_count, false);
  ordered_out.resize(expected_count);
  for (auto &result : completed) {
    if (result.index >= expected_count || seen[result.index]) {
      ordered_out.clear();
      return false;
    }
    seen[result.index] = true;
    size_t slot = static_cast<size_t>(result.index);
    ordered_out[slot] = std::move(result);
  }
  return true;
}

//----------------------------------------------------------------------------
// Pool
//----------------------------------------------------------------------------

namespace {

/**
 * @brief Worker loop: take a chunk, apply the operation, hand the result to
 * the collector. Exits once the queue is closed and drained.
 */
void pool_worker(ChunkQueue &queue, const Operation &op,
                 ResultCollector &collector) {
  while (true) {
    std::optional<Chunk> chunk = queue.pop();
    if (!chunk) {
      break;
    }

    CodecResult result;
    try {
      result = op.apply(*chunk);
      result.index = chunk->index;
    } catch (const std::exception &e) {
      result = CodecResult();
      result.index = chunk->index;
      result.error = op.failure_kind;
      result.reason = std::string(op.name) + " threw: " + e.what();
    }
    // The chunk's bytes are released here, before the next pop.
    chunk.reset();
    collector.add(std::move(result));
  }
}

} // namespace

PipelineStatus run(std::vector<Chunk> tasks, long worker_count,
                   const Operation &op, std::vector<CodecResult> &results_out,
                   const ProgressCallback &progress) {
  results_out.clear();
  if (worker_count <= 0) {
    return PipelineStatus::failure(
        ErrorKind::InvalidConfiguration, PipelineStage::Dispatching,
        "worker count must be positive, got " + std::to_string(worker_count));
  }
  if (!op.apply) {
    return PipelineStatus::failure(ErrorKind::InvalidConfiguration,
                                   PipelineStage::Dispatching,
                                   "no operation supplied");
  }

  const size_t total = tasks.size();
  const size_t num_workers =
      std::min(static_cast<size_t>(worker_count), std::max<size_t>(total, 1));

  ChunkQueue queue(static_cast<size_t>(worker_count));
  ResultCollector collector(total, progress);

  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  try {
    for (size_t t = 0; t < num_workers; ++t) {
      workers.emplace_back(pool_worker, std::ref(queue), std::cref(op),
                           std::ref(collector));
    }
  } catch (const std::system_error &e) {
    queue.close();
    for (auto &w : workers) {
      w.join();
    }
    return PipelineStatus::failure(ErrorKind::WorkerFailure,
                                   PipelineStage::Dispatching,
                                   std::string("cannot start workers: ") +
                                       e.what());
  }

  // Feed from the calling thread; push() blocks while the queue is full.
  for (auto &chunk : tasks) {
    if (!queue.push(std::move(chunk))) {
      break; // Closed early; the fan-in check below reports the gap.
    }
  }
  tasks.clear();
  queue.close();

  for (auto &w : workers) {
    w.join();
  }

  PipelineStatus status;
  status.stage = PipelineStage::Reordering;
  if (!reorder_by_index(collector.take(), total, results_out)) {
    return PipelineStatus::failure(
        ErrorKind::WorkerFailure, PipelineStage::Reordering,
        "worker results do not match the dispatched chunk indices");
  }
  return status;
}

} // namespace WorkerPool
