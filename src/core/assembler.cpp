/**
 * @file assembler.cpp
 * @brief Result validation and parallel block placement using OpenMP.
 */
#include "assembler.hpp"

#include <algorithm>
#include <cstring>
#include <omp.h>
#include <string>
#include <utility>

namespace Assembler {

namespace {

/**
 * @brief Copies every payload to its precomputed offset in @p dst.
 */
void place_payloads(const std::vector<CodecResult> &results,
                    std::vector<unsigned char> &dst, int num_threads) {
  const size_t count = results.size();
  std::vector<size_t> offsets(count);
  size_t total = 0;
  for (size_t i = 0; i < count; ++i) {
    offsets[i] = total;
    total += results[i].payload.size();
  }
  dst.resize(total);
  unsigned char *base = dst.data();

  // The team never exceeds the block count or the OpenMP thread limit.
  long team = std::min<long>(num_threads, omp_get_max_threads());
  team = std::min<long>(team, static_cast<long>(count));
  if (team < 1)
    team = 1;

// Blocks land in disjoint ranges, so the copies need no synchronization.
#pragma omp parallel for num_threads(static_cast<int>(team)) schedule(dynamic) \
    if (team > 1)
  for (size_t i = 0; i < count; ++i) {
    size_t sz = results[i].payload.size();
    if (sz > 0) {
      memcpy(base + offsets[i], results[i].payload.data(), sz);
    }
  }
}

/**
 * @brief Builds the failure message, quoting the first codec diagnostic.
 */
std::string failure_message(const std::vector<CodecResult> &results,
                            size_t failed_count, const char *verb) {
  std::string msg = std::to_string(failed_count) + " of " +
                    std::to_string(results.size()) + " chunks failed to " +
                    verb;
  auto first = std::find_if(results.begin(), results.end(),
                            [](const CodecResult &r) { return !r.ok(); });
  if (first != results.end() && !first->reason.empty()) {
    msg += " (chunk " + std::to_string(first->index) + ": " + first->reason +
           ")";
  }
  return msg;
}

} // namespace

std::vector<uint64_t> failed_indices(const std::vector<CodecResult> &results) {
  std::vector<uint64_t> failed;
  for (const auto &result : results) {
    if (!result.ok()) {
      failed.push_back(result.index);
    }
  }
  return failed;
}

PipelineStatus assemble_container(const std::vector<CodecResult> &results,
                                  uint64_t nominal_chunk_size,
                                  uint64_t original_size, int num_threads,
                                  Container::ContainerData &out) {
  out = Container::ContainerData();

  std::vector<uint64_t> failed = failed_indices(results);
  if (!failed.empty()) {
    std::string msg = failure_message(results, failed.size(), "compress");
    return PipelineStatus::failure(ErrorKind::CompressionFailure,
                                   PipelineStage::ContainerWrite, msg,
                                   std::move(failed));
  }

  out.header.chunk_count = results.size();
  out.header.nominal_chunk_size = nominal_chunk_size;
  out.header.original_size = original_size;
  out.index.resize(results.size());
  for (size_t i = 0; i < results.size(); ++i) {
    out.index[i].index = results[i].index;
    out.index[i].compressed_length = results[i].payload.size();
  }
  place_payloads(results, out.blocks, num_threads);

  PipelineStatus status;
  status.stage = PipelineStage::ContainerWrite;
  return status;
}

PipelineStatus assemble_output(const std::vector<CodecResult> &results,
                               int num_threads,
                               std::vector<unsigned char> &out) {
  out.clear();

  std::vector<uint64_t> failed = failed_indices(results);
  if (!failed.empty()) {
    std::string msg = failure_message(results, failed.size(), "decompress");
    return PipelineStatus::failure(ErrorKind::PartialDecompression,
                                   PipelineStage::Concatenating, msg,
                                   std::move(failed));
  }

  place_payloads(results, out, num_threads);

  PipelineStatus status;
  status.stage = PipelineStage::Concatenating;
  return status;
}

} // namespace Assembler
