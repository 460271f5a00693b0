/**
 * @file assembler.hpp
 * @brief Turns index-ordered codec results into a container (compression)
 * or into the restored output bytes (decompression).
 */
#ifndef CHUNKZP_ASSEMBLER_HPP
#define CHUNKZP_ASSEMBLER_HPP

#include "chunk.hpp"
#include "container.hpp"
#include "status.hpp"
#include <cstdint>
#include <vector>

namespace Assembler {

/**
 * @brief Indices of all failed results, ascending.
 */
std::vector<uint64_t> failed_indices(const std::vector<CodecResult> &results);

/**
 * @brief Builds a container from compressed chunks.
 *
 * Any failed result aborts with CompressionFailure listing every failed
 * index; @p out is left empty in that case.
 *
 * @param results Compressed chunks ordered by index.
 * @param nominal_chunk_size Chunk size used when splitting.
 * @param original_size Total uncompressed length.
 * @param num_threads Threads used to copy blocks into place.
 * @param[out] out The assembled container.
 */
PipelineStatus assemble_container(const std::vector<CodecResult> &results,
                                  uint64_t nominal_chunk_size,
                                  uint64_t original_size, int num_threads,
                                  Container::ContainerData &out);

/**
 * @brief Concatenates decompressed chunks in index order.
 *
 * Any failed result aborts with PartialDecompression listing every failed
 * index; nothing is written to @p out in that case, so a failed chunk is
 * never dropped or zero-filled.
 *
 * @param results Decompressed chunks ordered by index.
 * @param num_threads Threads used to copy payloads into place.
 * @param[out] out The restored bytes.
 */
PipelineStatus assemble_output(const std::vector<CodecResult> &results,
                               int num_threads, std::vector<unsigned char> &out);

} // namespace Assembler

#endif // CHUNKZP_ASSEMBLER_HPP
