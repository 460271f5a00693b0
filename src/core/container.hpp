/**
 * @file container.hpp
 * @brief On-disk container binding chunk indices to compressed blocks.
 *
 * Layout (host byte order, packed):
 *   ContainerHeader                      30 bytes
 *   chunk_count x uint64_t               compressed length of each chunk
 *   blocks                               compressed chunks, in index order
 *
 * Every block's byte span is known from the index alone, so decompression can
 * dispatch all chunks at once without scanning for delimiters.
 */
#ifndef CHUNKZP_CONTAINER_HPP
#define CHUNKZP_CONTAINER_HPP

#include "chunk.hpp"
#include "config.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Container {

#pragma pack(push, 1)
struct ContainerHeader {
  uint32_t magic_number = MAGIC_NUMBER_CONTAINER;
  uint16_t version = FORMAT_VERSION;
  uint64_t chunk_count = 0;
  uint64_t nominal_chunk_size = 0;
  uint64_t original_size = 0;
};
#pragma pack(pop)

static_assert(sizeof(ContainerHeader) == 30,
              "ContainerHeader must stay packed");

/**
 * @brief Index entry; only compressed_length is persisted, the index is the
 * entry's position.
 */
struct ChunkDescriptor {
  uint64_t index = 0;
  uint64_t compressed_length = 0;
};

/**
 * @brief Fully materialized container.
 *
 * Invariants: index.size() == header.chunk_count and the compressed lengths
 * sum to blocks.size().
 */
struct ContainerData {
  ContainerHeader header;
  std::vector<ChunkDescriptor> index;
  std::vector<unsigned char> blocks;
};

/** @brief Serialized size of a container with @p chunk_count chunks. */
size_t metadata_size(uint64_t chunk_count);

/** @brief Serialized size of @p container. */
size_t serialized_size(const ContainerData &container);

/**
 * @brief Appends the serialized container to @p out.
 */
void serialize(const ContainerData &container, std::vector<unsigned char> &out);

/**
 * @brief Parses a serialized container.
 *
 * Fails when the header is short or carries a bad magic/version, when fewer
 * than chunk_count index entries are present, when the compressed lengths do
 * not exactly cover the bytes after the index, or when the header is
 * internally inconsistent (chunks without a nominal size, zero chunks with a
 * non-zero original size).
 *
 * @param data Serialized bytes (may be null when size is 0).
 * @param size Length of @p data.
 * @param[out] out Parsed container on success.
 * @param[out] error Reason on failure.
 * @return true if the container is well formed.
 */
bool parse(const unsigned char *data, size_t size, ContainerData &out,
           std::string &error);

/**
 * @brief Slices the blocks region into one Chunk per descriptor, in order,
 * using the cumulative compressed lengths.
 */
std::vector<Chunk> extract_chunks(const ContainerData &container);

} // namespace Container

#endif // CHUNKZP_CONTAINER_HPP
