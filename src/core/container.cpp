/**
 * @file container.cpp
 * @brief Container serialization and validation.
 */
#include "container.hpp"

#include <cstring>
#include <utility>

namespace Container {

size_t metadata_size(uint64_t chunk_count) {
  return sizeof(ContainerHeader) +
         static_cast<size_t>(chunk_count) * sizeof(uint64_t);
}

size_t serialized_size(const ContainerData &container) {
  return metadata_size(container.header.chunk_count) + container.blocks.size();
}

void serialize(const ContainerData &container,
               std::vector<unsigned char> &out) {
  const ContainerHeader &header = container.header;
  size_t start = out.size();
  out.resize(start + serialized_size(container));
  unsigned char *ptr = out.data() + start;

  memcpy(ptr, &header, sizeof(header));
  ptr += sizeof(header);
  for (const auto &desc : container.index) {
    uint64_t len = desc.compressed_length;
    memcpy(ptr, &len, sizeof(len));
    ptr += sizeof(len);
  }
  if (!container.blocks.empty())
    memcpy(ptr, container.blocks.data(), container.blocks.size());
}

bool parse(const unsigned char *data, size_t size, ContainerData &out,
           std::string &error) {
  out = ContainerData();

  ContainerHeader header;
  if (size < sizeof(header)) {
    error = "buffer too short for container header (" + std::to_string(size) +
            " bytes)";
    return false;
  }
  memcpy(&header, data, sizeof(header));
  if (header.magic_number != MAGIC_NUMBER_CONTAINER) {
    error = "bad magic number";
    return false;
  }
  if (header.version == 0 || header.version > FORMAT_VERSION) {
    error = "unsupported format version " + std::to_string(header.version);
    return false;
  }
  if (header.chunk_count == 0 && header.original_size > 0) {
    error = "zero chunks declared for non-empty original data";
    return false;
  }
  if (header.chunk_count > 0 && header.nominal_chunk_size == 0) {
    error = "chunks declared with a zero nominal chunk size";
    return false;
  }

  size_t remaining = size - sizeof(header);
  if (header.chunk_count > remaining / sizeof(uint64_t)) {
    error = "index truncated: " + std::to_string(header.chunk_count) +
            " entries declared, room for " +
            std::to_string(remaining / sizeof(uint64_t));
    return false;
  }

  const unsigned char *ptr = data + sizeof(header);
  remaining -= static_cast<size_t>(header.chunk_count) * sizeof(uint64_t);

  std::vector<ChunkDescriptor> index(static_cast<size_t>(header.chunk_count));
  uint64_t total = 0;
  for (uint64_t i = 0; i < header.chunk_count; ++i) {
    uint64_t len = 0;
    memcpy(&len, ptr, sizeof(len));
    ptr += sizeof(len);
    if (len > remaining - total) {
      error = "compressed lengths exceed the blocks region at chunk " +
              std::to_string(i);
      return false;
    }
    total += len;
    index[i].index = i;
    index[i].compressed_length = len;
  }
  if (total != remaining) {
    error = std::to_string(remaining - total) +
            " trailing bytes after the last block";
    return false;
  }

  out.header = header;
  out.index = std::move(index);
  out.blocks.assign(ptr, ptr + remaining);
  return true;
}

std::vector<Chunk> extract_chunks(const ContainerData &container) {
  std::vector<Chunk> chunks;
  chunks.reserve(container.index.size());
  size_t offset = 0;
  for (const auto &desc : container.index) {
    size_t len = static_cast<size_t>(desc.compressed_length);
    Chunk chunk;
    chunk.index = desc.index;
    chunk.bytes.assign(container.blocks.begin() + offset,
                       container.blocks.begin() + offset + len);
    offset += len;
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

} // namespace Container
