/**
 * @file pipeline.cpp
 * @brief Orchestration of the chunk-parallel compression pipeline.
 */
#include "pipeline.hpp"
#include "assembler.hpp"
#include "chunker.hpp"
#include "codec.hpp"
#include "container.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <omp.h>
#include <string>
#include <utility>

namespace Pipeline {

namespace {

/** @brief Upper bound of the deflate expansion ratio. */
constexpr uint64_t DEFLATE_MAX_RATIO = 1032;

void trace(const PipelineOptions &opts, const char *direction,
           PipelineStage stage) {
  if (opts.verbosity >= 2) {
    std::cout << "[pipeline] " << direction << ": " << stage_name(stage)
              << std::endl;
  }
}

int pool_threads(const PipelineOptions &opts) {
  return static_cast<int>(
      std::min<long>(opts.worker_count, omp_get_max_threads()));
}

WorkerPool::Operation compress_operation(int level) {
  WorkerPool::Operation op;
  op.name = "compress";
  op.failure_kind = ErrorKind::CompressionFailure;
  op.apply = [level](const Chunk &chunk) {
    return Codec::compress(chunk, level);
  };
  return op;
}

WorkerPool::Operation decompress_operation(uint64_t nominal_chunk_size) {
  WorkerPool::Operation op;
  op.name = "decompress";
  op.failure_kind = ErrorKind::CorruptChunk;
  op.apply = [nominal_chunk_size](const Chunk &chunk) {
    // The header is untrusted; the hint only sizes the first allocation.
    uint64_t hint = std::min<uint64_t>(
        nominal_chunk_size, chunk.bytes.size() * DEFLATE_MAX_RATIO);
    return Codec::decompress(chunk, static_cast<size_t>(hint));
  };
  return op;
}

PipelineStatus read_all(std::istream &input, std::vector<unsigned char> &buf) {
  buf.assign(std::istreambuf_iterator<char>(input),
             std::istreambuf_iterator<char>());
  if (input.bad()) {
    buf.clear();
    return PipelineStatus::failure(ErrorKind::IoError, PipelineStage::Idle,
                                   "failed reading input stream");
  }
  return PipelineStatus();
}

PipelineStatus write_all(std::ostream &output,
                         const std::vector<unsigned char> &buf,
                         PipelineStatus done) {
  output.write(reinterpret_cast<const char *>(buf.data()),
               static_cast<std::streamsize>(buf.size()));
  output.flush();
  if (!output) {
    return PipelineStatus::failure(ErrorKind::IoError, PipelineStage::Done,
                                   "failed writing output stream");
  }
  return done;
}

} // namespace

PipelineStatus validate(const PipelineOptions &opts) {
  if (opts.chunk_size <= 0) {
    return PipelineStatus::failure(ErrorKind::InvalidConfiguration,
                                   PipelineStage::Idle,
                                   "chunk size must be positive, got " +
                                       std::to_string(opts.chunk_size));
  }
  if (opts.worker_count <= 0) {
    return PipelineStatus::failure(ErrorKind::InvalidConfiguration,
                                   PipelineStage::Idle,
                                   "worker count must be positive, got " +
                                       std::to_string(opts.worker_count));
  }
  if (!Codec::is_valid_level(opts.compression_level)) {
    return PipelineStatus::failure(
        ErrorKind::InvalidConfiguration, PipelineStage::Idle,
        "compression level must be -1 or 0..9, got " +
            std::to_string(opts.compression_level));
  }
  return PipelineStatus();
}

PipelineStatus compress_buffer(const unsigned char *data, size_t size,
                               const PipelineOptions &opts,
                               std::vector<unsigned char> &out) {
  out.clear();
  PipelineStatus status = validate(opts);
  if (!status.ok()) {
    return status;
  }

  trace(opts, "compress", PipelineStage::Chunking);
  std::vector<Chunk> chunks;
  if (!Chunker::split(data, size, opts.chunk_size, chunks)) {
    return PipelineStatus::failure(ErrorKind::InvalidConfiguration,
                                   PipelineStage::Chunking,
                                   "chunk size must be positive");
  }

  trace(opts, "compress", PipelineStage::Dispatching);
  std::vector<CodecResult> results;
  status = WorkerPool::run(std::move(chunks), opts.worker_count,
                           compress_operation(opts.compression_level),
                           results, opts.progress);
  if (!status.ok()) {
    return status;
  }

  trace(opts, "compress", PipelineStage::ContainerWrite);
  Container::ContainerData container;
  status = Assembler::assemble_container(
      results, static_cast<uint64_t>(opts.chunk_size),
      static_cast<uint64_t>(size), pool_threads(opts), container);
  if (!status.ok()) {
    return status;
  }
  results.clear();
  Container::serialize(container, out);

  trace(opts, "compress", PipelineStage::Done);
  status.stage = PipelineStage::Done;
  return status;
}

PipelineStatus decompress_buffer(const unsigned char *data, size_t size,
                                 const PipelineOptions &opts,
                                 std::vector<unsigned char> &out) {
  out.clear();
  PipelineStatus status = validate(opts);
  if (!status.ok()) {
    return status;
  }

  trace(opts, "decompress", PipelineStage::ContainerRead);
  Container::ContainerData container;
  std::string error;
  if (!Container::parse(data, size, container, error)) {
    return PipelineStatus::failure(ErrorKind::MalformedContainer,
                                   PipelineStage::ContainerRead, error);
  }
  if (opts.verbosity >= 2 &&
      container.header.nominal_chunk_size !=
          static_cast<uint64_t>(opts.chunk_size)) {
    std::cout << "[pipeline] container chunk size "
              << container.header.nominal_chunk_size
              << " differs from requested " << opts.chunk_size
              << "; using the container index" << std::endl;
  }
  std::vector<Chunk> chunks = Container::extract_chunks(container);
  const uint64_t original_size = container.header.original_size;
  const uint64_t nominal = container.header.nominal_chunk_size;
  container = Container::ContainerData();

  trace(opts, "decompress", PipelineStage::Dispatching);
  std::vector<CodecResult> results;
  status = WorkerPool::run(std::move(chunks), opts.worker_count,
                           decompress_operation(nominal), results,
                           opts.progress);
  if (!status.ok()) {
    return status;
  }

  trace(opts, "decompress", PipelineStage::Concatenating);
  status = Assembler::assemble_output(results, pool_threads(opts), out);
  if (!status.ok()) {
    return status;
  }
  if (out.size() != original_size) {
    std::string msg = "restored " + std::to_string(out.size()) +
                      " bytes, header declares " +
                      std::to_string(original_size);
    out.clear();
    return PipelineStatus::failure(ErrorKind::MalformedContainer,
                                   PipelineStage::Concatenating, msg);
  }

  trace(opts, "decompress", PipelineStage::Done);
  status.stage = PipelineStage::Done;
  return status;
}

PipelineStatus compress(std::istream &input, std::ostream &output,
                        const PipelineOptions &opts) {
  PipelineStatus status = validate(opts);
  if (!status.ok()) {
    return status;
  }
  std::vector<unsigned char> in_buf;
  status = read_all(input, in_buf);
  if (!status.ok()) {
    return status;
  }
  std::vector<unsigned char> out_buf;
  status = compress_buffer(in_buf.data(), in_buf.size(), opts, out_buf);
  if (!status.ok()) {
    return status;
  }
  return write_all(output, out_buf, status);
}

PipelineStatus decompress(std::istream &input, std::ostream &output,
                          const PipelineOptions &opts) {
  PipelineStatus status = validate(opts);
  if (!status.ok()) {
    return status;
  }
  std::vector<unsigned char> in_buf;
  status = read_all(input, in_buf);
  if (!status.ok()) {
    return status;
  }
  std::vector<unsigned char> out_buf;
  status = decompress_buffer(in_buf.data(), in_buf.size(), opts, out_buf);
  if (!status.ok()) {
    return status;
  }
  return write_all(output, out_buf, status);
}

PipelineStatus compress(std::istream &input, std::ostream &output,
                        long chunk_size, long worker_count) {
  PipelineOptions opts;
  opts.chunk_size = chunk_size;
  opts.worker_count = worker_count;
  return compress(input, output, opts);
}

PipelineStatus decompress(std::istream &input, std::ostream &output,
                          long chunk_size, long worker_count) {
  PipelineOptions opts;
  opts.chunk_size = chunk_size;
  opts.worker_count = worker_count;
  return decompress(input, output, opts);
}

} // namespace Pipeline
