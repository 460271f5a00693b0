/**
 * @file compressor.cpp
 * @brief Implements file-level compression and decompression on top of the
 * chunk pipeline, using memory-mapped input.
 */

#include "compressor.hpp"
#include "config.hpp"
#include "pipeline.hpp"

#include <cerrno>
#include <cstring> // For strerror
#include <fcntl.h> // For open
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/mman.h> // For mmap/munmap
#include <sys/stat.h> // For fstat
#include <unistd.h>   // For close
#include <vector>

namespace Compressor {
using ::SUFFIX;

//-----------------------------------------------------------------------------
// Internal Helper Functions (Anonymous Namespace)
//-----------------------------------------------------------------------------
namespace {

/**
 * @class MappedFile
 * @brief RAII wrapper for a read-only memory-mapped file.
 */
class MappedFile {
  unsigned char *ptr_ = nullptr;
  size_t size_ = 0;

public:
  MappedFile() = default;
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept
      : ptr_(other.ptr_), size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
  }
  MappedFile &operator=(MappedFile &&other) noexcept {
    if (this != &other) {
      unmap();
      ptr_ = other.ptr_;
      size_ = other.size_;
      other.ptr_ = nullptr;
      other.size_ = 0;
    }
    return *this;
  }

  ~MappedFile() noexcept { unmap(); }

  /**
   * @brief Maps an existing file read-only. Empty files are not mapped and
   * leave get() null with size() 0.
   * @param fname Path to the file.
   * @param[out] error strerror text on failure.
   * @return true if the file was opened (and mapped when non-empty).
   */
  bool map(const char *fname, std::string &error) {
    unmap();

    int fd = open(fname, O_RDONLY);
    if (fd < 0) {
      error = std::string("cannot open ") + fname + " - " + strerror(errno);
      return false;
    }

    struct stat s;
    if (fstat(fd, &s) != 0) {
      error = std::string("cannot fstat ") + fname + " - " + strerror(errno);
      close(fd);
      return false;
    }
    size_t size = static_cast<size_t>(s.st_size);
    if (size == 0) {
      close(fd);
      return true;
    }

    void *addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    int map_errno = errno;
    // The mapping stays valid after the descriptor is closed.
    close(fd);
    if (addr == MAP_FAILED) {
      error = std::string("cannot map ") + fname + " - " + strerror(map_errno);
      return false;
    }
    ptr_ = static_cast<unsigned char *>(addr);
    size_ = size;
    return true;
  }

  /**
   * @brief Unmaps the memory region.
   */
  void unmap() noexcept {
    if (ptr_ && size_ > 0) {
      munmap(ptr_, size_);
    }
    ptr_ = nullptr;
    size_ = 0;
  }

  const unsigned char *get() const { return ptr_; }
  size_t size() const { return size_; }
};

/**
 * @brief Writes @p data to @p output_path, creating parent directories.
 *
 * The bytes go to a sibling TEMP_SUFFIX file that is renamed onto
 * @p output_path once complete; the temporary file is removed on failure.
 */
PipelineStatus write_output(const std::string &output_path,
                            const std::vector<unsigned char> &data,
                            PipelineStatus done) {
  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(output_path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return PipelineStatus::failure(ErrorKind::IoError, PipelineStage::Done,
                                     "cannot create directory " +
                                         parent.string() + " - " +
                                         ec.message());
    }
  }

  const std::string temp_path = output_path + TEMP_SUFFIX;
  std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    return PipelineStatus::failure(ErrorKind::IoError, PipelineStage::Done,
                                   "cannot open output file " + temp_path);
  }
  out_file.write(reinterpret_cast<const char *>(data.data()),
                 static_cast<std::streamsize>(data.size()));
  out_file.close();
  if (!out_file.good()) {
    std::filesystem::remove(temp_path, ec); // Remove partial file
    return PipelineStatus::failure(ErrorKind::IoError, PipelineStage::Done,
                                   "error writing output file " + temp_path);
  }

  std::filesystem::rename(temp_path, output_path, ec);
  if (ec) {
    std::string reason = ec.message();
    std::filesystem::remove(temp_path, ec);
    return PipelineStatus::failure(ErrorKind::IoError, PipelineStage::Done,
                                   "cannot move output into place at " +
                                       output_path + " - " + reason);
  }
  return done;
}

/**
 * @brief Builds pipeline options from the configuration, including a chunk
 * progress printer at verbosity 2.
 */
Pipeline::PipelineOptions make_options(const ConfigData &cfg,
                                       const std::string &label) {
  Pipeline::PipelineOptions opts;
  opts.chunk_size = static_cast<long>(cfg.chunk_size);
  opts.worker_count = cfg.num_threads;
  opts.compression_level = cfg.compression_level;
  opts.verbosity = cfg.verbosity;
  if (cfg.verbosity >= 2) {
    opts.progress = [label](size_t completed, size_t total) {
      size_t step = total >= 20 ? total / 20 : 1;
      if (completed % step == 0 || completed == total) {
        std::cout << "  " << label << ": " << completed << "/" << total
                  << " chunks" << std::endl;
      }
    };
  }
  return opts;
}

using BufferStage = PipelineStatus (*)(const unsigned char *, size_t,
                                       const Pipeline::PipelineOptions &,
                                       std::vector<unsigned char> &);

PipelineStatus run_file(const std::string &input_path,
                        const std::string &output_path, const ConfigData &cfg,
                        const char *label, BufferStage stage) {
  Pipeline::PipelineOptions opts = make_options(cfg, label);
  // Configuration errors surface before the input is touched.
  PipelineStatus status = Pipeline::validate(opts);
  if (!status.ok()) {
    return status;
  }

  std::vector<unsigned char> result;
  {
    MappedFile mapped_in;
    std::string error;
    if (!mapped_in.map(input_path.c_str(), error)) {
      return PipelineStatus::failure(ErrorKind::IoError, PipelineStage::Idle,
                                     error);
    }
    status = stage(mapped_in.get(), mapped_in.size(), opts, result);
    // mapped_in unmaps here, before the output is written.
  }
  if (!status.ok()) {
    return status;
  }
  return write_output(output_path, result, status);
}

} // namespace

//-----------------------------------------------------------------------------
// Public Interface Implementation
//-----------------------------------------------------------------------------

PipelineStatus compress_file(const std::string &input_path,
                             const std::string &output_path,
                             const ConfigData &cfg) {
  return run_file(input_path, output_path, cfg, "Compressing",
                  &Pipeline::compress_buffer);
}

PipelineStatus decompress_file(const std::string &input_path,
                               const std::string &output_path,
                               const ConfigData &cfg) {
  return run_file(input_path, output_path, cfg, "Decompressing",
                  &Pipeline::decompress_buffer);
}

bool process_item(const FileHandler::WorkItem &item, const ConfigData &cfg) {
  const std::string output_path =
      FileHandler::output_path_for(item, cfg).string();

  if (!cfg.compress_mode && cfg.verbosity >= 1 &&
      (item.path.length() <= SUFFIX.length() ||
       item.path.compare(item.path.length() - SUFFIX.length(), SUFFIX.length(),
                         SUFFIX) != 0)) {
    std::cerr << "Warning: Input file " << item.path
              << " does not have expected suffix " << SUFFIX << ". Appending "
              << FALLBACK_SUFFIX << std::endl;
  }

  PipelineStatus status =
      cfg.compress_mode ? compress_file(item.path, output_path, cfg)
                        : decompress_file(item.path, output_path, cfg);
  if (!status.ok()) {
    if (cfg.verbosity >= 1)
      std::cerr << "Error: " << (cfg.compress_mode ? "compressing " : "decompressing ")
                << item.path << ": " << describe(status) << std::endl;
    return false;
  }
  if (cfg.verbosity >= 2) {
    std::cout << "File " << item.path << " "
              << (cfg.compress_mode ? "compressed" : "decompressed")
              << " and saved to " << output_path << std::endl;
  }
  return true;
}

} // namespace Compressor
