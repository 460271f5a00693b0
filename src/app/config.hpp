#ifndef CHUNKZP_CONFIG_HPP
#define CHUNKZP_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <omp.h> // For omp_get_max_threads
#include <string>

// --- Constants ---
/**
 * @brief Suffix for compressed files (e.g., "data.bin.compressed").
 */
inline const std::string SUFFIX = ".compressed";

/**
 * @brief Suffix appended when decompressing a file that lacks SUFFIX.
 */
inline const std::string FALLBACK_SUFFIX = ".out";

/**
 * @brief Suffix of the temporary file an output is written to before it is
 * renamed into place.
 */
inline const std::string TEMP_SUFFIX = ".tmp";

/**
 * @brief Nominal chunk size. Default is 1 MiB.
 */
constexpr size_t BLOCK_SIZE_DEFAULT = 1 * 1024 * 1024; // 1 MiB

/**
 * @brief Magic number for the container format (ASCII for "CKZP").
 */
constexpr uint32_t MAGIC_NUMBER_CONTAINER = 0x434B5A50; // "CKZP"

/**
 * @brief Version number for the container format.
 */
constexpr uint16_t FORMAT_VERSION = 1;

// --- Configuration Structure ---
struct ConfigData {
  /** @brief Operation mode: true for compression, false for decompression. */
  bool compress_mode = true;

  /** @brief Verbosity level: 0=silent, 1=errors only, 2=verbose info. */
  int verbosity = 1;

  /** @brief Whether to recurse into subdirectories. */
  bool recurse = true;

  /** @brief Number of pool workers. Defaults to max available. */
  int num_threads = omp_get_max_threads();

  /** @brief Nominal chunk size used when compressing. */
  size_t chunk_size = BLOCK_SIZE_DEFAULT;

  /** @brief zlib compression level, -1 for the library default. */
  int compression_level = -1;

  /** @brief Output folder; empty writes next to each input file. */
  std::string output_dir;
};

#endif // CHUNKZP_CONFIG_HPP
