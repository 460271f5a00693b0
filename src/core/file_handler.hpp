/**
 * @file file_handler.hpp
 * @brief Defines functions for discovering and filtering files based on
 * configuration, and for deriving output paths. Handles path checking,
 * recursion and suffix filtering.
 */
#ifndef CHUNKZP_FILE_HANDLER_HPP
#define CHUNKZP_FILE_HANDLER_HPP

#include "config.hpp" // Uses ConfigData
#include <filesystem> // Requires C++17
#include <optional>
#include <string>
#include <vector>

namespace FileHandler {

using ::SUFFIX;

/**
 * @brief Represents a file discovered for processing.
 */
struct WorkItem {
  std::string path;          /**< Full path to the file. */
  std::string relative_path; /**< Path below the scanned directory, or the
                                file name for files given directly. */
  size_t size = 0;           /**< Size in bytes. */
};

/**
 * @brief Checks if a path corresponds to a directory.
 * @param[in] p The path to check.
 * @param[in] verbosity Verbosity level for logging errors.
 * @return true if the path is a directory, false otherwise.
 */
bool is_directory(const std::filesystem::path &p, int verbosity);

/**
 * @brief Gets the size of a regular file.
 * @param[in] p The path to check.
 * @param[in] verbosity Verbosity level for logging errors.
 * @return std::optional<size_t> containing the file size if it's a regular file
 * and size could be obtained, std::nullopt otherwise.
 */
std::optional<size_t> get_regular_file_size(const std::filesystem::path &p,
                                            int verbosity);

/**
 * @brief Determines if a given filename should be processed based on mode and
 * suffix.
 * @param[in] filename The name of the file (not the full path).
 * @param[in] is_compress_mode True if in compression mode, false for
 * decompression.
 * @param[in] suffix The suffix to check for (e.g., ".compressed").
 * @return true if the file should be processed, false if it should be skipped.
 */
bool should_process(const std::string &filename, bool is_compress_mode,
                    const std::string &suffix);

/**
 * @brief Discovers all files to be processed based on initial paths and
 * configuration. Handles recursion and filtering based on the configuration.
 * Files inside cfg.output_dir are never picked up.
 * @param[in] initial_paths Starting file or directory paths.
 * @param[in] cfg The application configuration.
 * @return std::vector<WorkItem> A list of files to be processed.
 */
std::vector<WorkItem>
discover_work_items(const std::vector<std::string> &initial_paths,
                    const ConfigData &cfg);

/**
 * @brief Computes where the result for @p item is written.
 *
 * Compression appends SUFFIX; decompression strips it (or appends
 * FALLBACK_SUFFIX when absent). With cfg.output_dir set, the item's relative
 * path is mirrored below that directory; otherwise the output sits next to
 * the input.
 */
std::filesystem::path output_path_for(const WorkItem &item,
                                      const ConfigData &cfg);

} // namespace FileHandler

#endif // CHUNKZP_FILE_HANDLER_HPP
