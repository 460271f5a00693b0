/**
 * @file compressor.hpp
 * @brief File-level compression and decompression: maps an input file, runs
 * it through the chunk pipeline and writes the result only on success.
 */
#ifndef CHUNKZP_COMPRESSOR_HPP
#define CHUNKZP_COMPRESSOR_HPP

#include "config.hpp"
#include "file_handler.hpp"
#include "status.hpp"
#include <string>

namespace Compressor {
using ::SUFFIX;

/**
 * @brief Compresses @p input_path into a container at @p output_path.
 *
 * The input is memory-mapped read-only. The output's parent directories are
 * created as needed. On any failure no output file is left behind.
 *
 * @param input_path Path to the input file.
 * @param output_path Path of the container to write (overwritten).
 * @param cfg Configuration data (chunk size, threads, level, verbosity).
 * @return The pipeline status, or IoError for file access failures.
 */
PipelineStatus compress_file(const std::string &input_path,
                             const std::string &output_path,
                             const ConfigData &cfg);

/**
 * @brief Restores the file stored in the container @p input_path.
 *
 * Chunk boundaries come from the container; cfg.chunk_size is informational.
 * On any failure, including a single corrupt chunk, no output file is left
 * behind.
 *
 * @param input_path Path to the container.
 * @param output_path Path of the restored file (overwritten).
 * @param cfg Configuration data.
 * @return The pipeline status, or IoError for file access failures.
 */
PipelineStatus decompress_file(const std::string &input_path,
                               const std::string &output_path,
                               const ConfigData &cfg);

/**
 * @brief Processes one discovered file in the configured direction, writing
 * to FileHandler::output_path_for(item, cfg). Errors are reported on
 * std::cerr when cfg.verbosity >= 1.
 *
 * @return true on success, false on failure.
 */
bool process_item(const FileHandler::WorkItem &item, const ConfigData &cfg);

} // namespace Compressor

#endif // CHUNKZP_COMPRESSOR_HPP
