#ifndef CHUNKZP_TEST_UTILS_HPP
#define CHUNKZP_TEST_UTILS_HPP

#include <cstddef> // For size_t
#include <cstdint>
#include <string>
#include <vector>

namespace TestUtils {

/**
 * @brief Returns @p size pseudo-random bytes. The same seed gives the same
 * bytes.
 */
std::vector<unsigned char> random_bytes(size_t size, uint32_t seed = 42);

/**
 * @brief Returns @p size bytes of repetitive text-like data that deflate
 * shrinks well.
 */
std::vector<unsigned char> compressible_bytes(size_t size, uint32_t seed = 7);

/**
 * @brief Writes @p data to @p path, creating parent directories.
 * @return true on success, false on failure.
 */
bool write_file(const std::string &path, const std::vector<unsigned char> &data,
                int verbosity = 1);

/**
 * @brief Reads the whole file at @p path into @p out.
 * @return true on success, false on failure.
 */
bool read_file(const std::string &path, std::vector<unsigned char> &out,
               int verbosity = 1);

/**
 * @brief Creates a file with pseudo-random binary content.
 *
 * @param path The full path where the file should be created.
 * @param size The desired size of the file in bytes.
 * @param seed Seed of the generator.
 * @param verbosity Verbosity level for error messages.
 * @return true on success, false on failure.
 */
bool create_random_file(const std::string &path, size_t size,
                        uint32_t seed = 42, int verbosity = 1);

/**
 * @brief Compares two files byte-by-byte.
 *
 * @param path1 Path to the first file.
 * @param path2 Path to the second file.
 * @param verbosity Verbosity level for error messages.
 * @return true if the files are identical, false otherwise (or if an error
 * occurs).
 */
bool compare_files(const std::string &path1, const std::string &path2,
                   int verbosity = 1);

/**
 * @brief Cleans up (removes) files with a specific suffix in a directory.
 *
 * @param directory Path to the directory to clean.
 * @param suffix The suffix of files to remove (e.g., ".compressed").
 * @param recursive If true, also cleans subdirectories.
 * @param verbosity Verbosity level for messages.
 * @return true if successful (or no files to remove), false on error.
 */
bool clean_files_with_suffix(const std::string &directory,
                             const std::string &suffix, bool recursive = false,
                             int verbosity = 1);

} // namespace TestUtils

#endif // CHUNKZP_TEST_UTILS_HPP
