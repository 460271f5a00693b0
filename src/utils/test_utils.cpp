/**
 * \file test_utils.cpp
 * \brief Utility functions for generating test data, comparing files, and
 * cleaning directories used in tests.
 */

#include "test_utils.hpp"

#include <algorithm>
#include <cstring> // For memcmp
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>

namespace TestUtils {

std::vector<unsigned char> random_bytes(size_t size, uint32_t seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> distrib(0, 255);
  std::vector<unsigned char> data(size);
  for (auto &b : data) {
    b = static_cast<unsigned char>(distrib(gen));
  }
  return data;
}

std::vector<unsigned char> compressible_bytes(size_t size, uint32_t seed) {
  static const char *const WORDS[] = {"chunk ", "block ", "index ",
                                      "stream ", "worker ", "header\n"};
  constexpr size_t WORD_COUNT = sizeof(WORDS) / sizeof(WORDS[0]);
  std::mt19937 gen(seed);
  std::uniform_int_distribution<size_t> pick(0, WORD_COUNT - 1);
  std::vector<unsigned char> data;
  data.reserve(size);
  while (data.size() < size) {
    const char *word = WORDS[pick(gen)];
    size_t len = std::min(strlen(word), size - data.size());
    data.insert(data.end(), word, word + len);
  }
  return data;
}

bool write_file(const std::string &path, const std::vector<unsigned char> &data,
                int verbosity) {
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (verbosity >= 1)
        std::cerr << "Error: Cannot create directory " << parent.string()
                  << " - " << ec.message() << std::endl;
      return false;
    }
  }
  std::ofstream out_file(path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    if (verbosity >= 1)
      std::cerr << "Error: Cannot create file for testing: " << path
                << std::endl;
    return false;
  }
  out_file.write(reinterpret_cast<const char *>(data.data()),
                 static_cast<std::streamsize>(data.size()));
  out_file.close();
  if (!out_file) {
    if (verbosity >= 1)
      std::cerr << "Error writing test data to file: " << path << std::endl;
    std::filesystem::remove(path, ec);
    return false;
  }
  return true;
}

bool read_file(const std::string &path, std::vector<unsigned char> &out,
               int verbosity) {
  out.clear();
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    if (verbosity >= 1)
      std::cerr << "Error: Cannot open file: " << path << std::endl;
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in_file),
             std::istreambuf_iterator<char>());
  if (in_file.bad()) {
    if (verbosity >= 1)
      std::cerr << "Error reading file: " << path << std::endl;
    return false;
  }
  return true;
}

/**
 * \brief Creates a file at the specified path filled with random data.
 * \param path Path to the file to create.
 * \param size Number of bytes to write; if zero, creates an empty file.
 * \param seed Seed of the generator.
 * \param verbosity Verbosity level (0: silent; >=1: warnings).
 * \return True if file creation succeeds, false otherwise.
 */
bool create_random_file(const std::string &path, size_t size, uint32_t seed,
                        int verbosity) {
  return write_file(path, random_bytes(size, seed), verbosity);
}

/**
 * \brief Compares two files byte-by-byte to determine if they are identical.
 * \param path1 Path to the first file to compare.
 * \param path2 Path to the second file to compare.
 * \param verbosity Verbosity level (0: silent; >=1: error messages).
 * \return True if files are identical, false otherwise.
 */
bool compare_files(const std::string &path1, const std::string &path2,
                   int verbosity) {
  std::ifstream file1(path1, std::ios::binary | std::ios::ate);
  std::ifstream file2(path2, std::ios::binary | std::ios::ate);

  if (!file1) {
    if (verbosity >= 1)
      std::cerr << "Error: Cannot open file for comparison: " << path1
                << std::endl;
    return false;
  }
  if (!file2) {
    if (verbosity >= 1)
      std::cerr << "Error: Cannot open file for comparison: " << path2
                << std::endl;
    return false;
  }

  std::ifstream::pos_type size1 = file1.tellg();
  std::ifstream::pos_type size2 = file2.tellg();
  if (size1 != size2) {
    if (verbosity >= 1)
      std::cerr << "Files differ in size: " << path1 << " (" << size1 << ") vs "
                << path2 << " (" << size2 << ")" << std::endl;
    return false;
  }

  file1.seekg(0, std::ios::beg);
  file2.seekg(0, std::ios::beg);

  const size_t buffer_size = 4096;
  std::vector<char> buffer1(buffer_size);
  std::vector<char> buffer2(buffer_size);

  while (file1 && file2) {
    file1.read(buffer1.data(), buffer_size);
    file2.read(buffer2.data(), buffer_size);
    std::streamsize bytes_read1 = file1.gcount();
    std::streamsize bytes_read2 = file2.gcount();
    if (bytes_read1 != bytes_read2) {
      if (verbosity >= 1)
        std::cerr << "Internal comparison error: Read count mismatch."
                  << std::endl;
      return false;
    }
    if (bytes_read1 == 0) {
      break;
    }
    if (memcmp(buffer1.data(), buffer2.data(), bytes_read1) != 0) {
      if (verbosity >= 1)
        std::cerr << "Files differ in content: " << path1 << " vs " << path2
                  << std::endl;
      return false;
    }
  }

  if (!file1.eof() && file1.fail()) {
    if (verbosity >= 1)
      std::cerr << "Error reading file during comparison: " << path1
                << std::endl;
    return false;
  }
  if (!file2.eof() && file2.fail()) {
    if (verbosity >= 1)
      std::cerr << "Error reading file during comparison: " << path2
                << std::endl;
    return false;
  }
  return true;
}

/**
 * \brief Removes files with a given suffix in a directory.
 * \return True if cleaning succeeds or directory does not exist, false on
 * error.
 */
bool clean_files_with_suffix(const std::string &directory,
                             const std::string &suffix, bool recursive,
                             int verbosity) {
  bool success = true;
  try {
    std::filesystem::path dir_path(directory);
    if (!std::filesystem::exists(dir_path) ||
        !std::filesystem::is_directory(dir_path)) {
      if (verbosity >= 1)
        std::cerr << "Warning: Directory not found for cleaning: " << directory
                  << std::endl;
      return true;
    }

    auto iterator_options =
        std::filesystem::directory_options::skip_permission_denied;
    auto process_entry = [&](const std::filesystem::directory_entry &entry) {
      if (!entry.is_regular_file() || entry.path().extension() != suffix) {
        return;
      }
      std::error_code ec;
      std::filesystem::remove(entry.path(), ec);
      if (ec) {
        if (verbosity >= 1)
          std::cerr << "Warning: Failed to remove file: "
                    << entry.path().string() << " - " << ec.message()
                    << std::endl;
        success = false;
      } else if (verbosity >= 2) {
        std::cout << "Removed: " << entry.path().string() << std::endl;
      }
    };

    // Collect first: removing while iterating invalidates the iterator.
    std::vector<std::filesystem::directory_entry> entries;
    if (recursive) {
      for (const auto &entry : std::filesystem::recursive_directory_iterator(
               dir_path, iterator_options)) {
        entries.push_back(entry);
      }
    } else {
      for (const auto &entry :
           std::filesystem::directory_iterator(dir_path, iterator_options)) {
        entries.push_back(entry);
      }
    }
    for (const auto &entry : entries) {
      process_entry(entry);
    }
  } catch (const std::filesystem::filesystem_error &e) {
    if (verbosity >= 1)
      std::cerr << "Error during directory cleaning: " << e.what() << std::endl;
    return false;
  }
  return success;
}

} // namespace TestUtils
