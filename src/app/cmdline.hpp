#ifndef CHUNKZP_CMDLINE_HPP
#define CHUNKZP_CMDLINE_HPP

/**
 * @file cmdline.hpp
 * @brief Provides command-line argument parsing functionality for the chunkzp
 * application.
 */

#include "config.hpp"
#include <cerrno>
#include <climits>  // For INT_MAX
#include <cstdio>   // For std::printf (used in usage)
#include <cstdlib>  // For std::strtol
#include <iostream> // For std::cerr
#include <omp.h>    // For omp_get_max_threads
#include <string>
#include <unistd.h> // For getopt, optind, opterr, optopt
#include <vector>

/**
 * @brief Namespace containing command-line parsing utilities.
 */
namespace CmdLine {

/**
 * @brief Prints usage instructions to standard output.
 *
 * @param argv0 The program name (typically argv[0]).
 */
static inline void usage(const char *argv0) {
  std::printf("--------------------\n");
  std::printf("Usage: %s [options] file-or-directory [file-or-directory ...]\n",
              argv0);
  std::printf("\nOptions:\n");
  std::printf(" -C          Compress mode (Default).\n");
  std::printf(" -D          Decompress mode.\n");
  std::printf(" -o <dir>    Output directory (Default: next to each input).\n");
  std::printf(" -b <bytes>  Chunk size used when compressing (Default: %zu)\n",
              BLOCK_SIZE_DEFAULT);
  std::printf(" -t <num>    Number of worker threads (Default: %d)\n",
              omp_get_max_threads());
  std::printf(" -l <level>  Compression level 0-9 (Default: library "
              "default)\n");
  std::printf(" -r [0|1]    Recursively process subdirectories (0=No, 1=Yes. "
              "Default: %d)\n",
              1);
  std::printf(" -q <level>  Verbosity level (0=silent, 1=errors, 2=verbose. "
              "Default: %d)\n",
              1);
  std::printf(" -h          Show this help message.\n");
  std::printf("--------------------\n");
}

/**
 * @brief Checks if a C-string represents a valid integer.
 *
 * @param s Input C-style string to validate and convert.
 * @param[out] n Parsed integer value if successful.
 * @return true if the whole string is an integer without overflow.
 */
static bool isNumber(const char *s, long &n) {
  if (!s || *s == '\0')
    return false;
  char *endptr;
  errno = 0;
  n = std::strtol(s, &endptr, 10);
  if (errno != 0 || *endptr != '\0' || endptr == s) {
    return false;
  }
  return true;
}

/**
 * @brief Parses command-line arguments and populates configuration.
 *
 * Uses getopt to read options and validates mutual exclusions and ranges.
 *
 * @param argc Argument count from main.
 * @param argv Argument vector from main.
 * @param[out] config Configuration structure to fill with parsed values.
 * @param[out] input_paths Vector to be filled with non-option paths.
 * @return true if parsing succeeded and application should proceed;
 *         false if help was requested or an error occurred.
 */
static bool parseCommandLine(int argc, char *argv[], ConfigData &config,
                             std::vector<std::string> &input_paths) {
  int opt;
  const char *optstring = "CDo:b:t:l:r:q:h";
  bool c_present = false;
  bool d_present = false;
  opterr = 0; // We print our own messages.
  optind = 1;

  while ((opt = getopt(argc, argv, optstring)) != -1) {
    switch (opt) {
    case 'C':
      c_present = true;
      config.compress_mode = true;
      break;
    case 'D':
      d_present = true;
      config.compress_mode = false;
      break;
    case 'o':
      if (!optarg || *optarg == '\0') {
        std::cerr << "Error: -o requires a directory.\n";
        usage(argv[0]);
        return false;
      }
      config.output_dir = optarg;
      break;
    case 'b': {
      long val = 0;
      if (!isNumber(optarg, val) || val <= 0) {
        std::cerr << "Error: Invalid value for -b option. Must be a "
                     "positive integer.\n";
        usage(argv[0]);
        return false;
      }
      config.chunk_size = static_cast<size_t>(val);
    } break;
    case 't': {
      long val = 0;
      if (!isNumber(optarg, val) || val <= 0 || val > INT_MAX) {
        std::cerr << "Error: Invalid value for -t option. Must be a "
                     "positive integer.\n";
        usage(argv[0]);
        return false;
      }
      config.num_threads = static_cast<int>(val);
    } break;
    case 'l': {
      long val = 0;
      if (!isNumber(optarg, val) || val < 0 || val > 9) {
        std::cerr << "Error: Invalid value for -l option. Use 0 to 9.\n";
        usage(argv[0]);
        return false;
      }
      config.compression_level = static_cast<int>(val);
    } break;
    case 'r': {
      long val = 0;
      if (!isNumber(optarg, val) || (val != 0 && val != 1)) {
        std::cerr << "Error: Invalid value for -r option. Use 0 or 1.\n";
        usage(argv[0]);
        return false;
      }
      config.recurse = (val == 1);
    } break;
    case 'q': {
      long val = 0;
      if (!isNumber(optarg, val) || val < 0 || val > 2) {
        std::cerr << "Error: Invalid value for -q option. Use 0, 1, or 2.\n";
        usage(argv[0]);
        return false;
      }
      config.verbosity = static_cast<int>(val);
    } break;
    case 'h':
      usage(argv[0]);
      return false;
    case '?':
      if (optopt) {
        std::cerr << "Error: Unknown option '-" << static_cast<char>(optopt)
                  << "' or missing argument.\n";
      } else {
        std::cerr << "Error: Invalid option or missing argument near '"
                  << argv[optind - 1] << "'.\n";
      }
      usage(argv[0]);
      return false;
    default:
      std::cerr << "Error: Unexpected error parsing options.\n";
      usage(argv[0]);
      return false;
    }
  }

  if (c_present && d_present) {
    std::cerr << "Error: Options -C and -D are mutually exclusive.\n";
    usage(argv[0]);
    return false;
  }

  input_paths.clear();
  for (int i = optind; i < argc; ++i) {
    input_paths.push_back(argv[i]);
  }

  if (input_paths.empty()) {
    std::cerr << "Error: No input files or directories specified.\n";
    usage(argv[0]);
    return false;
  }

  if (config.num_threads <= 0) {
    config.num_threads = 1;
  }

  return true;
}

} // namespace CmdLine

#endif // CHUNKZP_CMDLINE_HPP
