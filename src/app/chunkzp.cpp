#include "cmdline.hpp"
#include "compressor.hpp"
#include "config.hpp"
#include "file_handler.hpp"

#include <filesystem>
#include <iostream>
#include <omp.h> // For omp_get_wtime
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  ConfigData config;
  std::vector<std::string> initial_paths;

  // 1. Parse Command Line
  if (!CmdLine::parseCommandLine(argc, argv, config, initial_paths)) {
    return 1;
  }

  if (config.verbosity >= 2) {
    std::cout << "Configuration:\n"
              << "  Mode:          "
              << (config.compress_mode ? "Compress" : "Decompress") << "\n"
              << "  Recurse:       " << (config.recurse ? "Yes" : "No") << "\n"
              << "  Verbosity:     " << config.verbosity << "\n"
              << "  Threads:       " << config.num_threads << "\n"
              << "  Chunk Size:    " << config.chunk_size << "\n"
              << "  Level:         " << config.compression_level << "\n"
              << "  Output Dir:    "
              << (config.output_dir.empty() ? "(next to input)"
                                            : config.output_dir)
              << std::endl;
  }

  if (!config.output_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create output directory "
                << config.output_dir << " - " << ec.message() << std::endl;
      return 1;
    }
  }

  // 2. Discover Files/Work Items
  if (config.verbosity >= 2) {
    std::cout << "Discovering work items..." << std::endl;
  }
  std::vector<FileHandler::WorkItem> work_items;
  try {
    work_items = FileHandler::discover_work_items(initial_paths, config);
  } catch (const std::exception &e) {
    std::cerr << "Error during file discovery: " << e.what() << std::endl;
    return 1;
  }

  if (config.verbosity >= 2) {
    std::cout << "Found " << work_items.size() << " items to process."
              << std::endl;
  }
  if (work_items.empty()) {
    if (config.verbosity >= 1)
      std::cout << "No files found matching the criteria." << std::endl;
    return 0;
  }

  // 3. Process Files. Each file is split across the worker pool, so files
  // run one after another.
  size_t failures = 0;
  double start_time = omp_get_wtime();

  for (size_t i = 0; i < work_items.size(); ++i) {
    const auto &item = work_items[i];
    if (config.verbosity >= 2) {
      std::cout << "[" << (i + 1) << "/" << work_items.size() << "] "
                << (config.compress_mode ? "Compressing: " : "Decompressing: ")
                << item.path << " (Size: " << item.size << ")" << std::endl;
    }
    bool success = false;
    try {
      success = Compressor::process_item(item, config);
    } catch (const std::exception &e) {
      std::cerr << "Exception processing " << item.path << ": " << e.what()
                << std::endl;
    }
    if (!success) {
      ++failures;
    }
  }

  double end_time = omp_get_wtime();

  // 4. Final Report
  if (config.verbosity >= 1) {
    std::cout << "--------------------\n";
    std::cout << "Processed " << work_items.size() << " file(s) in "
              << end_time - start_time << " seconds." << std::endl;
    if (failures > 0) {
      std::cout << "Exiting with Errors (" << failures << " failed)."
                << std::endl;
    } else {
      std::cout << "Exiting with Success." << std::endl;
    }
  }

  return failures > 0 ? 1 : 0;
}
