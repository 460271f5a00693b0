/**
 * @file file_handler.cpp
 * @brief Implements file discovery, filtering and output path derivation.
 */
#include "file_handler.hpp"
#include "config.hpp"
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace FileHandler {

namespace {

/**
 * @brief Resolves @p p for comparisons; falls back to the lexical absolute
 * path when it cannot be resolved.
 */
std::filesystem::path normalized(const std::filesystem::path &p) {
  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(p, ec);
  if (ec) {
    return std::filesystem::absolute(p, ec).lexically_normal();
  }
  return resolved;
}

bool has_suffix(const std::string &name, const std::string &suffix) {
  return name.length() >= suffix.length() &&
         name.compare(name.length() - suffix.length(), suffix.length(),
                      suffix) == 0;
}

} // namespace

/**
 * @brief Checks if a path corresponds to a directory.
 * @param[in] p Path to check.
 * @param[in] verbosity Verbosity level for logging warnings.
 * @return true if p is a directory, false otherwise.
 */
bool is_directory(const std::filesystem::path &p, int verbosity) {
  std::error_code ec;
  bool is_dir = std::filesystem::is_directory(p, ec);
  if (ec) {
    if (verbosity >= 1)
      std::cerr << "Warning: Error checking if path is directory: "
                << p.string() << " - " << ec.message() << std::endl;
    return false;
  }
  return is_dir;
}

/**
 * @brief Retrieves the size of a regular file.
 * @param[in] p Path to the file.
 * @param[in] verbosity Verbosity level for logging warnings.
 * @return Optional containing file size if successful, nullopt otherwise.
 */
std::optional<size_t> get_regular_file_size(const std::filesystem::path &p,
                                            int verbosity) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    if (ec && verbosity >= 1) {
      std::cerr << "Warning: Error checking if path is regular file: "
                << p.string() << " - " << ec.message() << std::endl;
    }
    return std::nullopt;
  }
  std::error_code size_ec;
  uintmax_t size = std::filesystem::file_size(p, size_ec);
  if (size_ec) {
    if (verbosity >= 1) {
      std::cerr << "Warning: Could not get file size for: " << p.string()
                << " - " << size_ec.message() << std::endl;
    }
    return std::nullopt;
  }
  return static_cast<size_t>(size);
}

bool should_process(const std::string &filename, bool is_compress_mode,
                    const std::string &suffix) {
  if (filename == "." || filename == "..") {
    return false;
  }
  bool suffixed = has_suffix(filename, suffix);
  return is_compress_mode ? !suffixed : suffixed;
}

std::vector<WorkItem>
discover_work_items(const std::vector<std::string> &initial_paths,
                    const ConfigData &cfg) {
  std::vector<WorkItem> items_to_process;
  // Each directory is scanned together with the root its items are
  // relative to.
  std::vector<std::pair<std::filesystem::path, std::filesystem::path>>
      directories_to_scan;

  std::optional<std::filesystem::path> output_root;
  if (!cfg.output_dir.empty()) {
    output_root = normalized(cfg.output_dir);
  }

  for (const auto &path_str : initial_paths) {
    std::filesystem::path current_path(path_str);
    if (is_directory(current_path, cfg.verbosity)) {
      directories_to_scan.emplace_back(current_path, current_path);
      continue;
    }
    auto filesize_opt = get_regular_file_size(current_path, cfg.verbosity);
    if (filesize_opt) {
      if (should_process(current_path.filename().string(), cfg.compress_mode,
                         SUFFIX)) {
        items_to_process.push_back({current_path.string(),
                                    current_path.filename().string(),
                                    filesize_opt.value()});
      } else if (cfg.verbosity >= 2) {
        std::cout << "Skipping initial path (suffix mismatch): "
                  << current_path.string() << std::endl;
      }
    } else {
      std::error_code exist_ec;
      if (!std::filesystem::exists(current_path, exist_ec)) {
        if (cfg.verbosity >= 1) {
          std::cerr << "Warning: Initial path not found or inaccessible: "
                    << path_str << std::endl;
        }
      } else if (cfg.verbosity >= 1) {
        std::cerr << "Warning: Skipping initial path (not a processable "
                     "regular file): "
                  << path_str << std::endl;
      }
    }
  }

  size_t current_dir_index = 0;
  while (current_dir_index < directories_to_scan.size()) {
    // Copy: push_back below may reallocate the vector.
    const auto dir_entry = directories_to_scan[current_dir_index++];
    const auto &dir_path = dir_entry.first;
    const auto &scan_root = dir_entry.second;
    if (cfg.verbosity >= 2) {
      std::cout << "Scanning directory: " << dir_path.string() << std::endl;
    }
    std::error_code ec;
    auto iterator_options =
        std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::directory_iterator dir_iter(dir_path, iterator_options,
                                                 ec);
    if (ec) {
      if (cfg.verbosity >= 1)
        std::cerr << "Warning: Cannot open directory: " << dir_path.string()
                  << " - " << ec.message() << std::endl;
      continue;
    }
    for (const auto &entry : dir_iter) {
      try {
        if (is_directory(entry.path(), cfg.verbosity)) {
          if (output_root && normalized(entry.path()) == *output_root) {
            if (cfg.verbosity >= 2)
              std::cout << "Skipping output directory: "
                        << entry.path().string() << std::endl;
            continue;
          }
          if (cfg.recurse) {
            directories_to_scan.emplace_back(entry.path(), scan_root);
          }
        } else {
          auto filesize_opt =
              get_regular_file_size(entry.path(), cfg.verbosity);
          if (filesize_opt) {
            if (should_process(entry.path().filename().string(),
                               cfg.compress_mode, SUFFIX)) {
              items_to_process.push_back(
                  {entry.path().string(),
                   entry.path().lexically_relative(scan_root).string(),
                   filesize_opt.value()});
            } else if (cfg.verbosity >= 2) {
              std::cout << "Skipping file (suffix mismatch): "
                        << entry.path().string() << std::endl;
            }
          }
        }
      } catch (const std::filesystem::filesystem_error &e) {
        if (cfg.verbosity >= 1) {
          std::cerr << "Warning: Filesystem error processing entry near "
                    << e.path1().string() << ": " << e.what() << std::endl;
        }
        continue;
      }
    }
  }
  return items_to_process;
}

std::filesystem::path output_path_for(const WorkItem &item,
                                      const ConfigData &cfg) {
  std::filesystem::path base = cfg.output_dir.empty()
                                   ? std::filesystem::path(item.path)
                                   : std::filesystem::path(cfg.output_dir) /
                                         item.relative_path;
  std::string name = base.filename().string();
  if (cfg.compress_mode) {
    return base.replace_filename(name + SUFFIX);
  }
  if (name.length() > SUFFIX.length() && has_suffix(name, SUFFIX)) {
    return base.replace_filename(
        name.substr(0, name.length() - SUFFIX.length()));
  }
  return base.replace_filename(name + FALLBACK_SUFFIX);
}

} // namespace FileHandler
