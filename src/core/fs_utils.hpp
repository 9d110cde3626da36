#ifndef CAMSHOT_CORE_FS_UTILS_HPP_
#define CAMSHOT_CORE_FS_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace camshot::core {

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Creates `dir` when missing and proves it accepts new files by writing and
// removing a small probe file. Permission bits alone are not trusted: network
// mounts and read-only bind mounts routinely lie about them.
inline bool ProbeDirectoryWritable(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  if (!std::filesystem::is_directory(dir, ec) || ec) {
    error = "path is not a directory: '" + dir.string() + "'";
    return false;
  }

  const std::filesystem::path probe_path = dir / ".write_test";
  {
    std::ofstream probe(probe_path, std::ios::binary | std::ios::trunc);
    if (!probe) {
      error = "directory is not writable: '" + dir.string() + "'";
      return false;
    }
    probe << "test";
    if (!probe) {
      error = "failed while writing probe file in '" + dir.string() + "'";
      return false;
    }
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(probe_path, remove_ec);
  return true;
}

// Size of an existing regular file. Missing files and non-regular entries are
// reported through `error` so callers can log the exact reason.
inline bool ReadRegularFileSize(const std::filesystem::path& path, std::uintmax_t& size_bytes,
                                std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    error = "file not created: '" + path.string() + "'";
    return false;
  }
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "path is not a regular file: '" + path.string() + "'";
    return false;
  }

  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    error = "failed to read size of '" + path.string() + "': " + ec.message();
    return false;
  }
  size_bytes = size;
  return true;
}

} // namespace camshot::core

#endif // CAMSHOT_CORE_FS_UTILS_HPP_
