// ============================================================================
// FILESYSTEM IMPLEMENTATION
// ============================================================================

#include "core/filesystem/FileSystem.h"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

// ============================================================================
// LIFECYCLE
// ============================================================================

FileSystem::FileSystem()
  : _mounted(false) {
}

bool FileSystem::mount(const std::string& rootDirectory) {
  std::error_code ec;
  fs::path root = rootDirectory.empty() ? fs::path(".") : fs::path(rootDirectory);

  if (!fs::exists(root, ec)) {
    fs::create_directories(root, ec);
    if (ec) {
      _mounted = false;
      return false;
    }
  }

  if (!fs::is_directory(root, ec)) {
    _mounted = false;
    return false;
  }

  _root = root.string();
  _mounted = true;
  return true;
}

std::string FileSystem::resolve(const std::string& path) const {
  fs::path p(path);
  if (p.is_absolute() || _root.empty()) return p.string();
  return (fs::path(_root) / p).lexically_normal().string();
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

bool FileSystem::fileExists(const std::string& path) const {
  std::error_code ec;
  return fs::is_regular_file(resolve(path), ec);
}

bool FileSystem::directoryExists(const std::string& path) const {
  std::error_code ec;
  return fs::is_directory(resolve(path), ec);
}

bool FileSystem::createDirectory(const std::string& path) {
  if (directoryExists(path)) return true;
  std::error_code ec;
  fs::create_directories(resolve(path), ec);
  return !ec;
}

std::vector<std::string> FileSystem::listFiles(const std::string& path) const {
  std::vector<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(resolve(path), ec);
  if (ec) return names;

  for (const auto& entry : it) {
    std::error_code typeEc;
    if (entry.is_regular_file(typeEc)) {
      names.push_back(entry.path().filename().string());
    }
  }
  return names;
}

// ============================================================================
// DISK USAGE
// ============================================================================

uint64_t FileSystem::getAvailableBytes() const {
  std::error_code ec;
  fs::space_info info = fs::space(_root.empty() ? fs::path(".") : fs::path(_root), ec);
  if (ec) return 0;
  return static_cast<uint64_t>(info.available);
}

// ============================================================================
// JSON HELPERS
// ============================================================================

bool FileSystem::loadJsonFile(const std::string& path, JsonDocument& doc, std::string& errorMsg) const {
  std::string fullPath = resolve(path);
  if (!fileExists(path)) {
    errorMsg = "JSON file not found: " + fullPath;
    return false;
  }

  std::ifstream file(fullPath);
  if (!file) {
    errorMsg = "Failed to open file for reading: " + fullPath;
    return false;
  }

  DeserializationError err = deserializeJson(doc, file);
  if (err) {
    errorMsg = "JSON parse error in " + fullPath + ": " + err.c_str();
    return false;
  }

  return true;
}

bool FileSystem::saveJsonFile(const std::string& path, const JsonDocument& doc, std::string& errorMsg) {
  std::string fullPath = resolve(path);

  // Ensure parent directory exists
  fs::path parent = fs::path(fullPath).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
  }

  std::ofstream file(fullPath, std::ios::trunc);
  if (!file) {
    errorMsg = "Failed to open file for writing: " + fullPath;
    return false;
  }

  size_t bytesWritten = serializeJsonPretty(doc, file);
  file << '\n';

  // Flush before close
  file.flush();

  if (!file || bytesWritten == 0) {
    errorMsg = "CRITICAL: JSON write failed: " + fullPath;
    return false;
  }

  return true;
}
