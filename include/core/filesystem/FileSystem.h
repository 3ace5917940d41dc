// ============================================================================
// FILESYSTEM - Data directory operations & JSON helpers
// ============================================================================
// std::filesystem wrapper rooted at the run's data directory, providing:
// - Path resolution (relative paths land in the data directory)
// - Existence checks and directory management
// - Disk space reporting
// - JSON file load/save helpers (ArduinoJson)
// ============================================================================

#ifndef FILESYSTEM_H
#define FILESYSTEM_H

#include <ArduinoJson.h>
#include <cstdint>
#include <string>
#include <vector>

class FileSystem {
public:
  // ========================================================================
  // LIFECYCLE
  // ========================================================================

  FileSystem();

  /**
   * Mount the data directory (created if missing)
   * @param rootDirectory Directory receiving logs, CSV and summaries
   * @return true if the directory exists and is usable
   */
  bool mount(const std::string& rootDirectory);

  /** Check if the data directory is mounted and ready */
  bool isReady() const { return _mounted; }

  /** Mounted root (empty when not mounted) */
  const std::string& getRoot() const { return _root; }

  /**
   * Resolve a path against the data directory
   * Absolute paths are returned unchanged
   */
  std::string resolve(const std::string& path) const;

  // ========================================================================
  // FILE OPERATIONS
  // ========================================================================

  /** Check if file exists (not a directory) */
  bool fileExists(const std::string& path) const;

  /** Check if directory exists */
  bool directoryExists(const std::string& path) const;

  /** Create directory and parents (no-op if already exists) */
  bool createDirectory(const std::string& path);

  /** Regular file names (not paths) inside a directory */
  std::vector<std::string> listFiles(const std::string& path) const;

  // ========================================================================
  // DISK USAGE
  // ========================================================================

  /** Bytes available to us on the data directory's volume (0 if unknown) */
  uint64_t getAvailableBytes() const;

  // ========================================================================
  // JSON HELPERS
  // ========================================================================

  /**
   * Load JSON from file (deserialize)
   * @param path File path (resolved against the data directory)
   * @param doc JsonDocument to populate
   * @param errorMsg Output: reason on failure
   * @return true if successful
   */
  bool loadJsonFile(const std::string& path, JsonDocument& doc, std::string& errorMsg) const;

  /**
   * Save JSON to file (pretty, flush + verify)
   * @return true if successful
   */
  bool saveJsonFile(const std::string& path, const JsonDocument& doc, std::string& errorMsg);

private:
  bool _mounted;
  std::string _root;
};

#endif // FILESYSTEM_H
