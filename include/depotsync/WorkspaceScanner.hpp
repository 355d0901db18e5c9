#ifndef DEPOTSYNC_WORKSPACESCANNER_HPP
#define DEPOTSYNC_WORKSPACESCANNER_HPP

#include "types.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace depotsync {

struct ScanResult {
  std::vector<std::string> files; // Relative paths, '/' separated
  std::vector<std::string> directories;
  // Entries that could not be read. Non-empty means the lists above are
  // incomplete.
  std::vector<std::string> errors;
};

/**
 * WorkspaceScanner answers questions about the tracked directory: where a
 * record lives locally, whether the local file matches the record, and what
 * files exist on disk.
 */
class WorkspaceScanner {
public:
  static constexpr const char *kStateDir = ".depotsync";

  explicit WorkspaceScanner(std::string syncPath);
  ~WorkspaceScanner();

  const std::string &root() const { return m_syncPath; }
  std::filesystem::path localPath(const std::string &relPath) const;

  // Hex SHA-256 of the local file, empty if it can not be read.
  std::string calculateHash(const std::string &absPath,
                            const FstatRecord &record) const;

  bool matchesChecksum(const FstatRecord &record) const;
  bool matchesExistence(const FstatRecord &record) const;

  // True if every component of relPath is spelled on disk exactly as given.
  // A path that does not exist is accurate.
  bool casefulAccurate(const std::string &relPath);
  bool exists(const std::string &relPath) const;
  // Forgets the directory listings casefulAccurate() has cached.
  void clearCache();

  ScanResult scanSyncPath() const;

private:
  std::string m_syncPath;
  std::map<std::string, std::set<std::string>> m_dirCache;
  std::mutex m_dirMutex;

  const std::set<std::string> &listDirectory(const std::string &relDir);
};

} // namespace depotsync

#endif // DEPOTSYNC_WORKSPACESCANNER_HPP
