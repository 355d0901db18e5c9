#include "depotsync/WorkspaceScanner.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

// Include picosha2 for hashing
#include <picosha2.h>

namespace fs = std::filesystem;

namespace depotsync {

namespace {
const unsigned char kUtf8Bom[3] = {0xEF, 0xBB, 0xBF};

bool sameDigest(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}
} // namespace

WorkspaceScanner::WorkspaceScanner(std::string syncPath)
    : m_syncPath(std::move(syncPath)) {}

WorkspaceScanner::~WorkspaceScanner() = default;

fs::path WorkspaceScanner::localPath(const std::string &relPath) const {
  return fs::path(m_syncPath) / fs::path(relPath);
}

std::string WorkspaceScanner::calculateHash(const std::string &absPath,
                                            const FstatRecord &record) const {
  std::ifstream f(absPath, std::ios::binary);
  if (!f.is_open())
    return "";

  // A utf8 file stored with a BOM the depot does not count is hashed
  // without it.
  if (record.isUtf8()) {
    std::error_code ec;
    auto onDisk = fs::file_size(absPath, ec);
    if (!ec && static_cast<int64_t>(onDisk) > record.size) {
      char bom[3] = {};
      f.read(bom, 3);
      if (f.gcount() != 3 || std::memcmp(bom, kUtf8Bom, 3) != 0) {
        f.clear();
        f.seekg(0);
      }
    }
  }

  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(f, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

bool WorkspaceScanner::matchesChecksum(const FstatRecord &record) const {
  auto p = localPath(record.path);
  std::error_code ec;
  auto st = fs::symlink_status(p, ec);
  bool present = !ec && fs::exists(st);

  if (record.isDeletion())
    return !present || fs::is_directory(st);
  if (!present)
    return false;
  if (record.isSymlink())
    return true;
  if (!fs::is_regular_file(st) && !fs::is_symlink(st))
    return false;
  return sameDigest(calculateHash(p.string(), record), record.digest);
}

bool WorkspaceScanner::matchesExistence(const FstatRecord &record) const {
  auto p = localPath(record.path);
  std::error_code ec;
  auto st = fs::symlink_status(p, ec);
  bool present = !ec && fs::exists(st) && !fs::is_directory(st);
  return present == !record.isDeletion();
}

bool WorkspaceScanner::exists(const std::string &relPath) const {
  std::error_code ec;
  return fs::exists(fs::symlink_status(localPath(relPath), ec));
}

const std::set<std::string> &
WorkspaceScanner::listDirectory(const std::string &relDir) {
  auto it = m_dirCache.find(relDir);
  if (it != m_dirCache.end())
    return it->second;

  std::set<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator d(localPath(relDir), ec), end; !ec && d != end;
       d.increment(ec)) {
    names.insert(d->path().filename().string());
  }
  return m_dirCache.emplace(relDir, std::move(names)).first->second;
}

bool WorkspaceScanner::casefulAccurate(const std::string &relPath) {
  if (!exists(relPath))
    return true;

  std::lock_guard<std::mutex> lock(m_dirMutex);
  fs::path rel(relPath);
  fs::path dir;
  for (const auto &part : rel) {
    const auto &names = listDirectory(dir.generic_string());
    if (names.find(part.string()) == names.end())
      return false;
    dir /= part;
  }
  return true;
}

void WorkspaceScanner::clearCache() {
  std::lock_guard<std::mutex> lock(m_dirMutex);
  m_dirCache.clear();
}

ScanResult WorkspaceScanner::scanSyncPath() const {
  ScanResult result;

  try {
    if (!fs::exists(m_syncPath))
      return result;

    for (auto it = fs::recursive_directory_iterator(m_syncPath);
         it != fs::recursive_directory_iterator(); ++it) {
      const auto &entry = *it;
      auto rel = fs::relative(entry.path(), m_syncPath).generic_string();
      if (it.depth() == 0 && entry.path().filename() == kStateDir) {
        it.disable_recursion_pending();
        continue;
      }
      try {
        if (entry.is_symlink() || entry.is_regular_file()) {
          result.files.push_back(rel);
        } else if (entry.is_directory()) {
          result.directories.push_back(rel);
        }
      } catch (const std::exception &e) {
        std::cerr << "[Scanner] Error scanning item: " << entry.path() << " - "
                  << e.what() << std::endl;
        result.errors.push_back(rel + ": " + e.what());
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "[Scanner] FileSystem Error: " << e.what() << std::endl;
    result.errors.push_back(e.what());
  }

  return result;
}

} // namespace depotsync
