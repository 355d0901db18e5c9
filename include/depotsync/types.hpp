#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace depotsync {

enum class Action {
  Add,
  Edit,
  Delete,
  Branch,
  Integrate,
  MoveAdd,
  MoveDelete
};

struct FstatRecord {
  int64_t change = 0;
  std::string path; // Relative to the depot prefix (e.g. "src/main.cpp")
  int64_t revision = 0;
  Action action = Action::Add;
  std::string fileType; // "text", "binary", "utf8", "utf16", "symlink", ...
  int64_t size = 0;
  std::string digest; // Hex SHA-256, empty for deletions
  std::vector<std::string> extra;
  std::optional<std::string> transferError;

  bool isDeletion() const {
    return action == Action::Delete || action == Action::MoveDelete;
  }
  bool isSymlink() const { return fileType.rfind("symlink", 0) == 0; }
  bool isUtf8() const { return fileType.rfind("utf8", 0) == 0; }
};

bool operator==(const FstatRecord &a, const FstatRecord &b);

using RecordList = std::vector<FstatRecord>;

struct Batch {
  RecordList records;
  std::size_t bytes = 0;
};

enum class TransferMode { Normal, Force };

struct TransferResult {
  bool success = false;
  std::string message;
  // Failures pinned on single records, by path. When empty, a failure
  // applies to the whole batch.
  std::map<std::string, std::string> recordErrors;

  std::optional<std::string> errorFor(const std::string &path) const;
};

struct HaveEntry {
  std::string path;
  int64_t changelist = 0;
  std::string digest;
};

struct LocalState {
  int64_t lastSynced = 0;
  std::map<std::string, HaveEntry> haveList;
};

enum class QueryStatus { Full, Redirect };

struct QueryResponse {
  QueryStatus status = QueryStatus::Full;
  int64_t redirectTo = 0;
  RecordList records;
};

enum class SyncState {
  Querying,
  Filtering,
  Transferring,
  Verifying,
  Done,
  Failed
};

struct SyncReport {
  SyncState state = SyncState::Querying;
  int64_t previous = 0;
  int64_t target = 0;
  std::size_t requested = 0;
  std::size_t firstTransfer = 0;
  std::size_t secondTransfer = 0;
  std::size_t cleaned = 0; // local files moved aside by clean()
  std::vector<std::string> failedPaths;
};

const char *toString(Action action);
std::optional<Action> actionFromString(const std::string &text);
const char *toString(SyncState state);

} // namespace depotsync
