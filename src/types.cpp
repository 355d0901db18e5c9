#include "depotsync/types.hpp"

namespace depotsync {

namespace {
struct ActionName {
  Action action;
  const char *name;
};

const ActionName kActionNames[] = {
    {Action::Add, "add"},
    {Action::Edit, "edit"},
    {Action::Delete, "delete"},
    {Action::Branch, "branch"},
    {Action::Integrate, "integrate"},
    {Action::MoveAdd, "move/add"},
    {Action::MoveDelete, "move/delete"},
};
} // namespace

bool operator==(const FstatRecord &a, const FstatRecord &b) {
  return a.change == b.change && a.path == b.path &&
         a.revision == b.revision && a.action == b.action &&
         a.fileType == b.fileType && a.size == b.size &&
         a.digest == b.digest && a.extra == b.extra &&
         a.transferError == b.transferError;
}

const char *toString(Action action) {
  for (const auto &entry : kActionNames) {
    if (entry.action == action)
      return entry.name;
  }
  return "unknown";
}

std::optional<Action> actionFromString(const std::string &text) {
  for (const auto &entry : kActionNames) {
    if (text == entry.name)
      return entry.action;
  }
  return std::nullopt;
}

std::optional<std::string>
TransferResult::errorFor(const std::string &path) const {
  auto it = recordErrors.find(path);
  if (it != recordErrors.end())
    return it->second;
  if (success || !recordErrors.empty())
    return std::nullopt;
  return message.empty() ? "transfer failed" : message;
}

const char *toString(SyncState state) {
  switch (state) {
  case SyncState::Querying:
    return "QUERYING";
  case SyncState::Filtering:
    return "FILTERING";
  case SyncState::Transferring:
    return "TRANSFERRING";
  case SyncState::Verifying:
    return "VERIFYING";
  case SyncState::Done:
    return "DONE";
  case SyncState::Failed:
    return "FAILED";
  }
  return "UNKNOWN";
}

} // namespace depotsync
