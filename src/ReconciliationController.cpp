#include "depotsync/ReconciliationController.hpp"
#include "depotsync/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace depotsync {

namespace {
std::string foldCase(const std::string &text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::vector<PredicateSpec> only(Predicate predicate) {
  return {PredicateSpec{predicate, false}};
}
} // namespace

ReconciliationController::ReconciliationController(
    const Config &config, const std::string &trackedDir, FstatQuery &query,
    TransferExecutor &executor)
    : m_config(config), m_trackedDir(trackedDir), m_query(query),
      m_executor(executor), m_scanner(trackedDir), m_store(trackedDir) {
  if (m_config.depotPrefix.empty())
    throw ConfigError("depot_prefix is not configured");
}

void ReconciliationController::transition(SyncState next) {
  std::cerr << "[Sync] " << m_trackedDir << ": " << toString(m_state.load())
            << " -> " << toString(next) << std::endl;
  m_state = next;
}

int64_t
ReconciliationController::resolveTarget(std::optional<int64_t> target) {
  int64_t head = m_query.head(m_config.depotPrefix);
  if (!target)
    return head;
  if (*target < 1)
    throw Error("Changelist must be positive: " + std::to_string(*target));
  if (*target > head) {
    std::cerr << "[Sync] Changelist " << *target << " is past head, using "
              << head << std::endl;
    return head;
  }
  return *target;
}

FilterContext ReconciliationController::filterContext(const LocalState *state) {
  FilterContext context;
  context.scanner = &m_scanner;
  context.state = state;
  context.caseInsensitive = m_config.caseInsensitive;
  return context;
}

SyncReport ReconciliationController::sync(std::optional<int64_t> target,
                                          bool force) {
  SyncReport report;
  m_state = SyncState::Querying;
  std::cerr << "[Sync] " << m_trackedDir << ": QUERYING" << std::endl;

  try {
    if (!fs::exists(m_trackedDir)) {
      std::cerr << "[Sync] Creating missing directory: " << m_trackedDir
                << std::endl;
      fs::create_directories(m_trackedDir);
    }
    m_store.open();
    LocalState state = m_store.load();
    report.previous = state.lastSynced;
    report.target = resolveTarget(target);

    if (!force && report.previous == report.target) {
      std::cerr << "[Sync] Already synced to " << report.target << std::endl;
      transition(SyncState::Done);
      report.state = SyncState::Done;
      return report;
    }

    const auto &prefix = m_config.depotPrefix;
    RecordList requested;
    if (force && report.target < report.previous) {
      // Paths created after the target need their deletes too.
      requested = m_query.changes(prefix, 0, report.target);
      for (auto &record :
           m_query.revert(prefix, report.target, report.previous))
        requested.push_back(std::move(record));
      requested = latestPerPath(std::move(requested));
    } else if (force) {
      requested = m_query.changes(prefix, 0, report.target);
    } else if (report.target > report.previous) {
      requested = m_query.changes(prefix, report.previous, report.target);
    } else {
      requested = m_query.revert(prefix, report.target, report.previous);
    }
    report.requested = requested.size();
    std::cerr << "[Sync] " << requested.size() << " records between "
              << (force ? 0 : report.previous) << " and " << report.target
              << std::endl;

    return reconcile(std::move(report), state, requested, force);
  } catch (const std::exception &) {
    transition(SyncState::Failed);
    throw;
  }
}

SyncReport ReconciliationController::reconcile(SyncReport report,
                                               const LocalState &state,
                                               const RecordList &requested,
                                               bool force) {
  m_scanner.clearCache();
  auto context = filterContext(&state);
  // Reverse-sync records are older than the have-list entries they replace.
  const bool reverse = report.target < report.previous;

  Pipeline pipeline(m_config.channelCapacity);
  std::map<std::size_t, SyncState> phaseEnds;
  auto endPhase = [&pipeline, &phaseEnds](SyncState next) {
    phaseEnds[pipeline.size() - 1] = next;
  };

  if (m_config.haveList && m_config.trustHaveList && !force && !reverse)
    pipeline.emplace<FilterStage>(FilterStage::Mode::Drop,
                                  only(Predicate::HaveList), context);
  pipeline.emplace<FilterStage>(FilterStage::Mode::Drop,
                                only(Predicate::Checksum), context);
  pipeline.emplace<FilterStage>(FilterStage::Mode::Keep,
                                only(Predicate::Case), context);
  pipeline.emplace<ProgressStage>("to transfer", m_config.progressInterval);
  endPhase(SyncState::Transferring);

  auto &firstTransfer = pipeline.emplace<TransferStage>(
      m_executor, TransferMode::Normal, m_config.workers, m_config.batchBytes);
  endPhase(SyncState::Verifying);

  pipeline.emplace<FilterStage>(FilterStage::Mode::Drop,
                                only(Predicate::Checksum), context);
  endPhase(SyncState::Transferring);

  auto &secondTransfer = pipeline.emplace<TransferStage>(
      m_executor, TransferMode::Force, m_config.workers, m_config.batchBytes);
  endPhase(SyncState::Verifying);

  pipeline.emplace<FilterStage>(FilterStage::Mode::Drop,
                                only(Predicate::Checksum), context);
  pipeline.emplace<FailStage>();

  pipeline.onStageFinished(
      [this, &phaseEnds](std::size_t index, const RecordStage &) {
        auto it = phaseEnds.find(index);
        if (it != phaseEnds.end())
          transition(it->second);
      });

  transition(SyncState::Filtering);
  std::cerr << "[Sync] " << pipeline.describe() << std::endl;
  try {
    pipeline.run(
        [&requested](RecordChannel &out) {
          for (const auto &record : requested) {
            if (!out.push(record))
              return;
          }
        },
        [](RecordChannel &in) {
          while (in.pop()) {
          }
        });
  } catch (const VerificationFailure &e) {
    report.firstTransfer = firstTransfer.records();
    report.secondTransfer = secondTransfer.records();
    report.failedPaths = e.paths();
    report.state = SyncState::Failed;
    transition(SyncState::Failed);
    return report;
  }
  report.firstTransfer = firstTransfer.records();
  report.secondTransfer = secondTransfer.records();

  m_store.commit(report.target, requested, m_config.haveList);
  report.state = SyncState::Done;
  transition(SyncState::Done);
  std::cerr << "[Sync] Synced to " << report.target << ": "
            << report.firstTransfer << " transferred, "
            << report.secondTransfer << " retried" << std::endl;
  return report;
}

std::size_t ReconciliationController::moveAside(const RecordList &depotState,
                                                bool discard) {
  auto key = [this](const std::string &path) {
    return m_config.caseInsensitive ? foldCase(path) : path;
  };
  std::set<std::string> expected;
  for (const auto &record : depotState) {
    if (!record.isDeletion())
      expected.insert(key(record.path));
  }

  fs::path cleanedDir =
      fs::path(m_trackedDir) / WorkspaceScanner::kStateDir / "cleaned";
  auto scan = m_scanner.scanSyncPath();
  if (!scan.errors.empty())
    throw Error("Cannot scan " + m_trackedDir + " (" +
                std::to_string(scan.errors.size()) +
                " error(s)): " + scan.errors.front());
  std::size_t moved = 0;

  for (const auto &file : scan.files) {
    if (expected.count(key(file)))
      continue;
    auto source = m_scanner.localPath(file);
    if (discard) {
      fs::remove(source);
    } else {
      auto destination = cleanedDir / file;
      fs::create_directories(destination.parent_path());
      if (fs::exists(fs::symlink_status(destination)))
        fs::remove_all(destination);
      fs::rename(source, destination);
    }
    ++moved;
  }

  // Deepest first, so parents empty out after their children.
  std::sort(scan.directories.begin(), scan.directories.end(),
            [](const std::string &a, const std::string &b) { return a > b; });
  for (const auto &dir : scan.directories) {
    auto path = m_scanner.localPath(dir);
    std::error_code ec;
    if (fs::is_directory(path, ec) && fs::is_empty(path, ec))
      fs::remove(path, ec);
  }

  std::cerr << "[Sync] " << (discard ? "Deleted " : "Moved ") << moved
            << " untracked file(s)"
            << (discard ? "" : " to " + cleanedDir.string()) << std::endl;
  return moved;
}

SyncReport ReconciliationController::clean(std::optional<int64_t> target,
                                           bool discard) {
  m_state = SyncState::Querying;
  std::size_t moved = 0;
  std::optional<int64_t> resolved;
  try {
    if (!fs::exists(m_trackedDir))
      fs::create_directories(m_trackedDir);
    resolved = resolveTarget(target);
    auto depotState = m_query.changes(m_config.depotPrefix, 0, *resolved);
    moved = moveAside(depotState, discard);
  } catch (const std::exception &) {
    transition(SyncState::Failed);
    throw;
  }

  auto report = sync(resolved, true);
  report.cleaned = moved;
  return report;
}

} // namespace depotsync
