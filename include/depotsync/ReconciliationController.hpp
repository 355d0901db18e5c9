#pragma once
#include "Config.hpp"
#include "Dispatcher.hpp"
#include "FilterStage.hpp"
#include "FstatQuery.hpp"
#include "Pipeline.hpp"
#include "StateStore.hpp"
#include "WorkspaceScanner.hpp"
#include "types.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace depotsync {

/**
 * ReconciliationController brings one tracked directory to a changelist.
 * After QUERYING the changed records for (last synced, target], one
 * streaming pipeline carries them through every phase:
 *
 *   FILTERING    drop [--havelist] --checksum | keep --case | progress
 *   TRANSFERRING batch and transfer
 *   VERIFYING    drop --checksum
 *   TRANSFERRING batch and transfer, forced
 *   VERIFYING    drop --checksum | fail
 *
 * state() names the earliest phase still running. The local state is
 * committed only after the final verification leaves nothing behind.
 * Records that still mismatch end the run FAILED.
 */
class ReconciliationController {
public:
  ReconciliationController(const Config &config, const std::string &trackedDir,
                           FstatQuery &query, TransferExecutor &executor);

  // Syncs to `target` (head when empty). Errors other than a failed
  // verification are rethrown after entering FAILED.
  SyncReport sync(std::optional<int64_t> target, bool force);

  // Moves local files the depot does not have at `target` into
  // .depotsync/cleaned (or deletes them), then force-syncs. Throws before
  // touching anything if part of the directory can not be read.
  SyncReport clean(std::optional<int64_t> target, bool discard);

  SyncState state() const { return m_state.load(); }
  const std::string &trackedDir() const { return m_trackedDir; }

private:
  const Config &m_config;
  std::string m_trackedDir;
  FstatQuery &m_query;
  TransferExecutor &m_executor;
  WorkspaceScanner m_scanner;
  StateStore m_store;
  std::atomic<SyncState> m_state{SyncState::Querying};

  void transition(SyncState next);
  int64_t resolveTarget(std::optional<int64_t> target);
  FilterContext filterContext(const LocalState *state);
  SyncReport reconcile(SyncReport report, const LocalState &state,
                       const RecordList &requested, bool force);
  std::size_t moveAside(const RecordList &depotState, bool discard);
};

} // namespace depotsync
