#include "TestSupport.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FstatQuery.hpp"
#include "depotsync/ReconciliationController.hpp"
#include "depotsync/StateStore.hpp"
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

using namespace depotsync;
namespace fs = std::filesystem;

namespace {

// Takes every permission away from a directory until destroyed.
class LockedDirectory {
public:
  explicit LockedDirectory(fs::path path) : m_path(std::move(path)) {
    fs::permissions(m_path, fs::perms::none);
  }
  ~LockedDirectory() {
    std::error_code ec;
    fs::permissions(m_path, fs::perms::owner_all, ec);
  }
  bool enforced() const { return ::access(m_path.c_str(), R_OK) != 0; }

private:
  fs::path m_path;
};

} // namespace

class ReconciliationControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config.depotPrefix = "//depot/main";
    config.workers = 2;
    config.batchBytes = 256;
    config.channelCapacity = 8;
    config.caseInsensitive = false;
    config.progressInterval = 1000;

    submit(1, "a.txt", 1, "a1", Action::Add);
    submit(1, "dir/b.txt", 1, "b1", Action::Add);
    submit(2, "a.txt", 2, "a2");
  }

  void submit(int64_t change, const std::string &path, int64_t revision,
              const std::string &content, Action action = Action::Edit) {
    source.submit(test::fileRecord(change, path, revision, content, action));
    executor.define(path, revision, content);
  }

  std::string read(const std::string &path) {
    return test::readFile(tracked / path);
  }

  LocalState storedState() {
    StateStore store(tracked.string());
    store.open();
    return store.load();
  }

  ReconciliationController controller() {
    return ReconciliationController(config, tracked.string(), query, executor);
  }

  test::TempDir root;
  fs::path tracked = root.path() / "workspace";
  test::FakeSource source;
  test::FakeExecutor executor{tracked};
  FstatQuery query{source};
  Config config;
};

TEST_F(ReconciliationControllerTest, FreshSyncMaterializesHead) {
  auto sync = controller();
  auto report = sync.sync(std::nullopt, false);

  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(sync.state(), SyncState::Done);
  EXPECT_EQ(report.previous, 0);
  EXPECT_EQ(report.target, 2);
  EXPECT_EQ(report.requested, 2u);
  EXPECT_EQ(report.firstTransfer, 2u);
  EXPECT_EQ(report.secondTransfer, 0u);
  EXPECT_EQ(read("a.txt"), "a2");
  EXPECT_EQ(read("dir/b.txt"), "b1");

  auto state = storedState();
  EXPECT_EQ(state.lastSynced, 2);
  ASSERT_EQ(state.haveList.size(), 2u);
  EXPECT_EQ(state.haveList.at("a.txt").changelist, 2);
}

TEST_F(ReconciliationControllerTest, RepeatedSyncDoesNothing) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  executor.reset();

  auto again = sync.sync(std::nullopt, false);
  EXPECT_EQ(again.state, SyncState::Done);
  EXPECT_EQ(again.requested, 0u);
  EXPECT_EQ(executor.batches(), 0u);
}

TEST_F(ReconciliationControllerTest, ForcedRerunOnCleanTreeTransfersNothing) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  executor.reset();

  auto forced = sync.sync(std::nullopt, true);
  EXPECT_EQ(forced.state, SyncState::Done);
  EXPECT_EQ(forced.requested, 2u);
  EXPECT_EQ(forced.firstTransfer, 0u);
  EXPECT_EQ(executor.batches(), 0u);
}

TEST_F(ReconciliationControllerTest, IncrementalSyncFetchesOnlyTheDelta) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(1, false).state, SyncState::Done);
  EXPECT_EQ(read("a.txt"), "a1");
  executor.reset();

  auto report = sync.sync(std::nullopt, false);
  EXPECT_EQ(report.previous, 1);
  EXPECT_EQ(report.requested, 1u);
  EXPECT_EQ(executor.transferred(), std::vector<std::string>{"a.txt"});
  EXPECT_EQ(read("a.txt"), "a2");
}

TEST_F(ReconciliationControllerTest, ForceRepairsLocalModifications) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  test::writeFile(tracked / "a.txt", "edited locally");

  auto report = sync.sync(std::nullopt, true);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.firstTransfer, 1u);
  EXPECT_EQ(read("a.txt"), "a2");
}

TEST_F(ReconciliationControllerTest, StaleTransferIsRetriedWithForce) {
  executor.stale = {"a.txt"};
  auto report = controller().sync(std::nullopt, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.firstTransfer, 2u);
  EXPECT_EQ(report.secondTransfer, 1u);
  EXPECT_EQ(read("a.txt"), "a2");
}

TEST_F(ReconciliationControllerTest, VerificationDecidesOverExitStatus) {
  executor.failWith = "disconnected";
  auto report = controller().sync(std::nullopt, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(storedState().lastSynced, 2);
}

TEST_F(ReconciliationControllerTest, UnrepairableFileFailsWithoutCommit) {
  executor.broken = {"dir/b.txt"};
  auto sync = controller();
  auto report = sync.sync(std::nullopt, false);

  EXPECT_EQ(report.state, SyncState::Failed);
  EXPECT_EQ(sync.state(), SyncState::Failed);
  EXPECT_EQ(report.failedPaths, std::vector<std::string>{"dir/b.txt"});
  EXPECT_EQ(report.secondTransfer, 1u);
  EXPECT_EQ(storedState().lastSynced, 0);
}

TEST_F(ReconciliationControllerTest, DeletionsRemoveFiles) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  source.submit(test::deleteRecord(3, "dir/b.txt", 2));

  auto report = sync.sync(std::nullopt, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_FALSE(fs::exists(tracked / "dir/b.txt"));
  auto state = storedState();
  EXPECT_EQ(state.lastSynced, 3);
  EXPECT_EQ(state.haveList.count("dir/b.txt"), 0u);
}

TEST_F(ReconciliationControllerTest, ReverseSyncRestoresOlderChangelist) {
  submit(3, "c.txt", 1, "c1", Action::Add);
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  ASSERT_TRUE(fs::exists(tracked / "c.txt"));

  auto report = sync.sync(1, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.previous, 3);
  EXPECT_EQ(report.target, 1);
  EXPECT_EQ(read("a.txt"), "a1");
  EXPECT_FALSE(fs::exists(tracked / "c.txt"));
  EXPECT_EQ(read("dir/b.txt"), "b1");

  auto state = storedState();
  EXPECT_EQ(state.lastSynced, 1);
  EXPECT_EQ(state.haveList.count("c.txt"), 0u);
}

TEST_F(ReconciliationControllerTest, TargetPastHeadIsClamped) {
  auto report = controller().sync(99, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.target, 2);
}

TEST_F(ReconciliationControllerTest, NonPositiveTargetIsRejected) {
  auto sync = controller();
  EXPECT_THROW(sync.sync(0, false), Error);
  EXPECT_EQ(sync.state(), SyncState::Failed);
}

TEST_F(ReconciliationControllerTest, RequiresDepotPrefix) {
  config.depotPrefix.clear();
  EXPECT_THROW(controller(), ConfigError);
}

TEST_F(ReconciliationControllerTest, CleanMovesUntrackedFilesAside) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  test::writeFile(tracked / "junk" / "untracked.txt", "stray");
  test::writeFile(tracked / "a.txt", "edited locally");

  auto report = sync.clean(std::nullopt, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.cleaned, 1u);
  EXPECT_FALSE(fs::exists(tracked / "junk"));
  EXPECT_EQ(test::readFile(tracked / ".depotsync" / "cleaned" / "junk" /
                           "untracked.txt"),
            "stray");
  EXPECT_EQ(read("a.txt"), "a2");
  EXPECT_EQ(read("dir/b.txt"), "b1");
}

TEST_F(ReconciliationControllerTest, CleanCanDiscard) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  test::writeFile(tracked / "stray.bin", "x");

  auto report = sync.clean(std::nullopt, true);
  EXPECT_EQ(report.cleaned, 1u);
  EXPECT_FALSE(fs::exists(tracked / "stray.bin"));
  EXPECT_FALSE(fs::exists(tracked / ".depotsync" / "cleaned" / "stray.bin"));
}

TEST_F(ReconciliationControllerTest, TrustedHaveListStillRevertsFiles) {
  config.trustHaveList = true;
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  ASSERT_EQ(read("a.txt"), "a2");
  executor.reset();

  auto report = sync.sync(1, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.firstTransfer, 1u);
  EXPECT_EQ(executor.transferred(), std::vector<std::string>{"a.txt"});
  EXPECT_EQ(read("a.txt"), "a1");
  EXPECT_EQ(storedState().haveList.at("a.txt").changelist, 1);
}

TEST_F(ReconciliationControllerTest, TrustedHaveListPassesNewerRecords) {
  config.trustHaveList = true;
  auto sync = controller();
  ASSERT_EQ(sync.sync(1, false).state, SyncState::Done);
  submit(3, "c.txt", 1, "c1", Action::Add);
  executor.reset();

  auto report = sync.sync(std::nullopt, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.requested, 2u);
  EXPECT_EQ(read("a.txt"), "a2");
  EXPECT_EQ(read("c.txt"), "c1");
}

TEST_F(ReconciliationControllerTest, ForcedReverseSyncRemovesNewerFiles) {
  submit(3, "c.txt", 1, "c1", Action::Add);
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);

  auto report = sync.sync(1, true);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_FALSE(fs::exists(tracked / "c.txt"));
  EXPECT_EQ(read("a.txt"), "a1");
  EXPECT_EQ(storedState().haveList.count("c.txt"), 0u);
}

TEST_F(ReconciliationControllerTest, PhasesRunInOrderOverOneStream) {
  config.channelCapacity = 1;
  config.batchBytes = 64;
  for (int i = 0; i < 40; ++i) {
    auto name = "bulk/f" + std::to_string(i) + ".txt";
    submit(3, name, 1, "content " + std::to_string(i), Action::Add);
  }
  executor.stale = {"bulk/f7.txt"};

  ::testing::internal::CaptureStderr();
  auto report = controller().sync(std::nullopt, false);
  std::string log = ::testing::internal::GetCapturedStderr();

  ASSERT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.requested, 42u);
  EXPECT_EQ(report.secondTransfer, 1u);
  EXPECT_GT(executor.batches(), 20u);
  EXPECT_EQ(read("bulk/f39.txt"), "content 39");

  std::size_t pos = 0;
  for (const char *step :
       {"QUERYING -> FILTERING", "FILTERING -> TRANSFERRING",
        "TRANSFERRING -> VERIFYING", "VERIFYING -> TRANSFERRING",
        "TRANSFERRING -> VERIFYING", "VERIFYING -> DONE"}) {
    pos = log.find(step, pos);
    ASSERT_NE(pos, std::string::npos) << step << "\n" << log;
  }
}

TEST_F(ReconciliationControllerTest, CaseCollisionTransfersOneSpelling) {
  config.caseInsensitive = true;
  submit(3, "docs/README.txt", 1, "caps", Action::Add);
  submit(3, "docs/Readme.txt", 1, "mixed", Action::Add);

  auto sync = controller();
  auto report = sync.sync(std::nullopt, false);
  EXPECT_EQ(report.state, SyncState::Done);
  EXPECT_EQ(report.requested, 4u);
  EXPECT_EQ(report.firstTransfer, 3u);

  auto sent = executor.transferred();
  EXPECT_EQ(std::count(sent.begin(), sent.end(), "docs/README.txt"), 1);
  EXPECT_EQ(std::count(sent.begin(), sent.end(), "docs/Readme.txt"), 0);
  EXPECT_EQ(read("docs/README.txt"), "caps");
  EXPECT_EQ(storedState().lastSynced, 3);
}

TEST_F(ReconciliationControllerTest, CleanFailsOnUnreadableDirectory) {
  auto sync = controller();
  ASSERT_EQ(sync.sync(std::nullopt, false).state, SyncState::Done);
  test::writeFile(tracked / "loose.txt", "stray");
  test::writeFile(tracked / "locked" / "hidden.txt", "stray");

  LockedDirectory locked(tracked / "locked");
  if (!locked.enforced())
    GTEST_SKIP() << "permission bits are not enforced for this user";

  EXPECT_THROW(sync.clean(std::nullopt, false), Error);
  EXPECT_EQ(sync.state(), SyncState::Failed);
  EXPECT_EQ(read("loose.txt"), "stray");
  EXPECT_FALSE(fs::exists(tracked / ".depotsync" / "cleaned"));
}
