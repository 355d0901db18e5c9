#include "TestSupport.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/StateStore.hpp"
#include <gtest/gtest.h>

using namespace depotsync;
using test::deleteRecord;
using test::fileRecord;

TEST(StateStoreTest, FreshDirectoryHasNothingSynced) {
  test::TempDir dir;
  StateStore store(dir.str());
  store.open();
  auto state = store.load();
  EXPECT_EQ(state.lastSynced, 0);
  EXPECT_TRUE(state.haveList.empty());
  EXPECT_TRUE(std::filesystem::exists(StateStore::databasePath(dir.str())));
}

TEST(StateStoreTest, UnopenedStoreRefusesWork) {
  test::TempDir dir;
  StateStore store(dir.str());
  EXPECT_THROW(store.lastSynced(), StateError);
  EXPECT_THROW(store.commit(1, {}, true), StateError);
}

TEST(StateStoreTest, CommitPersistsAcrossInstances) {
  test::TempDir dir;
  {
    StateStore store(dir.str());
    store.open();
    store.commit(7,
                 {fileRecord(5, "a.txt", 2, "alpha"),
                  fileRecord(7, "b/c.txt", 1, "gamma")},
                 true);
  }
  StateStore reopened(dir.str());
  reopened.open();
  auto state = reopened.load();
  EXPECT_EQ(state.lastSynced, 7);
  ASSERT_EQ(state.haveList.size(), 2u);
  EXPECT_EQ(state.haveList.at("a.txt").changelist, 5);
  EXPECT_EQ(state.haveList.at("b/c.txt").digest, test::sha256("gamma"));
}

TEST(StateStoreTest, DeletionsLeaveTheHaveList) {
  test::TempDir dir;
  StateStore store(dir.str());
  store.open();
  store.commit(3, {fileRecord(3, "a.txt", 1, "x"), fileRecord(3, "b", 1, "y")},
               true);
  store.commit(4, {deleteRecord(4, "a.txt", 2), fileRecord(4, "b", 2, "z")},
               true);

  EXPECT_EQ(store.lastSynced(), 4);
  EXPECT_FALSE(store.haveEntry("a.txt"));
  auto b = store.haveEntry("b");
  ASSERT_TRUE(b);
  EXPECT_EQ(b->changelist, 4);
  EXPECT_EQ(b->digest, test::sha256("z"));
}

TEST(StateStoreTest, HaveListCanBeSkipped) {
  test::TempDir dir;
  StateStore store(dir.str());
  store.open();
  store.commit(9, {fileRecord(9, "a.txt", 1, "x")}, false);
  auto state = store.load();
  EXPECT_EQ(state.lastSynced, 9);
  EXPECT_TRUE(state.haveList.empty());
}
