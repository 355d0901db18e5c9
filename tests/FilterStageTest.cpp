#include "TestSupport.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FilterStage.hpp"
#include "depotsync/Pipeline.hpp"
#include <gtest/gtest.h>

using namespace depotsync;
using test::fileRecord;
using test::deleteRecord;

class FilterStageTest : public ::testing::Test {
protected:
  test::TempDir dir;
  WorkspaceScanner scanner{dir.str()};

  FilterContext context(const LocalState *state = nullptr,
                        bool caseInsensitive = false) {
    FilterContext c;
    c.scanner = &scanner;
    c.state = state;
    c.caseInsensitive = caseInsensitive;
    return c;
  }

  std::vector<PredicateSpec> predicates(std::initializer_list<const char *> args) {
    std::vector<PredicateSpec> out;
    for (const char *arg : args)
      out.push_back(parsePredicate(arg));
    return out;
  }
};

TEST_F(FilterStageTest, ParsesPredicates) {
  auto spec = parsePredicate("--not-checksum");
  EXPECT_EQ(spec.kind, Predicate::Checksum);
  EXPECT_TRUE(spec.inverted);
  EXPECT_EQ(parsePredicate("--havelist").kind, Predicate::HaveList);
  EXPECT_THROW(parsePredicate("--size"), ConfigError);
  EXPECT_THROW(parsePredicate("checksum"), ConfigError);
}

TEST_F(FilterStageTest, RequiresAPredicate) {
  EXPECT_THROW(FilterStage(FilterStage::Mode::Drop, {}, context()),
               ConfigError);
  EXPECT_THROW(FilterStage(FilterStage::Mode::Drop,
                           predicates({"--checksum"}), FilterContext{}),
               ConfigError);
}

TEST_F(FilterStageTest, DropChecksumKeepsOnlyMismatches) {
  test::writeFile(dir.path() / "same.txt", "hello");
  test::writeFile(dir.path() / "changed.txt", "old");

  RecordList input = {
      fileRecord(2, "same.txt", 1, "hello"),
      fileRecord(2, "changed.txt", 2, "new"),
      fileRecord(2, "missing.txt", 1, "x"),
      deleteRecord(2, "gone.txt", 3),
      deleteRecord(2, "same.txt", 2),
  };

  Pipeline pipeline;
  auto &stage = pipeline.emplace<FilterStage>(
      FilterStage::Mode::Drop, predicates({"--checksum"}), context());
  EXPECT_EQ(stage.name(), "drop --checksum");
  auto output = pipeline.run(input);

  EXPECT_EQ(test::pathsOf(output),
            (std::vector<std::string>{"changed.txt", "missing.txt",
                                      "same.txt"}));
  EXPECT_TRUE(output.back().isDeletion());
}

TEST_F(FilterStageTest, ChecksumIgnoresUtf8ByteOrderMark) {
  test::writeFile(dir.path() / "bom.txt", "\xEF\xBB\xBFhello");
  auto record = fileRecord(1, "bom.txt", 1, "hello");
  record.fileType = "utf8";
  EXPECT_TRUE(scanner.matchesChecksum(record));
  record.fileType = "text";
  EXPECT_FALSE(scanner.matchesChecksum(record));
}

TEST_F(FilterStageTest, ExistenceAndDeletes) {
  test::writeFile(dir.path() / "here.txt", "x");
  FilterStage keep(FilterStage::Mode::Keep, predicates({"--existence"}),
                   context());
  EXPECT_TRUE(keep.accept(fileRecord(1, "here.txt", 1, "other content")));
  EXPECT_FALSE(keep.accept(fileRecord(1, "absent.txt", 1, "x")));
  EXPECT_TRUE(keep.accept(deleteRecord(1, "absent.txt", 2)));

  FilterStage dropDeletes(FilterStage::Mode::Drop, predicates({"--deletes"}),
                          FilterContext{});
  EXPECT_FALSE(dropDeletes.accept(deleteRecord(1, "a", 2)));
  EXPECT_TRUE(dropDeletes.accept(fileRecord(1, "a", 1, "x")));
}

TEST_F(FilterStageTest, KeepAnyAndInversion) {
  FilterStage stage(FilterStage::Mode::KeepAny,
                    predicates({"--deletes", "--not-existence"}), context());
  test::writeFile(dir.path() / "here.txt", "x");
  EXPECT_TRUE(stage.accept(deleteRecord(1, "here.txt", 2)));
  EXPECT_TRUE(stage.accept(fileRecord(1, "absent.txt", 1, "x")));
  EXPECT_FALSE(stage.accept(fileRecord(1, "here.txt", 1, "x")));
  EXPECT_EQ(stage.name(), "keep-any --deletes --not-existence");
}

TEST_F(FilterStageTest, HaveListMatchesAtOrAfterChange) {
  LocalState state;
  state.lastSynced = 5;
  state.haveList["a.txt"] = HaveEntry{"a.txt", 5, ""};
  FilterStage stage(FilterStage::Mode::Drop, predicates({"--havelist"}),
                    context(&state));
  EXPECT_FALSE(stage.accept(fileRecord(5, "a.txt", 2, "x")));
  EXPECT_TRUE(stage.accept(fileRecord(6, "a.txt", 3, "x")));
  EXPECT_TRUE(stage.accept(fileRecord(3, "b.txt", 1, "x")));
}

TEST_F(FilterStageTest, CaseKeepsOneSpellingPerPath) {
  test::writeFile(dir.path() / "Docs" / "Readme.md", "x");
  FilterStage stage(FilterStage::Mode::Keep, predicates({"--case"}),
                    context(nullptr, true));
  // Existing path: only the on-disk spelling survives.
  EXPECT_TRUE(stage.accept(fileRecord(1, "Docs/Readme.md", 1, "x")));
  // Missing path: first spelling wins.
  EXPECT_TRUE(stage.accept(fileRecord(1, "new/File.txt", 1, "x")));
  EXPECT_FALSE(stage.accept(fileRecord(1, "NEW/file.txt", 1, "x")));
}

TEST_F(FilterStageTest, CaseAcceptsEverythingOnCaseSensitiveFilesystems) {
  FilterStage stage(FilterStage::Mode::Keep, predicates({"--case"}),
                    context(nullptr, false));
  EXPECT_TRUE(stage.accept(fileRecord(1, "a/File.txt", 1, "x")));
  EXPECT_TRUE(stage.accept(fileRecord(1, "A/file.txt", 1, "x")));
}

TEST_F(FilterStageTest, ProgressReportsAndForwards) {
  std::vector<std::pair<std::size_t, bool>> reports;
  Pipeline pipeline;
  auto &progress = pipeline.emplace<ProgressStage>(
      "records", 2,
      [&reports](const std::string &, std::size_t count, bool finished) {
        reports.emplace_back(count, finished);
      });
  RecordList input;
  for (int i = 1; i <= 5; ++i)
    input.push_back(fileRecord(i, "f" + std::to_string(i), 1, "x"));
  auto output = pipeline.run(input);

  EXPECT_EQ(output.size(), 5u);
  EXPECT_EQ(progress.count(), 5u);
  std::vector<std::pair<std::size_t, bool>> expected = {
      {2, false}, {4, false}, {5, true}};
  EXPECT_EQ(reports, expected);
}

TEST_F(FilterStageTest, FailStageReportsSurvivors) {
  Pipeline pipeline;
  pipeline.emplace<FailStage>();
  EXPECT_NO_THROW(pipeline.run(RecordList{}));

  Pipeline failing;
  failing.emplace<FailStage>();
  auto broken = fileRecord(1, "broken.txt", 1, "x");
  broken.transferError = "exit status 1";
  try {
    failing.run(RecordList{broken, fileRecord(1, "other.txt", 1, "y")});
    FAIL() << "expected VerificationFailure";
  } catch (const VerificationFailure &e) {
    EXPECT_EQ(e.total(), 2u);
    EXPECT_EQ(e.paths(),
              (std::vector<std::string>{"broken.txt", "other.txt"}));
  }
}
