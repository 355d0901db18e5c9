#include "TestSupport.hpp"
#include "depotsync/CommandTransferExecutor.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FstatSource.hpp"
#include "depotsync/Process.hpp"
#include <gtest/gtest.h>

using namespace depotsync;
using test::fileRecord;

TEST(ProcessTest, CollectsOutputAndExitCode) {
  auto result = Process::run({"/bin/sh", "-c", "cat; echo oops >&2; exit 3"},
                             "fed through stdin\n");
  EXPECT_EQ(result.exitCode, 3);
  EXPECT_EQ(result.out, "fed through stdin\n");
  EXPECT_EQ(result.err, "oops\n");
}

TEST(ProcessTest, LargeInputDoesNotDeadlock) {
  std::string input(1 << 20, 'x');
  auto result = Process::run({"/bin/sh", "-c", "cat"}, input);
  EXPECT_EQ(result.exitCode, 0);
  EXPECT_EQ(result.out.size(), input.size());
}

TEST(ProcessTest, RunsInWorkingDirectory) {
  test::TempDir dir;
  auto result = Process::run({"/bin/sh", "-c", "pwd"}, "", dir.str());
  EXPECT_EQ(result.exitCode, 0);
  EXPECT_NE(result.out.find(dir.path().filename().string()),
            std::string::npos);
}

TEST(ProcessTest, MissingProgramThrows) {
  EXPECT_THROW(Process::run({"/nonexistent/program"}, ""), Error);
}

TEST(ProcessTest, SubstitutesPlaceholders) {
  auto args = substitute({"fstat", "{prefix}/...@{from},@{to}", "{to}"},
                         {{"prefix", "//depot"}, {"from", "3"}, {"to", "9"}});
  EXPECT_EQ(args, (std::vector<std::string>{"fstat", "//depot/...@3,@9",
                                            "9"}));
}

TEST(CommandTransferExecutorTest, EscapesReservedCharacters) {
  EXPECT_EQ(CommandTransferExecutor::escapePath("a%b@c#d*e"),
            "a%25b%40c%23d%2Ae");
  CommandTransferExecutor executor({"true"}, {"-f"}, "//depot/main/", "");
  EXPECT_EQ(executor.fileSpec(fileRecord(4, "dir/f@1.txt", 2, "x")),
            "//depot/main/dir/f%401.txt#2");
}

TEST(CommandTransferExecutorTest, RequiresCommand) {
  EXPECT_THROW(CommandTransferExecutor({}, {"-f"}, "//depot", ""),
               ConfigError);
}

TEST(CommandTransferExecutorTest, WritesSpecsAndForceArguments) {
  test::TempDir dir;
  CommandTransferExecutor executor(
      {"/bin/sh", "-c", "cat > specs.txt; echo \"$@\" > args.txt", "sh"},
      {"-f", "-q"}, "//depot/main", dir.str());

  Batch batch;
  batch.records = {fileRecord(1, "a.txt", 1, "x"),
                   fileRecord(2, "b c.txt", 3, "y")};
  auto normal = executor.execute(batch, TransferMode::Normal);
  EXPECT_TRUE(normal.success);
  EXPECT_EQ(test::readFile(dir.path() / "specs.txt"),
            "//depot/main/a.txt#1\n//depot/main/b c.txt#3\n");
  EXPECT_EQ(test::readFile(dir.path() / "args.txt"), "\n");

  auto forced = executor.execute(batch, TransferMode::Force);
  EXPECT_TRUE(forced.success);
  EXPECT_EQ(test::readFile(dir.path() / "args.txt"), "-f -q\n");
}

TEST(CommandTransferExecutorTest, ReportsFirstErrorLine) {
  CommandTransferExecutor failing(
      {"/bin/sh", "-c", "cat >/dev/null; echo 'no such file' >&2; "
                        "echo more >&2; exit 1"},
      {}, "//depot", "");
  Batch batch;
  batch.records = {fileRecord(1, "a.txt", 1, "x")};
  auto result = failing.execute(batch, TransferMode::Normal);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.message, "no such file");

  CommandTransferExecutor silent({"/bin/sh", "-c", "exit 2"}, {}, "//depot",
                                 "");
  auto quiet = silent.execute(batch, TransferMode::Normal);
  EXPECT_FALSE(quiet.success);
  EXPECT_EQ(quiet.message, "exit status 2");
}

TEST(CommandTransferExecutorTest, PinsFileErrorsOnTheirRecords) {
  CommandTransferExecutor failing(
      {"/bin/sh", "-c",
       "cat >/dev/null; "
       "echo '//depot/main/b - c.txt#3 - no such file(s).' >&2; "
       "echo '//depot/main/a.txt.bak#1 - unrelated' >&2; exit 1"},
      {}, "//depot/main", "");
  Batch batch;
  batch.records = {fileRecord(1, "a.txt", 1, "x"),
                   fileRecord(2, "b - c.txt", 3, "y")};
  auto result = failing.execute(batch, TransferMode::Normal);

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.recordErrors.size(), 1u);
  EXPECT_EQ(result.recordErrors.at("b - c.txt"), "no such file(s).");
  EXPECT_FALSE(result.errorFor("a.txt"));
  EXPECT_EQ(result.errorFor("b - c.txt").value_or(""), "no such file(s).");
}

TEST(CommandTransferExecutorTest, WarningsOnSuccessFailNothing) {
  CommandTransferExecutor warning(
      {"/bin/sh", "-c",
       "cat >/dev/null; echo '//depot/a.txt#1 - file(s) up-to-date.' >&2"},
      {}, "//depot", "");
  Batch batch;
  batch.records = {fileRecord(1, "a.txt", 1, "x")};
  auto result = warning.execute(batch, TransferMode::Normal);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.recordErrors.empty());
  EXPECT_FALSE(result.errorFor("a.txt"));
}

TEST(CommandFstatSourceTest, ParsesAndBoundsRecords) {
  CommandFstatSource source(
      {"/bin/sh", "-c",
       "printf '3,a.txt,2,edit,text,0,\\n9,b.txt,1,add,text,0,\\n"
       "1,old.txt,1,add,text,0,\\n'",
       "sh", "{prefix}", "{from}", "{to}"},
      {"/bin/sh", "-c", "echo 42"});
  auto records = source.changes("//depot/main", 1, 5);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].path, "a.txt");
  EXPECT_EQ(source.head("//depot/main"), 42);
}

TEST(CommandFstatSourceTest, RetriesThenFails) {
  CommandFstatSource source({"/bin/sh", "-c", "exit 1"},
                            {"/bin/sh", "-c", "echo not-a-number"}, "", 2);
  EXPECT_THROW(source.changes("//depot", 0, 5), SourceError);
  EXPECT_THROW(source.head("//depot"), SourceError);
}

TEST(CommandFstatSourceTest, KeepsNewestPerPath) {
  auto records = latestPerPath({fileRecord(2, "a", 1, "x"),
                                fileRecord(5, "a", 2, "y"),
                                fileRecord(3, "b", 1, "z")});
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].path, "a");
  EXPECT_EQ(records[0].change, 5);
  EXPECT_EQ(records[1].path, "b");
}
