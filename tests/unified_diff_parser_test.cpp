#include <review/unified_diff_parser.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

#include "test_support/temporary_directory.h"

namespace review {
namespace {

using ::testing::_;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Field;
using ::testing::Optional;
using ::testing::Return;
using ::testing::Throw;

class MockDiffProvider : public DiffProvider {
public:
  MOCK_METHOD(DiffText, Diff,
              (const std::string &, const std::optional<std::string> &),
              (override));
};

const char kSingleFileDiff[] = "diff --git a/src/app.ts b/src/app.ts\n"
                               "index 1111111..2222222 100644\n"
                               "--- a/src/app.ts\n"
                               "+++ b/src/app.ts\n"
                               "@@ -1,2 +1,2 @@\n"
                               " line1\n"
                               "+added\n"
                               "-old\n";

TEST(UnifiedDiffParserTest, AssignsNewFileLineNumbers) {
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(kSingleFileDiff);

  ASSERT_EQ(diff.files.size(), 1u);
  const auto &file = diff.files.front();
  EXPECT_EQ(file.path, "src/app.ts");
  EXPECT_EQ(file.status, FileStatus::kModified);
  EXPECT_FALSE(file.old_path.has_value());
  EXPECT_EQ(file.additions, 1);
  EXPECT_EQ(file.deletions, 1);
  EXPECT_THAT(
      file.changes,
      ElementsAre(
          AllOf(Field(&Change::kind, ChangeKind::kContext),
                Field(&Change::line_number, 1),
                Field(&Change::content, "line1")),
          AllOf(Field(&Change::kind, ChangeKind::kAdd),
                Field(&Change::line_number, 2),
                Field(&Change::content, "added")),
          AllOf(Field(&Change::kind, ChangeKind::kDelete),
                Field(&Change::line_number, 3),
                Field(&Change::content, "old"))));
  EXPECT_EQ(diff.summary, "1 files changed, 1 insertions(+), 1 deletions(-)");
}

TEST(UnifiedDiffParserTest, CountsMatchChangeRecords) {
  const std::string text = "diff --git a/a.ts b/a.ts\n"
                           "@@ -10,4 +12,6 @@ function f() {\n"
                           " keep\n"
                           "+one\n"
                           "+two\n"
                           "-gone\n"
                           " keep\n"
                           "+three\n"
                           "@@ -40 +44 @@\n"
                           "-tail\n"
                           "+tail2\n"
                           "diff --git a/b.js b/b.js\n"
                           "@@ -1 +1 @@\n"
                           "+x\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 2u);
  int additions = 0;
  int deletions = 0;
  for (const auto &file : diff.files) {
    const auto adds = std::count_if(
        file.changes.begin(), file.changes.end(),
        [](const Change &change) { return change.kind == ChangeKind::kAdd; });
    const auto deletes = std::count_if(
        file.changes.begin(), file.changes.end(), [](const Change &change) {
          return change.kind == ChangeKind::kDelete;
        });
    EXPECT_EQ(file.additions, adds);
    EXPECT_EQ(file.deletions, deletes);
    additions += file.additions;
    deletions += file.deletions;
  }
  EXPECT_EQ(diff.total_additions, additions);
  EXPECT_EQ(diff.total_deletions, deletions);
  EXPECT_EQ(diff.total_additions, 5);
  EXPECT_EQ(diff.total_deletions, 2);
}

TEST(UnifiedDiffParserTest, LineNumbersNeverDecreaseWithinHunk) {
  const std::string text = "diff --git a/a.tsx b/a.tsx\n"
                           "@@ -3,5 +7,6 @@\n"
                           " a\n"
                           "-b\n"
                           "-c\n"
                           "+d\n"
                           " e\n"
                           "+f\n"
                           "+g\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 1u);
  const auto &changes = diff.files.front().changes;
  ASSERT_FALSE(changes.empty());
  EXPECT_EQ(changes.front().line_number, 7);
  for (std::size_t i = 1; i < changes.size(); ++i) {
    EXPECT_GE(changes[i].line_number, changes[i - 1].line_number);
  }
  EXPECT_EQ(changes.back().line_number, 11);
}

TEST(UnifiedDiffParserTest, LeadingDeleteTakesHunkNewStart) {
  const std::string text = "diff --git a/a.ts b/a.ts\n"
                           "@@ -5,3 +5,2 @@\n"
                           "-gone\n"
                           " kept\n"
                           "+added\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 1u);
  EXPECT_THAT(diff.files.front().changes,
              ElementsAre(Field(&Change::line_number, 5),
                          Field(&Change::line_number, 5),
                          Field(&Change::line_number, 6)));
}

TEST(UnifiedDiffParserTest, KeepsOnlyFilesWithSupportedExtensions) {
  const std::string text = "diff --git a/a.ts b/a.ts\n@@ -1 +1 @@\n+a\n"
                           "diff --git a/b.py b/b.py\n@@ -1 +1 @@\n+b\n"
                           "diff --git a/c.jsx b/c.jsx\n@@ -1 +1 @@\n+c\n"
                           "diff --git a/d.ts.orig b/d.ts.orig\n@@ -1 +1 @@\n"
                           "+d\n"
                           "diff --git a/README.md b/README.md\n@@ -1 +1 @@\n"
                           "+e\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 2u);
  EXPECT_EQ(diff.files[0].path, "a.ts");
  EXPECT_EQ(diff.files[1].path, "c.jsx");
  EXPECT_EQ(diff.total_additions, 2);
}

TEST(UnifiedDiffParserTest, HonoursCustomExtensions) {
  const std::string text = "diff --git a/a.ts b/a.ts\n@@ -1 +1 @@\n+a\n"
                           "diff --git a/b.py b/b.py\n@@ -1 +1 @@\n+b\n";
  const UnifiedDiffParser parser({".py"});
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 1u);
  EXPECT_EQ(diff.files.front().path, "b.py");
  EXPECT_TRUE(parser.IsSupported("tools/x.py"));
  EXPECT_FALSE(parser.IsSupported("x.ts"));
}

TEST(UnifiedDiffParserTest, DetectsAddedDeletedAndRenamedFiles) {
  const std::string text = "diff --git a/new.ts b/new.ts\n"
                           "new file mode 100644\n"
                           "index 0000000..1111111\n"
                           "--- /dev/null\n"
                           "+++ b/new.ts\n"
                           "@@ -0,0 +1,2 @@\n"
                           "+export const a = 1;\n"
                           "+export const b = 2;\n"
                           "diff --git a/old.ts b/old.ts\n"
                           "deleted file mode 100644\n"
                           "--- a/old.ts\n"
                           "+++ /dev/null\n"
                           "@@ -1 +0,0 @@\n"
                           "-gone\n"
                           "diff --git a/before.js b/after.js\n"
                           "similarity index 90%\n"
                           "rename from before.js\n"
                           "rename to after.js\n"
                           "@@ -1 +1 @@\n"
                           "-a\n"
                           "+b\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 3u);
  EXPECT_EQ(diff.files[0].status, FileStatus::kAdded);
  EXPECT_EQ(diff.files[0].changes.front().line_number, 1);
  EXPECT_EQ(diff.files[1].status, FileStatus::kDeleted);
  EXPECT_EQ(diff.files[1].deletions, 1);
  EXPECT_EQ(diff.files[2].status, FileStatus::kRenamed);
  EXPECT_EQ(diff.files[2].path, "after.js");
  EXPECT_THAT(diff.files[2].old_path, Optional(Eq("before.js")));
}

TEST(UnifiedDiffParserTest, DropsMalformedBlocksAndKeepsTheRest) {
  const std::string text = "diff --git garbage\n"
                           "@@ -1 +1 @@\n"
                           "+lost\n"
                           "diff --git a/kept.ts b/kept.ts\n"
                           "@@ -1 +1 @@\n"
                           "+kept\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 1u);
  EXPECT_EQ(diff.files.front().path, "kept.ts");
  EXPECT_EQ(diff.total_additions, 1);
}

TEST(UnifiedDiffParserTest, IgnoresChangeLinesBeforeTheFirstHunk) {
  const std::string text = "diff --git a/a.ts b/a.ts\n"
                           "--- a/a.ts\n"
                           "+++ b/a.ts\n"
                           "+not a change\n"
                           "@@ -1 +1 @@\n"
                           "+real\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 1u);
  EXPECT_EQ(diff.files.front().additions, 1);
  EXPECT_EQ(diff.files.front().changes.front().content, "real");
}

TEST(UnifiedDiffParserTest, StripsCarriageReturns) {
  const std::string text = "diff --git a/a.ts b/a.ts\r\n"
                           "@@ -1 +1 @@\r\n"
                           "+value\r\n";
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(text);

  ASSERT_EQ(diff.files.size(), 1u);
  EXPECT_EQ(diff.files.front().path, "a.ts");
  EXPECT_EQ(diff.files.front().changes.front().content, "value");
}

TEST(UnifiedDiffParserTest, EmptyInputYieldsEmptyDiff) {
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse("");

  EXPECT_TRUE(diff.files.empty());
  EXPECT_EQ(diff.summary, "0 files changed, 0 insertions(+), 0 deletions(-)");
}

TEST(UnifiedDiffParserTest, PrefersProvidedStatForSummary) {
  const UnifiedDiffParser parser;
  const auto diff = parser.Parse(kSingleFileDiff, DiffStat{4, 20, 3});

  EXPECT_EQ(diff.summary, "4 files changed, 20 insertions(+), 3 deletions(-)");
  EXPECT_EQ(diff.total_additions, 1);
}

TEST(UnifiedDiffParserTest, ParsesDiffFiles) {
  test::TemporaryDirectory directory;
  const auto path = directory.AddFile("change.diff", kSingleFileDiff);

  const UnifiedDiffParser parser;
  const auto diff = parser.ParseFile(path);

  ASSERT_EQ(diff.files.size(), 1u);
  EXPECT_EQ(diff.files.front().path, "src/app.ts");
}

TEST(UnifiedDiffParserTest, MissingDiffFileIsUnreadable) {
  test::TemporaryDirectory directory;
  const UnifiedDiffParser parser;
  EXPECT_THROW(parser.ParseFile(directory.root() / "missing.diff"),
               DiffUnreadable);
}

TEST(UnifiedDiffParserTest, ParsesCommitThroughProvider) {
  MockDiffProvider provider;
  EXPECT_CALL(provider, Diff("abc123", Eq(std::nullopt)))
      .WillOnce(Return(DiffText{kSingleFileDiff, DiffStat{1, 1, 1}}));

  const UnifiedDiffParser parser;
  const auto diff = parser.ParseCommit(provider, "abc123");

  ASSERT_EQ(diff.files.size(), 1u);
  EXPECT_EQ(diff.summary, "1 files changed, 1 insertions(+), 1 deletions(-)");
}

TEST(UnifiedDiffParserTest, ProviderFailureIsUnreadable) {
  MockDiffProvider provider;
  EXPECT_CALL(provider, Diff(_, _))
      .WillOnce(Throw(std::runtime_error("fatal: bad revision 'nope'")));

  const UnifiedDiffParser parser;
  try {
    parser.ParseCommit(provider, "nope");
    FAIL() << "Expected DiffUnreadable";
  } catch (const DiffUnreadable &error) {
    EXPECT_THAT(error.what(), ::testing::HasSubstr("bad revision"));
  }
}

} // namespace
} // namespace review
