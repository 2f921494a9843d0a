#include <folly/experimental/TestUtil.h>
#include <gtest/gtest.h>

#include "common/utils/FileUtils.h"
#include "migration/scheduler/InputIngestor.h"
#include "tests/GtestHelpers.h"

namespace ostmig::migration::test {
namespace {

class TestInputIngestor : public ::testing::Test {
 protected:
  Path dir() const { return Path(tmp_.path().string()); }

  void write(const String &name, const String &content) { ASSERT_OK(storeToFile(dir() / name, content)); }

  folly::test::TemporaryDirectory tmp_;
};

TEST(TestParseLine, Accepted) {
  ASSERT_RESULT_EQ((MigrateItem{"OST1", "dir/file.bin"}), InputIngestor::parseLine("OST1 dir/file.bin"));
  ASSERT_RESULT_EQ((MigrateItem{"3", "/mnt/fs/a"}), InputIngestor::parseLine("  3\t /mnt/fs/a \r"));
}

TEST(TestParseLine, Rejected) {
  ASSERT_ERROR(InputIngestor::parseLine("OST1\tfoo\tbar"), MigrationCode::kMalformedInputLine);
  ASSERT_ERROR(InputIngestor::parseLine("OST1"), MigrationCode::kMalformedInputLine);
  ASSERT_ERROR(InputIngestor::parseLine(""), MigrationCode::kMalformedInputLine);
  ASSERT_ERROR(InputIngestor::parseLine("   "), MigrationCode::kMalformedInputLine);
  ASSERT_ERROR(InputIngestor::parseLine("OST1 a;b"), MigrationCode::kMalformedInputLine);
  ASSERT_ERROR(InputIngestor::parseLine(";"), MigrationCode::kMalformedInputLine);
}

TEST_F(TestInputIngestor, SkipMalformedLines) {
  write("batch.input", "OST1\tfoo\tbar\nOST1 dir/file.bin\n");

  MigrateItemCache cache;
  InputIngestor ingestor(dir());
  auto stats = ingestor.ingest(cache);
  ASSERT_OK(stats);
  ASSERT_EQ(stats->files, 1u);
  ASSERT_EQ(stats->loaded, 1u);
  ASSERT_EQ(stats->skipped, 1u);

  auto *items = cache.find("OST1");
  ASSERT_NE(items, nullptr);
  ASSERT_EQ(*items, (MigrateItemCache::Items{MigrateItem{"OST1", "dir/file.bin"}}));
}

TEST_F(TestInputIngestor, RenameProcessedFiles) {
  write("b.input", "2 /f3\n");
  write("a.input", "1 /f1\n\n1 /f2");
  write("c.txt", "9 /ignored\n");
  write("d.input.done", "9 /already-done\n");

  MigrateItemCache cache;
  InputIngestor ingestor(dir());
  auto stats = ingestor.ingest(cache);
  ASSERT_OK(stats);
  ASSERT_EQ(stats->files, 2u);
  ASSERT_EQ(stats->loaded, 3u);
  // the empty line in the middle of a.input
  ASSERT_EQ(stats->skipped, 1u);

  ASSERT_EQ(cache.size("1"), 2u);
  ASSERT_EQ(cache.size("2"), 1u);
  ASSERT_EQ(cache.find("9"), nullptr);
  ASSERT_EQ(cache.pop("1")->path, "/f2");

  ASSERT_FALSE(boost::filesystem::exists(dir() / "a.input"));
  ASSERT_FALSE(boost::filesystem::exists(dir() / "b.input"));
  ASSERT_TRUE(boost::filesystem::exists(dir() / "a.input.done"));
  ASSERT_TRUE(boost::filesystem::exists(dir() / "b.input.done"));
  ASSERT_TRUE(boost::filesystem::exists(dir() / "c.txt"));

  // nothing new
  stats = ingestor.ingest(cache);
  ASSERT_OK(stats);
  ASSERT_EQ(stats->files, 0u);
  ASSERT_EQ(cache.totalSize(), 2u);
}

TEST_F(TestInputIngestor, FailsOnMissingDirectory) {
  MigrateItemCache cache;
  InputIngestor ingestor(dir() / "missing");
  ASSERT_ERROR(ingestor.ingest(cache), StatusCode::kIOError);
}

TEST_F(TestInputIngestor, DoneFileAlreadyExists) {
  write("a.input", "1 /f1\n");
  write("a.input.done", "1 /old\n");

  MigrateItemCache cache;
  InputIngestor ingestor(dir());
  auto stats = ingestor.ingest(cache);
  ASSERT_OK(stats);
  ASSERT_EQ(stats->files, 1u);
  ASSERT_EQ(cache.size("1"), 1u);
  ASSERT_FALSE(boost::filesystem::exists(dir() / "a.input"));
  ASSERT_RESULT_EQ(String("1 /old\n"), loadFile(dir() / "a.input.done"));
  ASSERT_RESULT_EQ(String("1 /f1\n"), loadFile(dir() / "a.input.done.1"));

  // the same name arrives a third time
  write("a.input", "1 /f2\n");
  ASSERT_OK(ingestor.ingest(cache));
  ASSERT_EQ(cache.size("1"), 2u);
  ASSERT_TRUE(boost::filesystem::exists(dir() / "a.input.done.1"));
  ASSERT_RESULT_EQ(String("1 /f2\n"), loadFile(dir() / "a.input.done.2"));

  // nothing left to merge on the next scan
  auto again = ingestor.ingest(cache);
  ASSERT_OK(again);
  ASSERT_EQ(again->files, 0u);
  ASSERT_EQ(cache.size("1"), 2u);
}

}  // namespace
}  // namespace ostmig::migration::test
