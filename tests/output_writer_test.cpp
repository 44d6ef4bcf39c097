#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "../libdroply/include/event_bus.hpp"
#include "../libdroply/include/events.hpp"
#include "../libdroply/include/file_utils.hpp"
#include "../libdroply/include/output_writer.hpp"

namespace droply {

namespace fs = std::filesystem;

namespace {

class OutputWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("droply-writer-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    bus.subscribe<OutputWrittenEvent>([this](const OutputWrittenEvent& e) { written.push_back(e); });
    bus.subscribe<OutputSkippedEvent>([this](const OutputSkippedEvent&) { ++skipped; });
    bus.subscribe<OutputErrorEvent>([this](const OutputErrorEvent&) { ++errors; });
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  fs::path dir;
  EventBus bus;
  std::vector<OutputWrittenEvent> written;
  int skipped = 0;
  int errors = 0;
};

Bytes bytes(std::string_view s) { return Bytes(s.begin(), s.end()); }

}  // namespace

TEST_F(OutputWriterTest, WritesFilesAndPublishes) {
  const ConflictResolver resolver;
  OutputWriter writer(resolver, &bus);
  const std::vector<FileRecord> files = {{"a.txt", bytes("alpha")}, {"sub/b.txt", bytes("beta")}};

  const auto report = writer.write_all(dir, files);
  EXPECT_EQ(report.written.size(), 2U);
  EXPECT_EQ(report.failed, 0U);
  EXPECT_EQ(read_file(dir / "a.txt"), bytes("alpha"));
  EXPECT_EQ(read_file(dir / "sub" / "b.txt"), bytes("beta"));
  ASSERT_EQ(written.size(), 2U);
  EXPECT_EQ(written[0].size, 5U);
  EXPECT_FALSE(written[0].replaced);
}

TEST_F(OutputWriterTest, KeepBothRenames) {
  write_file(dir / "report.tar.gz", bytes("old"));
  const ConflictResolver resolver;
  OutputWriter writer(resolver, &bus);

  const auto target = writer.write(dir / "report.tar.gz", bytes("new"));
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(*target, dir / "report(1).tar.gz");
  EXPECT_EQ(read_file(dir / "report.tar.gz"), bytes("old"));
  EXPECT_EQ(read_file(*target), bytes("new"));
}

TEST_F(OutputWriterTest, ReplaceOverwrites) {
  write_file(dir / "a.gz", bytes("old"));
  const ConflictResolver resolver(std::make_shared<AutoDecisionProvider>(ConflictAction::Replace));
  OutputWriter writer(resolver, &bus);

  EXPECT_EQ(writer.write(dir / "a.gz", bytes("new!")), dir / "a.gz");
  EXPECT_EQ(read_file(dir / "a.gz"), bytes("new!"));
  ASSERT_EQ(written.size(), 1U);
  EXPECT_TRUE(written[0].replaced);
}

TEST_F(OutputWriterTest, SkipContinuesWithNextFile) {
  write_file(dir / "a.txt", bytes("old"));
  const ConflictResolver resolver(std::make_shared<AutoDecisionProvider>(ConflictAction::Skip));
  OutputWriter writer(resolver, &bus);

  const auto report = writer.write_all(dir, {{"a.txt", bytes("new")}, {"b.txt", bytes("b")}});
  EXPECT_EQ(report.skipped.size(), 1U);
  EXPECT_EQ(report.written.size(), 1U);
  EXPECT_EQ(skipped, 1);
  EXPECT_EQ(read_file(dir / "a.txt"), bytes("old"));
  EXPECT_TRUE(fs::exists(dir / "b.txt"));
}

TEST_F(OutputWriterTest, RejectsPathTraversal) {
  const ConflictResolver resolver;
  OutputWriter writer(resolver, &bus);

  const auto report = writer.write_all(dir / "out", {{"../escape.txt", bytes("x")}, {"ok.txt", bytes("y")}});
  EXPECT_EQ(report.failed, 1U);
  EXPECT_EQ(report.written.size(), 1U);
  EXPECT_EQ(errors, 1);
  EXPECT_FALSE(fs::exists(dir / "escape.txt"));
}

TEST(OutputWriter, SafeJoin) {
  const fs::path base = "/tmp/droply-out";
  EXPECT_EQ(OutputWriter::safe_join(base, "a.txt"), base / "a.txt");
  EXPECT_EQ(OutputWriter::safe_join(base, "/abs/a.txt"), base / "abs" / "a.txt");
  EXPECT_EQ(OutputWriter::safe_join(base, "x\\y.txt"), base / "x" / "y.txt");
  EXPECT_FALSE(OutputWriter::safe_join(base, "../a.txt").has_value());
  EXPECT_FALSE(OutputWriter::safe_join(base, "a/../../b").has_value());
  EXPECT_FALSE(OutputWriter::safe_join(base, "").has_value());
  EXPECT_FALSE(OutputWriter::safe_join(base, ".").has_value());
}

}  // namespace droply
