#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "../droply_cli/src/cli/commands.hpp"
#include "../droply_cli/src/utils/prompt_decision_provider.hpp"
#include "../libdroply/include/archive_codec.hpp"
#include "../libdroply/include/file_utils.hpp"

namespace droply {

namespace fs = std::filesystem;

namespace {

class CliCommandsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root = fs::temp_directory_path() /
           ("droply-cli-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(root);
    fs::create_directories(root / "in");
    droply.platform(Platform::Server).moduleDirectory({});
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  fs::path input(const std::string& name, const Bytes& data) const {
    const auto path = root / "in" / name;
    write_file(path, data);
    return path;
  }

  fs::path textInput(const std::string& name, const std::string& text) const {
    return input(name, Bytes(text.begin(), text.end()));
  }

  Settings compressSettings(std::vector<fs::path> inputs, const std::string& algo) const {
    Settings settings;
    settings.command = Command::Compress;
    settings.inputs = std::move(inputs);
    settings.algo = algo;
    settings.output_dir = root / "packed";
    settings.on_conflict = "keep-both";
    return settings;
  }

  Settings decompressSettings(const fs::path& packed) const {
    Settings settings;
    settings.command = Command::Decompress;
    settings.inputs = {packed};
    settings.output_dir = root / "restored";
    settings.on_conflict = "keep-both";
    return settings;
  }

  // the only file run_compress wrote
  fs::path packedFile() const {
    std::vector<fs::path> found;
    for (const auto& entry : fs::directory_iterator(root / "packed")) {
      found.push_back(entry.path());
    }
    EXPECT_EQ(found.size(), 1U);
    return found.empty() ? fs::path() : found.front();
  }

  fs::path root;
  Droply droply;
  EventBus bus;
};

std::string sampleText(int lines) {
  std::string text;
  for (int i = 0; i < lines; ++i) {
    text += "row " + std::to_string(i) + ": the quick brown fox\n";
  }
  return text;
}

}  // namespace

TEST(InferRestoreOptions, FromDoubleSuffix) {
  const auto options = infer_restore_options("/nowhere/report.tar.gz", {}, {});
  EXPECT_EQ(options.compression, "gzip");
  EXPECT_EQ(options.archive, "tar");
}

TEST(InferRestoreOptions, ExplicitOptionsWin) {
  const auto options = infer_restore_options("/nowhere/report.gz", "brotli", "none");
  EXPECT_EQ(options.compression, "brotli");
  EXPECT_EQ(options.archive, "none");
}

TEST_F(CliCommandsTest, InferSniffsGzipWithoutSuffix) {
  const auto text = sampleText(50);
  const auto gz = droply.pipeline().compress(Bytes(text.begin(), text.end()), "gzip");
  const auto options = infer_restore_options(input("blob", gz), {}, {});
  EXPECT_EQ(options.compression, "gzip");
  EXPECT_FALSE(options.archive.has_value());
}

TEST_F(CliCommandsTest, InferFailsWithoutAnyHint) {
  const auto plain = textInput("notes", sampleText(5));
  EXPECT_THROW(static_cast<void>(infer_restore_options(plain, {}, {})), ValidationError);
  EXPECT_EQ(infer_restore_options(plain, "none", {}).compression, "none");
}

TEST_F(CliCommandsTest, BareZipSuffixFollowsContent) {
  const auto single = textInput("a.txt", sampleText(20));
  ASSERT_EQ(run_compress(compressSettings({single}, "zip"), droply, bus), 0);
  const auto container = packedFile();
  EXPECT_EQ(container.filename(), "a.txt.zip");
  const auto asCompression = infer_restore_options(container, {}, {});
  EXPECT_EQ(asCompression.compression, "zip");
  EXPECT_FALSE(asCompression.archive.has_value());

  const auto archive = input("set.zip", ZipArchiveCodec().pack({{"x.txt", Bytes(5, 'x')}, {"y.txt", Bytes(6, 'y')}},
                                                                 false, 6));
  const auto asArchive = infer_restore_options(archive, {}, {});
  EXPECT_EQ(asArchive.compression, "none");
  EXPECT_EQ(asArchive.archive, "zip");
}

TEST_F(CliCommandsTest, SingleFileRoundTrip) {
  const auto text = sampleText(200);
  const auto original = textInput("a.txt", text);
  for (const auto* algo : {"gzip", "brotli", "zip", "none"}) {
    fs::remove_all(root / "packed");
    fs::remove_all(root / "restored");

    ASSERT_EQ(run_compress(compressSettings({original}, algo), droply, bus), 0) << algo;
    auto restore = decompressSettings(packedFile());
    if (std::string(algo) == "none") {
      restore.algo = "none";
    }
    ASSERT_EQ(run_decompress(restore, droply, bus), 0) << algo;
    EXPECT_EQ(read_file(root / "restored" / "a.txt"), Bytes(text.begin(), text.end())) << algo;
  }
}

TEST_F(CliCommandsTest, ArchiveInputComesBackWhole) {
  const auto bundle = ZipArchiveCodec().pack({{"x.txt", Bytes(50, 'x')}, {"y.txt", Bytes(60, 'y')}}, false, 6);
  const auto path = input("bundle.zip", bundle);

  ASSERT_EQ(run_compress(compressSettings({path}, "gzip"), droply, bus), 0);
  const auto packed = packedFile();
  EXPECT_EQ(packed.filename(), "bundle.zip.gz");

  ASSERT_EQ(run_decompress(decompressSettings(packed), droply, bus), 0);
  EXPECT_EQ(read_file(root / "restored" / "bundle.zip"), bundle);
  EXPECT_FALSE(fs::exists(root / "restored" / "x.txt"));
}

TEST_F(CliCommandsTest, SeveralFilesRoundTrip) {
  const auto a = textInput("a.txt", sampleText(30));
  const auto b = textInput("b.csv", "id,value\n1,2\n");
  auto settings = compressSettings({a, b}, "brotli");
  settings.archive = "tar";

  ASSERT_EQ(run_compress(settings, droply, bus), 0);
  const auto packed = packedFile();
  EXPECT_EQ(packed.filename(), "a.tar.br");

  ASSERT_EQ(run_decompress(decompressSettings(packed), droply, bus), 0);
  EXPECT_EQ(read_file(root / "restored" / "a.txt"), read_file(a));
  EXPECT_EQ(read_file(root / "restored" / "b.csv"), read_file(b));
}

TEST_F(CliCommandsTest, ExistingOutputIsKept) {
  const auto original = textInput("a.txt", sampleText(10));
  ASSERT_EQ(run_compress(compressSettings({original}, "gzip"), droply, bus), 0);
  ASSERT_EQ(run_compress(compressSettings({original}, "gzip"), droply, bus), 0);
  EXPECT_TRUE(fs::exists(root / "packed" / "a.txt.gz"));
  EXPECT_TRUE(fs::exists(root / "packed" / "a.txt(1).gz"));
}

TEST_F(CliCommandsTest, ExitCodes) {
  const auto a = textInput("a.txt", sampleText(10));
  const auto b = textInput("b.txt", sampleText(11));

  auto badLevel = compressSettings({a}, "gzip");
  badLevel.level = 42;
  EXPECT_EQ(run_command(badLevel, droply, bus), 2);

  EXPECT_EQ(run_command(decompressSettings(root / "in" / "gone.gz"), droply, bus), 1);

  const Bytes corrupt = {0x1f, 0x8b, 0x08, 0x00, 0x01, 0x02, 0x03};
  EXPECT_EQ(run_command(decompressSettings(input("broken.gz", corrupt)), droply, bus), 1);

  droply.platform(Platform::Browser);
  auto tar = compressSettings({a, b}, "gzip");
  tar.archive = "tar";
  EXPECT_EQ(run_command(tar, droply, bus), 2);
  EXPECT_FALSE(fs::exists(root / "packed"));

  EXPECT_EQ(exit_code_for(ValidationError("bad")), 2);
  EXPECT_EQ(exit_code_for(UnsupportedPlatformError("elsewhere")), 2);
  EXPECT_EQ(exit_code_for(CorruptInputError("truncated")), 1);
  EXPECT_EQ(exit_code_for(FilesystemConflictExhausted("full")), 1);
}

TEST(DecisionProvider, AskWithoutTerminalKeepsBoth) {
  Settings settings;
  settings.on_conflict = "ask";
  EXPECT_EQ(make_decision_provider(settings, false)->decide("a.gz", "a.gz"), ConflictAction::KeepBoth);

  settings.on_conflict = "skip";
  EXPECT_EQ(make_decision_provider(settings, true)->decide("a.gz", "a.gz"), ConflictAction::Skip);
  settings.on_conflict = "overwrite";
  EXPECT_EQ(make_decision_provider(settings, false)->decide("a.gz", "a.gz"), ConflictAction::Replace);
}

TEST(DecisionProvider, PromptReadsAnswers) {
  std::istringstream in("s\nr\n\n");
  std::ostringstream out;
  PromptDecisionProvider prompt(in, out);
  EXPECT_EQ(prompt.decide("a.gz", "a.gz"), ConflictAction::Skip);
  EXPECT_EQ(prompt.decide("a.gz", "a.gz"), ConflictAction::Replace);
  EXPECT_EQ(prompt.decide("a.gz", "a.gz"), ConflictAction::KeepBoth);
  EXPECT_EQ(prompt.decide("a.gz", "a.gz"), ConflictAction::KeepBoth);
  EXPECT_NE(out.str().find("a.gz"), std::string::npos);
}

}  // namespace droply
