#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../libdroply/include/archive_codec.hpp"
#include "../libdroply/include/errors.hpp"
#include "../libdroply/include/file_type.hpp"

namespace droply {

namespace {

FileRecord textFile(std::string name, std::size_t size, char fill) {
  return FileRecord{std::move(name), Bytes(size, static_cast<std::uint8_t>(fill))};
}

std::vector<FileRecord> sampleFiles() {
  return {textFile("a.txt", 500, 'a'), textFile("b.json", 300, 'b'), textFile("notes/c.md", 10, 'c')};
}

}  // namespace

TEST(ZipArchiveCodec, PackUnpackKeepsNamesAndOrder) {
  const ZipArchiveCodec codec;
  const auto files = sampleFiles();
  const auto packed = codec.pack(files, false, 6);
  EXPECT_EQ(sniff_payload_format(packed), PayloadFormat::Zip);
  EXPECT_EQ(codec.unpack(packed), files);
}

TEST(ZipArchiveCodec, CompressInsideShrinksEntries) {
  const ZipArchiveCodec codec;
  const auto files = sampleFiles();
  const auto stored = codec.pack(files, false, 6);
  const auto deflated = codec.pack(files, true, 6);
  EXPECT_LT(deflated.size(), stored.size());
  EXPECT_EQ(codec.unpack(deflated), files);
}

TEST(ZipArchiveCodec, CompressInsideFollowsLevel) {
  const ZipArchiveCodec codec;
  std::string text;
  for (int i = 0; i < 2000; ++i) {
    text += "line " + std::to_string(i * 7919 % 1000) + " of the report\n";
  }
  const std::vector<FileRecord> files = {{"report.txt", Bytes(text.begin(), text.end())}};

  const auto fast = codec.pack(files, true, 1);
  const auto best = codec.pack(files, true, 9);
  EXPECT_LE(best.size(), fast.size());
  EXPECT_EQ(codec.unpack(fast), files);
  EXPECT_EQ(codec.unpack(best), files);

  EXPECT_THROW(static_cast<void>(codec.pack(files, true, 0)), ValidationError);
  EXPECT_THROW(static_cast<void>(codec.pack(files, true, 10)), ValidationError);
  EXPECT_NO_THROW(static_cast<void>(codec.pack(files, false, 0)));
}

TEST(ZipCompressionCodec, TellsContainerFromArchive) {
  const ZipCompressionCodec compression;
  const auto container = compression.compress(Bytes(100, 'x'), 6);
  EXPECT_TRUE(ZipCompressionCodec::is_container(container));

  const auto archive = ZipArchiveCodec().pack(sampleFiles(), false, 6);
  EXPECT_FALSE(ZipCompressionCodec::is_container(archive));

  const std::vector<FileRecord> single = {textFile("a.txt", 10, 'a')};
  EXPECT_FALSE(ZipCompressionCodec::is_container(ZipArchiveCodec().pack(single, false, 6)));

  EXPECT_THROW(static_cast<void>(ZipCompressionCodec::is_container(Bytes(700, 0x42))), CorruptInputError);
}

TEST(TarArchiveCodec, PackUnpack) {
  const TarArchiveCodec codec;
  const auto files = sampleFiles();
  const auto packed = codec.pack(files, true, 6);
  EXPECT_EQ(sniff_payload_format(packed), PayloadFormat::Tar);
  EXPECT_EQ(packed.size() % 512, 0U);
  EXPECT_EQ(codec.unpack(packed), files);
}

TEST(ArchiveCodec, GarbageIsCorrupt) {
  const Bytes garbage(700, 0x42);
  EXPECT_THROW(static_cast<void>(ZipArchiveCodec().unpack(garbage)), CorruptInputError);
  EXPECT_THROW(static_cast<void>(TarArchiveCodec().unpack(garbage)), CorruptInputError);
}

TEST(ArchiveCodec, TruncatedZipIsCorrupt) {
  const ZipArchiveCodec codec;
  auto packed = codec.pack(sampleFiles(), false, 6);
  packed.resize(packed.size() / 2);
  EXPECT_THROW(static_cast<void>(codec.unpack(packed)), CorruptInputError);
}

}  // namespace droply
