#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "../libdroply/include/errors.hpp"
#include "../libdroply/include/file_type.hpp"
#include "../libdroply/include/pipeline.hpp"

namespace droply {

namespace {

Bytes repeatedText(std::size_t size) {
  static constexpr std::string_view kText = "The quick brown fox jumps over the lazy dog. ";
  Bytes out;
  out.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(static_cast<std::uint8_t>(kText[i % kText.size()]));
  }
  return out;
}

FileRecord file(std::string name, std::size_t size) {
  auto data = repeatedText(size);
  if (!data.empty()) {
    data[0] = static_cast<std::uint8_t>(name.front());
  }
  return FileRecord{std::move(name), std::move(data)};
}

ProcessOptions options(std::string algo, std::optional<std::string> archive = std::nullopt) {
  ProcessOptions opts;
  opts.compression.algo = std::move(algo);
  if (archive) {
    opts.archive = ArchiveOptions{*archive, false};
  }
  return opts;
}

RestoreOptions restoreOptions(std::string algo, std::optional<std::string> archive = std::nullopt) {
  RestoreOptions opts;
  opts.compression = std::move(algo);
  opts.archive = std::move(archive);
  return opts;
}

class PipelineTest : public ::testing::Test {
 protected:
  PluginRegistry registry{Platform::Server};
  ModuleLoader loader{registry, {}};
  Pipeline pipeline{registry, loader};
};

}  // namespace

TEST_F(PipelineTest, SingleTextFileGzip) {
  const std::vector<FileRecord> files = {file("a.txt", 1000)};
  auto opts = options("gzip");
  opts.compression.level = 9;

  const auto compressed = pipeline.process(files, opts);
  EXPECT_LT(compressed.size(), 1000U);
  EXPECT_EQ(sniff_payload_format(compressed), PayloadFormat::Gzip);

  const auto restored = pipeline.restore(compressed, restoreOptions("gzip"));
  ASSERT_EQ(restored.size(), 1U);
  EXPECT_EQ(restored[0].name, "a.txt");
  EXPECT_EQ(restored[0].data, files[0].data);
}

TEST_F(PipelineTest, SingleFileRoundTripKeepsName) {
  const std::vector<FileRecord> files = {file("notes.md", 2500)};
  for (const auto* algo : {"gzip", "brotli", "zip", "none"}) {
    const auto restored = pipeline.restore(pipeline.process(files, options(algo)), restoreOptions(algo));
    EXPECT_EQ(restored, files) << algo;
  }
}

TEST_F(PipelineTest, SingleFileWithoutMetadataIsNamedFile) {
  const std::vector<FileRecord> files = {file("a.txt", 1000)};
  auto opts = options("gzip");
  opts.embed_metadata = false;

  const auto compressed = pipeline.process(files, opts);
  EXPECT_EQ(pipeline.decompress(compressed, "gzip"), files[0].data);
  const auto restored = pipeline.restore_with_metadata(compressed, restoreOptions("gzip"));
  ASSERT_EQ(restored.files.size(), 1U);
  EXPECT_EQ(restored.files[0].name, "file");
  EXPECT_EQ(restored.files[0].data, files[0].data);
  EXPECT_FALSE(restored.metadata.has_value());
}

TEST_F(PipelineTest, ArchiveInputStaysOneFile) {
  const auto inner = pipeline.create_archive({file("x.txt", 40), file("y.txt", 50)}, "zip");
  const auto tarInner = pipeline.create_archive({file("z.txt", 60)}, "tar");
  const std::vector<FileRecord> zipInput = {{"bundle.zip", inner}};
  const std::vector<FileRecord> tarInput = {{"notes.tar", tarInner}};

  for (const bool embed : {false, true}) {
    auto opts = options("gzip");
    opts.embed_metadata = embed;

    const auto restoredZip = pipeline.restore(pipeline.process(zipInput, opts), restoreOptions("gzip"));
    ASSERT_EQ(restoredZip.size(), 1U) << (embed ? "embedded" : "plain");
    EXPECT_EQ(restoredZip[0].data, inner);
    EXPECT_EQ(restoredZip[0].name, embed ? "bundle.zip" : "file");

    const auto restoredTar = pipeline.restore(pipeline.process(tarInput, opts), restoreOptions("gzip"));
    ASSERT_EQ(restoredTar.size(), 1U) << (embed ? "embedded" : "plain");
    EXPECT_EQ(restoredTar[0].data, tarInner);
  }
}

TEST_F(PipelineTest, TrailerWinsOverDeclaredArchive) {
  const auto inner = pipeline.create_archive({file("x.txt", 40), file("y.txt", 50)}, "zip");
  const std::vector<FileRecord> files = {{"bundle.zip", inner}};

  // what a "bundle.zip.gz" name suggests: a zip archive compressed with gzip
  const auto restored = pipeline.restore(pipeline.process(files, options("gzip")), restoreOptions("gzip", "zip"));
  EXPECT_EQ(restored, files);
}

TEST_F(PipelineTest, UntaggedArchiveNeedsDeclaredFormat) {
  const std::vector<FileRecord> files = {file("a.txt", 100), file("b.txt", 200)};
  auto opts = options("gzip");
  opts.embed_metadata = false;
  const auto compressed = pipeline.process(files, opts);

  EXPECT_EQ(pipeline.restore(compressed, restoreOptions("gzip", "zip")), files);
  const auto undeclared = pipeline.restore(compressed, restoreOptions("gzip"));
  ASSERT_EQ(undeclared.size(), 1U);
  EXPECT_EQ(sniff_payload_format(undeclared[0].data), PayloadFormat::Zip);
}

TEST_F(PipelineTest, SingleFileWithEmbeddedMetadataKeepsName) {
  const std::vector<FileRecord> files = {file("a.txt", 1000)};
  auto opts = options("gzip");
  opts.embed_metadata = true;

  const auto restored = pipeline.restore_with_metadata(pipeline.process(files, opts), restoreOptions("gzip"));
  ASSERT_EQ(restored.files.size(), 1U);
  EXPECT_EQ(restored.files[0], files[0]);
  ASSERT_TRUE(restored.metadata.has_value());
  EXPECT_EQ(restored.metadata->algo, "gzip");
  EXPECT_FALSE(restored.metadata->archive.has_value());
}

TEST_F(PipelineTest, TwoFilesZipArchiveBrotli) {
  const std::vector<FileRecord> files = {file("a.txt", 500), file("b.json", 300)};
  const auto opts = options("brotli", "zip");

  const auto compressed = pipeline.process(files, opts);
  const auto restored = pipeline.restore(compressed, restoreOptions("brotli", "zip"));
  EXPECT_EQ(restored, files);

  // the archive is detected when not declared
  EXPECT_EQ(pipeline.restore(compressed, restoreOptions("brotli")), files);
}

TEST_F(PipelineTest, MultipleFilesDefaultToZip) {
  const std::vector<FileRecord> files = {file("a.txt", 100), file("b.txt", 200), file("c.txt", 300)};
  const auto compressed = pipeline.process(files, options("none"));
  EXPECT_EQ(sniff_payload_format(compressed), PayloadFormat::Zip);
  EXPECT_EQ(pipeline.restore(compressed, restoreOptions("none", "zip")), files);
}

TEST_F(PipelineTest, RoundTripEveryCombination) {
  const std::vector<FileRecord> files = {file("one.txt", 700), file("two.bin", 1), file("three.md", 4096)};
  for (const auto* algo : {"gzip", "brotli", "zip", "none"}) {
    for (const auto* archive : {"zip", "tar"}) {
      for (const bool embed : {false, true}) {
        auto opts = options(algo, archive);
        opts.embed_metadata = embed;
        const auto compressed = pipeline.process(files, opts);
        EXPECT_EQ(pipeline.restore(compressed, restoreOptions(algo, archive)), files)
            << algo << "+" << archive << (embed ? " embedded" : "");
      }
    }
  }
}

TEST_F(PipelineTest, EmbeddedMetadataEntryIsHidden) {
  const std::vector<FileRecord> files = {file("a.txt", 50), file("b.txt", 60)};
  auto opts = options("gzip", "tar");
  opts.embed_metadata = true;

  const auto compressed = pipeline.process(files, opts);
  const auto result = pipeline.restore_with_metadata(compressed, restoreOptions("gzip", "tar"));
  EXPECT_EQ(result.files, files);
  ASSERT_TRUE(result.metadata.has_value());
  ASSERT_EQ(result.metadata->files.size(), 2U);
  EXPECT_EQ(result.metadata->files[1].name, "b.txt");
  EXPECT_EQ(result.metadata->files[1].original_size, 60U);
  EXPECT_EQ(result.metadata->total_original, 110U);

  const auto listing = pipeline.list_archive(pipeline.decompress(compressed, "gzip"), "tar");
  ASSERT_EQ(listing.size(), 2U);
  EXPECT_EQ(listing[0].name, "a.txt");
  EXPECT_EQ(listing[0].size, 50U);
}

TEST_F(PipelineTest, MetadataNamesOverrideEntryNames) {
  EmbeddedMetadata meta;
  meta.algo = "none";
  meta.archive = "zip";
  meta.files = {{"report final.txt", 3}};
  const auto json = embedded_metadata_to_json(meta);

  const std::vector<FileRecord> entries = {
      {metadata_entry_path(), Bytes(json.begin(), json.end())},
      {"report_final.txt", Bytes{'a', 'b', 'c'}},
  };
  const auto packed = pipeline.create_archive(entries, "zip");
  EXPECT_THROW(static_cast<void>(pipeline.create_archive(entries, "zip", true, 0)), ValidationError);
  const auto result = pipeline.restore_with_metadata(packed, restoreOptions("none", "zip"));
  ASSERT_EQ(result.files.size(), 1U);
  EXPECT_EQ(result.files[0].name, "report final.txt");
}

TEST_F(PipelineTest, UnsupportedAlgorithmIsValidationError) {
  const std::vector<FileRecord> files = {file("a.txt", 10)};
  for (int attempt = 0; attempt < 2; ++attempt) {
    try {
      static_cast<void>(pipeline.process(files, options("zstd-unlisted")));
      FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::Validation);
      EXPECT_FALSE(e.hint().empty());
    }
  }
  EXPECT_FALSE(loader.is_cached("zstd-unlisted", PluginKind::Compression));
}

TEST_F(PipelineTest, InvalidInputsAreRejected) {
  EXPECT_THROW(static_cast<void>(pipeline.process({}, options("gzip"))), ValidationError);
  EXPECT_THROW(static_cast<void>(pipeline.process({{"", Bytes{1}}}, options("gzip"))), ValidationError);
  EXPECT_THROW(static_cast<void>(pipeline.process({{"empty.txt", {}}}, options("gzip"))), ValidationError);

  auto badLevel = options("gzip");
  badLevel.compression.level = 12;
  EXPECT_THROW(static_cast<void>(pipeline.process({file("a.txt", 10)}, badLevel)), ValidationError);

  EXPECT_THROW(static_cast<void>(pipeline.process({file("a.txt", 10)}, options("gzip", "rar"))), ValidationError);

  const std::vector<FileRecord> two = {file("a.txt", 10), file("b.txt", 10)};
  EXPECT_THROW(static_cast<void>(pipeline.process(two, options("gzip", "none"))), ValidationError);
}

TEST_F(PipelineTest, ReservedNamesNeedOptIn) {
  const std::vector<FileRecord> files = {file("a.txt", 10), {".droply/user.txt", Bytes{'u'}}};
  EXPECT_THROW(static_cast<void>(pipeline.process(files, options("gzip"))), ValidationError);

  auto opts = options("gzip");
  opts.allow_reserved_names = true;
  const auto restored = pipeline.restore(pipeline.process(files, opts), restoreOptions("gzip", "zip"));
  EXPECT_EQ(restored, files);
}

TEST_F(PipelineTest, UnsupportedPlatform) {
  PluginRegistry browser(Platform::Browser);
  ModuleLoader browserLoader(browser, {});
  Pipeline browserPipeline(browser, browserLoader);
  const std::vector<FileRecord> two = {file("a.txt", 10), file("b.txt", 10)};
  EXPECT_THROW(static_cast<void>(browserPipeline.process(two, options("gzip", "tar"))), UnsupportedPlatformError);
}

TEST_F(PipelineTest, SingleFileIgnoresArchive) {
  const std::vector<FileRecord> files = {file("a.txt", 400)};
  const auto compressed = pipeline.process(files, options("gzip", "tar"));
  EXPECT_NE(sniff_payload_format(pipeline.decompress(compressed, "gzip")), PayloadFormat::Tar);
  EXPECT_EQ(pipeline.restore(compressed, restoreOptions("gzip")), files);
}

TEST_F(PipelineTest, CompressInsideUsesRequestedLevel) {
  std::string text;
  for (int i = 0; i < 3000; ++i) {
    text += "entry " + std::to_string(i * 7919 % 1000) + " of the log\n";
  }
  const std::vector<FileRecord> files = {{"a.log", Bytes(text.begin(), text.end())}, file("b.txt", 300)};

  auto fast = options("none");
  fast.archive = ArchiveOptions{"zip", true};
  fast.compression.level = 1;
  auto best = fast;
  best.compression.level = 9;
  auto stored = fast;
  stored.archive->compress_inside = false;

  const auto fastOut = pipeline.process(files, fast);
  const auto bestOut = pipeline.process(files, best);
  EXPECT_LE(bestOut.size(), fastOut.size());
  EXPECT_LT(fastOut.size(), pipeline.process(files, stored).size());
  EXPECT_EQ(pipeline.restore(bestOut, restoreOptions("none", "zip")), files);

  // brotli levels above deflate's range are clamped
  auto brotli = options("brotli");
  brotli.archive = ArchiveOptions{"zip", true};
  brotli.compression.level = 11;
  EXPECT_EQ(pipeline.restore(pipeline.process(files, brotli), restoreOptions("brotli")), files);
}

TEST_F(PipelineTest, ProcessWithMetadata) {
  const std::vector<FileRecord> files = {file("a.txt", 500), file("b.json", 300)};
  auto opts = options("brotli", "zip");
  opts.compression.level = 4;
  const auto result = pipeline.process_with_metadata(files, opts);
  const auto& m = result.metadata;

  EXPECT_EQ(m.original_size, 800U);
  EXPECT_EQ(m.compressed_size, result.data.size());
  EXPECT_NEAR(m.compression_ratio, 1.0 - static_cast<double>(m.compressed_size) / 800.0, 1e-9);
  EXPECT_LT(m.compression_ratio, 1.0);
  EXPECT_EQ(m.compression_algo, "brotli");
  EXPECT_EQ(m.archive_algo, "zip");
  EXPECT_EQ(m.level, 4);
  EXPECT_EQ(m.file_count, 2U);
  EXPECT_GE(m.processing_time_ms, 0.0);
  EXPECT_FALSE(m.timestamp.empty());
  ASSERT_EQ(m.per_file.size(), 2U);
  EXPECT_EQ(m.per_file[0].checksum, "size_500_name_a.txt");
  EXPECT_EQ(m.checksums.original, "size_800_count_2");
  EXPECT_EQ(m.checksums.compressed, "size_" + std::to_string(m.compressed_size) + "_algo_brotli");
  EXPECT_EQ(m.compatibility.required_modules,
            (std::vector<std::string>{"compression-brotli", "archive-zip"}));
  EXPECT_EQ(pipeline.restore(result.data, restoreOptions("brotli", "zip")), files);
}

TEST_F(PipelineTest, RatioCanBeNegative) {
  const std::vector<FileRecord> files = {{"x", Bytes{'x'}}};
  const auto result = pipeline.process_with_metadata(files, options("gzip"));
  EXPECT_LT(result.metadata.compression_ratio, 0.0);
}

TEST_F(PipelineTest, HeaderMismatch) {
  const std::vector<FileRecord> files = {file("a.txt", 300)};
  const auto gz = pipeline.process(files, options("gzip"));
  EXPECT_THROW(static_cast<void>(pipeline.restore(gz, restoreOptions("zip"))), AlgorithmMismatchError);
  EXPECT_THROW(static_cast<void>(pipeline.restore(gz, restoreOptions("brotli"))), AlgorithmMismatchError);

  const auto zip = pipeline.process(files, options("zip"));
  EXPECT_THROW(static_cast<void>(pipeline.restore(zip, restoreOptions("gzip"))), AlgorithmMismatchError);

  const Bytes text = repeatedText(200);
  EXPECT_THROW(static_cast<void>(pipeline.restore(text, restoreOptions("gzip"))), AlgorithmMismatchError);
}

TEST_F(PipelineTest, CorruptInput) {
  const std::vector<FileRecord> files = {file("a.txt", 3000), file("b.txt", 3000)};
  auto gz = pipeline.process(files, options("gzip"));
  gz.resize(gz.size() / 2);
  EXPECT_THROW(static_cast<void>(pipeline.restore(gz, restoreOptions("gzip"))), CorruptInputError);

  const Bytes oneByte = {0x1f};
  EXPECT_THROW(static_cast<void>(pipeline.restore(oneByte, restoreOptions("gzip"))), CorruptInputError);

  auto br = pipeline.process(files, options("brotli"));
  br.resize(br.size() - 8);
  EXPECT_THROW(static_cast<void>(pipeline.restore(br, restoreOptions("brotli"))), CorruptInputError);

  EXPECT_THROW(static_cast<void>(pipeline.restore({}, restoreOptions("gzip"))), ValidationError);
}

TEST_F(PipelineTest, Primitives) {
  const auto data = repeatedText(5000);
  const auto br = pipeline.compress(data, "brotli", 11);
  EXPECT_EQ(pipeline.decompress(br, "brotli"), data);

  const std::vector<FileRecord> files = {file("a.txt", 20), file("b.txt", 30)};
  const auto tar = pipeline.create_archive(files, "tar");
  EXPECT_EQ(pipeline.extract_archive(tar, "tar"), files);
  EXPECT_THROW(static_cast<void>(pipeline.extract_archive(tar, "zip")), AlgorithmMismatchError);
}

TEST_F(PipelineTest, ConcurrentCallsAreIndependent) {
  constexpr int kThreads = 6;
  std::vector<int> ok(kThreads, 0);
  {
    std::vector<std::jthread> threads;
    for (int i = 0; i < kThreads; ++i) {
      threads.emplace_back([this, i, &ok] {
        const std::vector<FileRecord> files = {file("t" + std::to_string(i) + ".txt", 1000U + static_cast<std::size_t>(i)),
                                               file("u.txt", 10)};
        const char* algo = (i % 2) == 0 ? "gzip" : "brotli";
        const auto compressed = pipeline.process(files, options(algo, "zip"));
        ok[static_cast<std::size_t>(i)] = pipeline.restore(compressed, restoreOptions(algo, "zip")) == files ? 1 : 0;
      });
    }
  }
  for (int i = 0; i < kThreads; ++i) {
    EXPECT_EQ(ok[static_cast<std::size_t>(i)], 1) << "thread " << i;
  }
}

}  // namespace droply
