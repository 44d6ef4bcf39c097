#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../libdroply/include/embedded_metadata.hpp"
#include "../libdroply/include/errors.hpp"

namespace droply {

namespace {

EmbeddedMetadata sampleMetadata() {
  EmbeddedMetadata m;
  m.algo = "gzip";
  m.archive = "zip";
  m.created_at = "2025-01-31T12:00:00Z";
  m.files = {{"a.txt", 500}, {"b.json", 300}};
  m.total_original = 800;
  return m;
}

}  // namespace

TEST(EmbeddedMetadata, JsonRoundTrip) {
  const auto m = sampleMetadata();
  const auto parsed = parse_embedded_metadata(embedded_metadata_to_json(m));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->schema_version, meta_schema_version);
  EXPECT_EQ(parsed->algo, "gzip");
  EXPECT_EQ(parsed->archive, "zip");
  EXPECT_EQ(parsed->files, m.files);
  EXPECT_EQ(parsed->total_original, 800U);
}

TEST(EmbeddedMetadata, MalformedJsonIsIgnored) {
  EXPECT_FALSE(parse_embedded_metadata("{not json").has_value());
  EXPECT_FALSE(parse_embedded_metadata(R"({"algo":"gzip"})").has_value());
}

TEST(EmbeddedMetadata, EntryNames) {
  EXPECT_EQ(metadata_entry_path(), ".droply/__droply_meta.json");
  EXPECT_TRUE(is_metadata_entry(".droply/__droply_meta.json"));
  EXPECT_TRUE(is_metadata_entry(".droply/custom.json"));
  EXPECT_TRUE(is_metadata_entry(".__droply_meta.json"));
  EXPECT_FALSE(is_metadata_entry(".droply"));
  EXPECT_FALSE(is_metadata_entry("a.txt"));
}

TEST(EmbeddedMetadata, ReservedNames) {
  EXPECT_TRUE(is_reserved_name(".droply/x"));
  EXPECT_TRUE(is_reserved_name("dir/.droply/x"));
  EXPECT_FALSE(is_reserved_name(".droplyx"));

  const std::vector<FileRecord> files = {{"a.txt", {1}}, {".droply/evil.json", {2}}};
  EXPECT_THROW(ensure_no_reserved_names(files, false), ValidationError);
  EXPECT_NO_THROW(ensure_no_reserved_names(files, true));
}

TEST(EmbeddedMetadata, TrailerSplit) {
  const Bytes payload = {'h', 'e', 'l', 'l', 'o'};
  auto m = sampleMetadata();
  m.archive.reset();
  m.files = {{"hello.txt", 5}};

  const auto withTrailer = append_metadata_trailer(payload, m);
  const auto split = split_metadata_trailer(withTrailer);
  ASSERT_TRUE(split.metadata.has_value());
  EXPECT_EQ(Bytes(split.payload.begin(), split.payload.end()), payload);
  EXPECT_EQ(split.metadata->files.front().name, "hello.txt");
  EXPECT_FALSE(split.metadata->archive.has_value());
}

TEST(EmbeddedMetadata, PlainDataHasNoTrailer) {
  const Bytes payload(100, 'x');
  const auto split = split_metadata_trailer(payload);
  EXPECT_FALSE(split.metadata.has_value());
  EXPECT_EQ(split.payload.size(), payload.size());
}

TEST(EmbeddedMetadata, BogusLengthIsPlainData) {
  Bytes data = {'a', 'b', 0xff, 0xff, 0xff, 0xff};
  data.insert(data.end(), meta_trailer_marker.begin(), meta_trailer_marker.end());
  const auto split = split_metadata_trailer(data);
  EXPECT_FALSE(split.metadata.has_value());
  EXPECT_EQ(split.payload.size(), data.size());
}

}  // namespace droply
