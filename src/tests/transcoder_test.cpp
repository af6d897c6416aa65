#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include "build/transcoder.hpp"
#include "codec/compressor.hpp"
#include "test_utils.hpp"

using namespace hashrange;
using namespace hashrange::build;

namespace {

const std::string ZEROS(35, '0');
const std::string EFFS(35, 'F');

} // namespace

class TranscoderTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<store::ShardStore> store;
  Shard shard{store::decode("ABCDE"), {}};

  void SetUp() override {
    init_test_logging();
    test_dir = make_scratch_dir("transcoder_test");
    store = std::make_unique<store::ShardStore>(test_dir);
    store->ensure_layout();

    shard.records.push_back(Record{"ABCDE" + ZEROS, 3});
    shard.records.push_back(Record{"ABCDE" + EFFS, 1});
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string read_artifact(store::Representation representation) {
    std::string bytes;
    store->get(shard.key, representation, bytes);
    return bytes;
  }
};

TEST_F(TranscoderTest, AllRepresentationsCarryTheSameDocument) {
  Transcoder transcoder(*store, OutputSelection{});
  ArtifactSizes sizes = transcoder.transcode(shard);

  const std::string expected =
    "[{\"hash\":\"ABCDE" + ZEROS + "\",\"count\":3},{\"hash\":\"ABCDE" + EFFS + "\",\"count\":1}]";

  EXPECT_EQ(read_artifact(store::Representation::Json), expected);
  EXPECT_EQ(codec::gzip_decompress(read_artifact(store::Representation::Gzip)), expected);
  EXPECT_EQ(codec::brotli_decompress(read_artifact(store::Representation::Brotli)), expected);

  EXPECT_EQ(sizes.json, expected.size());
  EXPECT_EQ(sizes.gzip, store->get_file_size(shard.key, store::Representation::Gzip));
  EXPECT_EQ(sizes.brotli, store->get_file_size(shard.key, store::Representation::Brotli));
}

TEST_F(TranscoderTest, WritesOnlySelectedRepresentations) {
  OutputSelection selection;
  selection.json = false;
  selection.brotli = false;

  Transcoder transcoder(*store, selection);
  ArtifactSizes sizes = transcoder.transcode(shard);

  EXPECT_FALSE(store->has(shard.key, store::Representation::Json));
  EXPECT_TRUE(store->has(shard.key, store::Representation::Gzip));
  EXPECT_FALSE(store->has(shard.key, store::Representation::Brotli));
  EXPECT_EQ(sizes.json, 0u);
  EXPECT_GT(sizes.gzip, 0u);
  EXPECT_EQ(sizes.brotli, 0u);
}

TEST_F(TranscoderTest, RerunOverwritesWithIdenticalBytes) {
  Transcoder transcoder(*store, OutputSelection{});
  transcoder.transcode(shard);
  std::string first = read_artifact(store::Representation::Brotli);

  transcoder.transcode(shard);
  EXPECT_EQ(read_artifact(store::Representation::Brotli), first);
}

TEST_F(TranscoderTest, EmptyShard) {
  Shard empty{store::decode("00000"), {}};
  Transcoder transcoder(*store, OutputSelection{});
  transcoder.transcode(empty);

  std::string bytes;
  store->get(empty.key, store::Representation::Json, bytes);
  EXPECT_EQ(bytes, "[]");
}

TEST_F(TranscoderTest, WriteFailureBecomesTranscodeError) {
  store::ShardStore missing(test_dir / "does_not_exist");
  Transcoder transcoder(missing, OutputSelection{});
  EXPECT_THROW(transcoder.transcode(shard), TranscodeError);
}

TEST(ShardJsonTest, ParseInvertsSerialize) {
  std::vector<Record> records = {{"ABCDE" + ZEROS, 3}, {"ABCDE" + EFFS, 0}};
  EXPECT_EQ(parse_shard_json(serialize_shard(records)), records);
  EXPECT_TRUE(parse_shard_json("[]").empty());
}

TEST(ShardJsonTest, RejectsMalformedDocuments) {
  EXPECT_THROW(parse_shard_json("not json"), ParseError);
  EXPECT_THROW(parse_shard_json("{\"hash\":\"x\",\"count\":1}"), ParseError);
  EXPECT_THROW(parse_shard_json("[{\"hash\":\"x\"}]"), ParseError);
  EXPECT_THROW(parse_shard_json("[{\"hash\":1,\"count\":1}]"), ParseError);
  EXPECT_THROW(parse_shard_json("[{\"hash\":\"x\",\"count\":-1}]"), ParseError);
}

TEST(ShardJsonTest, FindCount) {
  std::vector<Record> records = {{"ABCDE" + ZEROS, 3}, {"ABCDE" + EFFS, 1}};
  EXPECT_EQ(find_count(records, "ABCDE" + EFFS), 1u);
  EXPECT_EQ(find_count(records, "ABCDE" + std::string(35, '1')), 0u);
}
