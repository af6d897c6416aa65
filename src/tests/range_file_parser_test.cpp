#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <string>
#include "build/range_file_parser.hpp"
#include "test_utils.hpp"

using namespace hashrange;
using namespace hashrange::build;

namespace {

const std::string ZEROS(35, '0');
const std::string EFFS(35, 'F');

std::vector<Record> parse(const std::string& content) {
  std::istringstream input(content);
  return parse_range_lines(store::decode("ABCDE"), input, "ABCDE.txt");
}

} // namespace

class RangeFileParserTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = make_scratch_dir("range_file_parser_test");
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }
};

TEST_F(RangeFileParserTest, ParsesRecordsInInputOrder) {
  std::vector<Record> records = parse(EFFS + ":1\n" + ZEROS + ":3\n");
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0], (Record{"ABCDE" + EFFS, 1}));
  EXPECT_EQ(records[1], (Record{"ABCDE" + ZEROS, 3}));
}

TEST_F(RangeFileParserTest, KeepsDuplicates) {
  std::vector<Record> records = parse(ZEROS + ":3\n" + ZEROS + ":3\n");
  EXPECT_EQ(records.size(), 2u);
}

TEST_F(RangeFileParserTest, ToleratesCrlfAndMissingFinalNewline) {
  std::vector<Record> records = parse(ZEROS + ":3\r\n" + EFFS + ":18446744073709551615");
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].count, 3u);
  EXPECT_EQ(records[1].count, 18446744073709551615ULL);
}

TEST_F(RangeFileParserTest, UppercasesSuffix) {
  std::string lower_suffix(35, 'a');
  std::vector<Record> records = parse(lower_suffix + ":7\n");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].hash, "ABCDE" + std::string(35, 'A'));
}

TEST_F(RangeFileParserTest, EmptyInputYieldsNoRecords) {
  EXPECT_TRUE(parse("").empty());
}

TEST_F(RangeFileParserTest, RejectsMissingSeparator) {
  EXPECT_THROW(parse(ZEROS + "3\n"), ParseError);
}

TEST_F(RangeFileParserTest, RejectsBadCounts) {
  EXPECT_THROW(parse(ZEROS + ":\n"), ParseError);
  EXPECT_THROW(parse(ZEROS + ":abc\n"), ParseError);
  EXPECT_THROW(parse(ZEROS + ":-1\n"), ParseError);
  EXPECT_THROW(parse(ZEROS + ":12x\n"), ParseError);
  EXPECT_THROW(parse(ZEROS + ": 12\n"), ParseError);
  EXPECT_THROW(parse(ZEROS + ":18446744073709551616\n"), ParseError);
}

TEST_F(RangeFileParserTest, RejectsBadSuffixes) {
  EXPECT_THROW(parse(std::string(34, '0') + ":1\n"), ParseError);
  EXPECT_THROW(parse(std::string(36, '0') + ":1\n"), ParseError);
  EXPECT_THROW(parse(std::string(34, '0') + "G:1\n"), ParseError);
}

TEST_F(RangeFileParserTest, ErrorNamesSourceAndLine) {
  try {
    parse(ZEROS + ":1\n" + ZEROS + ":oops\n");
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_NE(std::string(e.what()).find("ABCDE.txt:2:"), std::string::npos) << e.what();
  }
}

TEST_F(RangeFileParserTest, KeyComesFromFileName) {
  write_text_file(test_dir / "abcde.txt", ZEROS + ":3\n");
  Shard shard = parse_range_file(test_dir / "abcde.txt");
  EXPECT_EQ(shard.key.str(), "ABCDE");
  ASSERT_EQ(shard.records.size(), 1u);
  EXPECT_EQ(shard.records[0].hash, "ABCDE" + ZEROS);
}

TEST_F(RangeFileParserTest, FileWithoutExtension) {
  write_text_file(test_dir / "00000", EFFS + ":2\n");
  Shard shard = parse_range_file(test_dir / "00000");
  EXPECT_EQ(shard.key.str(), "00000");
  EXPECT_EQ(shard.records.size(), 1u);
}

TEST_F(RangeFileParserTest, RejectsBadFileName) {
  write_text_file(test_dir / "XYZ12.txt", ZEROS + ":3\n");
  EXPECT_THROW(parse_range_file(test_dir / "XYZ12.txt"), store::InvalidKeyError);

  write_text_file(test_dir / "ABCDEF.txt", ZEROS + ":3\n");
  EXPECT_THROW(parse_range_file(test_dir / "ABCDEF.txt"), store::InvalidKeyError);
}

TEST_F(RangeFileParserTest, MissingFile) {
  EXPECT_THROW(parse_range_file(test_dir / "ABCDE.txt"), ParseError);
}
