#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>
#include "http/negotiation.hpp"

using namespace hashrange;
using namespace hashrange::http;

namespace {

store::StoreCapabilities caps(bool json, bool gzip, bool brotli) {
  store::StoreCapabilities capabilities;
  capabilities.json = json;
  capabilities.gzip = gzip;
  capabilities.brotli = brotli;
  return capabilities;
}

AcceptedEncodings parse(const std::string& value) {
  return parse_accept_encoding(std::vector<std::string>{value});
}

} // namespace

TEST(NegotiationTest, ClassifiesTokensLiterally) {
  EXPECT_EQ(classify_token("br"), EncodingToken::Brotli);
  EXPECT_EQ(classify_token("gzip"), EncodingToken::GeneralCompressed);
  EXPECT_EQ(classify_token("deflate"), EncodingToken::Unrecognized);
  EXPECT_EQ(classify_token("identity"), EncodingToken::Unrecognized);
  EXPECT_EQ(classify_token("*"), EncodingToken::Unrecognized);
  EXPECT_EQ(classify_token("BR"), EncodingToken::Unrecognized);
  EXPECT_EQ(classify_token("x-gzip"), EncodingToken::Unrecognized);
  EXPECT_EQ(classify_token(""), EncodingToken::Unrecognized);
}

TEST(NegotiationTest, ParsesCommaSeparatedLists) {
  AcceptedEncodings accepted = parse("gzip, deflate, br");
  EXPECT_TRUE(accepted.brotli);
  EXPECT_TRUE(accepted.gzip);

  accepted = parse("deflate,gzip");
  EXPECT_FALSE(accepted.brotli);
  EXPECT_TRUE(accepted.gzip);

  accepted = parse("  br  ,\t,");
  EXPECT_TRUE(accepted.brotli);
  EXPECT_FALSE(accepted.gzip);
}

TEST(NegotiationTest, StripsQualityAnnotations) {
  AcceptedEncodings accepted = parse("br;q=1.0, gzip ; q=0.5");
  EXPECT_TRUE(accepted.brotli);
  EXPECT_TRUE(accepted.gzip);

  // A zero quality still counts, weights are not honoured
  accepted = parse("br;q=0");
  EXPECT_TRUE(accepted.brotli);
}

TEST(NegotiationTest, CombinesRepeatedHeaders) {
  AcceptedEncodings accepted = parse_accept_encoding({"gzip", "br"});
  EXPECT_TRUE(accepted.brotli);
  EXPECT_TRUE(accepted.gzip);
}

TEST(NegotiationTest, EmptyOrMissingHeader) {
  AcceptedEncodings accepted = parse_accept_encoding({});
  EXPECT_FALSE(accepted.brotli);
  EXPECT_FALSE(accepted.gzip);

  accepted = parse("");
  EXPECT_FALSE(accepted.brotli);
  EXPECT_FALSE(accepted.gzip);
}

TEST(NegotiationTest, RejectsNonVisibleAscii) {
  EXPECT_THROW(parse("gzip, br\x80"), NegotiationError);
  EXPECT_THROW(parse("gz\x01ip"), NegotiationError);
  EXPECT_THROW(parse("br\x7f"), NegotiationError);
  EXPECT_THROW(parse_accept_encoding({"gzip", "\xC3\xA9"}), NegotiationError);
  EXPECT_NO_THROW(parse("gzip,\tbr"));
}

TEST(NegotiationTest, PrecedenceMatrix) {
  AcceptedEncodings both;
  both.brotli = true;
  both.gzip = true;

  EXPECT_EQ(choose_representation(caps(true, true, true), both), store::Representation::Brotli);
  EXPECT_EQ(choose_representation(caps(false, true, true), both), store::Representation::Brotli);
  EXPECT_EQ(choose_representation(caps(false, true, false), both), store::Representation::Gzip);
  EXPECT_EQ(choose_representation(caps(true, false, false), both), store::Representation::Json);
  EXPECT_EQ(choose_representation(caps(false, false, false), both), std::nullopt);
}

TEST(NegotiationTest, FallsBackToJson) {
  AcceptedEncodings none;
  EXPECT_EQ(choose_representation(caps(true, true, true), none), store::Representation::Json);
  EXPECT_EQ(choose_representation(caps(false, true, true), none), std::nullopt);

  AcceptedEncodings gzip_only;
  gzip_only.gzip = true;
  EXPECT_EQ(choose_representation(caps(true, false, true), gzip_only), store::Representation::Json);
}

TEST(NegotiationTest, IgnoresClientWeights) {
  AcceptedEncodings accepted = parse("gzip;q=1.0, br;q=0.1");
  EXPECT_EQ(choose_representation(caps(true, true, true), accepted), store::Representation::Brotli);
}
