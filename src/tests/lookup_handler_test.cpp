#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "codec/compressor.hpp"
#include "http/lookup_handler.hpp"
#include "test_utils.hpp"

using namespace hashrange;
using namespace hashrange::http;

namespace {

std::string read_body(Response& response) {
  std::string body;
  char buffer[4096];
  boost::beast::error_code ec;
  while (true) {
    std::size_t n = response.file.file().read(buffer, sizeof(buffer), ec);
    if (ec || n == 0) {
      break;
    }
    body.append(buffer, n);
  }
  EXPECT_FALSE(ec) << ec.message();
  return body;
}

} // namespace

class LookupHandlerTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<store::ShardStore> store;
  std::string document;
  std::string gzipped;

  void SetUp() override {
    init_test_logging();
    test_dir = make_scratch_dir("lookup_handler_test");
    store = std::make_unique<store::ShardStore>(test_dir);

    document = "[{\"hash\":\"ABCDE" + std::string(35, '0') + "\",\"count\":3}]";
    gzipped = codec::gzip_compress(document);

    // Only the gzip representation of two shards
    write_text_file(store->artifact_path(store::decode("ABCDE"), store::Representation::Gzip), gzipped);
    write_text_file(store->artifact_path(store::decode("00000"), store::Representation::Gzip), gzipped);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }
};

TEST_F(LookupHandlerTest, ServesGzipArtifactVerbatim) {
  LookupHandler handler(*store, store->detect_capabilities());
  ASSERT_TRUE(handler.capabilities().gzip);
  ASSERT_FALSE(handler.capabilities().brotli);

  Response response = handler.handle("ABCDE", {"gzip"});
  EXPECT_EQ(response.status, beast_http::status::ok);
  EXPECT_EQ(response.content_type, "application/json");
  EXPECT_EQ(response.content_encoding, std::optional<std::string>("gzip"));
  ASSERT_TRUE(response.has_file());
  EXPECT_EQ(response.file.size(), gzipped.size());
  EXPECT_EQ(read_body(response), gzipped);
}

TEST_F(LookupHandlerTest, KeyCaseDoesNotMatter) {
  LookupHandler handler(*store, store->detect_capabilities());
  Response response = handler.handle("abcde", {"br, gzip"});
  EXPECT_EQ(response.status, beast_http::status::ok);
  EXPECT_EQ(read_body(response), gzipped);
}

TEST_F(LookupHandlerTest, InvalidKeyIsRejectedBeforeAnyFileAccess) {
  // Root does not exist and every representation claims to be present:
  // a 400 rather than a 404 shows validation ran first
  store::ShardStore missing(test_dir / "does_not_exist");
  store::StoreCapabilities everything;
  everything.json = everything.gzip = everything.brotli = true;
  LookupHandler handler(missing, everything);

  for (const std::string key : {"ABCD", "ABCDEG", "GHIJK", "..%2F", ""}) {
    Response response = handler.handle(key, {"gzip"});
    EXPECT_EQ(response.status, beast_http::status::bad_request) << key;
    EXPECT_FALSE(response.has_file());
  }

  EXPECT_EQ(handler.handle("ABCDE", {}).status, beast_http::status::not_found);
}

TEST_F(LookupHandlerTest, InvalidAcceptEncodingIsRejected) {
  LookupHandler handler(*store, store->detect_capabilities());
  Response response = handler.handle("ABCDE", {"gzip\x80"});
  EXPECT_EQ(response.status, beast_http::status::bad_request);
}

TEST_F(LookupHandlerTest, NoAcceptableRepresentation) {
  // Only gzip exists and the client does not accept it
  LookupHandler handler(*store, store->detect_capabilities());
  Response response = handler.handle("ABCDE", {"br"});
  EXPECT_EQ(response.status, beast_http::status::not_found);
  EXPECT_FALSE(response.has_file());
}

TEST_F(LookupHandlerTest, MissingArtifactIsNotFound) {
  LookupHandler handler(*store, store->detect_capabilities());
  Response response = handler.handle("12345", {"gzip"});
  EXPECT_EQ(response.status, beast_http::status::not_found);
  EXPECT_FALSE(response.has_file());
}

TEST_F(LookupHandlerTest, StaleCapabilitiesYieldNotFound) {
  // Capabilities claim brotli, the file is not there
  store::StoreCapabilities claimed;
  claimed.brotli = true;
  LookupHandler handler(*store, claimed);
  EXPECT_EQ(handler.handle("ABCDE", {"br"}).status, beast_http::status::not_found);
}

TEST_F(LookupHandlerTest, PlainJsonHasNoContentEncoding) {
  write_text_file(store->artifact_path(store::decode("ABCDE"), store::Representation::Json), document);
  store::StoreCapabilities json_only;
  json_only.json = true;
  LookupHandler handler(*store, json_only);

  Response response = handler.handle("ABCDE", {});
  EXPECT_EQ(response.status, beast_http::status::ok);
  EXPECT_FALSE(response.content_encoding.has_value());
  EXPECT_EQ(read_body(response), document);
}

TEST(IndexPageTest, ServesHtml) {
  Response response = index_page();
  EXPECT_EQ(response.status, beast_http::status::ok);
  EXPECT_EQ(response.content_type, "text/html; charset=utf-8");
  EXPECT_NE(response.text.find("<html>"), std::string::npos);
}
