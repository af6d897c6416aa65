#include "store/password_digest.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace hashrange {
namespace store {

//==============================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//==============================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw StoreError("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace


//==============================================
// DIGEST OPERATIONS
//==============================================

std::string sha1_hex(std::string_view text) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext ctx;

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr)) {
    throw StoreError("Digest: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx.get(), text.data(), text.size())) {
    throw StoreError("Digest: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw StoreError("Digest: Failed to finalize hash");
  }

  std::string result;
  result.reserve(hash_len * 2);
  for (unsigned int i = 0; i < hash_len; ++i) {
    result.push_back(hex_digit(hash[i] >> 4));
    result.push_back(hex_digit(hash[i]));
  }
  return result;
}

PasswordDigest digest_password(std::string_view password) {
  std::string hex = sha1_hex(password);
  BOOST_LOG_TRIVIAL(debug) << "Digest: Range key for password is " << hex.substr(0, RANGE_KEY_LENGTH);
  return PasswordDigest{decode(std::string_view(hex).substr(0, RANGE_KEY_LENGTH)),
                        hex.substr(RANGE_KEY_LENGTH)};
}

} // namespace store
} // namespace hashrange
