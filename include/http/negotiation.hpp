#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "store/representation.hpp"

namespace hashrange {
namespace http {

// An Accept-Encoding value that is not visible ASCII text
class NegotiationError : public std::runtime_error {
public:
  explicit NegotiationError(const std::string& message)
    : std::runtime_error("Invalid Accept-Encoding header: " + message) {}
};

enum class EncodingToken {
  Brotli,
  GeneralCompressed,
  Unrecognized
};

struct AcceptedEncodings {
  bool brotli = false;
  bool gzip = false;
};


// ---- TOKENIZER ----
// Classifies one token after its quality annotation is stripped: "br", "gzip" or anything else
EncodingToken classify_token(std::string_view token);
// Splits every value on ',', trims, drops ";q=..." and folds recognized tokens.
// Throws NegotiationError if a value holds a byte that is not visible ASCII or tab
AcceptedEncodings parse_accept_encoding(const std::vector<std::string>& header_values);


// ---- DECISION ----
// Fixed precedence brotli > gzip > json, independent of client quality values.
// Returns nullopt when no representation is both available and acceptable
std::optional<store::Representation> choose_representation(const store::StoreCapabilities& capabilities,
                                                            const AcceptedEncodings& accepted);

} // namespace http
} // namespace hashrange
