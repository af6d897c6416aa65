#include "http/negotiation.hpp"

namespace hashrange {
namespace http {

namespace {

bool is_header_text(char c) {
  unsigned char byte = static_cast<unsigned char>(c);
  return byte == '\t' || (byte >= 0x20 && byte < 0x7F);
}

std::string_view trim(std::string_view text) {
  const char* whitespace = " \t";
  std::size_t first = text.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  std::size_t last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

} // namespace


//==============================================
// TOKENIZER
//==============================================

EncodingToken classify_token(std::string_view token) {
  if (token == "br") {
    return EncodingToken::Brotli;
  }
  if (token == "gzip") {
    return EncodingToken::GeneralCompressed;
  }
  return EncodingToken::Unrecognized;
}

AcceptedEncodings parse_accept_encoding(const std::vector<std::string>& header_values) {
  AcceptedEncodings accepted;

  for (const auto& value : header_values) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      if (!is_header_text(value[i])) {
        throw NegotiationError("byte " + std::to_string(static_cast<unsigned char>(value[i])) +
                               " at position " + std::to_string(i) + " is not visible ASCII");
      }
    }

    std::string_view rest(value);
    while (true) {
      std::size_t comma = rest.find(',');
      std::string_view item = trim(rest.substr(0, comma));

      // Drop the quality annotation, "gzip;q=0.8" -> "gzip"
      std::size_t params = item.find(';');
      if (params != std::string_view::npos) {
        item = trim(item.substr(0, params));
      }

      switch (classify_token(item)) {
        case EncodingToken::Brotli:
          accepted.brotli = true;
          break;
        case EncodingToken::GeneralCompressed:
          accepted.gzip = true;
          break;
        case EncodingToken::Unrecognized:
          break;
      }

      if (comma == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(comma + 1);
    }
  }

  return accepted;
}


//==============================================
// DECISION
//==============================================

std::optional<store::Representation> choose_representation(const store::StoreCapabilities& capabilities,
                                                            const AcceptedEncodings& accepted) {
  if (capabilities.brotli && accepted.brotli) {
    return store::Representation::Brotli;
  }
  if (capabilities.gzip && accepted.gzip) {
    return store::Representation::Gzip;
  }
  if (capabilities.json) {
    return store::Representation::Json;
  }
  return std::nullopt;
}

} // namespace http
} // namespace hashrange
