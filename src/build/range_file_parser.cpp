#include "build/range_file_parser.hpp"
#include <charconv>
#include <fstream>
#include <string_view>
#include <boost/log/trivial.hpp>
#include "store/password_digest.hpp"

namespace hashrange {
namespace build {

namespace {

// Typical HIBP range files hold a few hundred to a few thousand lines
constexpr std::size_t EXPECTED_RECORDS = 2048;

std::string line_error(const std::string& source_name, std::size_t line_number, const std::string& what) {
  return source_name + ":" + std::to_string(line_number) + ": " + what;
}

} // namespace


//==============================================
// RANGE FILE PARSING
//==============================================

std::vector<Record> parse_range_lines(const store::RangeKey& key, std::istream& input,
                                      const std::string& source_name) {
  std::vector<Record> records;
  records.reserve(EXPECTED_RECORDS);

  std::string line;
  std::size_t line_number = 0;

  while (std::getline(input, line)) {
    ++line_number;

    // Tolerate CRLF line endings
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    std::string_view view(line);
    std::size_t separator = view.find(':');
    if (separator == std::string_view::npos) {
      throw ParseError(line_error(source_name, line_number, "missing ':' separator"));
    }

    std::string_view suffix = view.substr(0, separator);
    std::string_view count_text = view.substr(separator + 1);

    if (suffix.size() != store::SUFFIX_LENGTH) {
      throw ParseError(line_error(source_name, line_number,
        "suffix has " + std::to_string(suffix.size()) + " characters, expected " +
        std::to_string(store::SUFFIX_LENGTH)));
    }

    Record record;
    record.hash.reserve(store::FULL_HASH_LENGTH);
    record.hash = key.str();
    for (char c : suffix) {
      char canonical = store::canonical_hex(c);
      if (canonical == '\0') {
        throw ParseError(line_error(source_name, line_number, "suffix contains a non-hex character"));
      }
      record.hash.push_back(canonical);
    }

    const char* first = count_text.data();
    const char* last = first + count_text.size();
    auto [ptr, ec] = std::from_chars(first, last, record.count);
    if (count_text.empty() || ec != std::errc() || ptr != last) {
      throw ParseError(line_error(source_name, line_number,
        "count '" + std::string(count_text) + "' is not a non-negative integer"));
    }

    records.push_back(std::move(record));
  }

  if (input.bad()) {
    throw ParseError(source_name + ": read failure after line " + std::to_string(line_number));
  }

  return records;
}

Shard parse_range_file(const std::filesystem::path& path) {
  store::RangeKey key = store::decode(path.stem().string());

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Parser: Failed to open range file: " << path.string();
    throw ParseError(path.string() + ": cannot open file");
  }

  Shard shard{key, parse_range_lines(key, file, path.string())};
  BOOST_LOG_TRIVIAL(trace) << "Parser: Parsed " << shard.records.size() << " records from " << path.string();
  return shard;
}

} // namespace build
} // namespace hashrange
