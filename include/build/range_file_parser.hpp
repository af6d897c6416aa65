#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include "store/path_codec.hpp"
#include "build/build_error.hpp"

namespace hashrange {
namespace build {

// One breach record: full 40 character identifier (range key + suffix) and its count
struct Record {
  std::string hash;
  std::uint64_t count = 0;

  bool operator==(const Record& other) const {
    return hash == other.hash && count == other.count;
  }
};

// Records of one range key in input line order
struct Shard {
  store::RangeKey key;
  std::vector<Record> records;
};


// ---- RANGE FILE PARSING ----
// Parses "<suffix>:<count>" lines. Throws ParseError naming source and line number
// on a missing separator, a suffix that is not 35 hex characters or a non-numeric count
std::vector<Record> parse_range_lines(const store::RangeKey& key, std::istream& input,
                                      const std::string& source_name);
// Derives the key from the file name (stem) and parses the whole file.
// Throws store::InvalidKeyError for a bad file name, ParseError for bad content
Shard parse_range_file(const std::filesystem::path& path);

} // namespace build
} // namespace hashrange
