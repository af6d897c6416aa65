#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include "store/path_codec.hpp"
#include "store/representation.hpp"
#include "store/store_error.hpp"

namespace hashrange {
namespace store {

// Content addressed store of shard artifacts laid out as
// {base_path}/{c1}/{c2}/{c3}/{c4}/{c5}.{json|json.gz|json.br}
class ShardStore {
public:

  // ---- CONSTRUCTOR ----
  explicit ShardStore(std::filesystem::path base_path);


  // ---- LAYOUT ----
  // Creates the 65,536 leaf directories under the base path.
  // Already existing directories are left alone. Returns how many were newly created
  std::uint64_t ensure_layout() const;
  // True if every leaf directory of the skeleton exists
  bool layout_complete() const;


  // ---- CORE STORAGE OPERATIONS ----
  // Writes (or overwrites) one artifact, returns bytes written
  std::uint64_t put(const RangeKey& key, Representation representation, std::string_view bytes) const;
  // Reads a whole artifact into output
  void get(const RangeKey& key, Representation representation, std::string& output) const;


  // ---- QUERY OPERATIONS ----
  bool has(const RangeKey& key, Representation representation) const;
  std::uintmax_t get_file_size(const RangeKey& key, Representation representation) const;
  // Samples the reference shard 00000 to find out which representations were built
  StoreCapabilities detect_capabilities() const;


  // ---- PATHS ----
  std::filesystem::path artifact_path(const RangeKey& key, Representation representation) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;

  // Throws StoreError if the artifact does not exist
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

} // namespace store
} // namespace hashrange
