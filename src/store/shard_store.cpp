#include "store/shard_store.hpp"
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace hashrange {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

ShardStore::ShardStore(std::filesystem::path base_path) : base_path_(std::move(base_path)) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Using store root: "
                           << (base_path_.empty() ? std::string("<current directory>") : base_path_.string());
}


//==============================================
// LAYOUT
//==============================================

std::uint64_t ShardStore::ensure_layout() const {
  BOOST_LOG_TRIVIAL(info) << "Store: Ensuring " << DIRECTORY_COUNT << " output directories under " << base_path_;

  std::uint64_t created = 0;
  for (unsigned c1 = 0; c1 < 16; ++c1) {
    std::filesystem::path p1 = base_path_ / std::string(1, hex_digit(c1));
    for (unsigned c2 = 0; c2 < 16; ++c2) {
      std::filesystem::path p2 = p1 / std::string(1, hex_digit(c2));
      for (unsigned c3 = 0; c3 < 16; ++c3) {
        std::filesystem::path p3 = p2 / std::string(1, hex_digit(c3));
        for (unsigned c4 = 0; c4 < 16; ++c4) {
          std::error_code ec;
          if (std::filesystem::create_directories(p3 / std::string(1, hex_digit(c4)), ec)) {
            ++created;
          } else if (ec) {
            BOOST_LOG_TRIVIAL(error) << "Store: Failed to create directory under " << p3 << ": " << ec.message();
            throw StoreError("Store: Failed to create directory " + p3.string() + ": " + ec.message());
          }
        }
      }
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Created " << created << " new directories";
  return created;
}

bool ShardStore::layout_complete() const {
  for (std::uint32_t index = 0; index < DIRECTORY_COUNT; ++index) {
    std::filesystem::path leaf = base_path_;
    for (int shift = 12; shift >= 0; shift -= 4) {
      leaf /= std::string(1, hex_digit(index >> shift));
    }
    if (!std::filesystem::is_directory(leaf)) {
      return false;
    }
  }
  return true;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::uint64_t ShardStore::put(const RangeKey& key, Representation representation,
                              std::string_view bytes) const {
  std::filesystem::path file_path = artifact_path(key, representation);
  BOOST_LOG_TRIVIAL(trace) << "Store: Writing " << bytes.size() << " bytes to " << file_path.string();

  // Truncates any artifact left by an earlier run
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create file: " << file_path.string();
    throw StoreError("Store: Failed to create file: " + file_path.string());
  }

  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write file: " << file_path.string();
    throw StoreError("Store: Failed to write file: " + file_path.string());
  }

  return bytes.size();
}

void ShardStore::get(const RangeKey& key, Representation representation, std::string& output) const {
  std::filesystem::path file_path = artifact_path(key, representation);
  verify_file_exists(file_path);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  char buffer[4096];
  std::size_t total_bytes = 0;

  // Read file in chunks
  while (file.read(buffer, sizeof(buffer))) {
    output.append(buffer, static_cast<std::size_t>(file.gcount()));
    total_bytes += file.gcount();
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    output.append(buffer, static_cast<std::size_t>(file.gcount()));
    total_bytes += file.gcount();
  }

  if (file.bad()) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Read " << total_bytes << " bytes from " << file_path.string();
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ShardStore::has(const RangeKey& key, Representation representation) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(artifact_path(key, representation), ec);
}

std::uintmax_t ShardStore::get_file_size(const RangeKey& key, Representation representation) const {
  std::filesystem::path file_path = artifact_path(key, representation);
  verify_file_exists(file_path);
  return std::filesystem::file_size(file_path);
}

StoreCapabilities ShardStore::detect_capabilities() const {
  const RangeKey reference = decode("00000");

  StoreCapabilities capabilities;
  capabilities.json = has(reference, Representation::Json);
  capabilities.gzip = has(reference, Representation::Gzip);
  capabilities.brotli = has(reference, Representation::Brotli);

  BOOST_LOG_TRIVIAL(info) << "Store: Capabilities brotli: " << capabilities.brotli
                          << " | gzip: " << capabilities.gzip
                          << " | json: " << capabilities.json;
  return capabilities;
}


//==============================================
// PATHS
//==============================================

std::filesystem::path ShardStore::artifact_path(const RangeKey& key, Representation representation) const {
  std::filesystem::path path = base_path_ / encode(key);
  path += ".";
  path += extension(representation);
  return path;
}

void ShardStore::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << file_path.string();
    throw StoreError("Store: File not found: " + file_path.string());
  }
}

} // namespace store
} // namespace hashrange
