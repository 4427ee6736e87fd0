#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <map>
#include <vector>
#include <filesystem>
#include "protocol/file_tree.hpp"
#include "protocol/message.hpp"

namespace digest {

// Suffix of in-flight downloads; never part of a digest tree
constexpr char PARTIAL_SUFFIX[] = ".syncpart";

// Hash bytes using libsodium crypto_generichash (BLAKE2b)
// Returns a 32-byte hash as a hex string
std::string hash_bytes(const uint8_t* data, std::size_t len);
std::string hash_bytes(const std::vector<uint8_t>& data);

// Streams the file through the hash; throws std::runtime_error if unreadable
std::string hash_file(const std::filesystem::path& path);

// Describe the regular file at root/relative
protocol::File describe_file(const std::filesystem::path& root, const std::filesystem::path& relative);

// Recursively digest the tree under root. Children are sorted by name.
protocol::Dir build_dir(const std::filesystem::path& root);

// Every file in the tree keyed by its relative path
std::map<std::string, protocol::File> flatten(const protocol::Dir& dir);

// Actions that make remote match local: every DELETE first, then
// CREATE/UPDATE, each group in path order
std::vector<protocol::SyncRequest> diff(const protocol::Dir& local, const protocol::Dir& remote);

// Relative path is non-empty, not absolute and has no ".." component
bool is_safe_path(const std::string& relative);

} // namespace digest
