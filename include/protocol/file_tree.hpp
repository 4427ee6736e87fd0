#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <nlohmann/json.hpp>

namespace protocol {

// A regular file in a synced tree. path is relative to the tree root and
// always '/'-separated.
struct File {
    std::string path;
    std::string name;
    uint64_t size = 0;
    std::string digest; // hex BLAKE2b-256 of the content
};

// A directory in a synced tree; digest covers every child's name and digest
struct Dir {
    std::string path;
    std::string name;
    std::string digest;
    std::vector<File> files;
    std::vector<Dir> dirs;
};

bool operator==(const File& a, const File& b);
bool operator!=(const File& a, const File& b);
bool operator==(const Dir& a, const Dir& b);
bool operator!=(const Dir& a, const Dir& b);

std::ostream& operator<<(std::ostream& os, const File& file);
std::ostream& operator<<(std::ostream& os, const Dir& dir);

// JSON mapping with the wire field names (Path, Name, Size, Digest, Files, Dirs)
void to_json(nlohmann::json& j, const File& file);
void from_json(const nlohmann::json& j, File& file);
void to_json(nlohmann::json& j, const Dir& dir);
void from_json(const nlohmann::json& j, Dir& dir);

} // namespace protocol
