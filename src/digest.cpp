#include "digest.hpp"
#include <sodium.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace digest {

namespace {

void ensure_sodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

std::string to_hex(const unsigned char* hash, std::size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

bool has_suffix(const std::string& name, const std::string& suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

protocol::Dir build_subtree(const fs::path& root, const fs::path& relative) {
    std::vector<fs::directory_entry> entries;
    for (const auto& entry : fs::directory_iterator(root / relative)) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    protocol::Dir dir;
    dir.path = relative.generic_string();
    dir.name = relative.empty() ? root.filename().string() : relative.filename().string();

    // Children listing, one "<kind> <name>:<digest>" line each
    std::string listing;
    for (const auto& entry : entries) {
        std::string name = entry.path().filename().string();
        if (entry.is_symlink()) {
            continue;
        }
        if (entry.is_directory()) {
            protocol::Dir child = build_subtree(root, relative / name);
            listing += "D " + name + ":" + child.digest + "\n";
            dir.dirs.push_back(std::move(child));
        } else if (entry.is_regular_file() && !has_suffix(name, PARTIAL_SUFFIX)) {
            protocol::File file = describe_file(root, relative / name);
            listing += "F " + name + ":" + file.digest + "\n";
            dir.files.push_back(std::move(file));
        }
    }
    dir.digest = hash_bytes(reinterpret_cast<const uint8_t*>(listing.data()), listing.size());
    return dir;
}

void flatten_into(const protocol::Dir& dir, std::map<std::string, protocol::File>& out) {
    for (const auto& file : dir.files) {
        out[file.path] = file;
    }
    for (const auto& child : dir.dirs) {
        flatten_into(child, out);
    }
}

} // namespace

std::string hash_bytes(const uint8_t* data, std::size_t len) {
    ensure_sodium();

    unsigned char hash[crypto_generichash_BYTES]; // 32 bytes
    crypto_generichash(hash, sizeof(hash), data, len, nullptr, 0);
    return to_hex(hash, sizeof(hash));
}

std::string hash_bytes(const std::vector<uint8_t>& data) {
    return hash_bytes(data.data(), data.size());
}

std::string hash_file(const fs::path& path) {
    ensure_sodium();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for hashing: " + path.string());
    }

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES);

    std::vector<char> buffer(64 * 1024); // 64KB per read
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(buffer.data()),
                                  static_cast<unsigned long long>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing: " + path.string());
    }

    unsigned char hash[crypto_generichash_BYTES];
    crypto_generichash_final(&state, hash, sizeof(hash));
    return to_hex(hash, sizeof(hash));
}

protocol::File describe_file(const fs::path& root, const fs::path& relative) {
    fs::path full = root / relative;
    protocol::File file;
    file.path = relative.generic_string();
    file.name = relative.filename().string();
    file.size = fs::file_size(full);
    file.digest = hash_file(full);
    return file;
}

protocol::Dir build_dir(const fs::path& root) {
    if (!fs::is_directory(root)) {
        throw std::runtime_error("Not a directory: " + root.string());
    }
    return build_subtree(root, fs::path());
}

std::map<std::string, protocol::File> flatten(const protocol::Dir& dir) {
    std::map<std::string, protocol::File> files;
    flatten_into(dir, files);
    return files;
}

std::vector<protocol::SyncRequest> diff(const protocol::Dir& local, const protocol::Dir& remote) {
    std::vector<protocol::SyncRequest> actions;
    if (local.digest == remote.digest) {
        return actions;
    }
    // Deletes go first so a file can replace a directory of the same name
    // (and the reverse) on the remote side
    std::vector<protocol::SyncRequest> writes;

    auto local_files = flatten(local);
    auto remote_files = flatten(remote);

    auto l = local_files.begin();
    auto r = remote_files.begin();
    while (l != local_files.end() || r != remote_files.end()) {
        if (r == remote_files.end() || (l != local_files.end() && l->first < r->first)) {
            writes.push_back({protocol::SyncAction::CREATE, l->second});
            ++l;
        } else if (l == local_files.end() || r->first < l->first) {
            actions.push_back({protocol::SyncAction::DELETE, r->second});
            ++r;
        } else {
            if (l->second.digest != r->second.digest) {
                writes.push_back({protocol::SyncAction::UPDATE, l->second});
            }
            ++l;
            ++r;
        }
    }
    actions.insert(actions.end(), writes.begin(), writes.end());
    return actions;
}

bool is_safe_path(const std::string& relative) {
    if (relative.empty()) {
        return false;
    }
    fs::path path(relative);
    if (path.is_absolute() || path.has_root_path()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace digest
