#include "protocol/file_tree.hpp"

namespace protocol {

bool operator==(const File& a, const File& b) {
    return a.path == b.path && a.name == b.name && a.size == b.size && a.digest == b.digest;
}

bool operator!=(const File& a, const File& b) {
    return !(a == b);
}

bool operator==(const Dir& a, const Dir& b) {
    return a.path == b.path && a.name == b.name && a.digest == b.digest &&
           a.files == b.files && a.dirs == b.dirs;
}

bool operator!=(const Dir& a, const Dir& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const File& file) {
    return os << "File{" << file.path << ", " << file.size << " bytes, " << file.digest << "}";
}

std::ostream& operator<<(std::ostream& os, const Dir& dir) {
    return os << "Dir{" << (dir.path.empty() ? "." : dir.path) << ", " << dir.files.size()
              << " files, " << dir.dirs.size() << " dirs, " << dir.digest << "}";
}

void to_json(nlohmann::json& j, const File& file) {
    j = nlohmann::json{
        {"Path", file.path},
        {"Name", file.name},
        {"Size", file.size},
        {"Digest", file.digest}
    };
}

void from_json(const nlohmann::json& j, File& file) {
    j.at("Path").get_to(file.path);
    j.at("Name").get_to(file.name);
    j.at("Size").get_to(file.size);
    j.at("Digest").get_to(file.digest);
}

void to_json(nlohmann::json& j, const Dir& dir) {
    j = nlohmann::json{
        {"Path", dir.path},
        {"Name", dir.name},
        {"Digest", dir.digest},
        {"Files", dir.files},
        {"Dirs", dir.dirs}
    };
}

void from_json(const nlohmann::json& j, Dir& dir) {
    j.at("Path").get_to(dir.path);
    j.at("Name").get_to(dir.name);
    j.at("Digest").get_to(dir.digest);
    j.at("Files").get_to(dir.files);
    j.at("Dirs").get_to(dir.dirs);
}

} // namespace protocol
