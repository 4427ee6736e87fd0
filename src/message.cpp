#include "protocol/message.hpp"
#include "protocol/errors.hpp"
#include <nlohmann/json.hpp>
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

using nlohmann::json;

namespace protocol {

namespace {

std::string dump(const json& j) {
    // Invalid UTF-8 in string fields is replaced rather than rejected
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json parse_object(const std::string& text, const char* what) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw MalformedEnvelope(std::string(what) + ": invalid JSON");
    }
    if (!j.is_object()) {
        throw MalformedEnvelope(std::string(what) + ": expected a JSON object");
    }
    return j;
}

// A missing byte field or JSON null both decode to an empty buffer
Bytes bytes_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw MalformedEnvelope(std::string(key) + ": expected a base64 string");
    }
    return from_base64(it->get<std::string>());
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw MalformedEnvelope(std::string(key) + ": missing or not a string");
    }
    return it->get<std::string>();
}

std::string printable(const Bytes& data) {
    bool text = std::all_of(data.begin(), data.end(), [](uint8_t c) {
        return std::isprint(c) || c == '\n' || c == '\t';
    });
    if (text) {
        return std::string(data.begin(), data.end());
    }
    return "<" + std::to_string(data.size()) + " bytes>";
}

} // namespace

// --- Base64 ---

std::string to_base64(const Bytes& bytes) {
    if (bytes.empty()) {
        return "";
    }
    std::string out(sodium_base64_encoded_len(bytes.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
    sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    out.resize(out.size() - 1); // drop terminating NUL
    return out;
}

Bytes from_base64(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    Bytes out(text.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                          nullptr, &out_len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
        throw MalformedEnvelope("invalid base64 payload");
    }
    out.resize(out_len);
    return out;
}

// --- Request / Response ---

std::string Request::to_text() const {
    json j{
        {"Username", username},
        {"DataType", data_type},
        {"Data", to_base64(data)}
    };
    return dump(j);
}

Request Request::from_text(const std::string& text) {
    json j = parse_object(text, "request");
    Request request;
    request.username = string_field(j, "Username");
    request.data_type = string_field(j, "DataType");
    request.data = bytes_field(j, "Data");
    return request;
}

std::string Response::to_text() const {
    json j{
        {"Status", status},
        {"Message", message},
        {"Data", to_base64(data)}
    };
    return dump(j);
}

Response Response::from_text(const std::string& text) {
    json j = parse_object(text, "response");
    auto status = j.find("Status");
    if (status == j.end() || !status->is_number_integer()) {
        throw MalformedEnvelope("Status: missing or not an integer");
    }
    bool in_range = status->is_number_unsigned()
        ? status->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : status->get<int64_t>() >= std::numeric_limits<int>::min() &&
          status->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw MalformedEnvelope("Status: " + status->dump() + " out of range");
    }
    Response response;
    response.status = status->get<int>();
    response.message = string_field(j, "Message");
    response.data = bytes_field(j, "Data");
    return response;
}

bool operator==(const Request& a, const Request& b) {
    return a.username == b.username && a.data_type == b.data_type && a.data == b.data;
}

bool operator!=(const Request& a, const Request& b) {
    return !(a == b);
}

bool operator==(const Response& a, const Response& b) {
    return a.status == b.status && a.message == b.message && a.data == b.data;
}

bool operator!=(const Response& a, const Response& b) {
    return !(a == b);
}

// --- Sub-payloads ---

bool operator==(const IdentityRequest& a, const IdentityRequest& b) {
    return a.username == b.username;
}

bool operator==(const DigestRequest& a, const DigestRequest& b) {
    return a.dir == b.dir;
}

bool operator==(const SyncRequest& a, const SyncRequest& b) {
    return a.action == b.action && a.file == b.file;
}

bool operator==(const FileRequest& a, const FileRequest& b) {
    return a.file == b.file && a.content == b.content;
}

const char* to_string(SyncAction action) {
    switch (action) {
        case SyncAction::CREATE: return "CREATE";
        case SyncAction::UPDATE: return "UPDATE";
        case SyncAction::DELETE: return "DELETE";
    }
    return "UNKNOWN";
}

SyncAction sync_action_from_string(const std::string& name) {
    if (name == "CREATE") return SyncAction::CREATE;
    if (name == "UPDATE") return SyncAction::UPDATE;
    if (name == "DELETE") return SyncAction::DELETE;
    throw MalformedEnvelope("unknown sync action: " + name);
}

namespace {

struct PayloadEncoder {
    json operator()(const IdentityRequest& req) const {
        return json{{"Username", req.username}};
    }
    json operator()(const DigestRequest& req) const {
        return json{{"Dir", req.dir}};
    }
    json operator()(const SyncRequest& req) const {
        return json{{"Action", to_string(req.action)}, {"File", req.file}};
    }
    json operator()(const FileRequest& req) const {
        return json{{"File", req.file}, {"Content", to_base64(req.content)}};
    }
};

struct PayloadTag {
    std::string operator()(const IdentityRequest&) const { return TYPE_IDENTITY; }
    std::string operator()(const DigestRequest&) const { return TYPE_DIGEST; }
    std::string operator()(const SyncRequest&) const { return TYPE_SYNC_REQUEST; }
    std::string operator()(const FileRequest&) const { return TYPE_FILE; }
};

} // namespace

std::string data_type_of(const Payload& payload) {
    return std::visit(PayloadTag{}, payload);
}

Bytes encode_payload(const Payload& payload) {
    std::string text = dump(std::visit(PayloadEncoder{}, payload));
    return Bytes(text.begin(), text.end());
}

Request make_request(const std::string& username, const Payload& payload) {
    return Request{username, data_type_of(payload), encode_payload(payload)};
}

Payload decode_payload(const std::string& data_type, const Bytes& data) {
    json j = parse_object(std::string(data.begin(), data.end()), data_type.c_str());
    try {
        if (data_type == TYPE_IDENTITY) {
            return IdentityRequest{string_field(j, "Username")};
        }
        if (data_type == TYPE_DIGEST) {
            return DigestRequest{j.at("Dir").get<Dir>()};
        }
        if (data_type == TYPE_SYNC_REQUEST) {
            SyncRequest req;
            req.action = sync_action_from_string(string_field(j, "Action"));
            req.file = j.at("File").get<File>();
            return req;
        }
        if (data_type == TYPE_FILE) {
            FileRequest req;
            req.file = j.at("File").get<File>();
            req.content = bytes_field(j, "Content");
            return req;
        }
    } catch (const json::exception& e) {
        throw MalformedEnvelope(data_type + ": " + e.what());
    }
    throw MalformedEnvelope("unknown data type: " + data_type);
}

Payload decode_payload(const Request& request) {
    return decode_payload(request.data_type, request.data);
}

// --- Packet buffers ---

namespace {

std::string strip_padding(const Bytes& buffer) {
    auto end = std::find_if(buffer.rbegin(), buffer.rend(), [](uint8_t c) { return c != 0; });
    return std::string(buffer.begin(), end.base());
}

} // namespace

Request decode_request(const Bytes& buffer) {
    return Request::from_text(strip_padding(buffer));
}

Response decode_response(const Bytes& buffer) {
    return Response::from_text(strip_padding(buffer));
}

// --- Diagnostics ---

std::string to_string(const Request& request) {
    std::ostringstream oss;
    oss << "Username: " << request.username << "\n"
        << "DataType: " << request.data_type << "\n"
        << "Data: " << printable(request.data) << "\n";
    return oss.str();
}

std::string to_string(const Response& response) {
    std::ostringstream oss;
    oss << "Status: " << response.status << "\n"
        << "Message: " << response.message << "\n"
        << "Data: " << printable(response.data) << "\n";
    return oss.str();
}

std::string to_string(const IdentityRequest& request) {
    return "Username: " + request.username + "\n";
}

std::string to_string(const DigestRequest& request) {
    std::ostringstream oss;
    oss << "Dir: " << request.dir << "\n";
    return oss.str();
}

std::string to_string(const SyncRequest& request) {
    std::ostringstream oss;
    oss << "Action: " << to_string(request.action) << "\n"
        << "File: " << request.file << "\n";
    return oss.str();
}

std::string to_string(const FileRequest& request) {
    std::ostringstream oss;
    oss << "File: " << request.file << "\n"
        << "Content: " << printable(request.content) << "\n";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Request& request) {
    return os << to_string(request);
}

std::ostream& operator<<(std::ostream& os, const Response& response) {
    return os << to_string(response);
}

} // namespace protocol
