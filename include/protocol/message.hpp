#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <variant>
#include "protocol/constants.hpp"
#include "protocol/file_tree.hpp"

namespace protocol {

using Bytes = std::vector<uint8_t>;

// Envelope sent from a client. data holds the encoded sub-payload named by data_type.
struct Request {
    std::string username;
    std::string data_type;
    Bytes data;

    // JSON object {"Username", "DataType", "Data"}, Data as base64
    std::string to_text() const;
    // Throws MalformedEnvelope
    static Request from_text(const std::string& text);
};

struct Response {
    int status = STATUS_OK;
    std::string message;
    Bytes data;

    // JSON object {"Status", "Message", "Data"}, Data as base64
    std::string to_text() const;
    // Throws MalformedEnvelope
    static Response from_text(const std::string& text);
};

bool operator==(const Request& a, const Request& b);
bool operator!=(const Request& a, const Request& b);
bool operator==(const Response& a, const Response& b);
bool operator!=(const Response& a, const Response& b);

// --- Typed sub-payloads carried in Request::data ---

struct IdentityRequest {
    std::string username;
};

struct DigestRequest {
    Dir dir;
};

enum class SyncAction {
    CREATE,
    UPDATE,
    DELETE
};

struct SyncRequest {
    SyncAction action = SyncAction::CREATE;
    File file;
};

struct FileRequest {
    File file;
    Bytes content;
};

bool operator==(const IdentityRequest& a, const IdentityRequest& b);
bool operator==(const DigestRequest& a, const DigestRequest& b);
bool operator==(const SyncRequest& a, const SyncRequest& b);
bool operator==(const FileRequest& a, const FileRequest& b);

using Payload = std::variant<IdentityRequest, DigestRequest, SyncRequest, FileRequest>;

const char* to_string(SyncAction action);
// Throws MalformedEnvelope for an unknown action name
SyncAction sync_action_from_string(const std::string& name);

// TYPE_* tag matching the active alternative
std::string data_type_of(const Payload& payload);
Bytes encode_payload(const Payload& payload);
Request make_request(const std::string& username, const Payload& payload);

// Dispatches on data_type; throws MalformedEnvelope on an unknown tag or a
// body that does not match it
Payload decode_payload(const std::string& data_type, const Bytes& data);
Payload decode_payload(const Request& request);

// Decode a buffer reassembled from packets. Trailing zero padding is dropped
// first; JSON text never contains a raw NUL.
Request decode_request(const Bytes& buffer);
Response decode_response(const Bytes& buffer);

// Standard base64 with padding, as used for every byte field on the wire
std::string to_base64(const Bytes& bytes);
// Throws MalformedEnvelope
Bytes from_base64(const std::string& text);

// Diagnostics only, not part of the wire format
std::string to_string(const Request& request);
std::string to_string(const Response& response);
std::string to_string(const IdentityRequest& request);
std::string to_string(const DigestRequest& request);
std::string to_string(const SyncRequest& request);
std::string to_string(const FileRequest& request);

std::ostream& operator<<(std::ostream& os, const Request& request);
std::ostream& operator<<(std::ostream& os, const Response& response);

} // namespace protocol
