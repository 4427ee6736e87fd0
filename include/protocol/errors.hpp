#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// A size or sequence value does not fit the 4-byte address field
class AddressOverflow : public ProtocolError {
public:
    explicit AddressOverflow(const std::string& what) : ProtocolError(what) {}
};

// Packet bytes or stream framing could not be decoded
class DecodeFailure : public ProtocolError {
public:
    explicit DecodeFailure(const std::string& what) : ProtocolError(what) {}
};

// Request/Response (or one of their payloads) failed to decode from text
class MalformedEnvelope : public ProtocolError {
public:
    explicit MalformedEnvelope(const std::string& what) : ProtocolError(what) {}
};

} // namespace protocol
