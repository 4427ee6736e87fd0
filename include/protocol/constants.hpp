#pragma once

#include <cstddef>
#include <cstdint>

namespace protocol {

// Stream role prefixes, written once ahead of every message
constexpr char REQUEST_PREFIX = 'q';
constexpr char RESPONSE_PREFIX = 's';

constexpr std::size_t PACKET_DATA_SIZE = 1024;
constexpr std::size_t PACKET_ADDR_SIZE = 4;
constexpr std::size_t PACKET_TOTAL_SIZE = 2 * PACKET_ADDR_SIZE + PACKET_DATA_SIZE; // 1032

// Largest packet count / sequence the address field can hold
constexpr uint64_t PACKET_ADDR_MAX = 0xFFFFFFFFull;

constexpr uint8_t BYTE_DELIM = 4;
constexpr char STRING_DELIM[] = "\x04";

// Request::data_type tags
constexpr char TYPE_IDENTITY[] = "IDENTITY";
constexpr char TYPE_DIGEST[] = "DIGEST";
constexpr char TYPE_SYNC_REQUEST[] = "SYNC-REQUEST";
constexpr char TYPE_FILE[] = "FILE";

constexpr int STATUS_OK = 200;
constexpr int STATUS_BAD = 400;

constexpr char MESSAGE_ACCEPT[] = "ACCEPT";
constexpr char MESSAGE_DENY[] = "DENY";

constexpr char SERVER_USERNAME[] = "SYNCBOX-SERVER";

} // namespace protocol
