#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "protocol/packet.hpp"

namespace protocol {

// Splits a payload into ceil(len / PACKET_DATA_SIZE) packets, last one
// zero-padded. An empty payload yields no packets.
std::vector<Packet> serialize(const uint8_t* payload, std::size_t len);
std::vector<Packet> serialize(const std::vector<uint8_t>& payload);
std::vector<Packet> serialize(const std::string& payload);

// Concatenates packet data in the given order. Padding is kept, so the result
// is always packets.size() * PACKET_DATA_SIZE bytes.
std::vector<uint8_t> deserialize(const std::vector<Packet>& packets);

} // namespace protocol
