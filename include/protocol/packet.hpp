#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include "protocol/constants.hpp"

namespace protocol {

// Fixed 1032-byte record: total packet count, sequence, data chunk
class Packet {
public:
    using Address = std::array<uint8_t, PACKET_ADDR_SIZE>;
    using Data = std::array<uint8_t, PACKET_DATA_SIZE>;
    using Bytes = std::array<uint8_t, PACKET_TOTAL_SIZE>;

    Packet() = default;

    // Throws AddressOverflow if size or sequence exceeds PACKET_ADDR_MAX
    Packet(uint64_t size, uint64_t sequence, const Data& data);

    void set_size(uint64_t size);
    uint32_t get_size() const;
    void set_sequence(uint64_t sequence);
    uint32_t get_sequence() const;

    const Data& data() const { return data_; }

    Bytes to_bytes() const;
    static Packet from_bytes(const Bytes& bytes);
    // Throws DecodeFailure unless len == PACKET_TOTAL_SIZE
    static Packet from_bytes(const uint8_t* bytes, std::size_t len);

    bool operator==(const Packet& other) const;
    bool operator!=(const Packet& other) const { return !(*this == other); }

private:
    Address size_{};     // 4 bytes
    Address sequence_{}; // 4 bytes
    Data data_{};        // 1024 bytes
};

} // namespace protocol
