#include "protocol/packet.hpp"
#include "protocol/errors.hpp"
#include <endian.h>
#include <cstring>
#include <string>

namespace protocol {

namespace {

Packet::Address encode_address(uint64_t value, const char* field) {
    if (value > PACKET_ADDR_MAX) {
        throw AddressOverflow(std::string(field) + " " + std::to_string(value) +
                              " exceeds the " + std::to_string(PACKET_ADDR_SIZE) + "-byte address field");
    }
    Packet::Address bytes;
    uint32_t le = htole32(static_cast<uint32_t>(value));
    std::memcpy(bytes.data(), &le, PACKET_ADDR_SIZE);
    return bytes;
}

uint32_t decode_address(const Packet::Address& bytes) {
    uint32_t le;
    std::memcpy(&le, bytes.data(), PACKET_ADDR_SIZE);
    return le32toh(le);
}

} // namespace

Packet::Packet(uint64_t size, uint64_t sequence, const Data& data) : data_(data) {
    set_size(size);
    set_sequence(sequence);
}

void Packet::set_size(uint64_t size) {
    size_ = encode_address(size, "packet size");
}

uint32_t Packet::get_size() const {
    return decode_address(size_);
}

void Packet::set_sequence(uint64_t sequence) {
    sequence_ = encode_address(sequence, "packet sequence");
}

uint32_t Packet::get_sequence() const {
    return decode_address(sequence_);
}

Packet::Bytes Packet::to_bytes() const {
    Bytes buffer;
    std::memcpy(buffer.data(), size_.data(), PACKET_ADDR_SIZE);
    std::memcpy(buffer.data() + PACKET_ADDR_SIZE, sequence_.data(), PACKET_ADDR_SIZE);
    std::memcpy(buffer.data() + 2 * PACKET_ADDR_SIZE, data_.data(), PACKET_DATA_SIZE);
    return buffer;
}

Packet Packet::from_bytes(const Bytes& bytes) {
    Packet packet;
    std::memcpy(packet.size_.data(), bytes.data(), PACKET_ADDR_SIZE);
    std::memcpy(packet.sequence_.data(), bytes.data() + PACKET_ADDR_SIZE, PACKET_ADDR_SIZE);
    std::memcpy(packet.data_.data(), bytes.data() + 2 * PACKET_ADDR_SIZE, PACKET_DATA_SIZE);
    return packet;
}

Packet Packet::from_bytes(const uint8_t* bytes, std::size_t len) {
    if (bytes == nullptr || len != PACKET_TOTAL_SIZE) {
        throw DecodeFailure("packet buffer must be " + std::to_string(PACKET_TOTAL_SIZE) +
                            " bytes, got " + std::to_string(len));
    }
    Bytes buffer;
    std::memcpy(buffer.data(), bytes, PACKET_TOTAL_SIZE);
    return from_bytes(buffer);
}

bool Packet::operator==(const Packet& other) const {
    return size_ == other.size_ && sequence_ == other.sequence_ && data_ == other.data_;
}

} // namespace protocol
