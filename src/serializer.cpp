#include "protocol/serializer.hpp"
#include <algorithm>
#include <cstring>

namespace protocol {

std::vector<Packet> serialize(const uint8_t* payload, std::size_t len) {
    std::size_t count = (len + PACKET_DATA_SIZE - 1) / PACKET_DATA_SIZE;
    std::vector<Packet> packets;
    packets.reserve(count);
    for (std::size_t sequence = 0; sequence < count; ++sequence) {
        std::size_t offset = sequence * PACKET_DATA_SIZE;
        std::size_t chunk = std::min(PACKET_DATA_SIZE, len - offset);

        Packet::Data data{};
        std::memcpy(data.data(), payload + offset, chunk);
        packets.emplace_back(count, sequence, data);
    }
    return packets;
}

std::vector<Packet> serialize(const std::vector<uint8_t>& payload) {
    return serialize(payload.data(), payload.size());
}

std::vector<Packet> serialize(const std::string& payload) {
    return serialize(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

std::vector<uint8_t> deserialize(const std::vector<Packet>& packets) {
    std::vector<uint8_t> buffer(packets.size() * PACKET_DATA_SIZE);
    std::size_t offset = 0;
    for (const auto& packet : packets) {
        std::memcpy(buffer.data() + offset, packet.data().data(), PACKET_DATA_SIZE);
        offset += PACKET_DATA_SIZE;
    }
    return buffer;
}

} // namespace protocol
