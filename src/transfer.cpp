#include "transfer.hpp"
#include "protocol/errors.hpp"
#include "protocol/serializer.hpp"
#include <array>
#include <string>

namespace transfer {

namespace {

protocol::Packet read_packet(boost::asio::ip::tcp::socket& socket) {
    protocol::Packet::Bytes buf;
    boost::asio::read(socket, boost::asio::buffer(buf));
    return protocol::Packet::from_bytes(buf);
}

} // namespace

void MessageSender::send_packets(boost::asio::ip::tcp::socket& socket, char prefix,
                                 const std::vector<protocol::Packet>& packets) {
    if (packets.empty()) {
        throw protocol::ProtocolError("refusing to send a message with no packets");
    }
    boost::asio::write(socket, boost::asio::buffer(&prefix, 1));
    for (const auto& packet : packets) {
        auto buf = packet.to_bytes();
        boost::asio::write(socket, boost::asio::buffer(buf));
    }
}

void MessageSender::send_request(boost::asio::ip::tcp::socket& socket, const protocol::Request& request) {
    send_packets(socket, protocol::REQUEST_PREFIX, protocol::serialize(request.to_text()));
}

void MessageSender::send_response(boost::asio::ip::tcp::socket& socket, const protocol::Response& response) {
    send_packets(socket, protocol::RESPONSE_PREFIX, protocol::serialize(response.to_text()));
}

std::vector<protocol::Packet> MessageReceiver::receive_packets(boost::asio::ip::tcp::socket& socket, char expected_prefix,
                                                               uint64_t max_message_size) {
    char prefix = 0;
    boost::asio::read(socket, boost::asio::buffer(&prefix, 1));
    if (prefix != expected_prefix) {
        throw protocol::DecodeFailure("unexpected stream prefix " + std::to_string(static_cast<int>(prefix)) +
                                      ", expected '" + std::string(1, expected_prefix) + "'");
    }

    protocol::Packet first = read_packet(socket);
    uint32_t size = first.get_size();
    if (size == 0 || first.get_sequence() != 0) {
        throw protocol::DecodeFailure("first packet has size " + std::to_string(size) +
                                      " and sequence " + std::to_string(first.get_sequence()));
    }
    if (static_cast<uint64_t>(size) * protocol::PACKET_DATA_SIZE > max_message_size) {
        throw protocol::DecodeFailure("message of " + std::to_string(size) + " packets exceeds the " +
                                      std::to_string(max_message_size) + "-byte limit");
    }

    std::vector<protocol::Packet> packets;
    packets.push_back(first);
    for (uint32_t sequence = 1; sequence < size; ++sequence) {
        protocol::Packet packet = read_packet(socket);
        if (packet.get_size() != size || packet.get_sequence() != sequence) {
            throw protocol::DecodeFailure("packet " + std::to_string(packet.get_sequence()) + "/" +
                                          std::to_string(packet.get_size()) + " out of sequence, expected " +
                                          std::to_string(sequence) + "/" + std::to_string(size));
        }
        packets.push_back(packet);
    }
    return packets;
}

protocol::Request MessageReceiver::receive_request(boost::asio::ip::tcp::socket& socket, uint64_t max_message_size) {
    auto packets = receive_packets(socket, protocol::REQUEST_PREFIX, max_message_size);
    return protocol::decode_request(protocol::deserialize(packets));
}

protocol::Response MessageReceiver::receive_response(boost::asio::ip::tcp::socket& socket, uint64_t max_message_size) {
    auto packets = receive_packets(socket, protocol::RESPONSE_PREFIX, max_message_size);
    return protocol::decode_response(protocol::deserialize(packets));
}

} // namespace transfer
