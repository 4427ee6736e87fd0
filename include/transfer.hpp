#pragma once

#include <cstdint>
#include <vector>
#include <boost/asio.hpp>
#include "protocol/packet.hpp"
#include "protocol/message.hpp"

namespace transfer {

// Largest message a receiver accepts by default (1 GiB of packet data)
constexpr uint64_t DEFAULT_MAX_MESSAGE_SIZE = uint64_t{1} << 30;

// Stream format: one prefix byte (REQUEST_PREFIX / RESPONSE_PREFIX), then
// every packet of the message in sequence order.
class MessageSender {
public:
    // Throws protocol::ProtocolError for an empty packet set
    static void send_packets(boost::asio::ip::tcp::socket& socket, char prefix,
                             const std::vector<protocol::Packet>& packets);
    static void send_request(boost::asio::ip::tcp::socket& socket, const protocol::Request& request);
    static void send_response(boost::asio::ip::tcp::socket& socket, const protocol::Response& response);
};

class MessageReceiver {
public:
    // Throws protocol::DecodeFailure on a wrong prefix, a zero packet count,
    // a packet count whose data exceeds max_message_size, or packets out of
    // sequence. I/O errors (including EOF) propagate as
    // boost::system::system_error.
    static std::vector<protocol::Packet> receive_packets(boost::asio::ip::tcp::socket& socket, char expected_prefix,
                                                         uint64_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);
    static protocol::Request receive_request(boost::asio::ip::tcp::socket& socket,
                                             uint64_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);
    static protocol::Response receive_response(boost::asio::ip::tcp::socket& socket,
                                               uint64_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);
};

} // namespace transfer
