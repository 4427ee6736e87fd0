#pragma once

#include <string>
#include <cstdint>
#include <set>
#include <filesystem>
#include <boost/asio.hpp>
#include "logger.hpp"
#include "transfer.hpp"
#include "protocol/message.hpp"

namespace networking {

constexpr unsigned short DEFAULT_PORT = 45454;

struct ServerOptions {
    std::string root;
    unsigned short port = DEFAULT_PORT;
    // Requests whose packet data would exceed this end the connection
    uint64_t max_message_size = transfer::DEFAULT_MAX_MESSAGE_SIZE;
};

struct ClientOptions {
    std::string host = "127.0.0.1";
    unsigned short port = DEFAULT_PORT;
    std::string username;
    std::string root;
};

// Server side of one connection. Every request gets exactly one response;
// anything other than IDENTITY is denied until a client has identified.
class Session {
public:
    Session(std::filesystem::path root, logging::Logger& logger);

    protocol::Response handle(const protocol::Request& request);

    bool identified() const { return !username_.empty(); }
    const std::string& username() const { return username_; }

private:
    protocol::Response on_identity(const protocol::IdentityRequest& req);
    protocol::Response on_digest(const protocol::DigestRequest& req);
    protocol::Response on_sync(const protocol::SyncRequest& req);
    protocol::Response on_file(const protocol::FileRequest& req);

    void remove_file(const std::string& relative);
    void write_file(const protocol::FileRequest& req);

    std::filesystem::path root_;
    logging::Logger& logger_;
    std::string username_;
    std::set<std::string> pending_; // paths accepted for CREATE/UPDATE, awaiting FILE
};

class Server {
public:
    Server(ServerOptions options, logging::Logger& logger);

    // Accepts connections forever, serving one session at a time
    void start();
    // Serves requests on a connected socket until the peer closes it
    void handle(boost::asio::ip::tcp::socket& socket);

private:
    ServerOptions options_;
    logging::Logger& logger_;
};

class Client {
public:
    Client(ClientOptions options, logging::Logger& logger);

    // Pushes the local root to the server so that both trees match.
    // Returns false if the server denied a step or the connection failed.
    bool sync();

private:
    protocol::Response exchange(boost::asio::ip::tcp::socket& socket, const protocol::Payload& payload);
    bool push(boost::asio::ip::tcp::socket& socket, const protocol::SyncRequest& action);

    ClientOptions options_;
    logging::Logger& logger_;
};

} // namespace networking
