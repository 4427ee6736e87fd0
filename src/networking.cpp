#include "networking.hpp"
#include "transfer.hpp"
#include "digest.hpp"
#include "protocol/constants.hpp"
#include "protocol/errors.hpp"
#include <boost/asio.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/statvfs.h>

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

namespace {

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

protocol::Response accepted(protocol::Bytes data = {}) {
    return protocol::Response{protocol::STATUS_OK, protocol::MESSAGE_ACCEPT, std::move(data)};
}

protocol::Response denied() {
    return protocol::Response{protocol::STATUS_BAD, protocol::MESSAGE_DENY, {}};
}

uint64_t available_space(const fs::path& dir) {
    struct statvfs disk_stat;
    if (statvfs(dir.c_str(), &disk_stat) == 0) {
        return static_cast<uint64_t>(disk_stat.f_bavail) * disk_stat.f_frsize;
    }
    return 0;
}

protocol::Bytes read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for reading: " + path.string());
    }
    return protocol::Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

// --- Session ---

Session::Session(fs::path root, logging::Logger& logger)
    : root_(std::move(root)), logger_(logger) {}

protocol::Response Session::handle(const protocol::Request& request) {
    logger_.verbose("request from '" + request.username + "':\n" + protocol::to_string(request));

    protocol::Payload payload;
    try {
        payload = protocol::decode_payload(request);
    } catch (const protocol::MalformedEnvelope& e) {
        logger_.error("Rejecting " + request.data_type + " request: " + e.what());
        return denied();
    }

    if (auto* identity = std::get_if<protocol::IdentityRequest>(&payload)) {
        return on_identity(*identity);
    }
    if (!identified() || request.username != username_) {
        logger_.error("Rejecting " + request.data_type + " request from unidentified user '" + request.username + "'");
        return denied();
    }
    if (auto* snapshot = std::get_if<protocol::DigestRequest>(&payload)) {
        return on_digest(*snapshot);
    }
    if (auto* sync = std::get_if<protocol::SyncRequest>(&payload)) {
        return on_sync(*sync);
    }
    return on_file(std::get<protocol::FileRequest>(payload));
}

protocol::Response Session::on_identity(const protocol::IdentityRequest& req) {
    if (req.username.empty() || req.username == protocol::SERVER_USERNAME) {
        logger_.error("Identity denied for '" + req.username + "'");
        return denied();
    }
    username_ = req.username;
    pending_.clear();
    logger_.info("User '" + username_ + "' identified");
    return accepted(protocol::encode_payload(protocol::IdentityRequest{protocol::SERVER_USERNAME}));
}

protocol::Response Session::on_digest(const protocol::DigestRequest& req) {
    try {
        protocol::Dir server_dir = digest::build_dir(root_);
        logger_.debug("Client digest " + req.dir.digest + ", server digest " + server_dir.digest);
        return accepted(protocol::encode_payload(protocol::DigestRequest{server_dir}));
    } catch (const std::exception& e) {
        logger_.error(std::string("Could not digest server root: ") + e.what());
        return denied();
    }
}

protocol::Response Session::on_sync(const protocol::SyncRequest& req) {
    if (!digest::is_safe_path(req.file.path)) {
        logger_.error("Unsafe path in sync request: '" + req.file.path + "'");
        return denied();
    }

    if (req.action == protocol::SyncAction::DELETE) {
        try {
            remove_file(req.file.path);
        } catch (const std::exception& e) {
            logger_.error("Failed to delete " + req.file.path + ": " + e.what());
            return denied();
        }
        logger_.info("Deleted " + req.file.path);
        return accepted();
    }

    uint64_t space = available_space(root_);
    if (space > 0 && space < req.file.size) {
        logger_.error("Insufficient disk space for " + req.file.path + ": requires " + format_size(req.file.size) +
                      " but only " + format_size(space) + " available");
        return denied();
    }
    pending_.insert(req.file.path);
    logger_.debug(std::string(protocol::to_string(req.action)) + " accepted for " + req.file.path);
    return accepted();
}

protocol::Response Session::on_file(const protocol::FileRequest& req) {
    if (pending_.erase(req.file.path) == 0) {
        logger_.error("Unexpected file content for " + req.file.path);
        return denied();
    }
    if (req.content.size() != req.file.size || digest::hash_bytes(req.content) != req.file.digest) {
        logger_.error("Digest mismatch for " + req.file.path);
        return denied();
    }
    try {
        write_file(req);
    } catch (const std::exception& e) {
        logger_.error("Failed to write " + req.file.path + ": " + e.what());
        return denied();
    }
    logger_.info("Received " + req.file.path + " (" + format_size(req.file.size) + ")");
    return accepted();
}

void Session::remove_file(const std::string& relative) {
    fs::remove(root_ / relative);

    // Prune directories left empty, never the root itself
    for (fs::path dir = fs::path(relative).parent_path(); !dir.empty(); dir = dir.parent_path()) {
        fs::path full = root_ / dir;
        if (!fs::is_directory(full) || !fs::is_empty(full)) {
            break;
        }
        fs::remove(full);
    }
}

void Session::write_file(const protocol::FileRequest& req) {
    fs::path target = root_ / req.file.path;
    fs::path part_file = target;
    part_file += digest::PARTIAL_SUFFIX;

    // Ensure parent directories exist for nested file paths
    fs::path parent = target.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    {
        std::ofstream file(part_file, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + part_file.string());
        }
        file.write(reinterpret_cast<const char*>(req.content.data()), req.content.size());
        if (!file) {
            file.close();
            std::error_code ignored;
            fs::remove(part_file, ignored);
            throw std::runtime_error("Write failed: " + part_file.string());
        }
    }

    // Rename .syncpart to final filename
    std::error_code ec;
    fs::rename(part_file, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(part_file, ignored);
        throw fs::filesystem_error("Failed to rename temp file", part_file, target, ec);
    }
}

// --- Server ---

Server::Server(ServerOptions options, logging::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

void Server::start() {
    fs::create_directories(options_.root);

    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context, tcp::endpoint(tcp::v4(), options_.port));
    logger_.info("Listening on port " + std::to_string(acceptor.local_endpoint().port()) +
                 ", serving " + fs::absolute(options_.root).string());

    while (true) {
        tcp::socket socket(io_context);
        acceptor.accept(socket);
        handle(socket);
    }
}

void Server::handle(tcp::socket& socket) {
    std::string peer;
    try {
        peer = socket.remote_endpoint().address().to_string();
        logger_.info("Client connected from " + peer);

        Session session(options_.root, logger_);
        while (true) {
            protocol::Response response;
            try {
                protocol::Request request = transfer::MessageReceiver::receive_request(socket, options_.max_message_size);
                response = session.handle(request);
            } catch (const protocol::MalformedEnvelope& e) {
                // Framing is intact, only the envelope text is bad
                logger_.error("Malformed request from " + peer + ": " + e.what());
                response = denied();
            }
            transfer::MessageSender::send_response(socket, response);
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::asio::error::eof) {
            logger_.info("Client " + peer + " disconnected");
        } else {
            logger_.error("Connection error with " + peer + ": " + e.what());
        }
    } catch (const protocol::ProtocolError& e) {
        logger_.error("Framing error from " + peer + ", closing connection: " + e.what());
    } catch (const std::exception& e) {
        logger_.error("Session with " + peer + " aborted: " + e.what());
    }
}

// --- Client ---

Client::Client(ClientOptions options, logging::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

protocol::Response Client::exchange(tcp::socket& socket, const protocol::Payload& payload) {
    protocol::Request request = protocol::make_request(options_.username, payload);
    logger_.verbose("sending:\n" + protocol::to_string(request));
    transfer::MessageSender::send_request(socket, request);

    protocol::Response response = transfer::MessageReceiver::receive_response(socket);
    logger_.verbose("received:\n" + protocol::to_string(response));
    return response;
}

bool Client::push(tcp::socket& socket, const protocol::SyncRequest& action) {
    protocol::Response response = exchange(socket, action);
    if (response.status != protocol::STATUS_OK) {
        logger_.error(std::string(protocol::to_string(action.action)) + " denied for " + action.file.path);
        return false;
    }
    if (action.action == protocol::SyncAction::DELETE) {
        logger_.info("Deleted remote " + action.file.path);
        return true;
    }

    protocol::FileRequest file{action.file, read_file(fs::path(options_.root) / action.file.path)};
    response = exchange(socket, file);
    if (response.status != protocol::STATUS_OK) {
        logger_.error("Server rejected content of " + action.file.path);
        return false;
    }
    logger_.info("Sent " + action.file.path + " (" + format_size(action.file.size) + ")");
    return true;
}

bool Client::sync() {
    try {
        protocol::Dir local = digest::build_dir(options_.root);

        boost::asio::io_context io_context;
        tcp::socket socket(io_context);
        tcp::resolver resolver(io_context);
        boost::asio::connect(socket, resolver.resolve(options_.host, std::to_string(options_.port)));
        logger_.info("Connected to " + options_.host + ":" + std::to_string(options_.port));

        // --- Identity ---
        protocol::Response response = exchange(socket, protocol::IdentityRequest{options_.username});
        if (response.status != protocol::STATUS_OK) {
            logger_.error("Identity denied for '" + options_.username + "'");
            return false;
        }
        auto server = std::get<protocol::IdentityRequest>(protocol::decode_payload(protocol::TYPE_IDENTITY, response.data));
        if (server.username != protocol::SERVER_USERNAME) {
            logger_.error("Unexpected server identity '" + server.username + "'");
            return false;
        }

        // --- Digest ---
        response = exchange(socket, protocol::DigestRequest{local});
        if (response.status != protocol::STATUS_OK) {
            logger_.error("Digest exchange denied");
            return false;
        }
        auto remote = std::get<protocol::DigestRequest>(protocol::decode_payload(protocol::TYPE_DIGEST, response.data));

        std::vector<protocol::SyncRequest> actions = digest::diff(local, remote.dir);
        if (actions.empty()) {
            logger_.info("Already in sync (" + local.digest + ")");
            return true;
        }
        logger_.info(std::to_string(actions.size()) + " change(s) to push");

        // --- Actions ---
        bool ok = true;
        for (const auto& action : actions) {
            ok = push(socket, action) && ok;
        }

        socket.shutdown(tcp::socket::shutdown_both);
        return ok;
    } catch (const std::exception& e) {
        logger_.error(std::string("Sync failed: ") + e.what());
        return false;
    }
}

} // namespace networking
