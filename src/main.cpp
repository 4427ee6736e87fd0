#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "digest.hpp"
#include "logger.hpp"
#include "networking.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  syncbox [--verbose|--quiet] serve <root> [port]\n"
              << "  syncbox [--verbose|--quiet] sync <host> <port> <username> <root>\n"
              << "  syncbox [--verbose|--quiet] digest <root>\n";
}

unsigned short parse_port(const std::string& arg) {
    unsigned long port = std::stoul(arg);
    if (port == 0 || port > 65535) {
        throw std::out_of_range("port out of range: " + arg);
    }
    return static_cast<unsigned short>(port);
}

} // namespace

int main(int argc, char* argv[]) {
    logging::LogOptions log_options;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            log_options.verbose = true;
        } else if (arg == "--quiet") {
            log_options.info = false;
            log_options.debug = false;
        } else {
            args.push_back(arg);
        }
    }
    logging::Logger logger(log_options);

    if (args.empty()) {
        print_usage();
        return 1;
    }

    try {
        if (args[0] == "serve" && (args.size() == 2 || args.size() == 3)) {
            networking::ServerOptions options;
            options.root = args[1];
            if (args.size() == 3) {
                options.port = parse_port(args[2]);
            }
            networking::Server server(options, logger);
            server.start();
        } else if (args[0] == "sync" && args.size() == 5) {
            networking::ClientOptions options;
            options.host = args[1];
            options.port = parse_port(args[2]);
            options.username = args[3];
            options.root = args[4];

            networking::Client client(options, logger);
            return client.sync() ? 0 : 1;
        } else if (args[0] == "digest" && args.size() == 2) {
            nlohmann::json j = digest::build_dir(args[1]);
            std::cout << j.dump(2) << "\n";
        } else {
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        logger.error(e.what());
        return 1;
    }
    return 0;
}
