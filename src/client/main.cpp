/*
 * BcmpChat client entry point
 */

#include "client.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <exception>
#include <iostream>
#include <string>

using namespace bcmpchat;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: bcmpchat_client <server-host> [port] [nickname]\n";
        return 1;
    }

    if (auto level_name = env_var("BCMPCHAT_LOG_LEVEL")) {
        if (auto level = parse_log_level(*level_name)) {
            set_log_level(*level);
        }
    }

    std::string host = argv[1];
    uint16_t port = kDefaultPort;
    if (argc >= 3) {
        try {
            port = parse_port(argv[2]);
        } catch (const std::exception& ex) {
            std::cerr << "Bad port " << argv[2] << ": " << ex.what() << std::endl;
            return 1;
        }
    }

    std::string nick;
    if (argc >= 4) {
        nick = argv[3];
    } else {
        std::cout << "Enter nickname: " << std::flush;
        try {
            nick = trim(read_line(STDIN_FILENO).value_or(""));
        } catch (const std::exception& ex) {
            std::cerr << ex.what() << std::endl;
            return 1;
        }
    }

    std::cout << "Connecting to " << host << ":" << port << std::endl;

    try {
        ChatClient client;
        auto refusal = client.connect_to_server(host, port, nick);
        if (refusal) {
            std::cerr << "Server refused connection: " << *refusal << std::endl;
            return 0;
        }
        std::cout << "Type /nick <name> to change nickname, /quit to exit.\n";
        client.run();
    } catch (const std::exception& ex) {
        std::cerr << "Error connecting to server: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
