/*
 * BcmpChat server entry point
 *
 * Usage: bcmpchat_server [bind-address] [port]
 *
 * Environment:
 *   BCMPCHAT_UNENCRYPTED  accept plaintext sessions when set
 *   BCMPCHAT_MAX_USERS    maximum number of connected users (default 50)
 *   BCMPCHAT_LOG_LEVEL    debug, info, warn or error (default info)
 *   BCMPCHAT_LOG_FILE     also append log lines to this file
 */

#include "server.hpp"
#include "utils.hpp"

#include <pthread.h>
#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace bcmpchat;

namespace {
ServerConfig load_config(int argc, char** argv) {
    ServerConfig config;
    if (argc >= 2) {
        config.bind_address = argv[1];
    } else {
        log_warn("Bind IP missing, assuming 0.0.0.0");
    }
    if (argc >= 3) {
        config.port = parse_port(argv[2]);
    }

    config.require_encryption = !env_var("BCMPCHAT_UNENCRYPTED").has_value();
    if (auto max_users = env_var("BCMPCHAT_MAX_USERS")) {
        config.max_users = static_cast<std::size_t>(std::stoul(*max_users));
    }
    return config;
}

void configure_logging() {
    if (auto level_name = env_var("BCMPCHAT_LOG_LEVEL")) {
        auto level = parse_log_level(*level_name);
        if (level) {
            set_log_level(*level);
        } else {
            log_warn("Unknown log level " + *level_name + ", keeping info");
        }
    }
    if (auto path = env_var("BCMPCHAT_LOG_FILE")) {
        set_log_file(*path);
    }
}
} // namespace

int main(int argc, char** argv) {
    set_log_level(LogLevel::Info);
    configure_logging();

    // Block the shutdown signals in every thread; main waits for them below.
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr) != 0) {
        log_error("Unable to block shutdown signals");
        return 1;
    }

    try {
        ChatServer server(load_config(argc, argv));
        server.start();

        int received = 0;
        if (sigwait(&shutdown_signals, &received) != 0) {
            log_error("sigwait failed");
        }
        log_info(std::string("Received ") + (received == SIGTERM ? "SIGTERM" : "SIGINT") +
                 ", exiting...");

        server.stop();
    } catch (const std::exception& ex) {
        log_error(std::string("Server error: ") + ex.what());
        return 1;
    }

    return 0;
}
