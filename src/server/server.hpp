#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <signal.h>
#include "../non_copyable.hpp"
#include "handler.hpp"
#include "wait_group.hpp"

namespace server {

    struct ServerSettings {

        /// @brief Listen address, host:port
        std::string address = "127.0.0.1:6399";

        /// @brief Server socket backlog, depends on net.core.somaxconn, connections are not limited beyond it
        int maxConnections = 1024;

        /// @brief Time a closing connection waits for replies in flight before it is shut down
        std::chrono::seconds timeout{10};

        /// @brief Requested buffer size for server socket
        int sockBuffer = 1048576;
    };

    /// @brief Blocking TCP server, every accepted connection is served by handler on its own thread
    class CacheServer : NonCopyableOrMovable {
        private:
            Handler& handler;
            WaitGroup connections;
            std::atomic<bool> stopRequested = false;
            int server_fd = -1;

            void serveConnection(int client_fd) noexcept;
        public:
            /// @throws std::system_error when the socket cannot be created, bound or put into listening state
            /// @throws std::invalid_argument on malformed settings.address
            CacheServer(const ServerSettings& settings, Handler& handler);
            ~CacheServer();

            /// @brief Accepts connections until Stop() is called or accept fails.
            /// Closes the handler and waits for every connection thread before returning.
            /// @return operation result, 0 - success, other values - failure
            int Start();

            /// @brief Stops accepting and closes the handler, safe to call from any thread and more than once
            void Stop() noexcept;

            /// @brief Bound port, useful when listening on port 0
            uint16_t getPort() const;
    };

    /// @brief Blocks SIGHUP, SIGQUIT, SIGTERM and SIGINT for the calling thread and threads it spawns later
    /// @return the blocked set
    sigset_t blockShutdownSignals();

    /// @brief Runs a CacheServer until it fails or one of the shutdown signals arrives
    /// @return result of CacheServer::Start
    int listenAndServeWithSignal(const ServerSettings& settings, Handler& handler);
}
