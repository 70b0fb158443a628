#pragma once

namespace server {

    /// @brief Serves accepted connections
    class Handler {
        public:
            virtual ~Handler() = default;

            /// @brief Serves client_fd until the peer goes away or the handler is closed.
            /// Takes ownership of client_fd and blocks the calling thread.
            virtual void handle(int client_fd) = 0;

            /// @brief Stops serving and closes every active connection
            virtual void close() = 0;
    };
}
