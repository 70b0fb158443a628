#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string_view>
#include <system_error>
#include "../non_copyable.hpp"
#include "wait_group.hpp"

namespace server {

    enum class SessionState {
        Active,
        Draining,
        Closed,
    };

    /// @brief One client connection. Owns the socket, which is closed on destruction.
    class Session : NonCopyableOrMovable {
        private:
            int fd;
            std::mutex writeMutex;
            WaitGroup pendingWrites;
            std::atomic<SessionState> state = SessionState::Active;
        public:
            /// @brief Marks one reply as in flight for the lifetime of the guard
            class WriteGuard : NonCopyableOrMovable {
                private:
                    Session& session;
                public:
                    explicit WriteGuard(Session& session) : session(session) { session.pendingWrites.add(1); }
                    ~WriteGuard() { session.pendingWrites.done(); }
            };

            explicit Session(int fd) : fd(fd) {}
            ~Session();

            int getFd() const noexcept { return fd; }
            SessionState getState() const noexcept { return state.load(); }

            WriteGuard beginWrite() { return WriteGuard(*this); }

            /// @brief Sends all of data, writes of one session are serialized
            /// @return empty on success, errno of the failed send otherwise
            std::error_code write(std::string_view data);

            /// @brief Waits up to timeout for in flight writes, then shuts the socket down.
            /// Only the first call waits and shuts the socket down. A repeated call, or a call on
            /// a session the reader already marked Closed, returns true without touching the socket.
            /// @return false when the timeout expired with writes still pending
            bool close(std::chrono::milliseconds timeout);

            /// @brief Reader side is done with the session
            void markClosed() noexcept { state.store(SessionState::Closed); }
    };
}
