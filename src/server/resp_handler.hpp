#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include "../non_copyable.hpp"
#include "concurrent_set.hpp"
#include "constants.hpp"
#include "executor.hpp"
#include "handler.hpp"
#include "session.hpp"

namespace server {

    struct HandlerMetrics {
        uint_fast64_t numErrors = 0;
        uint_fast32_t numActiveConnections = 0;
        uint_fast64_t numRequests = 0;
    };

    /// @brief Decodes RESP requests of each connection and answers them through a CommandExecutor
    class RespHandler : public Handler, NonCopyableOrMovable {
        private:
            CommandExecutor& executor;
            std::chrono::milliseconds drainTimeout;
            ConcurrentSet<std::shared_ptr<Session>> activeSessions;
            std::atomic<bool> closing = false;
            std::atomic<uint_fast64_t> numErrors = 0;
            std::atomic<uint_fast64_t> numRequests = 0;

            void serve(Session& session);
            bool sendReply(Session& session, const Reply& reply);
        public:
            explicit RespHandler(CommandExecutor& executor, std::chrono::milliseconds drainTimeout = DEFAULT_DRAIN_TIMEOUT)
                : executor(executor), drainTimeout(drainTimeout) {}

            void handle(int client_fd) override;

            /// @brief Refuses new connections, then drains and closes the registered ones.
            /// Each session waits at most drainTimeout for its outstanding writes.
            void close() override;

            bool isClosing() const noexcept { return closing.load(); }

            HandlerMetrics getMetrics() const;
    };
}
