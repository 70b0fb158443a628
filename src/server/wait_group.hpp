#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include "../non_copyable.hpp"

namespace server {

    /// @brief Counts outstanding work, waiters are released when the counter drops to zero
    class WaitGroup : NonCopyableOrMovable {
        private:
            std::mutex mutex;
            std::condition_variable zero;
            int counter = 0;
        public:
            /// @throws std::logic_error when the counter would become negative
            void add(int delta);
            void done() { add(-1); }

            void wait();

            /// @return true when the timeout expired before the counter reached zero
            bool waitWithTimeout(std::chrono::milliseconds timeout);

            int pending();
    };
}
