#pragma once
#include <cstddef>
#include <mutex>
#include <unordered_set>
#include <vector>
#include "../non_copyable.hpp"

namespace server {

    /// @brief Mutex guarded set, iteration goes through snapshots
    template <typename T, typename Hash = std::hash<T>>
    class ConcurrentSet : NonCopyableOrMovable {
        private:
            mutable std::mutex mutex;
            std::unordered_set<T, Hash> items;
        public:
            bool insert(const T& item) {
                std::lock_guard lock(mutex);
                return items.insert(item).second;
            }

            bool erase(const T& item) {
                std::lock_guard lock(mutex);
                return items.erase(item) > 0;
            }

            bool contains(const T& item) const {
                std::lock_guard lock(mutex);
                return items.contains(item);
            }

            size_t size() const {
                std::lock_guard lock(mutex);
                return items.size();
            }

            std::vector<T> snapshot() const {
                std::lock_guard lock(mutex);
                return std::vector<T>(items.begin(), items.end());
            }
    };
}
