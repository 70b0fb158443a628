#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../kvs/sharded_map.hpp"
#include "../non_copyable.hpp"
#include "protocol.hpp"

namespace server {

    /// @brief Runs decoded request arrays against a ShardedMap
    class CommandExecutor : NonCopyableOrMovable {
        private:
            using CommandFunc = Reply (CommandExecutor::*)(const std::vector<std::string>& args);

            /// @brief Handler with its arity, negative arity means at least -arity arguments including the name
            struct Command {
                CommandFunc func;
                int arity;
            };

            kvs::ShardedMap& db;
            bool enableCompression;

            static const Command* findCommand(const std::string& name);

            kvs::Value encodeValue(std::string value) const;
            std::optional<std::string> decodeValue(const kvs::Value& value) const;
            Reply incrementBy(const std::string& key, int64_t delta);

            Reply execPing(const std::vector<std::string>& args);
            Reply execEcho(const std::vector<std::string>& args);
            Reply execGet(const std::vector<std::string>& args);
            Reply execSet(const std::vector<std::string>& args);
            Reply execSetNx(const std::vector<std::string>& args);
            Reply execDel(const std::vector<std::string>& args);
            Reply execExists(const std::vector<std::string>& args);
            Reply execIncr(const std::vector<std::string>& args);
            Reply execDecr(const std::vector<std::string>& args);
            Reply execIncrBy(const std::vector<std::string>& args);
            Reply execMSet(const std::vector<std::string>& args);
            Reply execMSetNx(const std::vector<std::string>& args);
            Reply execKeys(const std::vector<std::string>& args);
            Reply execRandomKey(const std::vector<std::string>& args);
            Reply execDbSize(const std::vector<std::string>& args);
            Reply execFlushDb(const std::vector<std::string>& args);

        public:
            CommandExecutor(kvs::ShardedMap& db, bool enableCompression = false) : db(db), enableCompression(enableCompression) {}

            /// @param args command name followed by its arguments, never empty
            /// @return reply to send back, errors are returned as error replies
            Reply execute(const std::vector<std::string>& args);
    };
}
