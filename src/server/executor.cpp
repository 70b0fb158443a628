#include "executor.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <unordered_map>
#include <fnmatch.h>
#include "../compressor/gzip_compressor.hpp"
#include "constants.hpp"

using namespace server;
using namespace kvs;

namespace {
    std::string toUpper(std::string_view text) {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    std::string toLower(std::string_view text) {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    bool parseInt64(std::string_view text, int64_t& out) noexcept {
        if (text.empty()) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc() && ptr == text.data() + text.size();
    }

    Reply wrongNumberOfArguments(const std::string& name) {
        return makeErrReply(std::string(WRONG_NUMBER_OF_ARGUMENTS) + " '" + toLower(name) + "' command");
    }

    /// Every other argument starting at the first key
    std::vector<std::string> pairKeys(const std::vector<std::string>& args) {
        std::vector<std::string> keys;
        keys.reserve(args.size() / 2);
        for (size_t i = 1; i < args.size(); i += 2) {
            keys.push_back(args[i]);
        }
        return keys;
    }
}

const CommandExecutor::Command* CommandExecutor::findCommand(const std::string& name)
{
    static const std::unordered_map<std::string, Command> commands {
        {"PING", {&CommandExecutor::execPing, -1}},
        {"ECHO", {&CommandExecutor::execEcho, 2}},
        {"GET", {&CommandExecutor::execGet, 2}},
        {"SET", {&CommandExecutor::execSet, -3}},
        {"SETNX", {&CommandExecutor::execSetNx, 3}},
        {"DEL", {&CommandExecutor::execDel, -2}},
        {"EXISTS", {&CommandExecutor::execExists, -2}},
        {"INCR", {&CommandExecutor::execIncr, 2}},
        {"DECR", {&CommandExecutor::execDecr, 2}},
        {"INCRBY", {&CommandExecutor::execIncrBy, 3}},
        {"MSET", {&CommandExecutor::execMSet, -3}},
        {"MSETNX", {&CommandExecutor::execMSetNx, -3}},
        {"KEYS", {&CommandExecutor::execKeys, 2}},
        {"RANDOMKEY", {&CommandExecutor::execRandomKey, 1}},
        {"DBSIZE", {&CommandExecutor::execDbSize, 1}},
        {"FLUSHDB", {&CommandExecutor::execFlushDb, 1}},
    };
    auto it = commands.find(toUpper(name));
    return it == commands.end() ? nullptr : &it->second;
}

Reply CommandExecutor::execute(const std::vector<std::string>& args)
{
    if (args.empty()) {
        return makeErrReply(std::string(UNKNOWN_COMMAND) + " ''");
    }
    const auto& name = args.front();
    auto command = findCommand(name);
    if (command == nullptr) {
        return makeErrReply(std::string(UNKNOWN_COMMAND) + " '" + name + "'");
    }
    auto argc = static_cast<int>(args.size());
    if ((command->arity > 0 && argc != command->arity) || (command->arity < 0 && argc < -command->arity)) {
        return wrongNumberOfArguments(name);
    }
    return (this->*command->func)(args);
}

Value CommandExecutor::encodeValue(std::string value) const
{
    if (enableCompression && value.size() >= MIN_SIZE_TO_COMPRESS) {
        auto compressed = GzipCompressor::Compress(value);
        if (compressed.ok()) {
            return Value::fromCompressed(std::move(compressed.data), value.size());
        }
        std::cerr << "Failed to compress value, zlib result = " << compressed.operationResult << std::endl;
    }
    return Value::fromString(std::move(value));
}

std::optional<std::string> CommandExecutor::decodeValue(const Value& value) const
{
    switch (value.kind()) {
        case ValueKind::String:
            return value.asString();
        case ValueKind::Integer:
            return std::to_string(value.asInteger());
        case ValueKind::Compressed: {
            const auto& packed = value.asCompressed();
            auto result = GzipCompressor::Decompress(packed.data, packed.originalSize);
            if (!result.ok()) {
                std::cerr << "Failed to decompress value, zlib result = " << result.operationResult << std::endl;
                return std::nullopt;
            }
            return std::move(result.data);
        }
    }
    return std::nullopt;
}

Reply CommandExecutor::execPing(const std::vector<std::string>& args)
{
    if (args.size() == 1) {
        return makeStatusReply(PONG);
    }
    if (args.size() == 2) {
        return makeBulkReply(args[1]);
    }
    return wrongNumberOfArguments(args[0]);
}

Reply CommandExecutor::execEcho(const std::vector<std::string>& args)
{
    return makeBulkReply(args[1]);
}

Reply CommandExecutor::execGet(const std::vector<std::string>& args)
{
    auto value = db.get(args[1]);
    if (!value) {
        return makeNullBulkReply();
    }
    auto bytes = decodeValue(*value);
    if (!bytes) {
        return makeErrReply(CORRUPTED_VALUE);
    }
    return makeBulkReply(std::move(*bytes));
}

Reply CommandExecutor::execSet(const std::vector<std::string>& args)
{
    const auto& key = args[1];
    if (args.size() == 3) {
        db.put(key, encodeValue(args[2]));
        return makeOkReply();
    }
    if (args.size() > 4) {
        return makeErrReply(SYNTAX_ERROR);
    }

    auto policy = toUpper(args[3]);
    int result;
    if (policy == "NX") {
        result = db.putIfAbsent(key, encodeValue(args[2]));
    } else if (policy == "XX") {
        result = db.putIfExists(key, encodeValue(args[2]));
    } else {
        return makeErrReply(SYNTAX_ERROR);
    }
    return result > 0 ? makeOkReply() : makeNullBulkReply();
}

Reply CommandExecutor::execSetNx(const std::vector<std::string>& args)
{
    return makeIntReply(db.putIfAbsent(args[1], encodeValue(args[2])));
}

Reply CommandExecutor::execDel(const std::vector<std::string>& args)
{
    std::vector<std::string> keys(args.begin() + 1, args.end());
    auto locks = db.rwLocks(keys, {});
    int64_t deleted = 0;
    for (const auto& key : keys) {
        deleted += db.removeWithLock(key).result;
    }
    return makeIntReply(deleted);
}

Reply CommandExecutor::execExists(const std::vector<std::string>& args)
{
    int64_t found = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        if (db.get(args[i])) {
            ++found;
        }
    }
    return makeIntReply(found);
}

Reply CommandExecutor::incrementBy(const std::string& key, int64_t delta)
{
    auto locks = db.rwLocks({key}, {});
    int64_t current = 0;
    if (auto value = db.getWithLock(key)) {
        if (value->kind() == ValueKind::Integer) {
            current = value->asInteger();
        } else {
            auto bytes = decodeValue(*value);
            if (!bytes || !parseInt64(*bytes, current)) {
                return makeErrReply(NOT_AN_INTEGER);
            }
        }
    }
    int64_t next;
    if (__builtin_add_overflow(current, delta, &next)) {
        return makeErrReply(INCREMENT_OVERFLOW);
    }
    db.putWithLock(key, Value::fromInteger(next));
    return makeIntReply(next);
}

Reply CommandExecutor::execIncr(const std::vector<std::string>& args)
{
    return incrementBy(args[1], 1);
}

Reply CommandExecutor::execDecr(const std::vector<std::string>& args)
{
    return incrementBy(args[1], -1);
}

Reply CommandExecutor::execIncrBy(const std::vector<std::string>& args)
{
    int64_t delta;
    if (!parseInt64(args[2], delta)) {
        return makeErrReply(NOT_AN_INTEGER);
    }
    return incrementBy(args[1], delta);
}

Reply CommandExecutor::execMSet(const std::vector<std::string>& args)
{
    if (args.size() % 2 == 0) {
        return wrongNumberOfArguments(args[0]);
    }
    auto locks = db.rwLocks(pairKeys(args), {});
    for (size_t i = 1; i < args.size(); i += 2) {
        db.putWithLock(args[i], encodeValue(args[i + 1]));
    }
    return makeOkReply();
}

Reply CommandExecutor::execMSetNx(const std::vector<std::string>& args)
{
    if (args.size() % 2 == 0) {
        return wrongNumberOfArguments(args[0]);
    }
    auto locks = db.rwLocks(pairKeys(args), {});
    for (size_t i = 1; i < args.size(); i += 2) {
        if (db.getWithLock(args[i])) {
            return makeIntReply(0);
        }
    }
    for (size_t i = 1; i < args.size(); i += 2) {
        db.putWithLock(args[i], encodeValue(args[i + 1]));
    }
    return makeIntReply(1);
}

Reply CommandExecutor::execKeys(const std::vector<std::string>& args)
{
    const auto& pattern = args[1];
    std::vector<std::string> matched;
    db.forEach([&pattern, &matched](const std::string& key, const Value&) {
        if (fnmatch(pattern.c_str(), key.c_str(), 0) == 0) {
            matched.push_back(key);
        }
        return true;
    });
    return makeMultiBulkReply(std::move(matched));
}

Reply CommandExecutor::execRandomKey(const std::vector<std::string>&)
{
    auto keys = db.randomKeys(1);
    if (keys.empty()) {
        return makeNullBulkReply();
    }
    return makeBulkReply(std::move(keys.front()));
}

Reply CommandExecutor::execDbSize(const std::vector<std::string>&)
{
    return makeIntReply(db.len());
}

Reply CommandExecutor::execFlushDb(const std::vector<std::string>&)
{
    db.clear();
    return makeOkReply();
}
