#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace server {

    inline constexpr char RESP_ARRAY_PREFIX = '*';
    inline constexpr char RESP_SIMPLE_PREFIX = '+';
    inline constexpr char RESP_ERROR_PREFIX = '-';
    inline constexpr char RESP_BULK_PREFIX = '$';
    inline constexpr char RESP_INTEGER_PREFIX = ':';
    inline constexpr char RESP_CR = '\r';
    inline constexpr char RESP_LF = '\n';
    inline constexpr char RESP_CRLF[] = "\r\n";
    inline constexpr char RESP_NULL_BULK[] = "$-1\r\n";
    inline constexpr char RESP_EMPTY_ARRAY[] = "*0\r\n";

    extern const char OK[];
    extern const char PONG[];
    extern const char UNKNOWN_COMMAND[];
    extern const char WRONG_NUMBER_OF_ARGUMENTS[];
    extern const char NOT_AN_INTEGER[];
    extern const char SYNTAX_ERROR[];
    extern const char PROTOCOL_ERROR[];
    extern const char NOT_A_MULTI_BULK[];
    extern const char CORRUPTED_VALUE[];
    extern const char INCREMENT_OVERFLOW[];

    /// @brief Simple string reply, +text
    struct StatusReply {
        std::string status;
        bool operator==(const StatusReply&) const = default;
    };

    /// @brief Error reply, -text
    struct ErrorReply {
        std::string message;
        bool operator==(const ErrorReply&) const = default;
    };

    /// @brief Signed 64-bit integer reply, :n
    struct IntReply {
        int64_t code = 0;
        bool operator==(const IntReply&) const = default;
    };

    /// @brief Binary safe bulk string reply, $len
    struct BulkReply {
        std::string arg;
        bool operator==(const BulkReply&) const = default;
    };

    /// @brief Null bulk string, $-1
    struct NullBulkReply {
        bool operator==(const NullBulkReply&) const = default;
    };

    /// @brief Array of bulk strings, *count
    struct MultiBulkReply {
        std::vector<std::string> args;
        bool operator==(const MultiBulkReply&) const = default;
    };

    /// @brief Empty array, *0
    struct EmptyMultiBulkReply {
        bool operator==(const EmptyMultiBulkReply&) const = default;
    };

    using Reply = std::variant<StatusReply, ErrorReply, IntReply, BulkReply, NullBulkReply, MultiBulkReply, EmptyMultiBulkReply>;

    Reply makeStatusReply(std::string status);
    Reply makeErrReply(std::string message);
    Reply makeIntReply(int64_t code);
    Reply makeBulkReply(std::string arg);
    Reply makeNullBulkReply();
    Reply makeMultiBulkReply(std::vector<std::string> args);
    Reply makeEmptyMultiBulkReply();
    Reply makeOkReply();

    /// @brief Appends the wire representation of reply to out
    void appendBytes(std::string& out, const Reply& reply);

    /// @brief Wire representation of reply
    std::string toBytes(const Reply& reply);

    /// @brief Human readable rendering, used for logging and tests
    std::string describe(const Reply& reply);

    bool isErrorReply(const Reply& reply) noexcept;
}
