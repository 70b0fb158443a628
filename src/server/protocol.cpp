#include "protocol.hpp"
#include <charconv>

namespace server {
    const char OK[] = "OK";
    const char PONG[] = "PONG";
    const char UNKNOWN_COMMAND[] = "ERR unknown command";
    const char WRONG_NUMBER_OF_ARGUMENTS[] = "ERR wrong number of arguments for";
    const char NOT_AN_INTEGER[] = "ERR value is not an integer or out of range";
    const char SYNTAX_ERROR[] = "ERR syntax error";
    const char PROTOCOL_ERROR[] = "ERR Protocol error:";
    const char NOT_A_MULTI_BULK[] = "ERR request must be an array of bulk strings";
    const char CORRUPTED_VALUE[] = "ERR stored value is corrupted";
    const char INCREMENT_OVERFLOW[] = "ERR increment or decrement would overflow";
}

namespace {
    void appendNumber(std::string& out, int64_t value) {
        char buffer[24];
        auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
        out.append(buffer, end);
    }

    void appendBulk(std::string& out, std::string_view arg) {
        out.push_back(server::RESP_BULK_PREFIX);
        appendNumber(out, static_cast<int64_t>(arg.size()));
        out.append(server::RESP_CRLF);
        out.append(arg);
        out.append(server::RESP_CRLF);
    }

    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

namespace server {

Reply makeStatusReply(std::string status) { return StatusReply{std::move(status)}; }
Reply makeErrReply(std::string message) { return ErrorReply{std::move(message)}; }
Reply makeIntReply(int64_t code) { return IntReply{code}; }
Reply makeBulkReply(std::string arg) { return BulkReply{std::move(arg)}; }
Reply makeNullBulkReply() { return NullBulkReply{}; }
Reply makeMultiBulkReply(std::vector<std::string> args) {
    if (args.empty()) {
        return EmptyMultiBulkReply{};
    }
    return MultiBulkReply{std::move(args)};
}
Reply makeEmptyMultiBulkReply() { return EmptyMultiBulkReply{}; }
Reply makeOkReply() { return StatusReply{OK}; }

void appendBytes(std::string& out, const Reply& reply)
{
    std::visit(overloaded{
        [&out](const StatusReply& r) {
            out.push_back(RESP_SIMPLE_PREFIX);
            out.append(r.status);
            out.append(RESP_CRLF);
        },
        [&out](const ErrorReply& r) {
            out.push_back(RESP_ERROR_PREFIX);
            out.append(r.message);
            out.append(RESP_CRLF);
        },
        [&out](const IntReply& r) {
            out.push_back(RESP_INTEGER_PREFIX);
            appendNumber(out, r.code);
            out.append(RESP_CRLF);
        },
        [&out](const BulkReply& r) {
            appendBulk(out, r.arg);
        },
        [&out](const NullBulkReply&) {
            out.append(RESP_NULL_BULK);
        },
        [&out](const MultiBulkReply& r) {
            out.push_back(RESP_ARRAY_PREFIX);
            appendNumber(out, static_cast<int64_t>(r.args.size()));
            out.append(RESP_CRLF);
            for (const auto& arg : r.args) {
                appendBulk(out, arg);
            }
        },
        [&out](const EmptyMultiBulkReply&) {
            out.append(RESP_EMPTY_ARRAY);
        },
    }, reply);
}

std::string toBytes(const Reply& reply)
{
    std::string out;
    appendBytes(out, reply);
    return out;
}

std::string describe(const Reply& reply)
{
    return std::visit(overloaded{
        [](const StatusReply& r) { return "status(" + r.status + ")"; },
        [](const ErrorReply& r) { return "error(" + r.message + ")"; },
        [](const IntReply& r) { return "int(" + std::to_string(r.code) + ")"; },
        [](const BulkReply& r) { return "bulk(" + std::to_string(r.arg.size()) + " bytes)"; },
        [](const NullBulkReply&) { return std::string("null"); },
        [](const MultiBulkReply& r) {
            std::string text = "array[";
            for (size_t i = 0; i < r.args.size(); ++i) {
                if (i > 0) {
                    text += ' ';
                }
                text += r.args[i];
            }
            return text + "]";
        },
        [](const EmptyMultiBulkReply&) { return std::string("array[]"); },
    }, reply);
}

bool isErrorReply(const Reply& reply) noexcept
{
    return std::holds_alternative<ErrorReply>(reply);
}

}
