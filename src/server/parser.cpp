#include "parser.hpp"
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sys/socket.h>
#include "constants.hpp"

using namespace server;

namespace {

    class ParseCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "resp"; }

            std::string message(int value) const override {
                switch (static_cast<ParseErrc>(value)) {
                    case ParseErrc::ProtocolError:
                        return "protocol error";
                    case ParseErrc::EndOfStream:
                        return "end of stream";
                }
                return "unknown parse error";
            }
    };

    /// Accepts an optional leading '+' and requires the whole text to be consumed
    bool parseInteger(std::string_view text, int64_t& out) noexcept {
        if (!text.empty() && text.front() == '+') {
            text.remove_prefix(1);
        }
        if (text.empty()) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc() && ptr == text.data() + text.size();
    }

    Payload parseIntegerFrame(std::string_view header) {
        int64_t value;
        if (!parseInteger(header.substr(1), value)) {
            return Payload::protocolError("illegal number " + std::string(header.substr(1)));
        }
        return Payload::ofReply(IntReply{value});
    }

    /// $len header already consumed, reads the body and its trailing CRLF
    Payload parseBulkFrame(std::string_view header, BufferedReader& reader) {
        int64_t length;
        if (!parseInteger(header.substr(1), length) || length < -1 || length > MAX_BULK_SIZE) {
            return Payload::protocolError("illegal bulk string header: " + std::string(header));
        }
        if (length == -1) {
            return Payload::ofReply(NullBulkReply{});
        }
        std::string body;
        if (auto ec = reader.readFull(body, static_cast<size_t>(length) + 2)) {
            return Payload::transportError(ec);
        }
        body.resize(static_cast<size_t>(length));
        return Payload::ofReply(BulkReply{std::move(body)});
    }

    /// *count header already consumed. A malformed element header drops the whole array.
    Payload parseArrayFrame(std::string_view header, BufferedReader& reader) {
        int64_t count;
        if (!parseInteger(header.substr(1), count) || count < 0 || count > MAX_MULTI_BULK_LENGTH) {
            return Payload::protocolError("illegal array header: " + std::string(header));
        }
        if (count == 0) {
            return Payload::ofReply(EmptyMultiBulkReply{});
        }

        std::vector<std::string> args;
        args.reserve(static_cast<size_t>(count));
        std::string line;
        for (int64_t i = 0; i < count; ++i) {
            if (auto ec = reader.readLine(line)) {
                return Payload::transportError(ec);
            }
            if (line.size() < 4 || line[line.size() - 2] != RESP_CR || line.front() != RESP_BULK_PREFIX) {
                return Payload::protocolError("illegal bulk string header: " + line.substr(0, line.size() - 1));
            }
            std::string_view elementHeader(line.data(), line.size() - 2);
            int64_t length;
            if (!parseInteger(elementHeader.substr(1), length) || length < -1 || length > MAX_BULK_SIZE) {
                return Payload::protocolError("illegal bulk string length: " + std::string(elementHeader));
            }
            if (length == -1) {
                args.emplace_back();
                continue;
            }
            std::string body;
            if (auto ec = reader.readFull(body, static_cast<size_t>(length) + 2)) {
                return Payload::transportError(ec);
            }
            body.resize(static_cast<size_t>(length));
            args.push_back(std::move(body));
        }
        return Payload::ofReply(MultiBulkReply{std::move(args)});
    }

    /// @return nothing for lines that carry no frame
    std::optional<Payload> parseFrame(const std::string& line, BufferedReader& reader) {
        if (line.size() <= 2 || line[line.size() - 2] != RESP_CR) {
            return std::nullopt;
        }
        std::string_view header(line.data(), line.size() - 2);
        switch (header.front()) {
            case RESP_SIMPLE_PREFIX:
                return Payload::ofReply(StatusReply{std::string(header.substr(1))});
            case RESP_ERROR_PREFIX:
                return Payload::ofReply(ErrorReply{std::string(header.substr(1))});
            case RESP_INTEGER_PREFIX:
                return parseIntegerFrame(header);
            case RESP_BULK_PREFIX:
                return parseBulkFrame(header, reader);
            case RESP_ARRAY_PREFIX:
                return parseArrayFrame(header, reader);
            default:
                return std::nullopt;
        }
    }
}

const std::error_category& server::parseCategory() noexcept
{
    static const ParseCategory category;
    return category;
}

std::error_code server::make_error_code(ParseErrc e) noexcept
{
    return {static_cast<int>(e), parseCategory()};
}

Payload Payload::ofReply(Reply reply)
{
    Payload payload;
    payload.data.emplace(std::move(reply));
    return payload;
}

Payload Payload::protocolError(std::string message)
{
    Payload payload;
    payload.error = ParseErrc::ProtocolError;
    payload.message = std::move(message);
    return payload;
}

Payload Payload::transportError(std::error_code error)
{
    Payload payload;
    payload.error = error;
    payload.message = error.message();
    return payload;
}

const Reply& Payload::reply() const
{
    if (!data) {
        throw std::logic_error("payload carries an error: " + message);
    }
    return *data;
}

Reply& Payload::reply()
{
    if (!data) {
        throw std::logic_error("payload carries an error: " + message);
    }
    return *data;
}

ssize_t FdSource::read(char* buffer, size_t size)
{
    for (uint_fast16_t attempt = 0;; ++attempt) {
        auto bytesRead = ::recv(fd, buffer, size, 0);
        if (bytesRead == -1 && errno == EINTR && attempt < READ_NUM_RETRY_ON_INT) {
            continue;
        }
        return bytesRead;
    }
}

ssize_t StringSource::read(char* buffer, size_t size)
{
    size_t count = std::min({size, maxChunk, data.size() - position});
    std::memcpy(buffer, data.data() + position, count);
    position += count;
    return static_cast<ssize_t>(count);
}

BufferedReader::BufferedReader(ByteSource& source) : source(source), buffer(READ_BUFFER_SIZE)
{
}

std::error_code BufferedReader::fill()
{
    start = end = 0;
    auto bytesRead = source.read(buffer.data(), buffer.size());
    if (bytesRead < 0) {
        return {errno, std::system_category()};
    }
    if (bytesRead == 0) {
        return ParseErrc::EndOfStream;
    }
    end = static_cast<size_t>(bytesRead);
    return {};
}

std::error_code BufferedReader::readLine(std::string& line)
{
    line.clear();
    for (;;) {
        if (start == end) {
            if (auto ec = fill()) {
                return ec;
            }
        }
        auto first = buffer.begin() + start;
        auto last = buffer.begin() + end;
        auto newline = std::find(first, last, RESP_LF);
        if (newline != last) {
            line.append(first, newline + 1);
            start += static_cast<size_t>(newline - first) + 1;
            return {};
        }
        line.append(first, last);
        start = end;
    }
}

std::error_code BufferedReader::readFull(std::string& out, size_t size)
{
    out.resize(size);
    size_t copied = std::min(size, end - start);
    std::memcpy(out.data(), buffer.data() + start, copied);
    start += copied;

    while (copied < size) {
        // Large bodies bypass the buffer
        if (size - copied >= buffer.size()) {
            auto bytesRead = source.read(out.data() + copied, size - copied);
            if (bytesRead < 0) {
                return {errno, std::system_category()};
            }
            if (bytesRead == 0) {
                return ParseErrc::EndOfStream;
            }
            copied += static_cast<size_t>(bytesRead);
            continue;
        }
        if (auto ec = fill()) {
            return ec;
        }
        size_t chunk = std::min(size - copied, end);
        std::memcpy(out.data() + copied, buffer.data(), chunk);
        start = chunk;
        copied += chunk;
    }
    return {};
}

PayloadStream server::parseStream(ByteSource& source)
{
    BufferedReader reader(source);
    std::string line;
    for (;;) {
        if (auto ec = reader.readLine(line)) {
            co_yield Payload::transportError(ec);
            co_return;
        }
        auto payload = parseFrame(line, reader);
        if (!payload) {
            continue;
        }
        bool fatal = payload->isTransportError();
        co_yield std::move(*payload);
        if (fatal) {
            co_return;
        }
    }
}

std::vector<Reply> server::parseBytes(std::string_view data)
{
    StringSource source{std::string(data)};
    auto stream = parseStream(source);
    std::vector<Reply> replies;
    while (auto payload = stream.next_value()) {
        if (payload->isEndOfStream()) {
            break;
        }
        if (payload->isProtocolError()) {
            throw ProtocolError(payload->errorMessage());
        }
        if (payload->isTransportError()) {
            throw std::system_error(payload->getError());
        }
        replies.push_back(std::move(payload->reply()));
    }
    return replies;
}

Reply server::parseOne(std::string_view data)
{
    StringSource source{std::string(data)};
    auto stream = parseStream(source);
    auto payload = stream.next_value();
    if (!payload || payload->isEndOfStream()) {
        throw ProtocolError("no reply");
    }
    if (payload->isProtocolError()) {
        throw ProtocolError(payload->errorMessage());
    }
    if (payload->isTransportError()) {
        throw std::system_error(payload->getError());
    }
    return std::move(payload->reply());
}
