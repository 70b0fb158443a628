#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cerrno>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "../server/parser.hpp"
#include "../server/protocol.hpp"

namespace skv {

/**
 * @brief Blocking RESP client for the shardkv server.
 *
 * Commands are encoded as arrays of bulk strings and queued locally, flush()
 * sends every queued command at once so requests can be pipelined. Replies are
 * matched to requests by their order on the connection.
 */
class CacheClient {
public:
    /// Unique identifier associated with each request.
    using RequestId = std::uint64_t;

    /// Result classification returned by the client.
    enum class ResultCode {
        Ok,        ///< Command executed successfully.
        NotFound,  ///< Null reply, or nothing deleted.
        Error,     ///< Server replied with an error.
    };

    /// Parsed response returned by the server.
    struct Response {
        RequestId requestId{};
        ResultCode result{ResultCode::Error};
        server::Reply reply;
        std::string value;        ///< Bulk or status text when result == Ok.
        std::int64_t integer{0};  ///< Integer replies.
        std::string errorMessage; ///< Filled when result == Error.

        [[nodiscard]] bool ok() const noexcept { return result == ResultCode::Ok; }
        [[nodiscard]] bool notFound() const noexcept { return result == ResultCode::NotFound; }
        [[nodiscard]] bool hasError() const noexcept { return result == ResultCode::Error; }
    };

    struct Options {
        std::string host{"127.0.0.1"};
        std::uint16_t port{6399};
        std::chrono::milliseconds sendTimeout{0};
        std::chrono::milliseconds receiveTimeout{0};
    };

    CacheClient() = default;
    explicit CacheClient(Options options) : options_(std::move(options)) {}
    CacheClient(const CacheClient&) = delete;
    CacheClient& operator=(const CacheClient&) = delete;

    CacheClient(CacheClient&& other) noexcept { moveFrom(std::move(other)); }
    CacheClient& operator=(CacheClient&& other) noexcept {
        if (this != &other) {
            close();
            moveFrom(std::move(other));
        }
        return *this;
    }

    ~CacheClient() { close(); }

    /// Establishes a TCP connection to the configured host.
    void connect() {
        if (connected()) {
            return;
        }

        const auto portStr = std::to_string(options_.port);

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* result = nullptr;
        const int gaiErr = ::getaddrinfo(options_.host.c_str(), portStr.c_str(), &hints, &result);
        if (gaiErr != 0) {
            throw std::runtime_error(std::string("Failed to resolve cache server host: ") + ::gai_strerror(gaiErr));
        }

        int lastErrno = 0;
        for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
            int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
            if (fd == INVALID_SOCKET_HANDLE) {
                lastErrno = errno;
                continue;
            }

            int flag = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

            if (options_.sendTimeout.count() > 0) {
                setSocketTimeout(fd, SO_SNDTIMEO, options_.sendTimeout);
            }

            if (options_.receiveTimeout.count() > 0) {
                setSocketTimeout(fd, SO_RCVTIMEO, options_.receiveTimeout);
            }

            if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) {
                socketFd_ = fd;
                lastErrno = 0;
                break;
            }

            lastErrno = errno;
            ::close(fd);
        }

        ::freeaddrinfo(result);

        if (!connected()) {
            throw std::system_error(lastErrno, std::system_category(), "Failed to connect to cache server");
        }

        source_ = std::make_unique<SocketSource>(socketFd_);
        stream_.emplace(server::parseStream(*source_));
    }

    /// Closes the socket connection.
    void close() noexcept {
        stream_.reset();
        source_.reset();
        if (socketFd_ != INVALID_SOCKET_HANDLE) {
            ::close(socketFd_);
            socketFd_ = INVALID_SOCKET_HANDLE;
        }
        pendingRequests_.clear();
        completedResponses_.clear();
        sendBuffer_.clear();
        sendOffset_ = 0;
        nextRequestId_ = 1;
    }

    [[nodiscard]] bool connected() const noexcept { return socketFd_ != INVALID_SOCKET_HANDLE; }

    /// Queues an arbitrary command, args[0] is the command name.
    RequestId enqueue(const std::vector<std::string>& args) {
        ensureConnected();
        if (args.empty()) {
            throw std::invalid_argument("Command must not be empty");
        }

        const RequestId id = nextRequestId_++;
        pendingRequests_.push_back(id);
        server::appendBytes(sendBuffer_, server::makeMultiBulkReply(args));
        return id;
    }

    RequestId enqueueGet(std::string_view key) {
        return enqueue({"GET", std::string(key)});
    }

    RequestId enqueueSet(std::string_view key, std::string_view value) {
        return enqueue({"SET", std::string(key), std::string(value)});
    }

    RequestId enqueueDelete(std::string_view key) {
        return enqueue({"DEL", std::string(key)});
    }

    /// Flushes all pending requests to the server.
    void flush() {
        ensureConnected();

        while (sendOffset_ < sendBuffer_.size()) {
            const auto remaining = sendBuffer_.size() - sendOffset_;
            const char* dataPtr = sendBuffer_.data() + sendOffset_;
            const auto sent = ::send(socketFd_, dataPtr, remaining, MSG_NOSIGNAL);
            if (sent == -1) {
                const int errorCode = errno;
                if (errorCode == EINTR) {
                    continue;
                }
                throw std::system_error(errorCode, std::system_category(), "Failed to send data to cache server");
            }
            sendOffset_ += static_cast<std::size_t>(sent);
        }

        sendBuffer_.clear();
        sendOffset_ = 0;
    }

    /// Receives the next response from the server.
    Response receiveResponse() {
        ensureConnected();

        if (pendingRequests_.empty()) {
            throw std::logic_error("No pending requests to receive responses for");
        }

        auto payload = stream_->next_value();
        if (!payload || payload->isEndOfStream()) {
            throw std::runtime_error("Connection closed by cache server");
        }
        if (payload->isTransportError()) {
            throw std::system_error(payload->getError(), "Failed to receive data from cache server");
        }
        if (payload->isProtocolError()) {
            throw std::runtime_error("Malformed reply from cache server: " + payload->errorMessage());
        }

        Response response;
        response.requestId = pendingRequests_.front();
        pendingRequests_.pop_front();
        response.reply = std::move(payload->reply());
        interpretReply(response);
        return response;
    }

    /// Waits for the response that corresponds to the provided request id.
    Response waitFor(RequestId id) {
        if (auto cached = popCompleted(id)) {
            return std::move(*cached);
        }

        while (true) {
            Response response = receiveResponse();
            if (response.requestId == id) {
                return response;
            }
            completedResponses_.emplace(response.requestId, std::move(response));
        }
    }

    /// Sends one command and waits for its reply.
    Response command(const std::vector<std::string>& args) {
        const auto id = enqueue(args);
        flush();
        return waitFor(id);
    }

    Response get(std::string_view key) {
        const auto id = enqueueGet(key);
        flush();
        return waitFor(id);
    }

    Response set(std::string_view key, std::string_view value) {
        const auto id = enqueueSet(key, value);
        flush();
        return waitFor(id);
    }

    Response del(std::string_view key) {
        const auto id = enqueueDelete(key);
        flush();
        return waitFor(id);
    }

    Response ping() {
        return command({"PING"});
    }

    [[nodiscard]] std::size_t pendingRequestCount() const noexcept {
        return pendingRequests_.size();
    }

private:
    static constexpr int INVALID_SOCKET_HANDLE = -1;

    /// Blocking reads from the client socket for the reply decoder.
    class SocketSource : public server::ByteSource {
    public:
        explicit SocketSource(int fd) : fd_(fd) {}

        ssize_t read(char* buffer, std::size_t size) override {
            while (true) {
                const auto received = ::recv(fd_, buffer, size, 0);
                if (received == -1 && errno == EINTR) {
                    continue;
                }
                return received;
            }
        }

    private:
        int fd_;
    };

    Options options_{};
    int socketFd_{INVALID_SOCKET_HANDLE};
    std::unique_ptr<SocketSource> source_{};
    std::optional<server::PayloadStream> stream_{};
    std::deque<RequestId> pendingRequests_{};
    std::unordered_map<RequestId, Response> completedResponses_{};
    std::string sendBuffer_{};
    std::size_t sendOffset_{0};
    RequestId nextRequestId_{1};

    void ensureConnected() {
        if (!connected()) {
            connect();
        }
    }

    static timeval toTimeVal(std::chrono::milliseconds duration) {
        timeval tv{};
        tv.tv_sec = static_cast<long>(duration.count() / 1000);
        tv.tv_usec = static_cast<long>((duration.count() % 1000) * 1000);
        return tv;
    }

    static void setSocketTimeout(int socket, int option, std::chrono::milliseconds timeout) noexcept {
        const auto tv = toTimeVal(timeout);
        ::setsockopt(socket, SOL_SOCKET, option, &tv, sizeof(tv));
    }

    static void interpretReply(Response& response) {
        if (const auto* error = std::get_if<server::ErrorReply>(&response.reply)) {
            response.result = ResultCode::Error;
            response.errorMessage = error->message;
        } else if (std::holds_alternative<server::NullBulkReply>(response.reply)) {
            response.result = ResultCode::NotFound;
        } else if (const auto* bulk = std::get_if<server::BulkReply>(&response.reply)) {
            response.result = ResultCode::Ok;
            response.value = bulk->arg;
        } else if (const auto* status = std::get_if<server::StatusReply>(&response.reply)) {
            response.result = ResultCode::Ok;
            response.value = status->status;
        } else if (const auto* number = std::get_if<server::IntReply>(&response.reply)) {
            response.result = ResultCode::Ok;
            response.integer = number->code;
        } else {
            response.result = ResultCode::Ok;
        }
    }

    [[nodiscard]] std::optional<Response> popCompleted(RequestId id) {
        auto it = completedResponses_.find(id);
        if (it == completedResponses_.end()) {
            return std::nullopt;
        }
        Response response = std::move(it->second);
        completedResponses_.erase(it);
        return response;
    }

    void moveFrom(CacheClient&& other) noexcept {
        options_ = std::move(other.options_);
        socketFd_ = std::exchange(other.socketFd_, INVALID_SOCKET_HANDLE);
        source_ = std::move(other.source_);
        stream_ = std::move(other.stream_);
        other.stream_.reset();
        pendingRequests_ = std::move(other.pendingRequests_);
        completedResponses_ = std::move(other.completedResponses_);
        sendBuffer_ = std::move(other.sendBuffer_);
        sendOffset_ = other.sendOffset_;
        other.sendOffset_ = 0;
        nextRequestId_ = other.nextRequestId_;
        other.nextRequestId_ = 1;
    }
};

} // namespace skv
