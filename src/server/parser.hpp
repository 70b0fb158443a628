#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>
#include <sys/types.h>
#include "../non_copyable.hpp"
#include "coroutines.hpp"
#include "protocol.hpp"

namespace server {

    /// @brief Decoder error codes, system errors are reported with std::system_category
    enum class ParseErrc : int {
        ProtocolError = 1, ///< malformed frame, decoding continues with the next line
        EndOfStream = 2,   ///< source exhausted, no more frames
    };

    const std::error_category& parseCategory() noexcept;
    std::error_code make_error_code(ParseErrc e) noexcept;
}

template <>
struct std::is_error_code_enum<server::ParseErrc> : std::true_type {};

namespace server {

    /// @brief Thrown by parseBytes and parseOne on malformed input
    class ProtocolError : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    /// @brief One decoded frame: either a reply or a decode error, never both
    class Payload {
        private:
            std::optional<Reply> data;
            std::error_code error;
            std::string message;

            Payload() = default;
        public:
            static Payload ofReply(Reply reply);
            static Payload protocolError(std::string message);
            static Payload transportError(std::error_code error);

            bool ok() const noexcept { return !error; }
            bool isProtocolError() const noexcept { return error == ParseErrc::ProtocolError; }
            /// @brief End of stream or read failure, the stream yields nothing after this payload
            bool isTransportError() const noexcept { return error && !isProtocolError(); }
            bool isEndOfStream() const noexcept { return error == ParseErrc::EndOfStream; }

            /// @throws std::logic_error when the payload carries an error
            const Reply& reply() const;
            Reply& reply();

            const std::error_code& getError() const noexcept { return error; }
            const std::string& errorMessage() const noexcept { return message; }
    };

    /// @brief Blocking byte source. read follows ::read conventions: bytes read, 0 at end of stream, -1 with errno on failure
    class ByteSource {
        public:
            virtual ~ByteSource() = default;
            virtual ssize_t read(char* buffer, size_t size) = 0;
    };

    /// @brief Reads from a connected socket, the descriptor is not owned
    class FdSource : public ByteSource {
        private:
            int fd;
        public:
            explicit FdSource(int fd) : fd(fd) {}
            ssize_t read(char* buffer, size_t size) override;
    };

    /// @brief Reads from memory, at most maxChunk bytes per call to emulate partial reads
    class StringSource : public ByteSource {
        private:
            std::string data;
            size_t position = 0;
            size_t maxChunk;
        public:
            explicit StringSource(std::string data, size_t maxChunk = SIZE_MAX)
                : data(std::move(data)), maxChunk(maxChunk == 0 ? 1 : maxChunk) {}
            ssize_t read(char* buffer, size_t size) override;
    };

    /// @brief Buffered line and fixed size reads on top of a ByteSource
    class BufferedReader : NonCopyableOrMovable {
        private:
            ByteSource& source;
            std::vector<char> buffer;
            size_t start = 0;
            size_t end = 0;

            std::error_code fill();
        public:
            explicit BufferedReader(ByteSource& source);

            /// @brief Reads up to and including the next '\n'
            std::error_code readLine(std::string& line);

            /// @brief Reads exactly size bytes
            std::error_code readFull(std::string& out, size_t size);
    };

    using PayloadStream = Generator<Payload>;

    /// @brief Decodes frames from source on demand.
    /// The stream is single pass, blocks only inside source.read and ends after yielding one transport error payload.
    /// source must outlive the returned stream.
    PayloadStream parseStream(ByteSource& source);

    /// @brief Decodes every frame of data
    /// @throws ProtocolError on malformed input
    std::vector<Reply> parseBytes(std::string_view data);

    /// @brief Decodes the first frame of data
    /// @throws ProtocolError on malformed input or when data holds no frame
    Reply parseOne(std::string_view data);
}
