#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <zlib.h>

#define CHUNK_SIZE 16384  // Buffer size for zlib operations
#define INVALID_INPUT -999
#define OPERATION_SUCCESS 0


/// @brief Result of compress or decompress operation
struct GzipResult {
    /// @brief Output bytes, empty on failure
    std::string data;
    /// @brief Return code of underlying zlib execution, 0 - on success, -999 on invalid input, non zero on error. Check complete list of result codes here: https://www.zlib.net/manual.html
    int operationResult;

    bool ok() const noexcept { return operationResult == OPERATION_SUCCESS; }
};

class GzipCompressor {
    public:
        /// @brief Performs gzip compression of arbitrary bytes
        /// @param input bytes to compress, may contain NUL
        /// @return compressed bytes and zlib result code
        static GzipResult Compress(std::string_view input);

        /// @brief Performs gzip decompression of bytes produced by Compress
        /// @param input compressed bytes
        /// @param sizeHint expected decompressed size, used to pre-size the output
        /// @return decompressed bytes and zlib result code
        static GzipResult Decompress(std::string_view input, size_t sizeHint = 0);
};
