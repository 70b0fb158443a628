#include "gzip_compressor.hpp"

GzipResult GzipCompressor::Compress(std::string_view input) {
    if (input.empty()) return { {}, INVALID_INPUT };

    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    auto operationResult = deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    if (operationResult != Z_OK) {
        return { {}, operationResult };
    }

    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));

    std::string output;
    size_t total_size = 0;

    do {
        output.resize(total_size + CHUNK_SIZE);
        strm.avail_out = CHUNK_SIZE;
        strm.next_out = reinterpret_cast<Bytef*>(output.data() + total_size);

        operationResult = deflate(&strm, Z_FINISH);
        total_size += (CHUNK_SIZE - strm.avail_out);
    } while (strm.avail_out == 0);

    deflateEnd(&strm);

    if (operationResult != Z_STREAM_END) {
        return { {}, operationResult };
    }

    output.resize(total_size);
    return { std::move(output), OPERATION_SUCCESS };
}

GzipResult GzipCompressor::Decompress(std::string_view input, size_t sizeHint) {
    if (input.empty()) return { {}, INVALID_INPUT };

    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));

    auto operationResult = inflateInit2(&strm, 15 + 16);
    if (operationResult != Z_OK) {
        return { {}, operationResult };
    }

    std::string output;
    output.reserve(sizeHint);
    size_t total_size = 0;

    do {
        output.resize(total_size + CHUNK_SIZE);
        strm.avail_out = CHUNK_SIZE;
        strm.next_out = reinterpret_cast<Bytef*>(output.data() + total_size);

        operationResult = inflate(&strm, Z_NO_FLUSH);
        total_size += (CHUNK_SIZE - strm.avail_out);

        if (operationResult == Z_STREAM_ERROR || operationResult == Z_DATA_ERROR || operationResult == Z_MEM_ERROR || operationResult == Z_NEED_DICT) {
            inflateEnd(&strm);
            return { {}, operationResult };
        }
        if (operationResult == Z_BUF_ERROR && strm.avail_in == 0) {
            // truncated input, no further progress possible
            inflateEnd(&strm);
            return { {}, operationResult };
        }
    } while (operationResult != Z_STREAM_END);

    inflateEnd(&strm);

    output.resize(total_size);
    return { std::move(output), OPERATION_SUCCESS };
}
