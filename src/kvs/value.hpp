#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace kvs
{
    /// @brief Kinds of values a shard can hold
    enum class ValueKind : uint_fast8_t {
        String = 0,
        Integer = 1,
        Compressed = 2,
    };

    const char* kindName(ValueKind kind) noexcept;

    /// @brief Thrown when a value is read as a kind it does not hold
    class WrongKindError : public std::logic_error {
        public:
            WrongKindError(ValueKind expected, ValueKind actual);
    };

    /// @brief Gzip encoded bytes together with the size of the original value
    struct CompressedString {
        std::string data;
        size_t originalSize = 0;

        bool operator==(const CompressedString&) const = default;
    };

    class Value {
        private:
            std::variant<std::string, int64_t, CompressedString> data;

            explicit Value(std::variant<std::string, int64_t, CompressedString> data): data(std::move(data)) {}

        public:
            Value(): data(std::string{}) {}

            static Value fromString(std::string bytes) { return Value{std::move(bytes)}; }
            static Value fromInteger(int64_t number) { return Value{number}; }
            static Value fromCompressed(std::string gzipBytes, size_t originalSize) {
                return Value{CompressedString{std::move(gzipBytes), originalSize}};
            }

            ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }

            /// @throws WrongKindError when the value is not a String
            const std::string& asString() const;
            /// @throws WrongKindError when the value is not an Integer
            int64_t asInteger() const;
            /// @throws WrongKindError when the value is not Compressed
            const CompressedString& asCompressed() const;

            bool operator==(const Value&) const = default;
    };
}
