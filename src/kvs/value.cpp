#include "value.hpp"

using namespace kvs;

const char* kvs::kindName(ValueKind kind) noexcept
{
    switch (kind)
    {
        case ValueKind::String:
            return "string";
        case ValueKind::Integer:
            return "integer";
        case ValueKind::Compressed:
            return "compressed";
    }
    return "unknown";
}

WrongKindError::WrongKindError(ValueKind expected, ValueKind actual)
    : std::logic_error(std::string("value holds ") + kindName(actual) + ", requested " + kindName(expected))
{
}

const std::string& Value::asString() const
{
    if (auto* bytes = std::get_if<std::string>(&data)) {
        return *bytes;
    }
    throw WrongKindError(ValueKind::String, kind());
}

int64_t Value::asInteger() const
{
    if (auto* number = std::get_if<int64_t>(&data)) {
        return *number;
    }
    throw WrongKindError(ValueKind::Integer, kind());
}

const CompressedString& Value::asCompressed() const
{
    if (auto* compressed = std::get_if<CompressedString>(&data)) {
        return *compressed;
    }
    throw WrongKindError(ValueKind::Compressed, kind());
}
