#include "hash.hpp"

static constexpr uint32_t FNV_OFFSET_BASIS = 2166136261u;
static constexpr uint32_t FNV_PRIME = 16777619u;

uint32_t fnv32(std::string_view key) noexcept {
    uint32_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : key) {
        hash *= FNV_PRIME;
        hash ^= static_cast<uint32_t>(c);
    }
    return hash;
}
