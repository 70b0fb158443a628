#pragma once
#include <cstdint>
#include <string_view>

/// @brief 32-bit FNV-style hash used to spread keys across shards
/// @param key key bytes
/// @return hash code
uint32_t fnv32(std::string_view key) noexcept;
