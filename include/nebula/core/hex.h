// NEBULA - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 NEBULA Developers
// MIT License

#ifndef NEBULA_CORE_HEX_H
#define NEBULA_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nebula {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (throws std::invalid_argument)
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

/// Remove a leading "0x" / "0X" if present
std::string StripHexPrefix(const std::string& str);

} // namespace nebula

#endif // NEBULA_CORE_HEX_H
