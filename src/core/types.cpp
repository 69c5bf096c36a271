// NEBULA - Core Types Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/core/types.h"
#include "nebula/core/hex.h"

#include <stdexcept>

namespace nebula {

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::ToHex() const {
    return "0x" + BytesToHex(data_.data(), SIZE);
}

std::string Address::ToShortHex() const {
    std::string hex = BytesToHex(data_.data(), SIZE);
    return "0x" + hex.substr(0, 4) + ".." + hex.substr(hex.size() - 4);
}

Address Address::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for address");
    }

    std::vector<HexByte> bytes = HexToBytes(digits);
    return Address(bytes.data(), bytes.size());
}

Address Address::FromSeed(uint64_t seed) {
    std::array<Byte, SIZE> data{};
    for (size_t i = 0; i < 8; ++i) {
        data[SIZE - 1 - i] = static_cast<Byte>((seed >> (i * 8)) & 0xFF);
    }
    return Address(data);
}

} // namespace nebula
