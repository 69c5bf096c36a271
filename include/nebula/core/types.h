// NEBULA - Core Types Header
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// This file defines fundamental types used throughout NEBULA.

#ifndef NEBULA_CORE_TYPES_H
#define NEBULA_CORE_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

namespace nebula {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

// ============================================================================
// Ledger Word Types
// ============================================================================

/// Unsigned 256-bit ledger word
using UInt256 = boost::multiprecision::uint256_t;

/// Unsigned 512-bit intermediate for full-precision products
using UInt512 = boost::multiprecision::uint512_t;

/// Signed 256-bit ledger word
using Int256 = boost::multiprecision::int256_t;

/// Largest value a pool reserve can hold (2^112 - 1)
inline const UInt256& MaxUInt112() {
    static const UInt256 value = (UInt256(1) << 112) - 1;
    return value;
}

/// Largest value representable in a 256-bit word
inline const UInt256& MaxUInt256() {
    static const UInt256 value = ~UInt256(0);
    return value;
}

// ============================================================================
// Address
// ============================================================================

/**
 * 160-bit identity of a ledger account: an asset, a price feed, a pool,
 * an oracle instance, a registry or a caller.
 *
 * Unlike block hashes, addresses are displayed in natural byte order with a
 * "0x" prefix.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;

    /// Default constructor - creates the null address
    Address() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit Address(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    Address(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if address is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set address to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    const Byte* data() const noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const Address& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const Address& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Address& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to "0x"-prefixed lowercase hex
    std::string ToHex() const;

    /// Short form for log lines ("0x1234..abcd")
    std::string ToShortHex() const;

    /// Parse from hex, with or without "0x" prefix.
    /// Throws std::invalid_argument on bad length or digits.
    static Address FromHex(const std::string& hex);

    /// Deterministic test/simulation address ending in big-endian `seed`
    static Address FromSeed(uint64_t seed);

private:
    std::array<Byte, SIZE> data_;
};

/// Hasher so Address can key unordered containers
struct AddressHasher {
    size_t operator()(const Address& addr) const noexcept {
        size_t h = 0;
        for (Byte b : addr) {
            h = h * 131 + b;
        }
        return h;
    }
};

} // namespace nebula

#endif // NEBULA_CORE_TYPES_H
