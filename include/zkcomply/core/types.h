// ZKCOMPLY - Core Types Header
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// This file defines fundamental types used throughout ZKCOMPLY.

#ifndef ZKCOMPLY_CORE_TYPES_H
#define ZKCOMPLY_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstring>

namespace zkcomply {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Get current time in milliseconds
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size digest. Bytes are stored and displayed in digest order.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }
    
    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    /// Iterators
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    /// Comparison operators
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Convert to hex string (digest order, no prefix)
    std::string ToHex() const;
    
    /// Create from hex string (optional 0x prefix)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

} // namespace zkcomply

#endif // ZKCOMPLY_CORE_TYPES_H
