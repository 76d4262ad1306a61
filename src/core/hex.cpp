// ZKCOMPLY - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/core/hex.h"

namespace zkcomply {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";
    
    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
    
    inline size_t PrefixLength(const std::string& hex) {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            return 2;
        }
        return 0;
    }
}

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    
    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    
    return result;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    size_t start = PrefixLength(hex);
    if ((hex.length() - start) % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }
    
    std::vector<HexByte> result;
    result.reserve((hex.length() - start) / 2);
    
    for (size_t i = start; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);
        
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        
        result.push_back(static_cast<HexByte>((high << 4) | low));
    }
    
    return result;
}

bool IsValidHex(const std::string& str) {
    size_t start = PrefixLength(str);
    if (str.length() == start || (str.length() - start) % 2 != 0) {
        return false;
    }
    
    for (size_t i = start; i < str.length(); ++i) {
        if (HexCharToNibble(str[i]) < 0) {
            return false;
        }
    }
    
    return true;
}

} // namespace zkcomply
