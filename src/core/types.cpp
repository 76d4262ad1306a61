// ZKCOMPLY - Core Types Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/core/types.h"
#include "zkcomply/core/hex.h"

namespace zkcomply {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string h = hex;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    
    std::vector<HexByte> bytes = HexToBytes(h);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;

} // namespace zkcomply
