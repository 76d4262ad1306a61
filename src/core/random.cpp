// ZKCOMPLY - Secure Random Number Generation Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/core/random.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>
#include <stdexcept>
#include <string>

namespace zkcomply {

void GetRandBytes(uint8_t* buf, size_t len) {
    while (len > 0) {
        int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(buf, chunk) != 1) {
            unsigned long err = ERR_get_error();
            char msg[256];
            ERR_error_string_n(err, msg, sizeof(msg));
            throw std::runtime_error(std::string("RAND_bytes failed: ") + msg);
        }
        buf += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

uint64_t GetRandUint64() {
    uint64_t value;
    GetRandBytes(reinterpret_cast<uint8_t*>(&value), sizeof(value));
    return value;
}

uint64_t GetRandInt(uint64_t max) {
    if (max <= 1) {
        return 0;
    }
    
    // Reject values in the final partial bucket
    uint64_t limit = UINT64_MAX - (UINT64_MAX % max);
    uint64_t value;
    do {
        value = GetRandUint64();
    } while (value >= limit);
    
    return value % max;
}

Hash256 GetRandHash256() {
    Hash256 hash;
    GetRandBytes(hash.data(), hash.size());
    return hash;
}

} // namespace zkcomply
