#pragma once

#include <string>

namespace cmdhost {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

// Compute SHA-256 hash of a string's bytes
HashResult compute_sha256(const std::string& data);

} // namespace cmdhost
