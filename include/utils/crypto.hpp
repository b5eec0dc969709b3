#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace settle {
namespace crypto {

/**
 * HMAC-SHA256, base64 encoded.
 */
std::string hmac_sha256(const std::string& key, const std::string& message);

/**
 * SHA256 hash, lowercase hex.
 */
std::string sha256(const std::string& data);

/**
 * Base64 encoding/decoding.
 */
std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& encoded);

std::string hex_encode(const std::vector<uint8_t>& data);

/**
 * Wallet request signature:
 * base64(HMAC-SHA256(base64decode(secret), timestamp + method + path + sha256(body)))
 */
std::string sign_wallet_request(const std::string& secret_b64,
                                const std::string& timestamp,
                                const std::string& method,
                                const std::string& path,
                                const std::string& body);

} // namespace crypto
} // namespace settle
