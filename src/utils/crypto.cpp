#include "utils/crypto.hpp"
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace settle {
namespace crypto {

std::string hmac_sha256(const std::string& key, const std::string& message) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    unsigned char* result = HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(),
         hash, &hash_len);
    if (!result) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    return base64_encode(std::vector<uint8_t>(hash, hash + hash_len));
}

std::string sha256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return hex_encode(std::vector<uint8_t>(hash, hash + SHA256_DIGEST_LENGTH));
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);
    int val = 0;
    int bits = -6;

    for (uint8_t c : data) {
        val = ((val << 8) + c) & 0xFFFFFF;
        bits += 8;
        while (bits >= 0) {
            result.push_back(chars[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }

    if (bits > -6) {
        result.push_back(chars[(val << -bits) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    auto lookup = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+' || c == '-') return 62;
        if (c == '/' || c == '_') return 63;
        return -1;
    };

    std::vector<uint8_t> result;
    int val = 0;
    int bits = -8;

    for (char c : encoded) {
        if (c == '=') break;
        int v = lookup(c);
        if (v < 0) continue;

        val = ((val << 6) + v) & 0xFFFFFF;
        bits += 6;

        if (bits >= 0) {
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
            bits -= 8;
        }
    }

    return result;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::string sign_wallet_request(const std::string& secret_b64,
                                const std::string& timestamp,
                                const std::string& method,
                                const std::string& path,
                                const std::string& body) {
    auto decoded = base64_decode(secret_b64);
    std::string key(decoded.begin(), decoded.end());
    return hmac_sha256(key, timestamp + method + path + sha256(body));
}

} // namespace crypto
} // namespace settle
