// credentials.cpp - Token generation and digests

#include "credentials.hpp"
#include "../core/result.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>

namespace hashfleet {
namespace credentials {

namespace {

constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";  // 64 symbols

std::string to_hex(const unsigned char* data, size_t len) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += DIGITS[data[i] >> 4];
        out += DIGITS[data[i] & 0x0f];
    }
    return out;
}

}  // namespace

std::string generate_token() {
    std::array<unsigned char, TOKEN_LENGTH> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        fail(ErrorCode::STORE_FAILURE, "RAND_bytes failed");
    }
    std::string token;
    token.reserve(TOKEN_LENGTH);
    for (unsigned char b : bytes) token += ALPHABET[b & 0x3f];
    return token;
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        fail(ErrorCode::STORE_FAILURE, "SHA-256 digest failed");
    }
    return to_hex(digest, len);
}

bool matches(const std::string& token, const std::string& digest) {
    std::string computed = sha256_hex(token);
    if (computed.size() != digest.size()) return false;
    return CRYPTO_memcmp(computed.data(), digest.data(), computed.size()) == 0;
}

}  // namespace credentials
}  // namespace hashfleet
