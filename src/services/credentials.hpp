// credentials.hpp - Agent token issue and verification (OpenSSL libcrypto)
// Tokens are returned to the agent once; only their SHA-256 digest is stored.

#pragma once

#include <string>

namespace hashfleet {
namespace credentials {

constexpr size_t TOKEN_LENGTH = 24;

// Random token of TOKEN_LENGTH url-safe characters. Throws on RNG failure.
std::string generate_token();

// Lower-case hex SHA-256 of `data`
std::string sha256_hex(const std::string& data);

// Constant-time comparison of a token against a stored digest
bool matches(const std::string& token, const std::string& digest);

}  // namespace credentials
}  // namespace hashfleet
