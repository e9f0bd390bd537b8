// resources.cpp - HMAC-signed fetch handles

#include "resources.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace hashfleet {

namespace {

std::string hex(const unsigned char* data, size_t len) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += DIGITS[data[i] >> 4];
        out += DIGITS[data[i] & 0x0f];
    }
    return out;
}

std::string query_value(const std::string& url, const std::string& key) {
    std::string needle = key + "=";
    size_t q = url.find('?');
    if (q == std::string::npos) return "";
    size_t pos = q + 1;
    while (pos < url.size()) {
        size_t amp = url.find('&', pos);
        std::string part = url.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (part.rfind(needle, 0) == 0) return part.substr(needle.size());
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return "";
}

}  // namespace

std::string SignedResourceResolver::sign(ResourceId id, Millis expires_at,
                                         const std::string& sha256) const {
    std::string message = std::to_string(id) + "|" + std::to_string(expires_at) + "|" + sha256;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    const unsigned char* out = HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
                                    reinterpret_cast<const unsigned char*>(message.data()),
                                    message.size(), mac, &len);
    if (!out) return "";
    return hex(mac, len);
}

Result<FetchHandle> SignedResourceResolver::resolve(const Resource& resource, Millis now) {
    if (secret_.empty()) {
        return Error{ErrorCode::INVALID_ARGUMENT, "resource signing secret is not configured"};
    }

    FetchHandle handle;
    handle.resource_id = resource.id;
    handle.kind = resource.kind;
    handle.sha256 = resource.sha256;
    handle.expires_at = now + ttl_seconds_ * MS_PER_SECOND;

    std::string sig = sign(resource.id, handle.expires_at, resource.sha256);
    if (sig.empty()) {
        return Error{ErrorCode::STORE_FAILURE, "HMAC signing failed for resource #" + std::to_string(resource.id)};
    }

    std::string base = base_url_;
    while (!base.empty() && base.back() == '/') base.pop_back();
    handle.url = base + "/" + std::to_string(resource.id) +
                 "?expires=" + std::to_string(handle.expires_at) + "&sig=" + sig;
    return handle;
}

bool SignedResourceResolver::verify(const FetchHandle& handle, Millis now) const {
    if (now >= handle.expires_at) return false;
    if (query_value(handle.url, "expires") != std::to_string(handle.expires_at)) return false;

    std::string presented = query_value(handle.url, "sig");
    std::string expected = sign(handle.resource_id, handle.expires_at, handle.sha256);
    if (expected.empty() || presented.size() != expected.size()) return false;
    return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

}  // namespace hashfleet
