/**
 * Resource Handles
 *
 * The coordinator never serves wordlist, rule or mask bytes. When it hands a
 * Task to an agent it asks a ResourceResolver for short-lived fetch handles;
 * the storage collaborator checks the signature and expiry before serving,
 * and the agent checks the downloaded bytes against `sha256`.
 */

#pragma once

#include "../core/entities.hpp"
#include "../core/result.hpp"
#include <string>

namespace hashfleet {

struct FetchHandle {
    ResourceId resource_id = 0;
    ResourceKind kind = ResourceKind::WORDLIST;
    std::string url;
    std::string sha256;         // Integrity digest reported at upload
    Millis expires_at = 0;
};

class ResourceResolver {
public:
    virtual ~ResourceResolver() = default;
    virtual Result<FetchHandle> resolve(const Resource& resource, Millis now) = 0;
};

/**
 * Issues URLs of the form
 *   <base>/<id>?expires=<ms>&sig=<hex HMAC-SHA256(secret, "<id>|<expires>|<sha256>")>
 */
class SignedResourceResolver : public ResourceResolver {
public:
    SignedResourceResolver(std::string base_url, std::string secret, int64_t ttl_seconds)
        : base_url_(std::move(base_url)), secret_(std::move(secret)), ttl_seconds_(ttl_seconds) {}

    Result<FetchHandle> resolve(const Resource& resource, Millis now) override;

    // Storage-side check: signature matches and the handle has not expired
    bool verify(const FetchHandle& handle, Millis now) const;

    std::string sign(ResourceId id, Millis expires_at, const std::string& sha256) const;

private:
    std::string base_url_;
    std::string secret_;
    int64_t ttl_seconds_;
};

}  // namespace hashfleet
