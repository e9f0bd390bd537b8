/**
 * Credential and Resource Handle Tests
 */

#include "../src/services/credentials.hpp"
#include "../src/services/resources.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <set>

using namespace hashfleet;
using namespace hashfleet::testing;

namespace {

constexpr Millis NOW = 1'700'000'000'000;

Resource sample_resource() {
    return Resource{7, 1, ResourceKind::WORDLIST, "rockyou.txt", 14'344'391,
                    "5a9f2b7c0e13d84e6f2a1b9c3d7e8f0a", NOW};
}

}  // namespace

void test_sha256_vectors() {
    assert(credentials::sha256_hex("") ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(credentials::sha256_hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::cout << "[PASS] SHA-256 vectors\n";
}

void test_token_generation() {
    std::set<std::string> seen;
    for (int i = 0; i < 64; i++) {
        std::string token = credentials::generate_token();
        assert(token.size() == credentials::TOKEN_LENGTH);
        for (char c : token) {
            bool url_safe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
            assert(url_safe);
        }
        seen.insert(token);
    }
    assert(seen.size() == 64);

    std::cout << "[PASS] Token generation\n";
}

void test_token_matching() {
    std::string token = credentials::generate_token();
    std::string digest = credentials::sha256_hex(token);
    assert(credentials::matches(token, digest));

    std::string other = token;
    other[0] = other[0] == 'A' ? 'B' : 'A';
    assert(!credentials::matches(other, digest));
    assert(!credentials::matches(token, ""));
    assert(!credentials::matches(token, digest.substr(1)));

    std::cout << "[PASS] Token matching\n";
}

void test_signed_handle() {
    SignedResourceResolver resolver("https://files.example/res/", "s3cret", 900);
    Resource resource = sample_resource();

    auto handle = resolver.resolve(resource, NOW);
    assert(handle.ok());
    assert(handle->resource_id == 7);
    assert(handle->kind == ResourceKind::WORDLIST);
    assert(handle->sha256 == resource.sha256);
    assert(handle->expires_at == NOW + 900 * MS_PER_SECOND);
    assert(handle->url.rfind("https://files.example/res/7?expires=", 0) == 0);
    assert(handle->url.find("&sig=" + resolver.sign(7, handle->expires_at, resource.sha256)) !=
           std::string::npos);

    assert(resolver.verify(handle.value(), NOW));
    assert(resolver.verify(handle.value(), handle->expires_at - 1));

    std::cout << "[PASS] Signed handle\n";
}

void test_handle_rejection() {
    SignedResourceResolver resolver("https://files.example/res", "s3cret", 60);
    Resource resource = sample_resource();
    FetchHandle handle = resolver.resolve(resource, NOW).value();

    // Expired
    assert(!resolver.verify(handle, handle.expires_at));

    // Extended expiry without re-signing
    FetchHandle extended = handle;
    extended.expires_at += 3600 * MS_PER_SECOND;
    assert(!resolver.verify(extended, NOW));

    // Swapped content digest
    FetchHandle swapped = handle;
    swapped.sha256 = "00";
    assert(!resolver.verify(swapped, NOW));

    // Different secret
    SignedResourceResolver other("https://files.example/res", "different", 60);
    assert(!other.verify(handle, NOW));

    // Missing secret refuses to issue
    SignedResourceResolver unsigned_resolver("https://files.example/res", "", 60);
    auto r = unsigned_resolver.resolve(resource, NOW);
    assert(!r.ok());
    assert(r.code() == ErrorCode::INVALID_ARGUMENT);

    std::cout << "[PASS] Tampered and expired handles rejected\n";
}

void test_handles_attached_to_assignment() {
    SignedResourceResolver resolver("https://files.example/res", "s3cret", 900);
    Harness h(test_config(), &resolver);
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa"}));
    ResourceId words = h.wordlist(p, 500);

    DictionaryAttack dict{words, std::nullopt};
    auto attack = h.coordinator.add_attack(c, "dict", dict);
    assert(attack.ok());
    h.activate(c);

    AgentId agent = h.agent({p});
    TaskAssignment assignment = h.poll(agent);
    assert(assignment.resources.size() == 1);
    const FetchHandle& handle = assignment.resources[0];
    assert(handle.resource_id == words);
    assert(handle.sha256 == "ab12");
    assert(resolver.verify(handle, h.clock.now()));

    std::cout << "[PASS] Handles attached to assignments\n";
}

int main() {
    std::cout << "=== Credential and Resource Tests ===\n\n";

    test_sha256_vectors();
    test_token_generation();
    test_token_matching();
    test_signed_handle();
    test_handle_rejection();
    test_handles_attached_to_assignment();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
