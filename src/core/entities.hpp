/**
 * hashfleet Entities
 *
 * One struct per persisted table. Rows carry their own id; the store assigns
 * ids on insert. Campaign and Attack states are derived from their Tasks by
 * the progress aggregator and are never written by request handlers directly.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace hashfleet {

struct Project {
    ProjectId id = 0;
    std::string name;
    Millis created_at = 0;
};

struct HashList {
    HashListId id = 0;
    ProjectId project_id = 0;
    std::string name;
    HashType hash_type = 0;
    uint64_t item_count = 0;
    uint64_t cracked_count = 0;
    Millis created_at = 0;

    uint64_t uncracked_count() const { return item_count - cracked_count; }
    bool fully_cracked() const { return item_count > 0 && cracked_count >= item_count; }
};

struct HashItem {
    HashItemId id = 0;
    HashListId hash_list_id = 0;
    std::string value;
    uint64_t digest = 0;              // XXH3 of value, lookup key
    bool cracked = false;             // Monotonic: never reset once set
    std::string plaintext;
    Millis cracked_at = 0;
    AttackId cracked_by_attack = 0;
    AgentId cracked_by_agent = 0;
};

/**
 * Attack resource (wordlist, rule file, mask list). The bytes live in the
 * storage collaborator; the coordinator only knows size and checksum.
 */
struct Resource {
    ResourceId id = 0;
    ProjectId project_id = 0;
    ResourceKind kind = ResourceKind::WORDLIST;
    std::string name;
    uint64_t line_count = 0;
    std::string sha256;               // Hex digest reported at upload
    Millis created_at = 0;
};

// -----------------------------------------------------------------------------
// Attack configurations
// -----------------------------------------------------------------------------

struct MaskPattern {
    std::string mask;                             // e.g. "?u?l?l?l?d?d"
    std::array<std::string, 4> custom_charsets;   // ?1..?4
    bool increment = false;
    uint32_t increment_min = 0;
    uint32_t increment_max = 0;
};

struct DictionaryAttack {
    ResourceId wordlist = 0;
    std::optional<ResourceId> rules;
};

struct MaskAttack {
    MaskPattern pattern;
};

// Wordlist candidates combined with a mask; mask_first selects hashcat -a 7
struct HybridAttack {
    ResourceId wordlist = 0;
    MaskPattern pattern;
    bool mask_first = false;
};

using AttackSpec = std::variant<DictionaryAttack, MaskAttack, HybridAttack>;

inline const char* attack_mode_name(const AttackSpec& spec) {
    switch (spec.index()) {
        case 0: return "dictionary";
        case 1: return "mask";
        case 2: return std::get<HybridAttack>(spec).mask_first ? "hybrid_mask" : "hybrid_dictionary";
    }
    return "?";
}

// -----------------------------------------------------------------------------
// Work hierarchy
// -----------------------------------------------------------------------------

struct Campaign {
    CampaignId id = 0;
    ProjectId project_id = 0;
    HashListId hash_list_id = 0;
    std::string name;
    Priority priority = Priority::ROUTINE;
    CampaignState state = CampaignState::DRAFT;
    bool paused_by_preemption = false;    // Only these resume automatically
    Millis created_at = 0;
    Millis started_at = 0;
    Millis finished_at = 0;
};

struct Attack {
    AttackId id = 0;
    CampaignId campaign_id = 0;
    std::string name;
    AttackSpec spec;
    HashType hash_type = 0;
    uint64_t total_keyspace = 0;
    uint64_t sliced_keyspace = 0;         // Next unallocated offset
    int complexity = 1;                   // 1..5 bucket, orders attacks in a campaign
    AttackState state = AttackState::PENDING;
    bool user_paused = false;
    Millis created_at = 0;
    Millis started_at = 0;
    Millis finished_at = 0;

    bool fully_sliced() const { return sliced_keyspace >= total_keyspace; }
};

struct Claim {
    AgentId agent_id = 0;
    Millis claimed_at = 0;
    Millis expires_at = 0;
};

/**
 * Unit of dispatch: the keyspace range [skip, skip + limit) of one Attack.
 */
struct Task {
    TaskId id = 0;
    AttackId attack_id = 0;
    CampaignId campaign_id = 0;
    uint64_t skip = 0;
    uint64_t limit = 0;
    TaskState state = TaskState::PENDING;
    uint64_t progress_keyspace = 0;       // Non-decreasing
    std::optional<AgentId> agent_id;      // Last assignee, never cleared once set
    std::optional<Claim> claim;           // Present only while leased
    uint32_t retry_count = 0;
    uint32_t crack_count = 0;
    bool stale = false;
    std::string last_error;
    Millis created_at = 0;
    Millis updated_at = 0;

    double progress_fraction() const {
        if (limit == 0) return 1.0;
        return static_cast<double>(progress_keyspace) / static_cast<double>(limit);
    }
    double progress_percent() const { return progress_fraction() * 100.0; }
    bool claimed_by(AgentId agent) const { return claim && claim->agent_id == agent; }
};

// -----------------------------------------------------------------------------
// Workers
// -----------------------------------------------------------------------------

struct Benchmark {
    double speed = 0.0;                   // Hashes per second
    Millis measured_at = 0;
};

struct Agent {
    AgentId id = 0;
    std::string signature;
    std::string host;
    std::string capabilities;             // Free-form device description
    std::string token_digest;             // SHA-256 hex of the issued token
    AgentState state = AgentState::PENDING;
    std::map<HashType, Benchmark> benchmarks;
    std::set<ProjectId> project_ids;
    std::optional<TaskId> claimed_task;   // At most one active claim
    Millis last_seen_at = 0;
    Millis created_at = 0;

    std::optional<double> speed_for(HashType type) const {
        auto it = benchmarks.find(type);
        if (it == benchmarks.end()) return std::nullopt;
        return it->second.speed;
    }

    Millis newest_benchmark_at() const {
        Millis newest = 0;
        for (const auto& [type, b] : benchmarks) newest = std::max(newest, b.measured_at);
        return newest;
    }
};

struct CrackResult {
    CrackId id = 0;
    HashItemId hash_item_id = 0;
    AttackId attack_id = 0;
    TaskId task_id = 0;
    AgentId agent_id = 0;
    std::string plaintext;
    Millis discovered_at = 0;
};

struct AgentError {
    AgentErrorId id = 0;
    AgentId agent_id = 0;
    std::optional<TaskId> task_id;
    std::optional<AttackId> attack_id;
    Severity severity = Severity::INFO;
    std::string message;
    Millis created_at = 0;
};

}  // namespace hashfleet
