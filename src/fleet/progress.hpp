/**
 * Progress Aggregator
 *
 * Keyspace-weighted roll-up Task -> Attack -> Campaign, and the completion
 * derivation that keeps Attack and Campaign states a function of their
 * children. The derive_* calls run inside the transaction that changed a
 * Task, right after the change; the progress queries are pure.
 *
 *   attack  = sum(task.fraction * task.limit) / attack.total_keyspace
 *   campaign = sum(attack.fraction * attack.total_keyspace) / sum(attack.total_keyspace)
 *
 * Keyspace not yet sliced into Tasks counts as zero progress. Finished Tasks
 * count as fully searched even when a crack stopped them early.
 */

#pragma once

#include "../store/store.hpp"
#include <optional>
#include <vector>

namespace hashfleet {

struct AttackProgress {
    AttackId attack_id = 0;
    AttackState state = AttackState::PENDING;
    uint64_t total_keyspace = 0;
    uint64_t searched_keyspace = 0;
    double fraction = 0.0;
};

struct CampaignProgress {
    CampaignId campaign_id = 0;
    CampaignState state = CampaignState::DRAFT;
    double fraction = 0.0;
    uint64_t total_keyspace = 0;
    uint64_t remaining_keyspace = 0;
    uint64_t cracked = 0;
    uint64_t hash_count = 0;
    std::optional<double> eta_seconds;     // None when no agent can run it
    std::vector<AttackProgress> attacks;
};

class ProgressAggregator {
public:
    explicit ProgressAggregator(uint32_t max_task_retries) : max_task_retries_(max_task_retries) {}

    // Pure queries

    static uint64_t searched_keyspace(const Task& task);
    static AttackProgress attack_progress(const store::Tables& tables, const Attack& attack);
    static CampaignProgress campaign_progress(const store::Tables& tables, const Campaign& campaign);

    // Seconds left at the fastest benchmarked speed among the campaign's project agents
    static std::optional<double> estimate_eta(const store::Tables& tables, const Campaign& campaign);

    // Derivation (inside a transaction)

    // Running task at full progress -> completed (cracks found) or exhausted
    void finish_if_searched(store::Tx& tx, Task& task) const;

    // Re-derive the attack, then its campaign
    void derive_after_task(store::Tx& tx, TaskId task_id) const;

    void derive_attack(store::Tx& tx, AttackId attack_id) const;

    // Returns true when the campaign reached a terminal state
    bool derive_campaign(store::Tx& tx, CampaignId campaign_id) const;

    // Every non-terminal task of an attack whose hash list is fully cracked
    void complete_cracked_attack(store::Tx& tx, Attack& attack) const;

    uint32_t max_task_retries() const { return max_task_retries_; }

private:
    uint32_t max_task_retries_;
};

}  // namespace hashfleet
