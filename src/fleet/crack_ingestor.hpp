// crack_ingestor.hpp - Idempotent crack submission with attribution
//
// A crack marks the HashItem cracked (never undone), appends one CrackResult
// and bumps the Task's crack count. Re-submitting an already-cracked item is
// accepted without a second record. The same hash value in other lists of the
// project (same hash type) is cracked with it, and every other task working
// an affected list is flagged stale so its agent re-fetches before trusting
// its local cache.

#pragma once

#include "../store/store.hpp"
#include "progress.hpp"

#include <string>
#include <utility>
#include <vector>

namespace hashfleet {

struct CrackOutcome {
    HashItemId hash_item_id = 0;
    bool duplicate = false;
    size_t propagated = 0;          // Items cracked in other lists
    size_t tasks_marked_stale = 0;
    bool list_cracked = false;      // Hash list has nothing left
};

class CrackIngestor {
public:
    explicit CrackIngestor(const ProgressAggregator& progress) : progress_(progress) {}

    CrackOutcome ingest(store::Tx& tx, AgentId agent_id, TaskId task_id, HashItemId item_id,
                        const std::string& plaintext, Millis discovered_at) const;

    // Resolve the item by its hash value inside the task's hash list
    CrackOutcome ingest_by_value(store::Tx& tx, AgentId agent_id, TaskId task_id,
                                 const std::string& hash_value, const std::string& plaintext,
                                 Millis discovered_at) const;

    // (hash, plaintext) pairs already cracked in a list
    static std::vector<std::pair<std::string, std::string>> cracked_pairs(const store::Tables& tables,
                                                                          HashListId list_id);

    // The task's submitter must hold the claim or be its last assignee
    static void check_submitter(const Task& task, AgentId agent_id);

private:
    void mark_cracked(store::Tx& tx, HashItem& item, const std::string& plaintext, Millis at,
                      AttackId attack_id, TaskId task_id, AgentId agent_id) const;

    const ProgressAggregator& progress_;
};

}  // namespace hashfleet
