/**
 * Task Assignment Scheduler
 *
 * On an agent poll, inside one store transaction:
 *   1. the agent must be active; an existing claim is handed back instead,
 *      unless an operator cancel or pause has stopped it since
 *   2. running campaigns of the agent's projects, priority desc then creation
 *   3. per campaign, pending/running attacks by complexity then creation
 *   4. per attack (capability permitting): the first pending task, else a
 *      retryable failed task, else a new slice of unallocated keyspace
 *   5. claim it: lease fields set, pending -> running
 *
 * Ineligible attacks are skipped, never reported. No match is "no work".
 */

#pragma once

#include "../store/store.hpp"
#include "../services/resources.hpp"
#include "capability.hpp"
#include "keyspace.hpp"
#include "progress.hpp"

#include <optional>
#include <unordered_set>
#include <vector>

namespace hashfleet {

struct TaskAssignment {
    TaskId task_id = 0;
    AttackId attack_id = 0;
    CampaignId campaign_id = 0;
    ProjectId project_id = 0;
    HashListId hash_list_id = 0;
    HashType hash_type = 0;
    std::string attack_mode;
    AttackSpec spec;
    uint64_t skip = 0;
    uint64_t limit = 0;
    uint64_t progress_keyspace = 0;
    Millis expires_at = 0;
    bool stale = false;
    std::vector<FetchHandle> resources;
};

class Scheduler {
public:
    Scheduler(const CapabilityMatcher& matcher, const KeyspaceSlicer& slicer,
              const ProgressAggregator& progress, Millis lease_duration,
              uint32_t max_task_retries, ResourceResolver* resolver = nullptr)
        : matcher_(matcher), slicer_(slicer), progress_(progress),
          lease_duration_(lease_duration), max_task_retries_(max_task_retries),
          resolver_(resolver) {}

    // Throws UNAUTHORIZED (retired) or FATAL_AGENT_FAULT (faulted agent)
    std::optional<TaskAssignment> assign(store::Tx& tx, AgentId agent_id) const;

    // True when the agent logged a fatal error against this task
    static bool excluded(const store::Tables& tables, AgentId agent_id, TaskId task_id);

    // Every task the agent logged a fatal error against
    static std::unordered_set<TaskId> excluded_tasks(const store::Tables& tables, AgentId agent_id);

    // Campaigns eligible for dispatch to this agent, in scan order
    static std::vector<const Campaign*> campaign_order(const store::Tables& tables, const Agent& agent);

    // Dispatchable attacks of a campaign, in scan order
    static std::vector<const Attack*> attack_order(const store::Tables& tables, CampaignId campaign_id);

private:
    std::optional<TaskId> pick(store::Tx& tx, const Agent& agent, const Attack& attack,
                               double speed, const std::unordered_set<TaskId>& fatal) const;
    void claim(store::Tx& tx, Agent& agent, Task& task, Priority priority) const;
    TaskAssignment describe(store::Tx& tx, const Task& task) const;

    const CapabilityMatcher& matcher_;
    const KeyspaceSlicer& slicer_;
    const ProgressAggregator& progress_;
    Millis lease_duration_;
    uint32_t max_task_retries_;
    ResourceResolver* resolver_;
};

}  // namespace hashfleet
