/**
 * Coordinator
 *
 * The one entry point for agents (poll, heartbeat, progress, cracks, errors)
 * and operators (projects, hash lists, resources, campaigns, attacks). Every
 * operation is one store transaction; failures come back as Result/Status and
 * no exception escapes this class.
 *
 * Background passes (sweep, rebalance) process one item per transaction and
 * log and skip the items that fail.
 */

#pragma once

#include "../core/clock.hpp"
#include "../core/yaml_config.hpp"
#include "../services/resources.hpp"
#include "../store/store.hpp"
#include "capability.hpp"
#include "crack_ingestor.hpp"
#include "keyspace.hpp"
#include "lease.hpp"
#include "preemption.hpp"
#include "progress.hpp"
#include "scheduler.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hashfleet {

struct Registration {
    AgentId agent_id = 0;
    std::string token;              // Shown once; only its digest is stored
};

struct ProgressReply {
    Disposition disposition = Disposition::CONTINUE;
    TaskState state = TaskState::RUNNING;
    double progress_percent = 0.0;
    bool ignored = false;           // Lower than the recorded progress
};

struct SweepReport {
    size_t disconnected = 0;
    size_t reassigned = 0;
    size_t failures = 0;
};

class Coordinator {
public:
    Coordinator(store::Store& store, const CoordinatorConfig& config,
                ResourceResolver* resolver = nullptr);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // ---- Agent surface ----------------------------------------------------

    Result<Registration> register_agent(const std::string& signature, const std::string& host,
                                        const std::string& capabilities,
                                        const std::vector<ProjectId>& project_ids = {});
    Result<AgentId> authenticate(const std::string& token);
    Status submit_benchmark(AgentId agent_id, HashType hash_type, double speed);
    Result<HeartbeatReply> heartbeat(AgentId agent_id);

    // nullopt = no work available (not an error)
    Result<std::optional<TaskAssignment>> request_task(AgentId agent_id);

    Result<ProgressReply> submit_progress(AgentId agent_id, TaskId task_id, uint64_t progress_keyspace);
    Result<CrackOutcome> submit_crack(AgentId agent_id, TaskId task_id, HashItemId item_id,
                                      const std::string& plaintext, Millis discovered_at = 0);
    Result<CrackOutcome> submit_crack_by_value(AgentId agent_id, TaskId task_id,
                                               const std::string& hash_value,
                                               const std::string& plaintext,
                                               Millis discovered_at = 0);
    Result<std::vector<std::pair<std::string, std::string>>> fetch_cracked(AgentId agent_id, TaskId task_id);
    Status report_exhausted(AgentId agent_id, TaskId task_id);
    Status report_task_failure(AgentId agent_id, TaskId task_id, const std::string& message);
    Result<AgentErrorId> report_error(AgentId agent_id, std::optional<TaskId> task_id,
                                      const std::string& message, Severity severity);

    // ---- Agent administration ---------------------------------------------

    Status assign_agent_project(AgentId agent_id, ProjectId project_id);
    Status fault_agent(AgentId agent_id, const std::string& reason);
    Status reset_agent(AgentId agent_id);
    Status retire_agent(AgentId agent_id);

    // ---- Operator surface -------------------------------------------------

    Result<ProjectId> create_project(const std::string& name);
    Result<HashListId> create_hash_list(ProjectId project_id, const std::string& name,
                                        HashType hash_type, const std::vector<std::string>& hashes);
    Result<ResourceId> create_resource(ProjectId project_id, ResourceKind kind, const std::string& name,
                                       uint64_t line_count, const std::string& sha256);
    Result<CampaignId> create_campaign(ProjectId project_id, HashListId hash_list_id,
                                       const std::string& name, Priority priority);
    Result<AttackId> add_attack(CampaignId campaign_id, const std::string& name, const AttackSpec& spec);

    Status schedule_campaign(CampaignId campaign_id);
    Status activate_campaign(CampaignId campaign_id);     // draft/scheduled -> running
    Status pause_campaign(CampaignId campaign_id);
    Status resume_campaign(CampaignId campaign_id);
    Status cancel_campaign(CampaignId campaign_id);
    Status pause_attack(AttackId attack_id);
    Status resume_attack(AttackId attack_id);

    // Destructive: abandoning the last open task abandons the attack and deletes its other tasks
    Status abandon_task(TaskId task_id);
    Status retry_task(TaskId task_id);

    // ---- Queries ----------------------------------------------------------

    Result<CampaignProgress> campaign_progress(CampaignId campaign_id) const;
    Result<AttackProgress> attack_progress(AttackId attack_id) const;

    std::optional<Agent> agent(AgentId id) const;
    std::optional<Campaign> campaign(CampaignId id) const;
    std::optional<Attack> attack(AttackId id) const;
    std::optional<Task> task(TaskId id) const;
    std::optional<HashItem> hash_item(HashItemId id) const;
    std::optional<HashList> hash_list(HashListId id) const;
    std::vector<Task> tasks_of(AttackId attack_id) const;
    std::vector<Campaign> campaigns_of(ProjectId project_id) const;
    std::vector<Agent> agents() const;
    size_t crack_count() const;

    // ---- Background passes ------------------------------------------------

    SweepReport sweep();
    size_t rebalance_all();

    const CoordinatorConfig& config() const { return config_; }
    store::Store& store() { return store_; }

private:
    // Runs fn inside a transaction, converting CoordinatorError to a Result
    template<typename T, typename Fn>
    Result<T> run(const char* op, Fn&& fn);
    template<typename Fn>
    Status run_status(const char* op, Fn&& fn);

    void require_live_agent(const Agent& agent) const;

    store::Store& store_;
    CoordinatorConfig config_;
    CapabilityMatcher matcher_;
    KeyspaceSlicer slicer_;
    ProgressAggregator progress_;
    PreemptionManager preemption_;
    LeaseManager lease_;
    CrackIngestor ingestor_;
    Scheduler scheduler_;
};

}  // namespace hashfleet
