// coordinator.cpp - Agent and operator operations over the store

#include "coordinator.hpp"
#include "transitions.hpp"
#include "../services/credentials.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace hashfleet {

Coordinator::Coordinator(store::Store& store, const CoordinatorConfig& config, ResourceResolver* resolver)
    : store_(store)
    , config_(config)
    , matcher_(CapabilityPolicy::from_config(config))
    , slicer_(KeyspaceSlicer::from_config(config))
    , progress_(config.max_task_retries)
    , preemption_(config.preemption_enabled)
    , lease_(matcher_, config.lease_duration_ms(), config.heartbeat_grace_ms())
    , ingestor_(progress_)
    , scheduler_(matcher_, slicer_, progress_, config.lease_duration_ms(), config.max_task_retries, resolver)
{
}

template<typename T, typename Fn>
Result<T> Coordinator::run(const char* op, Fn&& fn) {
    try {
        return Result<T>(store_.atomically(std::forward<Fn>(fn)));
    } catch (const CoordinatorError& e) {
        switch (e.code()) {
            case ErrorCode::STALE_CLAIM:
            case ErrorCode::LEASE_EXPIRED:
            case ErrorCode::NOT_FOUND:
                LOG_INFO(std::string(op) + ": " + e.error().describe());
                break;
            default:
                LOG_WARN(std::string(op) + ": " + e.error().describe());
        }
        return e.error();
    } catch (const std::exception& e) {
        Logger::instance().log_error(std::string(op) + " failed: " + e.what());
        return Error{ErrorCode::STORE_FAILURE, e.what()};
    }
}

template<typename Fn>
Status Coordinator::run_status(const char* op, Fn&& fn) {
    auto result = run<bool>(op, [&fn](store::Tx& tx) { fn(tx); return true; });
    if (!result) return result.error();
    return Status::success();
}

void Coordinator::require_live_agent(const Agent& agent) const {
    if (agent.state == AgentState::RETIRED) {
        fail(ErrorCode::UNAUTHORIZED, "agent #" + std::to_string(agent.id) + " is retired");
    }
    if (agent.state == AgentState::FAULTED) {
        fail(ErrorCode::FATAL_AGENT_FAULT, "agent #" + std::to_string(agent.id) + " is in error state");
    }
}

// =============================================================================
// Agent surface
// =============================================================================

Result<Registration> Coordinator::register_agent(const std::string& signature, const std::string& host,
                                                 const std::string& capabilities,
                                                 const std::vector<ProjectId>& project_ids) {
    if (signature.empty()) return Error{ErrorCode::INVALID_ARGUMENT, "agent signature is required"};

    return run<Registration>("register_agent", [&](store::Tx& tx) {
        Agent agent;
        for (ProjectId p : project_ids) {
            tx.project(p);
            agent.project_ids.insert(p);
        }
        std::string token = credentials::generate_token();
        agent.signature = signature;
        agent.host = host;
        agent.capabilities = capabilities;
        agent.token_digest = credentials::sha256_hex(token);
        agent.last_seen_at = tx.now();
        agent.created_at = tx.now();
        Agent& row = tx.tables().agents.insert(std::move(agent));

        tx.emit(TransitionEvent{EntityKind::AGENT, row.id, project_ids.empty() ? 0 : project_ids.front(),
                                "", to_string(AgentState::PENDING), "registered", tx.now()});
        LOG_INFO("Agent #" + std::to_string(row.id) + " registered from " + host);
        return Registration{row.id, token};
    });
}

Result<AgentId> Coordinator::authenticate(const std::string& token) {
    if (token.size() != credentials::TOKEN_LENGTH) {
        return Error{ErrorCode::UNAUTHORIZED, "malformed credential"};
    }
    try {
        return store_.read([&token](const store::Tables& tables) -> Result<AgentId> {
            for (const auto& [id, agent] : tables.agents.rows()) {
                if (agent.token_digest.empty() || !credentials::matches(token, agent.token_digest)) continue;
                if (agent.state == AgentState::RETIRED) {
                    return Error{ErrorCode::UNAUTHORIZED, "credential revoked"};
                }
                return id;
            }
            return Error{ErrorCode::UNAUTHORIZED, "unknown credential"};
        });
    } catch (const CoordinatorError& e) {
        return e.error();
    }
}

Status Coordinator::submit_benchmark(AgentId agent_id, HashType hash_type, double speed) {
    if (!(speed >= 0.0) || std::isinf(speed)) {
        return Error{ErrorCode::INVALID_ARGUMENT, "benchmark speed must be a non-negative number"};
    }

    return run_status("submit_benchmark", [&](store::Tx& tx) {
        Agent& agent = tx.agent(agent_id);
        require_live_agent(agent);
        agent.benchmarks[hash_type] = Benchmark{speed, tx.now()};
        agent.last_seen_at = tx.now();

        if (agent.state == AgentState::PENDING && speed > 0.0 && !matcher_.benchmarks_stale(agent, tx.now())) {
            fleet::set_state(tx, agent, AgentState::ACTIVE, "benchmark accepted");
        }
    });
}

Result<HeartbeatReply> Coordinator::heartbeat(AgentId agent_id) {
    return run<HeartbeatReply>("heartbeat", [&](store::Tx& tx) {
        return lease_.heartbeat(tx, agent_id);
    });
}

Result<std::optional<TaskAssignment>> Coordinator::request_task(AgentId agent_id) {
    auto result = run<std::optional<TaskAssignment>>("request_task", [&](store::Tx& tx) {
        return scheduler_.assign(tx, agent_id);
    });

    // Scheduling misses are "no work", never errors
    if (!result && (result.code() == ErrorCode::INELIGIBLE_AGENT || result.code() == ErrorCode::STALE_CLAIM)) {
        return std::optional<TaskAssignment>{};
    }
    return result;
}

Result<ProgressReply> Coordinator::submit_progress(AgentId agent_id, TaskId task_id, uint64_t progress_keyspace) {
    return run<ProgressReply>("submit_progress", [&](store::Tx& tx) {
        Agent& agent = tx.agent(agent_id);
        if (agent.state == AgentState::RETIRED) {
            fail(ErrorCode::UNAUTHORIZED, "agent #" + std::to_string(agent_id) + " is retired");
        }
        Task& task = tx.task(task_id);
        ProgressReply reply;
        if (!task.claimed_by(agent_id)) {
            Disposition released = LeaseManager::released_disposition(task, agent_id);
            if (released == Disposition::REASSIGNED) {
                fail(ErrorCode::STALE_CLAIM, "agent #" + std::to_string(agent_id) + " no longer holds task #" +
                     std::to_string(task_id));
            }
            // Stopped under the agent: tell it why, record nothing
            agent.last_seen_at = tx.now();
            reply.disposition = released;
            reply.state = task.state;
            reply.progress_percent = task.progress_percent();
            reply.ignored = true;
            return reply;
        }
        agent.last_seen_at = tx.now();

        uint64_t value = std::min(progress_keyspace, task.limit);
        if (value < task.progress_keyspace) {
            LOG_INFO("Task #" + std::to_string(task_id) + ": ignored progress " + std::to_string(value) +
                     " below recorded " + std::to_string(task.progress_keyspace));
            reply.ignored = true;
        } else {
            task.progress_keyspace = value;
            task.updated_at = tx.now();
        }

        reply.disposition = lease_.task_disposition(tx, agent, task);
        if (reply.disposition == Disposition::CONTINUE || reply.disposition == Disposition::STALE) {
            progress_.finish_if_searched(tx, task);
        }
        CampaignId campaign_id = task.campaign_id;
        progress_.derive_after_task(tx, task_id);
        preemption_.rebalance(tx, tx.campaign(campaign_id).project_id);

        const Task& after = tx.task(task_id);
        reply.state = after.state;
        reply.progress_percent = after.progress_percent();
        return reply;
    });
}

Result<CrackOutcome> Coordinator::submit_crack(AgentId agent_id, TaskId task_id, HashItemId item_id,
                                               const std::string& plaintext, Millis discovered_at) {
    return run<CrackOutcome>("submit_crack", [&](store::Tx& tx) {
        if (tx.agent(agent_id).state == AgentState::RETIRED) {
            fail(ErrorCode::UNAUTHORIZED, "agent #" + std::to_string(agent_id) + " is retired");
        }
        CrackOutcome outcome = ingestor_.ingest(tx, agent_id, task_id, item_id, plaintext, discovered_at);
        preemption_.rebalance(tx, tx.campaign(tx.task(task_id).campaign_id).project_id);
        return outcome;
    });
}

Result<CrackOutcome> Coordinator::submit_crack_by_value(AgentId agent_id, TaskId task_id,
                                                        const std::string& hash_value,
                                                        const std::string& plaintext,
                                                        Millis discovered_at) {
    return run<CrackOutcome>("submit_crack_by_value", [&](store::Tx& tx) {
        if (tx.agent(agent_id).state == AgentState::RETIRED) {
            fail(ErrorCode::UNAUTHORIZED, "agent #" + std::to_string(agent_id) + " is retired");
        }
        CrackOutcome outcome = ingestor_.ingest_by_value(tx, agent_id, task_id, hash_value, plaintext,
                                                         discovered_at);
        preemption_.rebalance(tx, tx.campaign(tx.task(task_id).campaign_id).project_id);
        return outcome;
    });
}

Result<std::vector<std::pair<std::string, std::string>>> Coordinator::fetch_cracked(AgentId agent_id,
                                                                                    TaskId task_id) {
    using Pairs = std::vector<std::pair<std::string, std::string>>;
    return run<Pairs>("fetch_cracked", [&](store::Tx& tx) {
        Task& task = tx.task(task_id);
        CrackIngestor::check_submitter(task, agent_id);
        Pairs pairs = CrackIngestor::cracked_pairs(tx.tables(), tx.campaign(task.campaign_id).hash_list_id);
        task.stale = false;
        return pairs;
    });
}

Status Coordinator::report_exhausted(AgentId agent_id, TaskId task_id) {
    return run_status("report_exhausted", [&](store::Tx& tx) {
        Task& task = tx.task(task_id);
        if (!task.claimed_by(agent_id)) {
            fail(ErrorCode::STALE_CLAIM, "agent #" + std::to_string(agent_id) + " no longer holds task #" +
                 std::to_string(task_id));
        }
        task.progress_keyspace = task.limit;
        progress_.finish_if_searched(tx, task);
        CampaignId campaign_id = task.campaign_id;
        progress_.derive_after_task(tx, task_id);
        preemption_.rebalance(tx, tx.campaign(campaign_id).project_id);
    });
}

Status Coordinator::report_task_failure(AgentId agent_id, TaskId task_id, const std::string& message) {
    return run_status("report_task_failure", [&](store::Tx& tx) {
        Task& task = tx.task(task_id);
        if (!task.claimed_by(agent_id)) {
            fail(ErrorCode::STALE_CLAIM, "agent #" + std::to_string(agent_id) + " no longer holds task #" +
                 std::to_string(task_id));
        }
        fleet::release_claim(tx, task);
        task.last_error = message;
        fleet::set_state(tx, task, TaskState::FAILED, "agent reported failure");
        CampaignId campaign_id = task.campaign_id;
        progress_.derive_after_task(tx, task_id);
        preemption_.rebalance(tx, tx.campaign(campaign_id).project_id);
    });
}

Result<AgentErrorId> Coordinator::report_error(AgentId agent_id, std::optional<TaskId> task_id,
                                               const std::string& message, Severity severity) {
    return run<AgentErrorId>("report_error", [&](store::Tx& tx) {
        tx.agent(agent_id);
        AgentError error;
        error.agent_id = agent_id;
        if (task_id) {
            error.task_id = task_id;
            error.attack_id = tx.task(*task_id).attack_id;
        }
        error.severity = severity;
        error.message = message;
        error.created_at = tx.now();
        AgentError& row = tx.tables().agent_errors.insert(std::move(error));

        std::ostringstream ss;
        ss << "Agent #" << agent_id << " reported " << to_string(severity);
        if (task_id) ss << " on task #" << *task_id;
        ss << ": " << message;
        if (severity >= Severity::CRITICAL) {
            LOG_WARN(ss.str());
        } else {
            LOG_INFO(ss.str());
        }
        return row.id;
    });
}

// =============================================================================
// Agent administration
// =============================================================================

Status Coordinator::assign_agent_project(AgentId agent_id, ProjectId project_id) {
    return run_status("assign_agent_project", [&](store::Tx& tx) {
        tx.project(project_id);
        tx.agent(agent_id).project_ids.insert(project_id);
    });
}

Status Coordinator::fault_agent(AgentId agent_id, const std::string& reason) {
    return run_status("fault_agent", [&](store::Tx& tx) {
        Agent& agent = tx.agent(agent_id);
        fleet::set_state(tx, agent, AgentState::FAULTED, reason);

        AgentError error;
        error.agent_id = agent_id;
        error.task_id = agent.claimed_task;
        error.severity = Severity::FATAL;
        error.message = reason;
        error.created_at = tx.now();
        tx.tables().agent_errors.insert(std::move(error));

        // Swept now, not at lease expiry
        std::vector<TaskId> held;
        for (const auto& [id, t] : tx.tables().tasks.rows()) {
            if (t.claimed_by(agent_id)) held.push_back(id);
        }
        for (TaskId id : held) lease_.reclaim(tx, id, true);
    });
}

Status Coordinator::reset_agent(AgentId agent_id) {
    return run_status("reset_agent", [&](store::Tx& tx) {
        Agent& agent = tx.agent(agent_id);
        if (agent.state != AgentState::FAULTED) {
            fail(ErrorCode::INVALID_TRANSITION, "agent #" + std::to_string(agent_id) + " is " +
                 to_string(agent.state) + ", not error");
        }
        fleet::set_state(tx, agent, AgentState::PENDING, "reset by operator");
    });
}

Status Coordinator::retire_agent(AgentId agent_id) {
    return run_status("retire_agent", [&](store::Tx& tx) {
        Agent& agent = tx.agent(agent_id);
        fleet::set_state(tx, agent, AgentState::RETIRED, "retired by operator");
        agent.token_digest.clear();
    });
}

// =============================================================================
// Operator surface
// =============================================================================

Result<ProjectId> Coordinator::create_project(const std::string& name) {
    if (name.empty()) return Error{ErrorCode::INVALID_ARGUMENT, "project name is required"};
    return run<ProjectId>("create_project", [&](store::Tx& tx) {
        Project project;
        project.name = name;
        project.created_at = tx.now();
        return tx.tables().projects.insert(std::move(project)).id;
    });
}

Result<HashListId> Coordinator::create_hash_list(ProjectId project_id, const std::string& name,
                                                 HashType hash_type, const std::vector<std::string>& hashes) {
    std::vector<std::string> values;
    std::set<std::string> seen;
    for (const auto& raw : hashes) {
        std::string value = raw;
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.pop_back();
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) start++;
        value = value.substr(start);
        if (value.empty() || !seen.insert(value).second) continue;
        values.push_back(value);
    }
    if (values.empty()) return Error{ErrorCode::INVALID_ARGUMENT, "hash list has no hashes"};

    return run<HashListId>("create_hash_list", [&](store::Tx& tx) {
        tx.project(project_id);
        HashList list;
        list.project_id = project_id;
        list.name = name;
        list.hash_type = hash_type;
        list.item_count = values.size();
        list.created_at = tx.now();
        HashListId list_id = tx.tables().hash_lists.insert(std::move(list)).id;

        for (const auto& value : values) {
            HashItem item;
            item.hash_list_id = list_id;
            item.value = value;
            tx.tables().insert_item(std::move(item));
        }

        // Hashes already cracked elsewhere in the project count immediately
        uint64_t known = 0;
        for (const auto& [id, item] : tx.tables().hash_items.rows()) {
            if (item.hash_list_id != list_id) continue;
            for (const HashItem* other : tx.tables().find_items(item.value)) {
                const HashList* other_list = tx.tables().hash_lists.get(other->hash_list_id);
                if (!other->cracked || !other_list || other_list->project_id != project_id ||
                    other_list->hash_type != hash_type) continue;
                HashItem& mine = tx.hash_item(id);
                mine.cracked = true;
                mine.plaintext = other->plaintext;
                mine.cracked_at = tx.now();
                known++;
                break;
            }
        }
        tx.hash_list(list_id).cracked_count = known;
        return list_id;
    });
}

Result<ResourceId> Coordinator::create_resource(ProjectId project_id, ResourceKind kind, const std::string& name,
                                                uint64_t line_count, const std::string& sha256) {
    if (name.empty()) return Error{ErrorCode::INVALID_ARGUMENT, "resource name is required"};
    return run<ResourceId>("create_resource", [&](store::Tx& tx) {
        tx.project(project_id);
        Resource resource;
        resource.project_id = project_id;
        resource.kind = kind;
        resource.name = name;
        resource.line_count = line_count;
        resource.sha256 = sha256;
        resource.created_at = tx.now();
        return tx.tables().resources.insert(std::move(resource)).id;
    });
}

Result<CampaignId> Coordinator::create_campaign(ProjectId project_id, HashListId hash_list_id,
                                                const std::string& name, Priority priority) {
    return run<CampaignId>("create_campaign", [&](store::Tx& tx) {
        tx.project(project_id);
        const HashList& list = tx.hash_list(hash_list_id);
        if (list.project_id != project_id) {
            fail(ErrorCode::INVALID_ARGUMENT, "hash list #" + std::to_string(hash_list_id) +
                 " belongs to another project");
        }
        Campaign campaign;
        campaign.project_id = project_id;
        campaign.hash_list_id = hash_list_id;
        campaign.name = name;
        campaign.priority = priority;
        campaign.created_at = tx.now();
        Campaign& row = tx.tables().campaigns.insert(std::move(campaign));
        tx.emit(TransitionEvent{EntityKind::CAMPAIGN, row.id, project_id, "",
                                to_string(CampaignState::DRAFT), "created", tx.now()});
        return row.id;
    });
}

Result<AttackId> Coordinator::add_attack(CampaignId campaign_id, const std::string& name, const AttackSpec& spec) {
    return run<AttackId>("add_attack", [&](store::Tx& tx) {
        const Campaign& campaign = tx.campaign(campaign_id);
        if (is_terminal(campaign.state)) {
            fail(ErrorCode::INVALID_TRANSITION, "campaign #" + std::to_string(campaign_id) + " is " +
                 to_string(campaign.state));
        }
        ProjectId project_id = campaign.project_id;
        const HashList& list = tx.hash_list(campaign.hash_list_id);

        // Resources of other projects are invisible
        const store::Tables& tables = tx.tables();
        auto lookup = [&tables, project_id](ResourceId id) -> const Resource* {
            const Resource* r = tables.resources.get(id);
            return (r && r->project_id == project_id) ? r : nullptr;
        };
        auto total = keyspace::compute(spec, lookup);
        if (!total) fail(total.code(), total.error().message);

        Attack attack;
        attack.campaign_id = campaign_id;
        attack.name = name;
        attack.spec = spec;
        attack.hash_type = list.hash_type;
        attack.total_keyspace = total.value();
        attack.complexity = keyspace::complexity_bucket(total.value());
        attack.created_at = tx.now();
        Attack& row = tx.tables().attacks.insert(std::move(attack));

        std::ostringstream reason;
        reason << attack_mode_name(spec) << ", keyspace " << row.total_keyspace;
        tx.emit(TransitionEvent{EntityKind::ATTACK, row.id, project_id, "",
                                to_string(AttackState::PENDING), reason.str(), tx.now()});
        return row.id;
    });
}

Status Coordinator::schedule_campaign(CampaignId campaign_id) {
    return run_status("schedule_campaign", [&](store::Tx& tx) {
        Campaign& campaign = tx.campaign(campaign_id);
        if (campaign.state != CampaignState::DRAFT) {
            fail(ErrorCode::INVALID_TRANSITION, "campaign #" + std::to_string(campaign_id) + " is " +
                 to_string(campaign.state) + ", not draft");
        }
        fleet::set_state(tx, campaign, CampaignState::SCHEDULED, "scheduled");
    });
}

Status Coordinator::activate_campaign(CampaignId campaign_id) {
    return run_status("activate_campaign", [&](store::Tx& tx) {
        Campaign& campaign = tx.campaign(campaign_id);
        if (campaign.state != CampaignState::DRAFT && campaign.state != CampaignState::SCHEDULED) {
            fail(ErrorCode::INVALID_TRANSITION, "campaign #" + std::to_string(campaign_id) + " is " +
                 to_string(campaign.state) + ", cannot activate");
        }
        auto attacks = tx.tables().attacks.select([campaign_id](const Attack& a) {
            return a.campaign_id == campaign_id && a.state != AttackState::ABANDONED;
        });
        if (attacks.empty()) {
            fail(ErrorCode::INVALID_ARGUMENT, "campaign #" + std::to_string(campaign_id) + " has no attacks");
        }

        if (campaign.state == CampaignState::DRAFT) {
            fleet::set_state(tx, campaign, CampaignState::SCHEDULED, "scheduled");
        }
        fleet::set_state(tx, campaign, CampaignState::RUNNING, "activated");
        ProjectId project_id = campaign.project_id;

        progress_.derive_campaign(tx, campaign_id);
        preemption_.rebalance(tx, project_id);
    });
}

Status Coordinator::pause_campaign(CampaignId campaign_id) {
    return run_status("pause_campaign", [&](store::Tx& tx) {
        Campaign& campaign = tx.campaign(campaign_id);
        if (campaign.state == CampaignState::PAUSED) {
            campaign.paused_by_preemption = false;  // Now held by the operator
            return;
        }
        fleet::set_state(tx, campaign, CampaignState::PAUSED, "paused by operator");
        preemption_.rebalance(tx, campaign.project_id);
    });
}

Status Coordinator::resume_campaign(CampaignId campaign_id) {
    return run_status("resume_campaign", [&](store::Tx& tx) {
        Campaign& campaign = tx.campaign(campaign_id);
        if (campaign.state != CampaignState::PAUSED) {
            fail(ErrorCode::INVALID_TRANSITION, "campaign #" + std::to_string(campaign_id) + " is " +
                 to_string(campaign.state) + ", not paused");
        }
        fleet::set_state(tx, campaign, CampaignState::RUNNING, "resumed by operator");
        ProjectId project_id = campaign.project_id;

        std::vector<TaskId> paused;
        for (const auto& [id, t] : tx.tables().tasks.rows()) {
            if (t.campaign_id != campaign_id || t.state != TaskState::PAUSED) continue;
            const Attack* a = tx.tables().attacks.get(t.attack_id);
            if (a && !a->user_paused) paused.push_back(id);
        }
        for (TaskId id : paused) fleet::set_state(tx, tx.task(id), TaskState::PENDING, "campaign resumed");

        progress_.derive_campaign(tx, campaign_id);
        preemption_.rebalance(tx, project_id);
    });
}

Status Coordinator::cancel_campaign(CampaignId campaign_id) {
    return run_status("cancel_campaign", [&](store::Tx& tx) {
        Campaign& campaign = tx.campaign(campaign_id);
        fleet::set_state(tx, campaign, CampaignState::CANCELLED, "cancelled by operator");
        ProjectId project_id = campaign.project_id;

        // Claimed tasks learn about it on their next heartbeat
        std::vector<TaskId> idle;
        for (const auto& [id, t] : tx.tables().tasks.rows()) {
            if (t.campaign_id == campaign_id && !t.claim &&
                (t.state == TaskState::PENDING || t.state == TaskState::PAUSED)) {
                idle.push_back(id);
            }
        }
        for (TaskId id : idle) {
            Task& task = tx.task(id);
            task.last_error = "cancelled";
            fleet::set_state(tx, task, TaskState::FAILED, "campaign cancelled");
        }
        preemption_.rebalance(tx, project_id);
    });
}

Status Coordinator::pause_attack(AttackId attack_id) {
    return run_status("pause_attack", [&](store::Tx& tx) {
        Attack& attack = tx.attack(attack_id);
        fleet::set_state(tx, attack, AttackState::PAUSED, "paused by operator");
        attack.user_paused = true;

        std::vector<TaskId> pending;
        for (const auto& [id, t] : tx.tables().tasks.rows()) {
            if (t.attack_id == attack_id && t.state == TaskState::PENDING) pending.push_back(id);
        }
        for (TaskId id : pending) fleet::set_state(tx, tx.task(id), TaskState::PAUSED, "attack paused");
    });
}

Status Coordinator::resume_attack(AttackId attack_id) {
    return run_status("resume_attack", [&](store::Tx& tx) {
        Attack& attack = tx.attack(attack_id);
        if (attack.state != AttackState::PAUSED) {
            fail(ErrorCode::INVALID_TRANSITION, "attack #" + std::to_string(attack_id) + " is " +
                 to_string(attack.state) + ", not paused");
        }
        attack.user_paused = false;

        std::vector<TaskId> paused;
        bool any_running = false;
        for (const auto& [id, t] : tx.tables().tasks.rows()) {
            if (t.attack_id != attack_id) continue;
            if (t.state == TaskState::PAUSED) paused.push_back(id);
            if (t.state == TaskState::RUNNING) any_running = true;
        }
        for (TaskId id : paused) fleet::set_state(tx, tx.task(id), TaskState::PENDING, "attack resumed");

        // Running requires at least one pending or running task
        bool has_work = any_running || !paused.empty();
        if (!has_work) {
            for (const auto& [id, t] : tx.tables().tasks.rows()) {
                if (t.attack_id == attack_id && t.state == TaskState::PENDING) { has_work = true; break; }
            }
        }
        fleet::set_state(tx, attack, has_work ? AttackState::RUNNING : AttackState::PENDING, "resumed by operator");
        CampaignId campaign_id = attack.campaign_id;
        progress_.derive_attack(tx, attack_id);
        progress_.derive_campaign(tx, campaign_id);
    });
}

Status Coordinator::abandon_task(TaskId task_id) {
    return run_status("abandon_task", [&](store::Tx& tx) {
        Task& task = tx.task(task_id);
        AttackId attack_id = task.attack_id;
        CampaignId campaign_id = task.campaign_id;

        // A finished attack keeps its task history
        const Attack& owner = tx.attack(attack_id);
        if (is_terminal(owner.state) && owner.state != AttackState::FAILED) {
            fail(ErrorCode::INVALID_TRANSITION, "attack #" + std::to_string(attack_id) + " is " +
                 to_string(owner.state) + ", its tasks can no longer be abandoned");
        }

        fleet::release_claim(tx, task);
        fleet::set_state(tx, task, TaskState::ABANDONED, "abandoned by operator");

        std::vector<TaskId> siblings;
        bool others_open = false;
        for (const auto& [id, t] : tx.tables().tasks.rows()) {
            if (t.attack_id != attack_id || id == task_id) continue;
            siblings.push_back(id);
            if (!is_terminal(t.state)) others_open = true;
        }
        if (others_open) {
            progress_.derive_attack(tx, attack_id);
            progress_.derive_campaign(tx, campaign_id);
            return;
        }

        // Last open task: the attack goes with it
        fleet::set_state(tx, tx.attack(attack_id), AttackState::ABANDONED, "last task abandoned");
        for (TaskId id : siblings) {
            Task& sibling = tx.task(id);
            fleet::release_claim(tx, sibling);
            tx.tables().tasks.erase(id);
        }
        LOG_WARN("Attack #" + std::to_string(attack_id) + " abandoned, " + std::to_string(siblings.size()) +
                 " sibling task(s) deleted");

        progress_.derive_campaign(tx, campaign_id);
        preemption_.rebalance(tx, tx.campaign(campaign_id).project_id);
    });
}

Status Coordinator::retry_task(TaskId task_id) {
    return run_status("retry_task", [&](store::Tx& tx) {
        Task& task = tx.task(task_id);
        if (task.state != TaskState::FAILED) {
            fail(ErrorCode::INVALID_TRANSITION, "task #" + std::to_string(task_id) + " is " +
                 to_string(task.state) + ", not failed");
        }
        const Attack& attack = tx.attack(task.attack_id);
        if (is_terminal(attack.state)) {
            fail(ErrorCode::INVALID_TRANSITION, "attack #" + std::to_string(attack.id) + " is " +
                 to_string(attack.state));
        }
        task.retry_count++;
        task.last_error.clear();
        fleet::set_state(tx, task, TaskState::PENDING, "retried by operator");
    });
}

// =============================================================================
// Queries
// =============================================================================

Result<CampaignProgress> Coordinator::campaign_progress(CampaignId campaign_id) const {
    return store_.read([campaign_id](const store::Tables& tables) -> Result<CampaignProgress> {
        const Campaign* campaign = tables.campaigns.get(campaign_id);
        if (!campaign) return Error{ErrorCode::NOT_FOUND, "campaign #" + std::to_string(campaign_id) + " not found"};
        return ProgressAggregator::campaign_progress(tables, *campaign);
    });
}

Result<AttackProgress> Coordinator::attack_progress(AttackId attack_id) const {
    return store_.read([attack_id](const store::Tables& tables) -> Result<AttackProgress> {
        const Attack* attack = tables.attacks.get(attack_id);
        if (!attack) return Error{ErrorCode::NOT_FOUND, "attack #" + std::to_string(attack_id) + " not found"};
        return ProgressAggregator::attack_progress(tables, *attack);
    });
}

namespace {

template<typename Row>
std::optional<Row> copy_of(const store::Table<Row>& table, uint64_t id) {
    const Row* row = table.get(id);
    if (!row) return std::nullopt;
    return *row;
}

}  // namespace

std::optional<Agent> Coordinator::agent(AgentId id) const {
    return store_.read([id](const store::Tables& t) { return copy_of(t.agents, id); });
}

std::optional<Campaign> Coordinator::campaign(CampaignId id) const {
    return store_.read([id](const store::Tables& t) { return copy_of(t.campaigns, id); });
}

std::optional<Attack> Coordinator::attack(AttackId id) const {
    return store_.read([id](const store::Tables& t) { return copy_of(t.attacks, id); });
}

std::optional<Task> Coordinator::task(TaskId id) const {
    return store_.read([id](const store::Tables& t) { return copy_of(t.tasks, id); });
}

std::optional<HashItem> Coordinator::hash_item(HashItemId id) const {
    return store_.read([id](const store::Tables& t) { return copy_of(t.hash_items, id); });
}

std::optional<HashList> Coordinator::hash_list(HashListId id) const {
    return store_.read([id](const store::Tables& t) { return copy_of(t.hash_lists, id); });
}

std::vector<Task> Coordinator::tasks_of(AttackId attack_id) const {
    return store_.read([attack_id](const store::Tables& t) {
        std::vector<Task> out;
        for (const auto& [id, task] : t.tasks.rows()) {
            if (task.attack_id == attack_id) out.push_back(task);
        }
        return out;
    });
}

std::vector<Campaign> Coordinator::campaigns_of(ProjectId project_id) const {
    return store_.read([project_id](const store::Tables& t) {
        std::vector<Campaign> out;
        for (const auto& [id, c] : t.campaigns.rows()) {
            if (c.project_id == project_id) out.push_back(c);
        }
        return out;
    });
}

std::vector<Agent> Coordinator::agents() const {
    return store_.read([](const store::Tables& t) {
        std::vector<Agent> out;
        for (const auto& [id, a] : t.agents.rows()) out.push_back(a);
        return out;
    });
}

size_t Coordinator::crack_count() const {
    return store_.read([](const store::Tables& t) { return t.cracks.size(); });
}

// =============================================================================
// Background passes
// =============================================================================

SweepReport Coordinator::sweep() {
    SweepReport report;
    Millis now = store_.clock().now();

    auto silent = store_.read([&](const store::Tables& t) { return lease_.find_disconnected(t, now); });
    for (AgentId id : silent) {
        try {
            if (store_.atomically([&](store::Tx& tx) { return lease_.mark_disconnected(tx, id); })) {
                report.disconnected++;
            }
        } catch (const std::exception& e) {
            report.failures++;
            LOG_ERROR("Sweep: agent #" + std::to_string(id) + ": " + e.what());
        }
    }

    now = store_.clock().now();
    auto expired = store_.read([&](const store::Tables& t) { return lease_.find_expired(t, now); });
    for (TaskId id : expired) {
        try {
            if (store_.atomically([&](store::Tx& tx) { return lease_.reclaim(tx, id); })) {
                report.reassigned++;
            }
        } catch (const std::exception& e) {
            report.failures++;
            LOG_ERROR("Sweep: task #" + std::to_string(id) + ": " + e.what());
        }
    }

    if (report.disconnected || report.reassigned || report.failures) {
        Logger::instance().log_sweep(report.disconnected, report.reassigned, report.failures);
    }
    return report;
}

size_t Coordinator::rebalance_all() {
    auto projects = store_.read([](const store::Tables& t) {
        std::vector<ProjectId> ids;
        for (const auto& [id, p] : t.projects.rows()) ids.push_back(id);
        return ids;
    });

    size_t changed = 0;
    for (ProjectId id : projects) {
        try {
            auto outcome = store_.atomically([&](store::Tx& tx) { return preemption_.rebalance(tx, id); });
            changed += outcome.paused + outcome.resumed;
        } catch (const std::exception& e) {
            LOG_ERROR("Rebalance: project #" + std::to_string(id) + ": " + e.what());
        }
    }
    return changed;
}

}  // namespace hashfleet
