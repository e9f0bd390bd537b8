// scheduler.cpp - Agent poll -> bounded, leased Task

#include "scheduler.hpp"
#include "lease.hpp"
#include "transitions.hpp"

#include <algorithm>
#include <sstream>

namespace hashfleet {

bool Scheduler::excluded(const store::Tables& tables, AgentId agent_id, TaskId task_id) {
    return excluded_tasks(tables, agent_id).count(task_id) > 0;
}

std::unordered_set<TaskId> Scheduler::excluded_tasks(const store::Tables& tables, AgentId agent_id) {
    std::unordered_set<TaskId> out;
    for (const auto& [id, e] : tables.agent_errors.rows()) {
        if (e.agent_id == agent_id && e.task_id && e.severity == Severity::FATAL) out.insert(*e.task_id);
    }
    return out;
}

std::vector<const Campaign*> Scheduler::campaign_order(const store::Tables& tables, const Agent& agent) {
    auto campaigns = tables.campaigns.select([&agent](const Campaign& c) {
        return c.state == CampaignState::RUNNING && agent.project_ids.count(c.project_id) > 0;
    });
    std::sort(campaigns.begin(), campaigns.end(), [](const Campaign* a, const Campaign* b) {
        if (a->priority != b->priority) return a->priority > b->priority;
        if (a->created_at != b->created_at) return a->created_at < b->created_at;
        return a->id < b->id;
    });
    return campaigns;
}

std::vector<const Attack*> Scheduler::attack_order(const store::Tables& tables, CampaignId campaign_id) {
    auto attacks = tables.attacks.select([campaign_id](const Attack& a) {
        return a.campaign_id == campaign_id && !a.user_paused &&
               (a.state == AttackState::PENDING || a.state == AttackState::RUNNING);
    });
    std::sort(attacks.begin(), attacks.end(), [](const Attack* a, const Attack* b) {
        if (a->complexity != b->complexity) return a->complexity < b->complexity;
        if (a->created_at != b->created_at) return a->created_at < b->created_at;
        return a->id < b->id;
    });
    return attacks;
}

std::optional<TaskAssignment> Scheduler::assign(store::Tx& tx, AgentId agent_id) const {
    Agent& agent = tx.agent(agent_id);
    if (agent.state == AgentState::RETIRED) {
        fail(ErrorCode::UNAUTHORIZED, "agent #" + std::to_string(agent_id) + " is retired");
    }
    if (agent.state == AgentState::FAULTED) {
        fail(ErrorCode::FATAL_AGENT_FAULT, "agent #" + std::to_string(agent_id) + " is in error state");
    }
    agent.last_seen_at = tx.now();
    if (agent.state != AgentState::ACTIVE) {
        LOG_DEBUG("No work for agent #" + std::to_string(agent_id) + " in state " + to_string(agent.state));
        return std::nullopt;
    }

    // One scan of the error log per poll
    const std::unordered_set<TaskId> fatal = excluded_tasks(tx.tables(), agent.id);

    // At most one claim per agent: hand the current one back unless it was stopped
    if (agent.claimed_task) {
        Task* held = tx.tables().tasks.modify(*agent.claimed_task);
        if (held && held->claimed_by(agent.id) && held->state == TaskState::RUNNING) {
            if (fatal.count(held->id)) {
                fleet::release_claim(tx, *held);
                fleet::set_state(tx, *held, TaskState::PENDING, "claimant reported a fatal error");
            } else if (auto stop = LeaseManager::apply_stop_request(tx, *held)) {
                LOG_INFO("Task #" + std::to_string(held->id) + " " + to_string(*stop) +
                         ", not handed back to agent #" + std::to_string(agent.id));
                progress_.derive_after_task(tx, held->id);
            } else {
                held->claim->expires_at = tx.now() + lease_duration_;
                return describe(tx, *held);
            }
        } else {
            agent.claimed_task.reset();
        }
    }

    for (const Campaign* campaign : campaign_order(tx.tables(), agent)) {
        const HashList* list = tx.tables().hash_lists.get(campaign->hash_list_id);
        if (!list || list->uncracked_count() == 0) continue;

        Priority priority = campaign->priority;
        for (const Attack* attack : attack_order(tx.tables(), campaign->id)) {
            Eligibility eligibility = matcher_.check(agent, attack->hash_type, priority, tx.now());
            if (eligibility != Eligibility::ELIGIBLE) {
                LOG_DEBUG("Agent #" + std::to_string(agent.id) + " skips attack #" +
                          std::to_string(attack->id) + ": " + to_string(eligibility));
                continue;
            }

            double speed = agent.speed_for(attack->hash_type).value_or(0.0);
            std::optional<TaskId> task_id = pick(tx, agent, *attack, speed, fatal);
            if (!task_id) continue;

            Task& task = tx.task(*task_id);
            claim(tx, agent, task, priority);
            progress_.derive_attack(tx, task.attack_id);
            return describe(tx, task);
        }
    }

    return std::nullopt;
}

std::optional<TaskId> Scheduler::pick(store::Tx& tx, const Agent& agent, const Attack& attack,
                                      double speed, const std::unordered_set<TaskId>& fatal) const {
    std::optional<TaskId> pending;
    std::optional<TaskId> retry;
    for (const auto& [id, t] : tx.tables().tasks.rows()) {
        if (t.attack_id != attack.id || t.claim) continue;
        if (t.state == TaskState::PENDING && !pending) {
            if (!fatal.count(id)) pending = id;
        } else if (t.state == TaskState::FAILED && t.retry_count < max_task_retries_ && !retry) {
            if (!fatal.count(id)) retry = id;
        }
        if (pending) break;
    }

    if (pending) return pending;

    if (retry) {
        Task& task = tx.task(*retry);
        task.retry_count++;
        task.last_error.clear();
        fleet::set_state(tx, task, TaskState::PENDING, "retry " + std::to_string(task.retry_count));
        return retry;
    }

    if (attack.fully_sliced()) return std::nullopt;

    auto [skip, limit] = slicer_.next_range(attack, speed);
    if (limit == 0) return std::nullopt;

    Attack& row = tx.attack(attack.id);
    row.sliced_keyspace = skip + limit;

    Task task;
    task.attack_id = row.id;
    task.campaign_id = row.campaign_id;
    task.skip = skip;
    task.limit = limit;
    task.created_at = tx.now();
    task.updated_at = tx.now();
    Task& created = tx.tables().tasks.insert(std::move(task));

    std::ostringstream reason;
    reason << "sliced [" << skip << ", " << (skip + limit) << ")";
    const Campaign* campaign = tx.tables().campaigns.get(row.campaign_id);
    tx.emit(TransitionEvent{EntityKind::TASK, created.id, campaign ? campaign->project_id : 0,
                            "", to_string(TaskState::PENDING), reason.str(), tx.now()});
    return created.id;
}

void Scheduler::claim(store::Tx& tx, Agent& agent, Task& task, Priority priority) const {
    if (task.claim || task.state != TaskState::PENDING) {
        fail(ErrorCode::STALE_CLAIM, "task #" + std::to_string(task.id) + " is no longer claimable");
    }
    if (agent.claimed_task) {
        fail(ErrorCode::INVALID_TRANSITION, "agent #" + std::to_string(agent.id) + " already holds task #" +
             std::to_string(*agent.claimed_task));
    }

    // Re-validated at claim time
    const Attack& attack = tx.attack(task.attack_id);
    if (!matcher_.eligible(agent, attack.hash_type, priority, tx.now())) {
        fail(ErrorCode::INELIGIBLE_AGENT, "agent #" + std::to_string(agent.id) +
             " cannot run hash type " + std::to_string(attack.hash_type));
    }

    Millis expires_at = tx.now() + lease_duration_;
    task.claim = Claim{agent.id, tx.now(), expires_at};
    task.agent_id = agent.id;
    agent.claimed_task = task.id;
    fleet::set_state(tx, task, TaskState::RUNNING, "claimed by agent #" + std::to_string(agent.id));

    Logger::instance().log_claim(task.id, agent.id, task.skip, task.limit, expires_at);
}

TaskAssignment Scheduler::describe(store::Tx& tx, const Task& task) const {
    const Attack& attack = tx.attack(task.attack_id);
    const Campaign& campaign = tx.campaign(task.campaign_id);

    TaskAssignment out;
    out.task_id = task.id;
    out.attack_id = attack.id;
    out.campaign_id = campaign.id;
    out.project_id = campaign.project_id;
    out.hash_list_id = campaign.hash_list_id;
    out.hash_type = attack.hash_type;
    out.attack_mode = attack_mode_name(attack.spec);
    out.spec = attack.spec;
    out.skip = task.skip;
    out.limit = task.limit;
    out.progress_keyspace = task.progress_keyspace;
    out.expires_at = task.claim ? task.claim->expires_at : 0;
    out.stale = task.stale;

    std::vector<ResourceId> ids;
    if (const auto* d = std::get_if<DictionaryAttack>(&attack.spec)) {
        ids.push_back(d->wordlist);
        if (d->rules) ids.push_back(*d->rules);
    } else if (const auto* h = std::get_if<HybridAttack>(&attack.spec)) {
        ids.push_back(h->wordlist);
    }

    for (ResourceId id : ids) {
        const Resource& resource = tx.resource(id);
        if (!resolver_) {
            out.resources.push_back(FetchHandle{resource.id, resource.kind, "", resource.sha256, 0});
            continue;
        }
        auto handle = resolver_->resolve(resource, tx.now());
        if (!handle) fail(handle.code(), handle.error().message);
        out.resources.push_back(handle.value());
    }
    return out;
}

}  // namespace hashfleet
