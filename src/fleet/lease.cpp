// lease.cpp - Heartbeats, disconnect detection and lease reclaim

#include "lease.hpp"
#include "transitions.hpp"

namespace hashfleet {

HeartbeatReply LeaseManager::heartbeat(store::Tx& tx, AgentId agent_id) const {
    Agent& agent = tx.agent(agent_id);
    if (agent.state == AgentState::RETIRED) {
        fail(ErrorCode::UNAUTHORIZED, "agent #" + std::to_string(agent_id) + " is retired");
    }

    HeartbeatReply reply;
    agent.last_seen_at = tx.now();

    if (agent.state == AgentState::FAULTED) {
        reply.state = agent.state;
        return reply;
    }

    bool stale_bench = matcher_.benchmarks_stale(agent, tx.now());
    switch (agent.state) {
        case AgentState::DISCONNECTED:
            fleet::set_state(tx, agent, AgentState::RECONNECTING, "heartbeat resumed");
            break;
        case AgentState::RECONNECTING:
            if (agent.benchmarks.empty() || stale_bench) {
                fleet::set_state(tx, agent, AgentState::PENDING, "benchmark required");
            } else {
                fleet::set_state(tx, agent, AgentState::ACTIVE, "reconnected");
            }
            break;
        case AgentState::ACTIVE:
            if (stale_bench) fleet::set_state(tx, agent, AgentState::PENDING, "benchmarks expired");
            break;
        default:
            break;
    }

    reply.state = agent.state;
    reply.rebenchmark = agent.state == AgentState::PENDING && (agent.benchmarks.empty() || stale_bench);

    if (agent.claimed_task) {
        Task* task = tx.tables().tasks.modify(*agent.claimed_task);
        if (!task) {
            agent.claimed_task.reset();
        } else {
            reply.task_id = task->id;
            reply.disposition = task_disposition(tx, agent, *task);
            if (task->claim) reply.expires_at = task->claim->expires_at;
        }
    }
    return reply;
}

Disposition LeaseManager::task_disposition(store::Tx& tx, Agent& agent, Task& task) const {
    if (!task.claimed_by(agent.id)) {
        if (agent.claimed_task == task.id) agent.claimed_task.reset();
        return released_disposition(task, agent.id);
    }

    if (auto stop = apply_stop_request(tx, task)) return *stop;

    task.claim->expires_at = tx.now() + lease_duration_;
    task.updated_at = tx.now();
    return task.stale ? Disposition::STALE : Disposition::CONTINUE;
}

std::optional<Disposition> LeaseManager::apply_stop_request(store::Tx& tx, Task& task) {
    const Campaign& campaign = tx.campaign(task.campaign_id);
    const Attack& attack = tx.attack(task.attack_id);

    if (campaign.state == CampaignState::CANCELLED || attack.state == AttackState::ABANDONED) {
        fleet::release_claim(tx, task);
        task.last_error = "cancelled";
        fleet::set_state(tx, task, TaskState::FAILED, "campaign cancelled");
        return Disposition::CANCELLED;
    }

    // Preempted campaigns only stop receiving new work; an operator pause stops the task
    bool operator_paused = attack.user_paused ||
        (campaign.state == CampaignState::PAUSED && !campaign.paused_by_preemption);
    if (operator_paused) {
        fleet::release_claim(tx, task);
        fleet::set_state(tx, task, TaskState::PAUSED, "paused by operator");
        return Disposition::PAUSED;
    }
    return std::nullopt;
}

Disposition LeaseManager::released_disposition(const Task& task, AgentId agent_id) {
    if (task.agent_id != agent_id) return Disposition::REASSIGNED;
    if (is_finished(task.state)) return Disposition::COMPLETED;
    if (task.state == TaskState::ABANDONED) return Disposition::CANCELLED;
    if (task.state == TaskState::FAILED && task.last_error == "cancelled") return Disposition::CANCELLED;
    if (task.state == TaskState::PAUSED) return Disposition::PAUSED;
    return Disposition::REASSIGNED;
}

std::vector<AgentId> LeaseManager::find_disconnected(const store::Tables& tables, Millis now) const {
    std::vector<AgentId> out;
    for (const auto& [id, agent] : tables.agents.rows()) {
        if (is_live(agent.state) && agent.last_seen_at + heartbeat_grace_ < now) out.push_back(id);
    }
    return out;
}

bool LeaseManager::mark_disconnected(store::Tx& tx, AgentId agent_id) const {
    Agent& agent = tx.agent(agent_id);
    if (!is_live(agent.state) || agent.last_seen_at + heartbeat_grace_ >= tx.now()) return false;
    fleet::set_state(tx, agent, AgentState::DISCONNECTED, "heartbeat timeout");
    return true;
}

std::vector<TaskId> LeaseManager::find_expired(const store::Tables& tables, Millis now) const {
    std::vector<TaskId> out;
    for (const auto& [id, task] : tables.tasks.rows()) {
        if (!task.claim || task.claim->expires_at > now) continue;
        const Agent* agent = tables.agents.get(task.claim->agent_id);
        if (agent && is_live(agent->state)) continue;
        out.push_back(id);
    }
    return out;
}

bool LeaseManager::reclaim(store::Tx& tx, TaskId task_id, bool force) const {
    Task* task = tx.tables().tasks.modify(task_id);
    if (!task || !task->claim || task->state != TaskState::RUNNING) return false;

    AgentId former = task->claim->agent_id;
    if (!force) {
        // Only leases that already expired, held by agents already marked non-live
        if (task->claim->expires_at > tx.now()) return false;
        const Agent* agent = tx.tables().agents.get(former);
        if (agent && is_live(agent->state)) return false;
    }

    fleet::release_claim(tx, *task);
    task->stale = true;
    fleet::set_state(tx, *task, TaskState::PENDING,
                     force ? "claimant faulted" : "lease expired");
    LOG_INFO("Task #" + std::to_string(task_id) + " released from agent #" + std::to_string(former) +
             " (stale)");
    return true;
}

}  // namespace hashfleet
