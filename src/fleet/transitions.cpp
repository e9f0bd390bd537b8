// transitions.cpp - Check-and-set state changes with event emission

#include "transitions.hpp"
#include "../core/lifecycle.hpp"

namespace hashfleet {
namespace fleet {

namespace {

template<typename S>
void guard(S from, S to, const char* entity, uint64_t id) {
    if (!lifecycle::can_transition(from, to)) {
        fail(ErrorCode::INVALID_TRANSITION, std::string(entity) + " #" + std::to_string(id) +
             ": cannot go from " + to_string(from) + " to " + to_string(to));
    }
}

ProjectId project_of_campaign(const store::Tx& tx, CampaignId id) {
    const Campaign* c = tx.tables().campaigns.get(id);
    return c ? c->project_id : 0;
}

}  // namespace

void set_state(store::Tx& tx, Task& task, TaskState to, const std::string& reason) {
    TaskState from = task.state;
    guard(from, to, "task", task.id);
    if (from == to) return;

    task.state = to;
    task.updated_at = tx.now();
    tx.emit(TransitionEvent{EntityKind::TASK, task.id, project_of_campaign(tx, task.campaign_id),
                            to_string(from), to_string(to), reason, tx.now()});
}

void set_state(store::Tx& tx, Attack& attack, AttackState to, const std::string& reason) {
    AttackState from = attack.state;
    guard(from, to, "attack", attack.id);
    if (from == to) return;

    attack.state = to;
    if (to == AttackState::RUNNING && attack.started_at == 0) attack.started_at = tx.now();
    if (is_terminal(to)) attack.finished_at = tx.now();
    tx.emit(TransitionEvent{EntityKind::ATTACK, attack.id, project_of_campaign(tx, attack.campaign_id),
                            to_string(from), to_string(to), reason, tx.now()});
}

void set_state(store::Tx& tx, Campaign& campaign, CampaignState to, const std::string& reason) {
    CampaignState from = campaign.state;
    guard(from, to, "campaign", campaign.id);
    if (from == to) return;

    campaign.state = to;
    if (to == CampaignState::RUNNING && campaign.started_at == 0) campaign.started_at = tx.now();
    if (to != CampaignState::PAUSED) campaign.paused_by_preemption = false;
    if (is_terminal(to)) campaign.finished_at = tx.now();
    tx.emit(TransitionEvent{EntityKind::CAMPAIGN, campaign.id, campaign.project_id,
                            to_string(from), to_string(to), reason, tx.now()});
}

void set_state(store::Tx& tx, Agent& agent, AgentState to, const std::string& reason) {
    AgentState from = agent.state;
    guard(from, to, "agent", agent.id);
    if (from == to) return;

    agent.state = to;
    ProjectId project = agent.project_ids.empty() ? 0 : *agent.project_ids.begin();
    tx.emit(TransitionEvent{EntityKind::AGENT, agent.id, project,
                            to_string(from), to_string(to), reason, tx.now()});
}

void release_claim(store::Tx& tx, Task& task) {
    if (!task.claim) return;
    Agent* agent = tx.tables().agents.modify(task.claim->agent_id);
    if (agent && agent->claimed_task == task.id) agent->claimed_task.reset();
    task.claim.reset();
    task.updated_at = tx.now();
}

}  // namespace fleet
}  // namespace hashfleet
