// lifecycle.cpp - Transition tables for the four state machines

#include "lifecycle.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace hashfleet {
namespace lifecycle {

namespace {

template<typename S>
using Edge = std::pair<S, S>;

constexpr std::array<Edge<AgentState>, 17> AGENT_EDGES = {{
    {AgentState::PENDING, AgentState::ACTIVE},             // first benchmark accepted
    {AgentState::PENDING, AgentState::DISCONNECTED},
    {AgentState::ACTIVE, AgentState::DISCONNECTED},        // heartbeat timeout
    {AgentState::ACTIVE, AgentState::PENDING},             // benchmarks expired
    {AgentState::DISCONNECTED, AgentState::RECONNECTING},  // heartbeat resumed
    {AgentState::RECONNECTING, AgentState::ACTIVE},
    {AgentState::RECONNECTING, AgentState::PENDING},
    {AgentState::RECONNECTING, AgentState::DISCONNECTED},
    {AgentState::PENDING, AgentState::RETIRED},
    {AgentState::ACTIVE, AgentState::RETIRED},
    {AgentState::DISCONNECTED, AgentState::RETIRED},
    {AgentState::RECONNECTING, AgentState::RETIRED},
    {AgentState::FAULTED, AgentState::RETIRED},
    {AgentState::PENDING, AgentState::FAULTED},
    {AgentState::ACTIVE, AgentState::FAULTED},
    {AgentState::DISCONNECTED, AgentState::FAULTED},
    {AgentState::RECONNECTING, AgentState::FAULTED},
}};

// Operator reset of a faulted agent; kept apart from the fault edges above
constexpr Edge<AgentState> AGENT_RESET = {AgentState::FAULTED, AgentState::PENDING};

constexpr std::array<Edge<CampaignState>, 13> CAMPAIGN_EDGES = {{
    {CampaignState::DRAFT, CampaignState::SCHEDULED},
    {CampaignState::SCHEDULED, CampaignState::RUNNING},
    {CampaignState::RUNNING, CampaignState::PAUSED},
    {CampaignState::PAUSED, CampaignState::RUNNING},
    {CampaignState::RUNNING, CampaignState::COMPLETED},
    {CampaignState::PAUSED, CampaignState::COMPLETED},     // hash list cracked while paused
    {CampaignState::RUNNING, CampaignState::FAILED},
    {CampaignState::PAUSED, CampaignState::FAILED},
    {CampaignState::DRAFT, CampaignState::CANCELLED},
    {CampaignState::SCHEDULED, CampaignState::CANCELLED},
    {CampaignState::RUNNING, CampaignState::CANCELLED},
    {CampaignState::PAUSED, CampaignState::CANCELLED},
    {CampaignState::SCHEDULED, CampaignState::DRAFT},
}};

constexpr std::array<Edge<AttackState>, 16> ATTACK_EDGES = {{
    {AttackState::PENDING, AttackState::RUNNING},
    {AttackState::PENDING, AttackState::PAUSED},
    {AttackState::RUNNING, AttackState::PAUSED},
    {AttackState::PAUSED, AttackState::RUNNING},
    {AttackState::PAUSED, AttackState::PENDING},
    {AttackState::RUNNING, AttackState::COMPLETED},
    {AttackState::RUNNING, AttackState::EXHAUSTED},
    {AttackState::RUNNING, AttackState::FAILED},
    {AttackState::PENDING, AttackState::COMPLETED},        // hash list already cracked
    {AttackState::PAUSED, AttackState::COMPLETED},
    {AttackState::PAUSED, AttackState::EXHAUSTED},     // in-flight tasks finished while paused
    {AttackState::PAUSED, AttackState::FAILED},
    {AttackState::PENDING, AttackState::ABANDONED},
    {AttackState::RUNNING, AttackState::ABANDONED},
    {AttackState::PAUSED, AttackState::ABANDONED},
    {AttackState::FAILED, AttackState::ABANDONED},
}};

constexpr std::array<Edge<TaskState>, 20> TASK_EDGES = {{
    {TaskState::PENDING, TaskState::RUNNING},      // claim
    {TaskState::PENDING, TaskState::PAUSED},
    {TaskState::RUNNING, TaskState::PAUSED},
    {TaskState::PAUSED, TaskState::PENDING},       // resume
    {TaskState::RUNNING, TaskState::PENDING},      // lease released
    {TaskState::RUNNING, TaskState::COMPLETED},
    {TaskState::RUNNING, TaskState::EXHAUSTED},
    {TaskState::RUNNING, TaskState::FAILED},
    {TaskState::PENDING, TaskState::FAILED},       // cancelled before start
    {TaskState::PAUSED, TaskState::FAILED},
    {TaskState::FAILED, TaskState::PENDING},       // retry
    {TaskState::PENDING, TaskState::COMPLETED},    // hash list cracked elsewhere
    {TaskState::PAUSED, TaskState::COMPLETED},
    {TaskState::FAILED, TaskState::COMPLETED},
    {TaskState::PENDING, TaskState::ABANDONED},
    {TaskState::RUNNING, TaskState::ABANDONED},
    {TaskState::PAUSED, TaskState::ABANDONED},
    {TaskState::FAILED, TaskState::ABANDONED},
    {TaskState::COMPLETED, TaskState::ABANDONED},
    {TaskState::EXHAUSTED, TaskState::ABANDONED},
}};

template<typename S, size_t N>
bool contains(const std::array<Edge<S>, N>& edges, S from, S to) {
    return std::find(edges.begin(), edges.end(), Edge<S>{from, to}) != edges.end();
}

template<typename S, size_t N>
std::vector<S> targets(const std::array<Edge<S>, N>& edges, S from) {
    std::vector<S> out;
    for (const auto& [a, b] : edges) {
        if (a == from) out.push_back(b);
    }
    return out;
}

}  // namespace

bool can_transition(AgentState from, AgentState to) {
    if (from == to) return true;
    if (from == AGENT_RESET.first && to == AGENT_RESET.second) return true;
    return contains(AGENT_EDGES, from, to);
}

bool can_transition(CampaignState from, CampaignState to) {
    return from == to || contains(CAMPAIGN_EDGES, from, to);
}

bool can_transition(AttackState from, AttackState to) {
    return from == to || contains(ATTACK_EDGES, from, to);
}

bool can_transition(TaskState from, TaskState to) {
    return from == to || contains(TASK_EDGES, from, to);
}

std::vector<AgentState> successors(AgentState from) {
    auto out = targets(AGENT_EDGES, from);
    if (from == AGENT_RESET.first) out.push_back(AGENT_RESET.second);
    return out;
}

std::vector<CampaignState> successors(CampaignState from) { return targets(CAMPAIGN_EDGES, from); }
std::vector<AttackState> successors(AttackState from) { return targets(ATTACK_EDGES, from); }
std::vector<TaskState> successors(TaskState from) { return targets(TASK_EDGES, from); }

}  // namespace lifecycle
}  // namespace hashfleet
