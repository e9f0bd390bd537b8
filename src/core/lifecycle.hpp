/**
 * Lifecycle State Machines
 *
 * Allowed transitions for Agent, Campaign, Attack and Task. Same-state
 * transitions are always allowed. The tables are pure data; applying a
 * transition (with the check-and-set against the persisted row and the
 * resulting event) happens inside a store transaction, see fleet/transitions.hpp.
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace hashfleet {
namespace lifecycle {

bool can_transition(AgentState from, AgentState to);
bool can_transition(CampaignState from, CampaignState to);
bool can_transition(AttackState from, AttackState to);
bool can_transition(TaskState from, TaskState to);

// Targets reachable in one step (excluding the source itself)
std::vector<AgentState> successors(AgentState from);
std::vector<CampaignState> successors(CampaignState from);
std::vector<AttackState> successors(AttackState from);
std::vector<TaskState> successors(TaskState from);

}  // namespace lifecycle
}  // namespace hashfleet
