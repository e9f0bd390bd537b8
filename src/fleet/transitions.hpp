// transitions.hpp - Guarded state changes applied inside a store transaction
//
// Each call re-checks the row as it currently sits in the store against the
// lifecycle tables, writes the new state and queues a TransitionEvent. An
// illegal transition throws CoordinatorError(INVALID_TRANSITION), which rolls
// back the whole transaction. Same-state calls succeed and emit nothing.

#pragma once

#include "../store/store.hpp"
#include <string>

namespace hashfleet {
namespace fleet {

void set_state(store::Tx& tx, Task& task, TaskState to, const std::string& reason);
void set_state(store::Tx& tx, Attack& attack, AttackState to, const std::string& reason);
void set_state(store::Tx& tx, Campaign& campaign, CampaignState to, const std::string& reason);
void set_state(store::Tx& tx, Agent& agent, AgentState to, const std::string& reason);

// Clears the lease on `task` and the back-reference on its claimant
void release_claim(store::Tx& tx, Task& task);

}  // namespace fleet
}  // namespace hashfleet
