/**
 * Lifecycle Tests
 *
 * Transition tables for the four state machines and the guarded,
 * transactional application of a transition.
 */

#include "../src/core/lifecycle.hpp"
#include "../src/fleet/transitions.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace hashfleet;
using namespace hashfleet::testing;

void test_agent_edges() {
    using lifecycle::can_transition;
    assert(can_transition(AgentState::PENDING, AgentState::ACTIVE));
    assert(can_transition(AgentState::ACTIVE, AgentState::DISCONNECTED));
    assert(can_transition(AgentState::DISCONNECTED, AgentState::RECONNECTING));
    assert(can_transition(AgentState::RECONNECTING, AgentState::ACTIVE));
    assert(can_transition(AgentState::ACTIVE, AgentState::RETIRED));

    // Any live state can fault
    for (AgentState s : {AgentState::PENDING, AgentState::ACTIVE, AgentState::DISCONNECTED,
                         AgentState::RECONNECTING}) {
        assert(can_transition(s, AgentState::FAULTED));
    }

    assert(!can_transition(AgentState::RETIRED, AgentState::ACTIVE));
    assert(!can_transition(AgentState::DISCONNECTED, AgentState::ACTIVE));
    assert(can_transition(AgentState::FAULTED, AgentState::PENDING));
    assert(!can_transition(AgentState::FAULTED, AgentState::ACTIVE));

    std::cout << "[PASS] Agent transitions\n";
}

void test_campaign_edges() {
    using lifecycle::can_transition;
    assert(can_transition(CampaignState::DRAFT, CampaignState::SCHEDULED));
    assert(can_transition(CampaignState::SCHEDULED, CampaignState::RUNNING));
    assert(can_transition(CampaignState::RUNNING, CampaignState::PAUSED));
    assert(can_transition(CampaignState::PAUSED, CampaignState::RUNNING));
    assert(can_transition(CampaignState::RUNNING, CampaignState::COMPLETED));
    assert(can_transition(CampaignState::RUNNING, CampaignState::FAILED));

    assert(!can_transition(CampaignState::DRAFT, CampaignState::RUNNING));
    assert(!can_transition(CampaignState::COMPLETED, CampaignState::RUNNING));
    assert(!can_transition(CampaignState::CANCELLED, CampaignState::PAUSED));

    std::cout << "[PASS] Campaign transitions\n";
}

void test_attack_and_task_edges() {
    using lifecycle::can_transition;
    assert(can_transition(AttackState::PENDING, AttackState::RUNNING));
    assert(can_transition(AttackState::RUNNING, AttackState::EXHAUSTED));
    assert(can_transition(AttackState::PAUSED, AttackState::RUNNING));
    assert(!can_transition(AttackState::COMPLETED, AttackState::RUNNING));
    assert(!can_transition(AttackState::ABANDONED, AttackState::PENDING));

    assert(can_transition(TaskState::PENDING, TaskState::RUNNING));
    assert(can_transition(TaskState::RUNNING, TaskState::PENDING));
    assert(can_transition(TaskState::FAILED, TaskState::PENDING));
    assert(can_transition(TaskState::PAUSED, TaskState::PENDING));
    assert(can_transition(TaskState::RUNNING, TaskState::ABANDONED));
    assert(!can_transition(TaskState::COMPLETED, TaskState::RUNNING));
    assert(!can_transition(TaskState::EXHAUSTED, TaskState::PENDING));
    assert(!can_transition(TaskState::ABANDONED, TaskState::PENDING));

    std::cout << "[PASS] Attack and task transitions\n";
}

void test_same_state_always_allowed() {
    using lifecycle::can_transition;
    assert(can_transition(TaskState::RUNNING, TaskState::RUNNING));
    assert(can_transition(TaskState::ABANDONED, TaskState::ABANDONED));
    assert(can_transition(CampaignState::COMPLETED, CampaignState::COMPLETED));
    assert(can_transition(AgentState::RETIRED, AgentState::RETIRED));

    std::cout << "[PASS] Same-state transitions\n";
}

void test_successors() {
    auto next = lifecycle::successors(CampaignState::DRAFT);
    assert(std::find(next.begin(), next.end(), CampaignState::SCHEDULED) != next.end());
    assert(std::find(next.begin(), next.end(), CampaignState::CANCELLED) != next.end());
    assert(std::find(next.begin(), next.end(), CampaignState::RUNNING) == next.end());
    assert(std::find(next.begin(), next.end(), CampaignState::DRAFT) == next.end());

    assert(lifecycle::successors(TaskState::ABANDONED).empty());

    std::cout << "[PASS] Successor lists\n";
}

void test_invalid_transition_rolls_back() {
    Harness h;
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa", "bb"}));
    h.events.clear();

    // Valid first step, then an illegal one in the same transaction
    bool threw = false;
    try {
        h.store.atomically([&](store::Tx& tx) {
            Campaign& campaign = tx.campaign(c);
            fleet::set_state(tx, campaign, CampaignState::SCHEDULED, "step one");
            fleet::set_state(tx, campaign, CampaignState::COMPLETED, "illegal");
        });
    } catch (const CoordinatorError& e) {
        threw = true;
        assert(e.code() == ErrorCode::INVALID_TRANSITION);
    }
    assert(threw);
    assert(h.campaign_row(c).state == CampaignState::DRAFT);
    assert(h.events.size() == 0);

    // The facade reports the same failure as a value
    Status s = h.coordinator.resume_campaign(c);
    assert(!s.ok());
    assert(s.code() == ErrorCode::INVALID_TRANSITION);
    assert(h.campaign_row(c).state == CampaignState::DRAFT);

    std::cout << "[PASS] Invalid transition rolls back\n";
}

void test_transition_events() {
    Harness h;
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa"}));
    h.mask_attack(c, "?d?d");
    h.events.clear();

    h.activate(c);
    auto events = h.events.events_for(EntityKind::CAMPAIGN, c);
    assert(events.size() == 2);
    assert(events[0].from == "draft" && events[0].to == "scheduled");
    assert(events[1].from == "scheduled" && events[1].to == "running");
    assert(events[1].project_id == p);
    assert(events[1].at == h.clock.now());

    // Same-state request emits nothing
    h.events.clear();
    h.store.atomically([&](store::Tx& tx) {
        fleet::set_state(tx, tx.campaign(c), CampaignState::RUNNING, "again");
    });
    assert(h.events.size() == 0);

    std::cout << "[PASS] Transition events\n";
}

int main() {
    std::cout << "=== Lifecycle Tests ===\n\n";

    test_agent_edges();
    test_campaign_edges();
    test_attack_and_task_edges();
    test_same_state_always_allowed();
    test_successors();
    test_invalid_transition_rolls_back();
    test_transition_events();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
