/**
 * Preemption Tests
 */

#include "../src/fleet/preemption.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace hashfleet;
using namespace hashfleet::testing;

namespace {

CampaignId running(Harness& h, ProjectId p, Priority priority, const std::string& hash,
                   const std::string& mask = "?d?d?d") {
    CampaignId c = h.campaign(p, h.hash_list(p, {hash}), priority, hash);
    h.mask_attack(c, mask);
    h.activate(c);
    return c;
}

}  // namespace

void test_higher_priority_pauses_lower() {
    Harness h;
    ProjectId p = h.project();
    CampaignId deferred = running(h, p, Priority::DEFERRED, "d1");
    CampaignId routine = running(h, p, Priority::ROUTINE, "r1");
    assert(h.campaign_row(deferred).state == CampaignState::PAUSED);
    assert(h.campaign_row(routine).state == CampaignState::RUNNING);

    CampaignId high = running(h, p, Priority::HIGH, "h1");
    assert(h.campaign_row(high).state == CampaignState::RUNNING);
    assert(h.campaign_row(routine).state == CampaignState::PAUSED);
    assert(h.campaign_row(routine).paused_by_preemption);
    assert(h.campaign_row(deferred).paused_by_preemption);

    auto top = h.store.read([&](const store::Tables& t) {
        return PreemptionManager::top_running_priority(t, p);
    });
    assert(top == Priority::HIGH);

    auto events = h.events.events_for(EntityKind::CAMPAIGN, routine);
    assert(events.back().to == "paused");
    assert(events.back().reason.find("preempted") != std::string::npos);

    std::cout << "[PASS] Higher priority pauses lower\n";
}

void test_equal_priority_coexists() {
    Harness h;
    ProjectId p = h.project();
    CampaignId a = running(h, p, Priority::HIGH, "a");
    CampaignId b = running(h, p, Priority::HIGH, "b");
    assert(h.campaign_row(a).state == CampaignState::RUNNING);
    assert(h.campaign_row(b).state == CampaignState::RUNNING);

    std::cout << "[PASS] Equal priorities never preempt\n";
}

void test_resume_when_higher_finishes() {
    Harness h;
    ProjectId p = h.project();
    CampaignId routine = running(h, p, Priority::ROUTINE, "r1");
    CampaignId urgent = running(h, p, Priority::URGENT, "u1", "?d?d");
    assert(h.campaign_row(routine).state == CampaignState::PAUSED);

    AgentId agent = h.agent({p});
    TaskAssignment t = h.poll(agent);
    assert(t.campaign_id == urgent);
    assert(h.coordinator.submit_progress(agent, t.task_id, t.limit).ok());

    assert(h.campaign_row(urgent).state == CampaignState::COMPLETED);
    Campaign resumed = h.campaign_row(routine);
    assert(resumed.state == CampaignState::RUNNING);
    assert(!resumed.paused_by_preemption);
    assert(h.poll(agent).campaign_id == routine);

    std::cout << "[PASS] Preempted campaign resumes when higher work finishes\n";
}

void test_resume_when_higher_cancelled() {
    Harness h;
    ProjectId p = h.project();
    CampaignId deferred = running(h, p, Priority::DEFERRED, "d1");
    CampaignId routine = running(h, p, Priority::ROUTINE, "r1");
    CampaignId high = running(h, p, Priority::HIGH, "h1");

    assert(h.coordinator.cancel_campaign(high).ok());

    // Only the best of the preempted campaigns comes back
    assert(h.campaign_row(routine).state == CampaignState::RUNNING);
    assert(h.campaign_row(deferred).state == CampaignState::PAUSED);

    assert(h.coordinator.cancel_campaign(routine).ok());
    assert(h.campaign_row(deferred).state == CampaignState::RUNNING);

    std::cout << "[PASS] Preempted campaigns resume when higher work is cancelled\n";
}

void test_operator_pause_is_sticky() {
    Harness h;
    ProjectId p = h.project();
    CampaignId routine = running(h, p, Priority::ROUTINE, "r1");
    CampaignId high = running(h, p, Priority::HIGH, "h1");
    assert(h.campaign_row(routine).paused_by_preemption);

    // The operator takes over the pause
    assert(h.coordinator.pause_campaign(routine).ok());
    assert(!h.campaign_row(routine).paused_by_preemption);

    assert(h.coordinator.cancel_campaign(high).ok());
    assert(h.campaign_row(routine).state == CampaignState::PAUSED);
    assert(h.coordinator.rebalance_all() == 0);

    assert(h.coordinator.resume_campaign(routine).ok());
    assert(h.campaign_row(routine).state == CampaignState::RUNNING);

    std::cout << "[PASS] Operator pause is not auto-resumed\n";
}

void test_in_flight_task_keeps_lease() {
    Harness h;
    ProjectId p = h.project();
    CampaignId routine = running(h, p, Priority::ROUTINE, "r1");
    AgentId agent = h.agent({p}, 0, 50.0);
    TaskAssignment t = h.poll(agent);
    assert(t.campaign_id == routine);

    running(h, p, Priority::URGENT, "u1");
    assert(h.campaign_row(routine).state == CampaignState::PAUSED);

    auto beat = h.coordinator.heartbeat(agent);
    assert(beat->disposition == Disposition::CONTINUE);
    assert(h.task(t.task_id).state == TaskState::RUNNING);

    auto reply = h.coordinator.submit_progress(agent, t.task_id, 200);
    assert(reply->disposition == Disposition::CONTINUE);

    std::cout << "[PASS] Preempted campaign keeps in-flight leases\n";
}

void test_projects_are_independent() {
    Harness h;
    ProjectId a = h.project("a");
    ProjectId b = h.project("b");
    CampaignId routine = running(h, a, Priority::ROUTINE, "r1");
    running(h, b, Priority::URGENT, "u1");
    assert(h.campaign_row(routine).state == CampaignState::RUNNING);

    std::cout << "[PASS] Projects do not preempt each other\n";
}

void test_disabled() {
    CoordinatorConfig config = test_config();
    config.preemption_enabled = false;
    Harness h(config);
    ProjectId p = h.project();
    CampaignId routine = running(h, p, Priority::ROUTINE, "r1");
    running(h, p, Priority::URGENT, "u1");
    assert(h.campaign_row(routine).state == CampaignState::RUNNING);

    std::cout << "[PASS] Preemption can be disabled\n";
}

int main() {
    std::cout << "=== Preemption Tests ===\n\n";

    test_higher_priority_pauses_lower();
    test_equal_priority_coexists();
    test_resume_when_higher_finishes();
    test_resume_when_higher_cancelled();
    test_operator_pause_is_sticky();
    test_in_flight_task_keeps_lease();
    test_projects_are_independent();
    test_disabled();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
