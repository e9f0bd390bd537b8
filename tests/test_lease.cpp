/**
 * Lease Manager Tests
 *
 * Heartbeat renewal, disconnect detection, expired-lease reclaim without
 * cascade, reconnect, benchmark expiry and task dispositions.
 */

#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace hashfleet;
using namespace hashfleet::testing;

namespace {

struct Fixture {
    Harness h;
    ProjectId project = 0;
    CampaignId campaign = 0;
    AttackId attack = 0;

    explicit Fixture(const CoordinatorConfig& config = test_config()) : h(config) {
        project = h.project();
        campaign = h.campaign(project, h.hash_list(project, {"aa", "bb"}));
        attack = h.mask_attack(campaign, "?d?d?d?d");
        h.activate(campaign);
    }
};

constexpr Millis LEASE = 300 * MS_PER_SECOND;

}  // namespace

void test_heartbeat_renews_lease() {
    Fixture f;
    AgentId agent = f.h.agent({f.project});
    TaskAssignment task = f.h.poll(agent);
    assert(task.expires_at == f.h.clock.now() + LEASE);

    f.h.clock.advance_seconds(100);
    auto reply = f.h.coordinator.heartbeat(agent);
    assert(reply.ok());
    assert(reply->state == AgentState::ACTIVE);
    assert(reply->disposition == Disposition::CONTINUE);
    assert(reply->task_id == task.task_id);
    assert(reply->expires_at == f.h.clock.now() + LEASE);
    assert(f.h.task(task.task_id).claim->expires_at == f.h.clock.now() + LEASE);

    // Idle agents just check in
    AgentId idle = f.h.agent({f.project}, 0, 0.0, "idle");
    auto idle_reply = f.h.coordinator.heartbeat(idle);
    assert(idle_reply.ok());
    assert(idle_reply->disposition == Disposition::IDLE);
    assert(idle_reply->rebenchmark);

    std::cout << "[PASS] Heartbeat renews lease\n";
}

void test_silent_agent_disconnects() {
    Fixture f;
    AgentId agent = f.h.agent({f.project});
    TaskAssignment task = f.h.poll(agent);

    f.h.clock.advance_seconds(60);
    SweepReport early = f.h.coordinator.sweep();
    assert(early.disconnected == 0);

    f.h.clock.advance_seconds(31);
    SweepReport report = f.h.coordinator.sweep();
    assert(report.disconnected == 1);
    assert(report.reassigned == 0);
    assert(f.h.agent_row(agent).state == AgentState::DISCONNECTED);

    // Lease has not expired yet, the claim stays
    assert(f.h.task(task.task_id).claimed_by(agent));
    assert(f.h.task(task.task_id).state == TaskState::RUNNING);

    // Heartbeat resumes: reconnecting, then active with the same task
    auto first = f.h.coordinator.heartbeat(agent);
    assert(first->state == AgentState::RECONNECTING);
    assert(first->disposition == Disposition::CONTINUE);
    auto second = f.h.coordinator.heartbeat(agent);
    assert(second->state == AgentState::ACTIVE);
    assert(second->task_id == task.task_id);

    std::cout << "[PASS] Silent agent disconnects and reconnects\n";
}

void test_expired_lease_returns_to_pending() {
    Fixture f;
    AgentId lost = f.h.agent({f.project}, 0, 100.0, "lost");
    TaskAssignment first = f.h.poll(lost);
    TaskAssignment sibling = f.h.poll(f.h.agent({f.project}, 0, 100.0, "busy"));
    assert(f.h.coordinator.submit_progress(lost, first.task_id, 250).ok());

    f.h.clock.advance_seconds(301);
    auto busy_beat = f.h.coordinator.heartbeat(f.h.task(sibling.task_id).claim->agent_id);
    assert(busy_beat.ok());

    SweepReport report = f.h.coordinator.sweep();
    assert(report.disconnected == 1);
    assert(report.reassigned == 1);

    Task reclaimed = f.h.task(first.task_id);
    assert(reclaimed.state == TaskState::PENDING);
    assert(!reclaimed.claim);
    assert(reclaimed.stale);
    assert(reclaimed.progress_keyspace == 250);
    assert(reclaimed.agent_id == lost);
    assert(!f.h.agent_row(lost).claimed_task);

    // No cascade: the sibling and the attack are untouched
    assert(f.h.task(sibling.task_id).state == TaskState::RUNNING);
    assert(f.h.attack(f.attack).state == AttackState::RUNNING);
    assert(f.h.coordinator.tasks_of(f.attack).size() == 2);

    auto events = f.h.events.events_for(EntityKind::TASK, first.task_id);
    assert(events.back().from == "running" && events.back().to == "pending");

    // The next claimant is told to re-fetch
    AgentId rescuer = f.h.agent({f.project}, 0, 100.0, "rescuer");
    TaskAssignment again = f.h.poll(rescuer);
    assert(again.task_id == first.task_id);
    assert(again.stale);
    assert(again.progress_keyspace == 250);

    // The former owner is refused and told it has nothing
    auto refused = f.h.coordinator.submit_progress(lost, first.task_id, 500);
    assert(!refused.ok());
    assert(refused.code() == ErrorCode::STALE_CLAIM);
    auto beat = f.h.coordinator.heartbeat(lost);
    assert(beat->state == AgentState::RECONNECTING);
    assert(beat->disposition == Disposition::IDLE);

    std::cout << "[PASS] Expired lease returns to pending\n";
}

void test_live_agent_keeps_expired_lease() {
    Fixture f;
    AgentId agent = f.h.agent({f.project});
    TaskAssignment task = f.h.poll(agent);

    // Heartbeats inside the grace window keep the agent live
    for (int i = 0; i < 5; i++) {
        f.h.clock.advance_seconds(80);
        f.h.store.atomically([&](store::Tx& tx) { tx.agent(agent).last_seen_at = tx.now(); });
    }
    assert(f.h.task(task.task_id).claim->expires_at < f.h.clock.now());

    SweepReport report = f.h.coordinator.sweep();
    assert(report.reassigned == 0);
    assert(f.h.task(task.task_id).claimed_by(agent));

    std::cout << "[PASS] Live agent is never reclaimed\n";
}

void test_benchmark_expiry() {
    CoordinatorConfig config = test_config();
    config.max_benchmark_age_hours = 1;
    Fixture f(config);
    AgentId agent = f.h.agent({f.project});
    assert(f.h.agent_row(agent).state == AgentState::ACTIVE);

    f.h.clock.advance_seconds(2 * 3600);
    auto reply = f.h.coordinator.heartbeat(agent);
    assert(reply->state == AgentState::PENDING);
    assert(reply->rebenchmark);
    assert(f.h.no_work(agent));

    assert(f.h.coordinator.submit_benchmark(agent, 0, 120.0).ok());
    assert(f.h.agent_row(agent).state == AgentState::ACTIVE);
    assert(f.h.poll(agent).limit == 1200);

    std::cout << "[PASS] Expired benchmarks return agent to pending\n";
}

void test_fault_releases_immediately() {
    Fixture f;
    AgentId agent = f.h.agent({f.project});
    TaskAssignment task = f.h.poll(agent);

    assert(f.h.coordinator.fault_agent(agent, "GPU fell off the bus").ok());
    assert(f.h.agent_row(agent).state == AgentState::FAULTED);
    Task released = f.h.task(task.task_id);
    assert(released.state == TaskState::PENDING);
    assert(released.stale);
    assert(!released.claim);

    auto poll = f.h.coordinator.request_task(agent);
    assert(!poll.ok());
    assert(poll.code() == ErrorCode::FATAL_AGENT_FAULT);

    auto beat = f.h.coordinator.heartbeat(agent);
    assert(beat.ok());
    assert(beat->state == AgentState::FAULTED);

    assert(f.h.coordinator.reset_agent(agent).ok());
    assert(f.h.agent_row(agent).state == AgentState::PENDING);
    assert(f.h.coordinator.reset_agent(agent).code() == ErrorCode::INVALID_TRANSITION);

    std::cout << "[PASS] Faulted agent releases its task at once\n";
}

void test_operator_pause_stops_task() {
    Fixture f;
    AgentId agent = f.h.agent({f.project});
    TaskAssignment task = f.h.poll(agent);

    assert(f.h.coordinator.pause_campaign(f.campaign).ok());
    auto reply = f.h.coordinator.heartbeat(agent);
    assert(reply->disposition == Disposition::PAUSED);
    assert(f.h.task(task.task_id).state == TaskState::PAUSED);
    assert(!f.h.task(task.task_id).claim);
    assert(f.h.no_work(agent));

    assert(f.h.coordinator.resume_campaign(f.campaign).ok());
    assert(f.h.task(task.task_id).state == TaskState::PENDING);
    assert(f.h.poll(agent).task_id == task.task_id);

    std::cout << "[PASS] Operator pause stops the running task\n";
}

void test_cancel_stops_task() {
    Fixture f;
    AgentId agent = f.h.agent({f.project});
    AgentId other = f.h.agent({f.project}, 0, 100.0, "other");
    TaskAssignment running = f.h.poll(agent);
    TaskAssignment idle = f.h.poll(other);
    assert(f.h.coordinator.report_task_failure(other, idle.task_id, "driver crash").ok());
    assert(f.h.coordinator.retry_task(idle.task_id).ok());
    assert(f.h.task(idle.task_id).state == TaskState::PENDING);

    assert(f.h.coordinator.cancel_campaign(f.campaign).ok());
    assert(f.h.task(idle.task_id).state == TaskState::FAILED);

    auto progress = f.h.coordinator.submit_progress(agent, running.task_id, 10);
    assert(progress.ok());
    assert(progress->disposition == Disposition::CANCELLED);
    Task cancelled = f.h.task(running.task_id);
    assert(cancelled.state == TaskState::FAILED);
    assert(cancelled.last_error == "cancelled");
    assert(!f.h.agent_row(agent).claimed_task);

    std::cout << "[PASS] Cancel stops the running task\n";
}

void test_poll_applies_cancel_and_pause() {
    {
        Fixture f;
        AgentId agent = f.h.agent({f.project});
        TaskAssignment held = f.h.poll(agent);
        assert(f.h.coordinator.cancel_campaign(f.campaign).ok());

        // Polling instead of heartbeating still stops the task
        auto poll = f.h.coordinator.request_task(agent);
        assert(poll.ok());
        assert(!poll->has_value());
        Task cancelled = f.h.task(held.task_id);
        assert(cancelled.state == TaskState::FAILED);
        assert(cancelled.last_error == "cancelled");
        assert(!cancelled.claim);
        assert(!f.h.agent_row(agent).claimed_task);

        // A late report is answered with the reason, not recorded
        auto late = f.h.coordinator.submit_progress(agent, held.task_id, 10);
        assert(late.ok());
        assert(late->disposition == Disposition::CANCELLED);
        assert(late->ignored);
        assert(f.h.task(held.task_id).progress_keyspace == 0);
    }
    {
        Fixture f;
        AgentId agent = f.h.agent({f.project});
        TaskAssignment held = f.h.poll(agent);
        assert(f.h.coordinator.pause_campaign(f.campaign).ok());

        f.h.clock.advance_seconds(10);
        auto poll = f.h.coordinator.request_task(agent);
        assert(poll.ok());
        assert(!poll->has_value());
        Task paused = f.h.task(held.task_id);
        assert(paused.state == TaskState::PAUSED);
        assert(!paused.claim);

        assert(f.h.coordinator.resume_campaign(f.campaign).ok());
        assert(f.h.poll(agent).task_id == held.task_id);
    }

    std::cout << "[PASS] Poll applies cancel and pause to a held task\n";
}

int main() {
    std::cout << "=== Lease Manager Tests ===\n\n";

    test_heartbeat_renews_lease();
    test_silent_agent_disconnects();
    test_expired_lease_returns_to_pending();
    test_live_agent_keeps_expired_lease();
    test_benchmark_expiry();
    test_fault_releases_immediately();
    test_operator_pause_stops_task();
    test_cancel_stops_task();
    test_poll_applies_cancel_and_pause();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
