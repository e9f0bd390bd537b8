/**
 * Coordinator Tests
 *
 * Registration and credentials, operator validation, attack pause/resume,
 * task retry and the destructive abandon cascade.
 */

#include "../src/fleet/sweeper.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace hashfleet;
using namespace hashfleet::testing;

void test_register_and_authenticate() {
    Harness h;
    ProjectId p = h.project();

    auto reg = h.coordinator.register_agent("rig-01", "10.0.0.5", "2x RTX 4090", {p});
    assert(reg.ok());
    assert(reg->token.size() == 24);
    Agent agent = h.agent_row(reg->agent_id);
    assert(agent.state == AgentState::PENDING);
    assert(agent.project_ids.count(p) == 1);
    assert(agent.token_digest != reg->token);

    auto events = h.events.events_for(EntityKind::AGENT, reg->agent_id);
    assert(events.size() == 1);
    assert(events[0].from.empty() && events[0].to == "pending");

    auto who = h.coordinator.authenticate(reg->token);
    assert(who.ok());
    assert(who.value() == reg->agent_id);

    assert(h.coordinator.authenticate("short").code() == ErrorCode::UNAUTHORIZED);
    assert(h.coordinator.authenticate(std::string(24, 'x')).code() == ErrorCode::UNAUTHORIZED);

    // Validation
    assert(h.coordinator.register_agent("", "host", "").code() == ErrorCode::INVALID_ARGUMENT);
    assert(h.coordinator.register_agent("rig-02", "host", "", {42}).code() == ErrorCode::NOT_FOUND);
    assert(h.coordinator.submit_benchmark(reg->agent_id, 0, -1.0).code() == ErrorCode::INVALID_ARGUMENT);

    std::cout << "[PASS] Register and authenticate\n";
}

void test_retire_revokes() {
    Harness h;
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa"}));
    h.mask_attack(c, "?d?d?d?d");
    h.activate(c);

    auto reg = h.coordinator.register_agent("rig", "host", "", {p});
    AgentId agent = reg->agent_id;
    assert(h.coordinator.submit_benchmark(agent, 0, 100.0).ok());
    TaskAssignment t = h.poll(agent);

    assert(h.coordinator.retire_agent(agent).ok());
    assert(h.coordinator.authenticate(reg->token).code() == ErrorCode::UNAUTHORIZED);
    assert(h.coordinator.request_task(agent).code() == ErrorCode::UNAUTHORIZED);
    assert(h.coordinator.heartbeat(agent).code() == ErrorCode::UNAUTHORIZED);
    assert(h.coordinator.submit_progress(agent, t.task_id, 10).code() == ErrorCode::UNAUTHORIZED);
    assert(h.coordinator.retire_agent(agent).ok());

    // Its claim is released by the sweep once the lease runs out
    h.clock.advance_seconds(301);
    SweepReport report = h.coordinator.sweep();
    assert(report.reassigned == 1);
    assert(h.task(t.task_id).state == TaskState::PENDING);

    std::cout << "[PASS] Retire revokes the credential\n";
}

void test_operator_validation() {
    Harness h;
    ProjectId p = h.project();
    ProjectId other = h.project("other");
    HashListId list = h.hash_list(p, {"aa"});
    HashListId foreign_list = h.hash_list(other, {"bb"});
    ResourceId foreign_words = h.wordlist(other, 100);

    assert(h.coordinator.create_project("").code() == ErrorCode::INVALID_ARGUMENT);
    assert(h.coordinator.create_hash_list(p, "blank", 0, {"  ", ""}).code() == ErrorCode::INVALID_ARGUMENT);
    assert(h.coordinator.create_campaign(p, foreign_list, "x", Priority::ROUTINE).code() ==
           ErrorCode::INVALID_ARGUMENT);

    // Values are trimmed and de-duplicated
    HashListId dedup = h.hash_list(p, {" aa ", "aa", "bb\n"});
    assert(h.coordinator.hash_list(dedup)->item_count == 2);

    CampaignId c = h.campaign(p, list);
    assert(h.coordinator.activate_campaign(c).code() == ErrorCode::INVALID_ARGUMENT);

    DictionaryAttack dict{foreign_words, std::nullopt};
    assert(h.coordinator.add_attack(c, "dict", dict).code() == ErrorCode::NOT_FOUND);
    MaskAttack bad;
    bad.pattern.mask = "?q";
    assert(h.coordinator.add_attack(c, "bad", bad).code() == ErrorCode::INVALID_ARGUMENT);

    h.mask_attack(c, "?d?d");
    assert(h.coordinator.schedule_campaign(c).ok());
    assert(h.campaign_row(c).state == CampaignState::SCHEDULED);
    assert(h.coordinator.schedule_campaign(c).code() == ErrorCode::INVALID_TRANSITION);
    h.activate(c);
    assert(h.coordinator.activate_campaign(c).code() == ErrorCode::INVALID_TRANSITION);

    assert(h.coordinator.cancel_campaign(c).ok());
    assert(h.coordinator.add_attack(c, "late", MaskAttack{}).code() == ErrorCode::INVALID_TRANSITION);
    assert(h.coordinator.resume_campaign(c).code() == ErrorCode::INVALID_TRANSITION);

    std::cout << "[PASS] Operator validation\n";
}

void test_pause_and_resume_attack() {
    Harness h;
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa"}));
    AttackId attack = h.mask_attack(c, "?d?d?d?d");
    h.activate(c);

    AgentId a = h.agent({p}, 0, 100.0, "a");
    AgentId b = h.agent({p}, 0, 100.0, "b");
    TaskAssignment ta = h.poll(a);
    TaskAssignment tb = h.poll(b);
    assert(h.coordinator.report_task_failure(b, tb.task_id, "segfault").ok());
    assert(h.coordinator.retry_task(tb.task_id).ok());

    assert(h.coordinator.pause_attack(attack).ok());
    assert(h.attack(attack).state == AttackState::PAUSED);
    assert(h.task(tb.task_id).state == TaskState::PAUSED);
    assert(h.no_work(b));

    // The running task stops at its next report
    auto reply = h.coordinator.submit_progress(a, ta.task_id, 300);
    assert(reply->disposition == Disposition::PAUSED);
    assert(h.task(ta.task_id).state == TaskState::PAUSED);
    assert(h.task(ta.task_id).progress_keyspace == 300);

    assert(h.coordinator.resume_attack(attack).ok());
    assert(h.attack(attack).state == AttackState::RUNNING);
    assert(h.task(ta.task_id).state == TaskState::PENDING);
    assert(h.task(tb.task_id).state == TaskState::PENDING);
    assert(h.poll(a).task_id == ta.task_id);
    assert(h.coordinator.resume_attack(attack).code() == ErrorCode::INVALID_TRANSITION);

    std::cout << "[PASS] Pause and resume attack\n";
}

void test_retry_task() {
    Harness h;
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa"}));
    h.mask_attack(c, "?d?d?d?d");
    h.activate(c);

    AgentId agent = h.agent({p});
    TaskAssignment t = h.poll(agent);
    assert(h.coordinator.retry_task(t.task_id).code() == ErrorCode::INVALID_TRANSITION);

    assert(h.coordinator.report_task_failure(agent, t.task_id, "hashcat exit 255").ok());
    assert(h.coordinator.retry_task(t.task_id).ok());
    Task retried = h.task(t.task_id);
    assert(retried.state == TaskState::PENDING);
    assert(retried.retry_count == 1);
    assert(retried.last_error.empty());

    assert(h.coordinator.retry_task(9999).code() == ErrorCode::NOT_FOUND);

    std::cout << "[PASS] Retry failed task\n";
}

void test_abandon_cascade() {
    Harness h;
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa"}));
    AttackId attack = h.mask_attack(c, "?d?d?d?d");
    h.activate(c);

    AgentId agent = h.agent({p});
    TaskAssignment t1 = h.poll(agent);
    assert(h.coordinator.report_exhausted(agent, t1.task_id).ok());
    TaskAssignment t2 = h.poll(agent);
    AgentId other = h.agent({p}, 0, 100.0, "other");
    TaskAssignment t3 = h.poll(other);

    // Other tasks still open: only this one goes
    assert(h.coordinator.abandon_task(t2.task_id).ok());
    assert(h.task(t2.task_id).state == TaskState::ABANDONED);
    assert(!h.agent_row(agent).claimed_task);
    assert(h.attack(attack).state == AttackState::RUNNING);
    assert(h.coordinator.tasks_of(attack).size() == 3);

    // The last open task takes the attack and its siblings with it
    assert(h.coordinator.abandon_task(t3.task_id).ok());
    assert(h.attack(attack).state == AttackState::ABANDONED);
    auto remaining = h.coordinator.tasks_of(attack);
    assert(remaining.size() == 1);
    assert(remaining[0].id == t3.task_id);
    assert(!h.coordinator.task(t1.task_id));
    assert(!h.agent_row(other).claimed_task);

    assert(h.no_work(agent));

    std::cout << "[PASS] Abandon cascade\n";
}

void test_abandon_rejected_on_finished_attack() {
    Harness h;
    ProjectId p = h.project();
    CampaignId c = h.campaign(p, h.hash_list(p, {"aa"}));
    AttackId attack = h.mask_attack(c, "?d?d?d", "short");
    h.mask_attack(c, "?d?d?d?d", "long");
    h.activate(c);

    AgentId agent = h.agent({p}, 0, 50.0);
    TaskAssignment t1 = h.poll(agent);
    assert(t1.attack_id == attack);
    assert(h.coordinator.report_exhausted(agent, t1.task_id).ok());
    TaskAssignment t2 = h.poll(agent);
    assert(t2.attack_id == attack);
    assert(h.coordinator.report_exhausted(agent, t2.task_id).ok());
    assert(h.attack(attack).state == AttackState::EXHAUSTED);

    // The searched attack keeps its task history
    assert(h.coordinator.abandon_task(t2.task_id).code() == ErrorCode::INVALID_TRANSITION);
    assert(h.task(t2.task_id).state == TaskState::EXHAUSTED);
    assert(h.coordinator.tasks_of(attack).size() == 2);
    assert(h.attack(attack).state == AttackState::EXHAUSTED);

    std::cout << "[PASS] Finished attack keeps its tasks\n";
}

void test_sweeper_thread() {
    Harness h;
    ProjectId p = h.project();
    AgentId agent = h.agent({p});

    h.clock.advance_seconds(120);
    Sweeper sweeper(h.coordinator, std::chrono::milliseconds(10));
    sweeper.start();
    assert(sweeper.running());
    for (int i = 0; i < 200 && sweeper.passes() == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    sweeper.stop();
    assert(!sweeper.running());
    assert(sweeper.passes() > 0);
    assert(h.agent_row(agent).state == AgentState::DISCONNECTED);

    std::cout << "[PASS] Background sweeper\n";
}

int main() {
    std::cout << "=== Coordinator Tests ===\n\n";

    test_register_and_authenticate();
    test_retire_revokes();
    test_operator_validation();
    test_pause_and_resume_attack();
    test_retry_task();
    test_abandon_cascade();
    test_abandon_rejected_on_finished_attack();
    test_sweeper_thread();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
