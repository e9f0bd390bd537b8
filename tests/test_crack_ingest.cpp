/**
 * Crack Ingestion Tests
 *
 * Idempotent submission, propagation across hash lists, stale marking and
 * early completion when a hash list runs out of uncracked hashes.
 */

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace hashfleet;
using namespace hashfleet::testing;

namespace {

constexpr const char* MD5_PASSWORD = "5f4dcc3b5aa765d61d8327deb882cf99";
constexpr const char* MD5_123456 = "e10adc3949ba59abbe56e057f20f883e";
constexpr const char* MD5_QWERTY = "d8578edf8458ce06fbc5bb76a58c5ca4";

HashItemId item_id(Harness& h, HashListId list, const std::string& value) {
    return h.store.read([&](const store::Tables& t) {
        auto items = t.find_items(list, value);
        assert(items.size() == 1);
        return items.front()->id;
    });
}

}  // namespace

void test_duplicate_submission_is_idempotent() {
    Harness h;
    ProjectId p = h.project();
    HashListId list = h.hash_list(p, {MD5_PASSWORD, MD5_123456});
    CampaignId c = h.campaign(p, list);
    h.mask_attack(c, "?d?d?d");
    h.activate(c);

    AgentId agent = h.agent({p}, 0, 50.0);
    TaskAssignment t = h.poll(agent);
    HashItemId item = item_id(h, list, MD5_123456);

    auto first = h.coordinator.submit_crack(agent, t.task_id, item, "123456");
    assert(first.ok());
    assert(!first->duplicate);
    assert(!first->list_cracked);
    auto second = h.coordinator.submit_crack(agent, t.task_id, item, "123456");
    assert(second.ok());
    assert(second->duplicate);

    assert(h.coordinator.crack_count() == 1);
    assert(h.task(t.task_id).crack_count == 1);
    HashItem cracked = *h.coordinator.hash_item(item);
    assert(cracked.cracked);
    assert(cracked.plaintext == "123456");
    assert(cracked.cracked_by_agent == agent);
    assert(cracked.cracked_by_attack == t.attack_id);
    assert(h.coordinator.hash_list(list)->cracked_count == 1);

    std::cout << "[PASS] Duplicate crack is idempotent\n";
}

void test_crack_by_value() {
    Harness h;
    ProjectId p = h.project();
    HashListId list = h.hash_list(p, {MD5_PASSWORD, MD5_123456});
    CampaignId c = h.campaign(p, list);
    h.mask_attack(c, "?d?d?d");
    h.activate(c);

    AgentId agent = h.agent({p}, 0, 50.0);
    TaskAssignment t = h.poll(agent);

    auto ok = h.coordinator.submit_crack_by_value(agent, t.task_id, MD5_PASSWORD, "password");
    assert(ok.ok());
    assert(ok->hash_item_id == item_id(h, list, MD5_PASSWORD));

    auto missing = h.coordinator.submit_crack_by_value(agent, t.task_id, MD5_QWERTY, "qwerty");
    assert(!missing.ok());
    assert(missing.code() == ErrorCode::NOT_FOUND);

    // Only the claimant or last assignee may submit
    AgentId stranger = h.agent({p}, 0, 50.0, "stranger");
    auto refused = h.coordinator.submit_crack_by_value(stranger, t.task_id, MD5_123456, "123456");
    assert(!refused.ok());
    assert(refused.code() == ErrorCode::STALE_CLAIM);
    assert(h.coordinator.crack_count() == 1);

    std::cout << "[PASS] Crack by hash value\n";
}

void test_propagation_and_stale_marking() {
    Harness h;
    ProjectId p = h.project();
    HashListId first_list = h.hash_list(p, {MD5_PASSWORD, MD5_123456}, 0, "first");
    HashListId second_list = h.hash_list(p, {MD5_PASSWORD, MD5_QWERTY}, 0, "second");
    HashListId other_type = h.hash_list(p, {MD5_PASSWORD}, 100, "sha1-typed");

    CampaignId c1 = h.campaign(p, first_list, Priority::ROUTINE, "c1");
    h.mask_attack(c1, "?d");
    h.activate(c1);
    CampaignId c2 = h.campaign(p, second_list, Priority::ROUTINE, "c2");
    h.mask_attack(c2, "?d?d?d");
    h.activate(c2);

    AgentId a = h.agent({p}, 0, 50.0, "a");
    AgentId b = h.agent({p}, 0, 50.0, "b");
    TaskAssignment ta = h.poll(a);
    TaskAssignment tb = h.poll(b);
    assert(ta.campaign_id == c1);
    assert(tb.campaign_id == c2);

    auto outcome = h.coordinator.submit_crack_by_value(a, ta.task_id, MD5_PASSWORD, "password");
    assert(outcome.ok());
    assert(outcome->propagated == 1);
    assert(outcome->tasks_marked_stale == 1);

    assert(h.coordinator.hash_item(item_id(h, second_list, MD5_PASSWORD))->cracked);
    assert(!h.coordinator.hash_item(item_id(h, other_type, MD5_PASSWORD))->cracked);
    assert(h.coordinator.hash_list(second_list)->cracked_count == 1);
    assert(h.coordinator.crack_count() == 2);

    // The other agent re-fetches, then carries on
    assert(h.task(tb.task_id).stale);
    auto beat = h.coordinator.heartbeat(b);
    assert(beat->disposition == Disposition::STALE);
    auto pairs = h.coordinator.fetch_cracked(b, tb.task_id);
    assert(pairs.ok());
    assert(pairs->size() == 1);
    assert(pairs->front().first == MD5_PASSWORD && pairs->front().second == "password");
    assert(!h.task(tb.task_id).stale);
    assert(h.coordinator.heartbeat(b)->disposition == Disposition::CONTINUE);

    // Lists created later inherit what is already known
    HashListId later = h.hash_list(p, {MD5_PASSWORD, MD5_QWERTY}, 0, "later");
    assert(h.coordinator.hash_list(later)->cracked_count == 1);
    assert(h.coordinator.hash_item(item_id(h, later, MD5_PASSWORD))->plaintext == "password");

    std::cout << "[PASS] Propagation and stale marking\n";
}

void test_fully_cracked_list_completes_campaign() {
    Harness h;
    ProjectId p = h.project();
    HashListId list = h.hash_list(p, {MD5_PASSWORD, MD5_123456});
    CampaignId c = h.campaign(p, list);
    AttackId first = h.mask_attack(c, "?d?d?d", "first");
    AttackId second = h.mask_attack(c, "?d?d?d?d", "second");
    h.activate(c);

    AgentId a = h.agent({p}, 0, 50.0, "a");
    AgentId b = h.agent({p}, 0, 50.0, "b");
    TaskAssignment ta = h.poll(a);
    TaskAssignment tb = h.poll(b);

    assert(h.coordinator.submit_crack_by_value(a, ta.task_id, MD5_PASSWORD, "password").ok());
    auto last = h.coordinator.submit_crack_by_value(b, tb.task_id, MD5_123456, "123456");
    assert(last.ok());
    assert(last->list_cracked);

    // Searched or not, everything stops
    assert(h.campaign_row(c).state == CampaignState::COMPLETED);
    assert(h.attack(first).state == AttackState::COMPLETED);
    assert(h.attack(second).state == AttackState::COMPLETED);
    assert(h.task(ta.task_id).state == TaskState::COMPLETED);
    assert(h.task(tb.task_id).state == TaskState::COMPLETED);
    assert(!h.agent_row(a).claimed_task);

    auto beat = h.coordinator.heartbeat(a);
    assert(beat->disposition == Disposition::IDLE);
    assert(h.no_work(a));

    // Former claimants hear the work is done; anyone else is refused
    auto late = h.coordinator.submit_progress(b, tb.task_id, 10);
    assert(late.ok());
    assert(late->disposition == Disposition::COMPLETED);
    assert(late->state == TaskState::COMPLETED);
    assert(h.coordinator.submit_progress(a, tb.task_id, 10).code() == ErrorCode::STALE_CLAIM);
    assert(h.coordinator.campaign_progress(c)->fraction == 1.0);

    std::cout << "[PASS] Fully cracked list completes the campaign\n";
}

void test_late_crack_after_release() {
    Harness h;
    ProjectId p = h.project();
    HashListId list = h.hash_list(p, {MD5_PASSWORD, MD5_123456});
    CampaignId c = h.campaign(p, list);
    h.mask_attack(c, "?d?d?d");
    h.activate(c);

    AgentId agent = h.agent({p}, 0, 50.0);
    TaskAssignment t = h.poll(agent);
    assert(h.coordinator.report_exhausted(agent, t.task_id).ok());

    // Found just before the slice ended: the last assignee may still report it
    auto late = h.coordinator.submit_crack_by_value(agent, t.task_id, MD5_123456, "123456");
    assert(late.ok());
    assert(h.coordinator.crack_count() == 1);

    std::cout << "[PASS] Late crack from the last assignee\n";
}

int main() {
    std::cout << "=== Crack Ingestion Tests ===\n\n";

    test_duplicate_submission_is_idempotent();
    test_crack_by_value();
    test_propagation_and_stale_marking();
    test_fully_cracked_list_completes_campaign();
    test_late_crack_after_release();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
