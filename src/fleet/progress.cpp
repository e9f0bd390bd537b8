// progress.cpp - Keyspace-weighted roll-up and completion derivation

#include "progress.hpp"
#include "transitions.hpp"

#include <algorithm>

namespace hashfleet {

namespace {

std::vector<const Task*> live_tasks(const store::Tables& tables, AttackId attack_id) {
    return tables.tasks.select([attack_id](const Task& t) {
        return t.attack_id == attack_id && t.state != TaskState::ABANDONED;
    });
}

std::vector<const Attack*> live_attacks(const store::Tables& tables, CampaignId campaign_id) {
    return tables.attacks.select([campaign_id](const Attack& a) {
        return a.campaign_id == campaign_id && a.state != AttackState::ABANDONED;
    });
}

bool list_cracked(const store::Tables& tables, CampaignId campaign_id) {
    const Campaign* c = tables.campaigns.get(campaign_id);
    if (!c) return false;
    const HashList* list = tables.hash_lists.get(c->hash_list_id);
    return list && list->fully_cracked();
}

}  // namespace

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

uint64_t ProgressAggregator::searched_keyspace(const Task& task) {
    if (is_finished(task.state)) return task.limit;
    return std::min(task.progress_keyspace, task.limit);
}

AttackProgress ProgressAggregator::attack_progress(const store::Tables& tables, const Attack& attack) {
    AttackProgress out;
    out.attack_id = attack.id;
    out.state = attack.state;
    out.total_keyspace = attack.total_keyspace;

    if (attack.state == AttackState::COMPLETED || attack.state == AttackState::EXHAUSTED) {
        out.searched_keyspace = attack.total_keyspace;
        out.fraction = 1.0;
        return out;
    }

    for (const Task* task : live_tasks(tables, attack.id)) {
        out.searched_keyspace += searched_keyspace(*task);
    }
    out.searched_keyspace = std::min(out.searched_keyspace, attack.total_keyspace);
    out.fraction = attack.total_keyspace == 0
        ? 0.0
        : static_cast<double>(out.searched_keyspace) / static_cast<double>(attack.total_keyspace);
    return out;
}

CampaignProgress ProgressAggregator::campaign_progress(const store::Tables& tables, const Campaign& campaign) {
    CampaignProgress out;
    out.campaign_id = campaign.id;
    out.state = campaign.state;

    if (const HashList* list = tables.hash_lists.get(campaign.hash_list_id)) {
        out.cracked = list->cracked_count;
        out.hash_count = list->item_count;
    }

    double weighted = 0.0;
    for (const Attack* attack : live_attacks(tables, campaign.id)) {
        AttackProgress ap = attack_progress(tables, *attack);
        weighted += ap.fraction * static_cast<double>(ap.total_keyspace);
        out.total_keyspace += ap.total_keyspace;
        if (!is_terminal(attack->state)) out.remaining_keyspace += ap.total_keyspace - ap.searched_keyspace;
        out.attacks.push_back(ap);
    }

    if (campaign.state == CampaignState::COMPLETED) {
        out.fraction = 1.0;
    } else if (out.total_keyspace > 0) {
        out.fraction = weighted / static_cast<double>(out.total_keyspace);
    }
    out.eta_seconds = estimate_eta(tables, campaign);
    return out;
}

std::optional<double> ProgressAggregator::estimate_eta(const store::Tables& tables, const Campaign& campaign) {
    if (is_terminal(campaign.state)) return 0.0;

    double seconds = 0.0;
    for (const Attack* attack : live_attacks(tables, campaign.id)) {
        if (is_terminal(attack->state)) continue;
        AttackProgress ap = attack_progress(tables, *attack);
        uint64_t remaining = ap.total_keyspace - ap.searched_keyspace;
        if (remaining == 0) continue;

        double fastest = 0.0;
        for (const auto& [id, agent] : tables.agents.rows()) {
            if (!is_live(agent.state) || !agent.project_ids.count(campaign.project_id)) continue;
            fastest = std::max(fastest, agent.speed_for(attack->hash_type).value_or(0.0));
        }
        if (fastest <= 0.0) return std::nullopt;
        seconds += static_cast<double>(remaining) / fastest;
    }
    return seconds;
}

// -----------------------------------------------------------------------------
// Derivation
// -----------------------------------------------------------------------------

void ProgressAggregator::finish_if_searched(store::Tx& tx, Task& task) const {
    if (task.state != TaskState::RUNNING || task.progress_keyspace < task.limit) return;
    fleet::release_claim(tx, task);
    fleet::set_state(tx, task, task.crack_count > 0 ? TaskState::COMPLETED : TaskState::EXHAUSTED,
                     "keyspace searched");
}

void ProgressAggregator::derive_after_task(store::Tx& tx, TaskId task_id) const {
    const Task* task = tx.tables().tasks.get(task_id);
    if (!task) return;
    CampaignId campaign_id = task->campaign_id;
    derive_attack(tx, task->attack_id);
    derive_campaign(tx, campaign_id);
}

void ProgressAggregator::complete_cracked_attack(store::Tx& tx, Attack& attack) const {
    std::vector<TaskId> open;
    for (const Task* t : live_tasks(tx.tables(), attack.id)) {
        if (!is_terminal(t->state)) open.push_back(t->id);
    }
    for (TaskId id : open) {
        Task& task = tx.task(id);
        fleet::release_claim(tx, task);
        fleet::set_state(tx, task, TaskState::COMPLETED, "hash list fully cracked");
    }
    if (!is_terminal(attack.state)) {
        fleet::set_state(tx, attack, AttackState::COMPLETED, "hash list fully cracked");
    }
}

void ProgressAggregator::derive_attack(store::Tx& tx, AttackId attack_id) const {
    Attack& attack = tx.attack(attack_id);
    if (is_terminal(attack.state)) return;

    if (list_cracked(tx.tables(), attack.campaign_id)) {
        complete_cracked_attack(tx, attack);
        return;
    }

    auto tasks = live_tasks(tx.tables(), attack_id);
    bool any_open = false;
    bool any_running = false;
    bool any_retryable = false;
    bool any_failed = false;
    bool any_completed = false;
    for (const Task* t : tasks) {
        switch (t->state) {
            case TaskState::RUNNING:   any_running = true; any_open = true; break;
            case TaskState::PENDING:
            case TaskState::PAUSED:    any_open = true; break;
            case TaskState::FAILED:
                any_failed = true;
                if (t->retry_count < max_task_retries_) any_retryable = true;
                break;
            case TaskState::COMPLETED: any_completed = true; break;
            default: break;
        }
    }

    if (!tasks.empty() && attack.fully_sliced() && !any_open && !any_retryable) {
        if (any_failed) {
            fleet::set_state(tx, attack, AttackState::FAILED, "task retries exhausted");
        } else if (any_completed) {
            fleet::set_state(tx, attack, AttackState::COMPLETED, "all tasks finished");
        } else {
            fleet::set_state(tx, attack, AttackState::EXHAUSTED, "keyspace exhausted");
        }
        return;
    }

    if (any_running && attack.state == AttackState::PENDING) {
        fleet::set_state(tx, attack, AttackState::RUNNING, "task claimed");
    }
}

bool ProgressAggregator::derive_campaign(store::Tx& tx, CampaignId campaign_id) const {
    Campaign& campaign = tx.campaign(campaign_id);
    if (campaign.state != CampaignState::RUNNING && campaign.state != CampaignState::PAUSED) {
        return false;
    }

    if (list_cracked(tx.tables(), campaign_id)) {
        std::vector<AttackId> open;
        for (const Attack* a : live_attacks(tx.tables(), campaign_id)) {
            if (!is_terminal(a->state)) open.push_back(a->id);
        }
        for (AttackId id : open) complete_cracked_attack(tx, tx.attack(id));
        fleet::set_state(tx, campaign, CampaignState::COMPLETED, "hash list fully cracked");
        return true;
    }

    auto attacks = live_attacks(tx.tables(), campaign_id);
    if (attacks.empty()) return false;

    bool any_failed = false;
    for (const Attack* a : attacks) {
        if (!is_terminal(a->state)) return false;
        if (a->state == AttackState::FAILED) any_failed = true;
    }

    if (any_failed) {
        fleet::set_state(tx, campaign, CampaignState::FAILED, "attack failed");
    } else {
        fleet::set_state(tx, campaign, CampaignState::COMPLETED, "all attacks finished");
    }
    return true;
}

}  // namespace hashfleet
