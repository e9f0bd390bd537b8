// crack_ingestor.cpp - Crack dedup, propagation and completion triggers

#include "crack_ingestor.hpp"

#include <set>

namespace hashfleet {

void CrackIngestor::check_submitter(const Task& task, AgentId agent_id) {
    if (task.claimed_by(agent_id) || task.agent_id == agent_id) return;
    fail(ErrorCode::STALE_CLAIM, "agent #" + std::to_string(agent_id) + " does not own task #" +
         std::to_string(task.id));
}

void CrackIngestor::mark_cracked(store::Tx& tx, HashItem& item, const std::string& plaintext, Millis at,
                                 AttackId attack_id, TaskId task_id, AgentId agent_id) const {
    item.cracked = true;
    item.plaintext = plaintext;
    item.cracked_at = at;
    item.cracked_by_attack = attack_id;
    item.cracked_by_agent = agent_id;

    HashList& list = tx.hash_list(item.hash_list_id);
    if (list.cracked_count < list.item_count) list.cracked_count++;

    CrackResult result;
    result.hash_item_id = item.id;
    result.attack_id = attack_id;
    result.task_id = task_id;
    result.agent_id = agent_id;
    result.plaintext = plaintext;
    result.discovered_at = at;
    tx.tables().cracks.insert(std::move(result));
}

CrackOutcome CrackIngestor::ingest(store::Tx& tx, AgentId agent_id, TaskId task_id, HashItemId item_id,
                                   const std::string& plaintext, Millis discovered_at) const {
    Task& task = tx.task(task_id);
    check_submitter(task, agent_id);

    const Campaign& campaign = tx.campaign(task.campaign_id);
    const HashList& list = tx.hash_list(campaign.hash_list_id);
    HashItem& item = tx.hash_item(item_id);
    if (item.hash_list_id != list.id) {
        fail(ErrorCode::INVALID_ARGUMENT, "hash item #" + std::to_string(item_id) +
             " is not in hash list #" + std::to_string(list.id));
    }

    CrackOutcome outcome;
    outcome.hash_item_id = item_id;
    if (discovered_at == 0) discovered_at = tx.now();

    if (item.cracked) {
        outcome.duplicate = true;
        outcome.list_cracked = list.fully_cracked();
        Logger::instance().log_crack(item_id, task_id, agent_id, true);
        return outcome;
    }

    mark_cracked(tx, item, plaintext, discovered_at, task.attack_id, task_id, agent_id);
    task.crack_count++;
    task.updated_at = tx.now();
    Logger::instance().log_crack(item_id, task_id, agent_id, false);

    // Same hash, same type, other lists of the project
    std::set<HashListId> affected{list.id};
    std::vector<HashItemId> twins;
    for (const HashItem* other : tx.tables().find_items(item.value)) {
        if (other->id == item.id || other->cracked) continue;
        const HashList* other_list = tx.tables().hash_lists.get(other->hash_list_id);
        if (!other_list || other_list->project_id != campaign.project_id ||
            other_list->hash_type != list.hash_type) continue;
        twins.push_back(other->id);
    }
    for (HashItemId twin : twins) {
        HashItem& other = tx.hash_item(twin);
        mark_cracked(tx, other, plaintext, discovered_at, task.attack_id, task_id, agent_id);
        affected.insert(other.hash_list_id);
        outcome.propagated++;
    }

    std::vector<CampaignId> campaigns;
    for (const auto& [id, c] : tx.tables().campaigns.rows()) {
        if (affected.count(c.hash_list_id)) campaigns.push_back(id);
    }

    std::vector<TaskId> to_mark;
    for (const auto& [id, t] : tx.tables().tasks.rows()) {
        if (id == task_id || is_terminal(t.state) || t.stale) continue;
        for (CampaignId c : campaigns) {
            if (t.campaign_id == c) { to_mark.push_back(id); break; }
        }
    }
    for (TaskId id : to_mark) {
        tx.task(id).stale = true;
        outcome.tasks_marked_stale++;
    }

    outcome.list_cracked = tx.hash_list(campaign.hash_list_id).fully_cracked();

    progress_.derive_attack(tx, task.attack_id);
    for (CampaignId c : campaigns) progress_.derive_campaign(tx, c);
    return outcome;
}

CrackOutcome CrackIngestor::ingest_by_value(store::Tx& tx, AgentId agent_id, TaskId task_id,
                                            const std::string& hash_value, const std::string& plaintext,
                                            Millis discovered_at) const {
    const Task& task = tx.task(task_id);
    check_submitter(task, agent_id);
    const Campaign& campaign = tx.campaign(task.campaign_id);

    auto items = tx.tables().find_items(campaign.hash_list_id, hash_value);
    if (items.empty()) {
        fail(ErrorCode::NOT_FOUND, "hash '" + hash_value + "' is not in hash list #" +
             std::to_string(campaign.hash_list_id));
    }
    return ingest(tx, agent_id, task_id, items.front()->id, plaintext, discovered_at);
}

std::vector<std::pair<std::string, std::string>> CrackIngestor::cracked_pairs(const store::Tables& tables,
                                                                              HashListId list_id) {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [id, item] : tables.hash_items.rows()) {
        if (item.hash_list_id == list_id && item.cracked) out.emplace_back(item.value, item.plaintext);
    }
    return out;
}

}  // namespace hashfleet
