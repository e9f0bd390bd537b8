// store.cpp - Table set, transaction helpers and flush

#include "store.hpp"

#define XXH_INLINE_ALL
#include "xxhash.h"

namespace hashfleet {
namespace store {

uint64_t HashIndex::digest(std::string_view value) {
    return XXH3_64bits(value.data(), value.size());
}

std::vector<const HashItem*> Tables::find_items(HashListId list, std::string_view value) const {
    std::vector<const HashItem*> out;
    for (const auto* item : find_items(value)) {
        if (item->hash_list_id == list) out.push_back(item);
    }
    return out;
}

std::vector<const HashItem*> Tables::find_items(std::string_view value) const {
    std::vector<const HashItem*> out;
    const auto* ids = hash_index.bucket(HashIndex::digest(value));
    if (!ids) return out;
    for (HashItemId id : *ids) {
        const HashItem* item = hash_items.get(id);
        if (item && item->value == value) out.push_back(item);
    }
    return out;
}

HashItem& Tables::insert_item(HashItem item) {
    item.digest = HashIndex::digest(item.value);
    HashItem& row = hash_items.insert(std::move(item));
    hash_index.add(row.digest, row.id);
    return row;
}

// -----------------------------------------------------------------------------
// Tx lookups
// -----------------------------------------------------------------------------

namespace {

template<typename Row>
Row& require(Table<Row>& table, uint64_t id, const char* what) {
    Row* row = table.modify(id);
    if (!row) fail(ErrorCode::NOT_FOUND, std::string(what) + " #" + std::to_string(id) + " not found");
    return *row;
}

}  // namespace

Project& Tx::project(ProjectId id) { return require(tables_.projects, id, "project"); }
HashList& Tx::hash_list(HashListId id) { return require(tables_.hash_lists, id, "hash list"); }
HashItem& Tx::hash_item(HashItemId id) { return require(tables_.hash_items, id, "hash item"); }
Campaign& Tx::campaign(CampaignId id) { return require(tables_.campaigns, id, "campaign"); }
Attack& Tx::attack(AttackId id) { return require(tables_.attacks, id, "attack"); }
Task& Tx::task(TaskId id) { return require(tables_.tasks, id, "task"); }
Agent& Tx::agent(AgentId id) { return require(tables_.agents, id, "agent"); }

const Resource& Tx::resource(ResourceId id) const {
    const Resource* row = tables_.resources.get(id);
    if (!row) fail(ErrorCode::NOT_FOUND, "resource #" + std::to_string(id) + " not found");
    return *row;
}

// -----------------------------------------------------------------------------
// Store
// -----------------------------------------------------------------------------

void Store::begin_all() {
    tables_.for_each_table([](auto& table) { table.begin(); });
}

void Store::commit_all() {
    bool changed = false;
    tables_.for_each_table([&changed](auto& table) { changed |= table.commit(); });
    if (changed) dirty_ = true;
}

void Store::rollback_all() {
    tables_.for_each_table([](auto& table) { table.rollback(); });
}

void Store::publish(const std::vector<TransitionEvent>& events) {
    if (!sink_) return;
    for (const auto& event : events) sink_->publish(event);
}

Status Store::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backend_ || !dirty_) return Status::success();
    Status status = backend_->save(tables_);
    if (status.ok()) {
        dirty_ = false;
    } else {
        LOG_ERROR("Store flush failed: " + status.error().describe());
    }
    return status;
}

Status Store::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backend_) return Status::success();

    auto loaded = std::make_unique<Tables>();
    Status status = backend_->load(*loaded);
    if (!status.ok()) return status;

    tables_ = std::move(*loaded);
    tables_.hash_index.clear();
    std::vector<HashItemId> ids;
    for (const auto& [id, item] : tables_.hash_items.rows()) ids.push_back(id);
    for (HashItemId id : ids) {
        HashItem* item = tables_.hash_items.modify(id);
        item->digest = HashIndex::digest(item->value);
        tables_.hash_index.add(item->digest, id);
    }
    dirty_ = false;
    return Status::success();
}

}  // namespace store
}  // namespace hashfleet
