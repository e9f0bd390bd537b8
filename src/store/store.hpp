/**
 * Transactional Store
 *
 * In-memory relational tables, one per entity. All cross-request coordination
 * goes through Store::atomically(): transactions are serialised, every row a
 * transaction touches is journaled, and any exception thrown inside the
 * transaction rolls every table back before it propagates.
 *
 * Rows are plain structs from core/entities.hpp. Mutation is only possible
 * through Table::modify/insert/erase, which record the prior version.
 */

#pragma once

#include "../core/entities.hpp"
#include "../core/clock.hpp"
#include "../core/result.hpp"
#include "../services/events.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hashfleet {
namespace store {

/**
 * One table with an undo journal. Ids are assigned on insert and are never
 * reused by committed transactions.
 */
template<typename Row>
class Table {
public:
    using Id = uint64_t;

    const Row* get(Id id) const {
        auto it = rows_.find(id);
        return it == rows_.end() ? nullptr : &it->second;
    }

    // Journals the current version and returns the row for in-place update
    Row* modify(Id id) {
        auto it = rows_.find(id);
        if (it == rows_.end()) return nullptr;
        if (journaling_) undo_.emplace_back(id, it->second);
        return &it->second;
    }

    Row& insert(Row row) {
        row.id = next_id_++;
        if (journaling_) undo_.emplace_back(row.id, std::nullopt);
        auto [it, inserted] = rows_.emplace(row.id, std::move(row));
        return it->second;
    }

    bool erase(Id id) {
        auto it = rows_.find(id);
        if (it == rows_.end()) return false;
        if (journaling_) undo_.emplace_back(id, it->second);
        rows_.erase(it);
        return true;
    }

    template<typename Pred>
    std::vector<const Row*> select(Pred pred) const {
        std::vector<const Row*> out;
        for (const auto& [id, row] : rows_) {
            if (pred(row)) out.push_back(&row);
        }
        return out;
    }

    const std::map<Id, Row>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    Id next_id() const { return next_id_; }

    // Snapshot loading: keeps the row's id
    void restore(Row row) {
        Id id = row.id;
        rows_[id] = std::move(row);
        if (id >= next_id_) next_id_ = id + 1;
    }

    void set_next_id(Id next) { if (next > next_id_) next_id_ = next; }

    void begin() {
        journaling_ = true;
        undo_.clear();
        saved_next_id_ = next_id_;
    }

    bool commit() {
        bool changed = !undo_.empty();
        undo_.clear();
        journaling_ = false;
        return changed;
    }

    void rollback() {
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            if (it->second) {
                rows_[it->first] = *it->second;
            } else {
                rows_.erase(it->first);
            }
        }
        undo_.clear();
        next_id_ = saved_next_id_;
        journaling_ = false;
    }

private:
    std::map<Id, Row> rows_;
    std::vector<std::pair<Id, std::optional<Row>>> undo_;
    Id next_id_ = 1;
    Id saved_next_id_ = 1;
    bool journaling_ = false;
};

/**
 * Digest index over HashItem values. Entries are only ever added; lookups
 * re-check the row, so entries left behind by a rolled-back insert are inert.
 */
class HashIndex {
public:
    static uint64_t digest(std::string_view value);

    void add(uint64_t digest, HashItemId id) { buckets_[digest].insert(id); }
    const std::set<HashItemId>* bucket(uint64_t digest) const {
        auto it = buckets_.find(digest);
        return it == buckets_.end() ? nullptr : &it->second;
    }
    void clear() { buckets_.clear(); }

private:
    std::unordered_map<uint64_t, std::set<HashItemId>> buckets_;
};

struct Tables {
    Table<Project> projects;
    Table<HashList> hash_lists;
    Table<HashItem> hash_items;
    Table<Resource> resources;
    Table<Campaign> campaigns;
    Table<Attack> attacks;
    Table<Task> tasks;
    Table<Agent> agents;
    Table<CrackResult> cracks;
    Table<AgentError> agent_errors;
    HashIndex hash_index;

    template<typename Fn>
    void for_each_table(Fn&& fn) {
        fn(projects); fn(hash_lists); fn(hash_items); fn(resources); fn(campaigns);
        fn(attacks); fn(tasks); fn(agents); fn(cracks); fn(agent_errors);
    }

    // Items in list `list` whose value equals `value`
    std::vector<const HashItem*> find_items(HashListId list, std::string_view value) const;

    // Items anywhere whose value equals `value`
    std::vector<const HashItem*> find_items(std::string_view value) const;

    HashItem& insert_item(HashItem item);
};

/**
 * Handle passed to a transaction body. Carries the transaction time and
 * buffers events until commit.
 */
class Tx {
public:
    Tx(Tables& tables, Millis now) : tables_(tables), now_(now) {}

    Tables& tables() { return tables_; }
    const Tables& tables() const { return tables_; }
    Millis now() const { return now_; }

    void emit(TransitionEvent event) {
        if (event.at == 0) event.at = now_;
        events_.push_back(std::move(event));
    }

    std::vector<TransitionEvent>& events() { return events_; }

    // Row lookups that fail the transaction when the row is missing
    Project& project(ProjectId id);
    HashList& hash_list(HashListId id);
    HashItem& hash_item(HashItemId id);
    Campaign& campaign(CampaignId id);
    Attack& attack(AttackId id);
    Task& task(TaskId id);
    Agent& agent(AgentId id);
    const Resource& resource(ResourceId id) const;

private:
    Tables& tables_;
    Millis now_;
    std::vector<TransitionEvent> events_;
};

/**
 * Durability collaborator. The store calls save() from flush(); load() is
 * called once at start-up.
 */
class StoreBackend {
public:
    virtual ~StoreBackend() = default;
    virtual Status save(const Tables& tables) = 0;
    virtual Status load(Tables& tables) = 0;
};

class Store {
public:
    explicit Store(const Clock& clock, EventSink* sink = nullptr)
        : clock_(clock), sink_(sink) {}

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    void set_backend(std::unique_ptr<StoreBackend> backend) { backend_ = std::move(backend); }
    void set_event_sink(EventSink* sink) { sink_ = sink; }

    const Clock& clock() const { return clock_; }

    /**
     * Run fn(Tx&) as one transaction. Exceptions roll back and propagate.
     * Must not be called re-entrantly from inside fn.
     */
    template<typename Fn>
    auto atomically(Fn&& fn) -> std::invoke_result_t<Fn, Tx&> {
        using R = std::invoke_result_t<Fn, Tx&>;
        std::vector<TransitionEvent> events;
        std::unique_lock<std::mutex> lock(mutex_);
        begin_all();
        Tx tx(tables_, clock_.now());
        if constexpr (std::is_void_v<R>) {
            run_or_rollback([&] { fn(tx); });
            commit_all();
            events.swap(tx.events());
            lock.unlock();
            publish(events);
        } else {
            std::optional<R> out;
            run_or_rollback([&] { out.emplace(fn(tx)); });
            commit_all();
            events.swap(tx.events());
            lock.unlock();
            publish(events);
            return std::move(*out);
        }
    }

    /**
     * Read-only access under the store lock.
     */
    template<typename Fn>
    auto read(Fn&& fn) const -> std::invoke_result_t<Fn, const Tables&> {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(static_cast<const Tables&>(tables_));
    }

    // Persist through the backend when anything changed since the last flush
    Status flush();

    // Replace all tables with the backend's snapshot
    Status load();

    bool dirty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dirty_;
    }

private:
    template<typename Body>
    void run_or_rollback(Body&& body) {
        try {
            body();
        } catch (...) {
            rollback_all();
            throw;
        }
    }

    void begin_all();
    void commit_all();
    void rollback_all();
    void publish(const std::vector<TransitionEvent>& events);

    const Clock& clock_;
    EventSink* sink_;
    std::unique_ptr<StoreBackend> backend_;
    Tables tables_;
    bool dirty_ = false;
    mutable std::mutex mutex_;
};

}  // namespace store
}  // namespace hashfleet
