/**
 * Lease Manager
 *
 * Heartbeats renew the lease on an agent's claimed Task and move the agent
 * through disconnected -> reconnecting -> active. Two background passes run
 * item by item, each in its own transaction:
 *
 *   find_disconnected / mark_disconnected   live agents silent beyond the grace period
 *   find_expired / reclaim                  leases past expires_at whose agent is not live
 *
 * A reclaimed Task goes back to pending with its claim cleared and stale set.
 * Reclaiming never abandons anything.
 */

#pragma once

#include "../store/store.hpp"
#include "capability.hpp"
#include "progress.hpp"

#include <optional>
#include <vector>

namespace hashfleet {

// What an agent should do with the task it is working on
enum class Disposition {
    IDLE,          // No claimed task
    CONTINUE,
    STALE,         // Continue, but re-fetch cracked hashes first
    PAUSED,        // Stop, the task was paused
    CANCELLED,     // Stop, the campaign was cancelled
    REASSIGNED,    // Stop, the claim now belongs to someone else
    COMPLETED,     // Stop, the task finished without this agent (hash list cracked)
};

inline const char* to_string(Disposition d) {
    switch (d) {
        case Disposition::IDLE:       return "idle";
        case Disposition::CONTINUE:   return "continue";
        case Disposition::STALE:      return "stale";
        case Disposition::PAUSED:     return "paused";
        case Disposition::CANCELLED:  return "cancelled";
        case Disposition::REASSIGNED: return "reassigned";
        case Disposition::COMPLETED:  return "completed";
    }
    return "?";
}

struct HeartbeatReply {
    AgentState state = AgentState::PENDING;
    Disposition disposition = Disposition::IDLE;
    std::optional<TaskId> task_id;
    Millis expires_at = 0;
    bool rebenchmark = false;
};

class LeaseManager {
public:
    LeaseManager(const CapabilityMatcher& matcher, Millis lease_duration, Millis heartbeat_grace)
        : matcher_(matcher), lease_duration_(lease_duration), heartbeat_grace_(heartbeat_grace) {}

    HeartbeatReply heartbeat(store::Tx& tx, AgentId agent_id) const;

    /**
     * Where `agent` stands on `task`. Renews the lease while the answer is
     * continue/stale; applies pending pause and cancel requests otherwise.
     */
    Disposition task_disposition(store::Tx& tx, Agent& agent, Task& task) const;

    /**
     * Apply an operator stop to a claimed task: cancel or abandon fails it,
     * an operator pause pauses it. Either way the claim is released.
     * Returns nullopt when the task may keep running.
     */
    static std::optional<Disposition> apply_stop_request(store::Tx& tx, Task& task);

    // What a former claimant is told about a task it no longer holds
    static Disposition released_disposition(const Task& task, AgentId agent_id);

    std::vector<AgentId> find_disconnected(const store::Tables& tables, Millis now) const;
    bool mark_disconnected(store::Tx& tx, AgentId agent_id) const;

    std::vector<TaskId> find_expired(const store::Tables& tables, Millis now) const;

    // Return an expired lease to pending. `force` skips the expiry check (fatal agent fault).
    bool reclaim(store::Tx& tx, TaskId task_id, bool force = false) const;

    Millis lease_duration() const { return lease_duration_; }
    Millis heartbeat_grace() const { return heartbeat_grace_; }

private:
    const CapabilityMatcher& matcher_;
    Millis lease_duration_;
    Millis heartbeat_grace_;
};

}  // namespace hashfleet
