// preemption.hpp - Priority preemption between campaigns of one project
//
// The highest priority among running campaigns of a project wins. Running
// campaigns below it are paused (flagged paused_by_preemption), and campaigns
// paused that way resume once nothing above them is running. Equal priorities
// never preempt each other. Paused campaigns are only starved of new work:
// their in-flight tasks keep their leases.

#pragma once

#include "../store/store.hpp"

namespace hashfleet {

class PreemptionManager {
public:
    explicit PreemptionManager(bool enabled) : enabled_(enabled) {}

    struct Outcome {
        size_t paused = 0;
        size_t resumed = 0;
    };

    // Re-evaluate a project; called whenever a campaign starts, pauses, resumes or finishes
    Outcome rebalance(store::Tx& tx, ProjectId project_id) const;

    // Highest priority currently running in the project, if any
    static std::optional<Priority> top_running_priority(const store::Tables& tables, ProjectId project_id);

    bool enabled() const { return enabled_; }

private:
    bool enabled_;
};

}  // namespace hashfleet
