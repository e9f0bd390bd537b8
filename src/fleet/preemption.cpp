// preemption.cpp - Pause / resume campaigns by priority

#include "preemption.hpp"
#include "transitions.hpp"

#include <sstream>

namespace hashfleet {

std::optional<Priority> PreemptionManager::top_running_priority(const store::Tables& tables,
                                                                ProjectId project_id) {
    std::optional<Priority> top;
    for (const auto& [id, c] : tables.campaigns.rows()) {
        if (c.project_id != project_id || c.state != CampaignState::RUNNING) continue;
        if (!top || c.priority > *top) top = c.priority;
    }
    return top;
}

PreemptionManager::Outcome PreemptionManager::rebalance(store::Tx& tx, ProjectId project_id) const {
    Outcome outcome;
    if (!enabled_) return outcome;

    std::optional<Priority> top = top_running_priority(tx.tables(), project_id);

    // Nothing running: the best preempted campaigns come back
    if (!top) {
        for (const auto& [id, c] : tx.tables().campaigns.rows()) {
            if (c.project_id != project_id || c.state != CampaignState::PAUSED || !c.paused_by_preemption) continue;
            if (!top || c.priority > *top) top = c.priority;
        }
        if (!top) return outcome;
    }

    std::vector<CampaignId> to_pause;
    std::vector<CampaignId> to_resume;
    for (const auto& [id, c] : tx.tables().campaigns.rows()) {
        if (c.project_id != project_id) continue;
        if (c.state == CampaignState::RUNNING && c.priority < *top) {
            to_pause.push_back(id);
        } else if (c.state == CampaignState::PAUSED && c.paused_by_preemption && c.priority >= *top) {
            to_resume.push_back(id);
        }
    }

    for (CampaignId id : to_pause) {
        Campaign& c = tx.campaign(id);
        std::ostringstream reason;
        reason << "preempted by " << to_string(*top) << " priority work";
        fleet::set_state(tx, c, CampaignState::PAUSED, reason.str());
        c.paused_by_preemption = true;
        outcome.paused++;
    }
    for (CampaignId id : to_resume) {
        Campaign& c = tx.campaign(id);
        fleet::set_state(tx, c, CampaignState::RUNNING, "higher priority work finished");
        outcome.resumed++;
    }

    if (outcome.paused || outcome.resumed) {
        std::ostringstream ss;
        ss << "PREEMPTION: Project #" << project_id << " top=" << to_string(*top)
           << ", Paused=" << outcome.paused << ", Resumed=" << outcome.resumed;
        LOG_INFO(ss.str());
    }
    return outcome;
}

}  // namespace hashfleet
