/**
 * Test harness shared by the coordinator tests: a manual clock, an in-memory
 * store recording every transition event, and shortcuts that build a project
 * with hash lists, campaigns, attacks and benchmarked agents.
 */

#pragma once

#include "../src/core/clock.hpp"
#include "../src/core/yaml_config.hpp"
#include "../src/fleet/coordinator.hpp"
#include "../src/services/events.hpp"
#include "../src/store/store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace hashfleet {
namespace testing {

inline CoordinatorConfig test_config() {
    CoordinatorConfig config;
    config.lease_duration_seconds = 300;
    config.heartbeat_grace_seconds = 90;
    config.slice_target_seconds = 10;
    config.slice_min_keyspace = 1;
    config.slice_max_keyspace = 0;
    config.max_task_retries = 3;
    config.max_benchmark_age_hours = 168;
    return config;
}

struct Harness {
    ManualClock clock;
    RecordingEventSink events;
    store::Store store;
    CoordinatorConfig config;
    Coordinator coordinator;

    explicit Harness(const CoordinatorConfig& cfg = test_config(), ResourceResolver* resolver = nullptr)
        : store(clock, &events), config(cfg), coordinator(store, config, resolver) {}

    ProjectId project(const std::string& name = "acme") {
        auto id = coordinator.create_project(name);
        assert(id.ok());
        return id.value();
    }

    HashListId hash_list(ProjectId project, const std::vector<std::string>& hashes, HashType type = 0,
                         const std::string& name = "list") {
        auto id = coordinator.create_hash_list(project, name, type, hashes);
        assert(id.ok());
        return id.value();
    }

    ResourceId wordlist(ProjectId project, uint64_t lines, const std::string& name = "words.txt") {
        auto id = coordinator.create_resource(project, ResourceKind::WORDLIST, name, lines, "ab12");
        assert(id.ok());
        return id.value();
    }

    CampaignId campaign(ProjectId project, HashListId list, Priority priority = Priority::ROUTINE,
                        const std::string& name = "campaign") {
        auto id = coordinator.create_campaign(project, list, name, priority);
        assert(id.ok());
        return id.value();
    }

    AttackId mask_attack(CampaignId campaign, const std::string& mask, const std::string& name = "mask") {
        MaskAttack spec;
        spec.pattern.mask = mask;
        auto id = coordinator.add_attack(campaign, name, spec);
        assert(id.ok());
        return id.value();
    }

    void activate(CampaignId campaign) {
        Status s = coordinator.activate_campaign(campaign);
        assert(s.ok());
    }

    // Registered, benchmarked and active
    AgentId agent(const std::vector<ProjectId>& projects, HashType type = 0, double speed = 100.0,
                  const std::string& signature = "rig") {
        auto reg = coordinator.register_agent(signature, "host-" + signature, "gpu", projects);
        assert(reg.ok());
        AgentId id = reg->agent_id;
        if (speed > 0.0) {
            Status s = coordinator.submit_benchmark(id, type, speed);
            assert(s.ok());
        }
        return id;
    }

    TaskAssignment poll(AgentId agent) {
        auto result = coordinator.request_task(agent);
        assert(result.ok());
        assert(result.value().has_value());
        return *result.value();
    }

    bool no_work(AgentId agent) {
        auto result = coordinator.request_task(agent);
        assert(result.ok());
        return !result.value().has_value();
    }

    Task task(TaskId id) {
        auto t = coordinator.task(id);
        assert(t.has_value());
        return *t;
    }

    Attack attack(AttackId id) {
        auto a = coordinator.attack(id);
        assert(a.has_value());
        return *a;
    }

    Campaign campaign_row(CampaignId id) {
        auto c = coordinator.campaign(id);
        assert(c.has_value());
        return *c;
    }

    Agent agent_row(AgentId id) {
        auto a = coordinator.agent(id);
        assert(a.has_value());
        return *a;
    }
};

}  // namespace testing
}  // namespace hashfleet
