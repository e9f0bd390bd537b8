// capability.hpp - Decides whether an agent may run work for a hash type

#pragma once

#include "../core/entities.hpp"
#include "../core/yaml_config.hpp"

namespace hashfleet {

enum class Eligibility {
    ELIGIBLE,
    NO_BENCHMARK,       // No entry (or zero speed) for the hash type
    BELOW_THRESHOLD,    // Too slow for a gated priority
    BENCHMARK_EXPIRED,
};

inline const char* to_string(Eligibility e) {
    switch (e) {
        case Eligibility::ELIGIBLE:          return "eligible";
        case Eligibility::NO_BENCHMARK:      return "no benchmark";
        case Eligibility::BELOW_THRESHOLD:   return "below performance threshold";
        case Eligibility::BENCHMARK_EXPIRED: return "benchmark expired";
    }
    return "?";
}

struct CapabilityPolicy {
    double min_performance = 0.0;
    Priority gate_priority = Priority::HIGH;   // Threshold applies at and above this
    Millis max_benchmark_age = 0;              // 0 = benchmarks never expire

    static CapabilityPolicy from_config(const CoordinatorConfig& config) {
        CapabilityPolicy p;
        p.min_performance = config.min_performance;
        p.gate_priority = config.performance_gate_priority;
        p.max_benchmark_age = config.max_benchmark_age_ms();
        return p;
    }
};

class CapabilityMatcher {
public:
    explicit CapabilityMatcher(CapabilityPolicy policy) : policy_(policy) {}

    Eligibility check(const Agent& agent, HashType hash_type, Priority priority, Millis now) const;

    bool eligible(const Agent& agent, HashType hash_type, Priority priority, Millis now) const {
        return check(agent, hash_type, priority, now) == Eligibility::ELIGIBLE;
    }

    // True when the agent's newest benchmark is older than the allowed age
    bool benchmarks_stale(const Agent& agent, Millis now) const;

    const CapabilityPolicy& policy() const { return policy_; }

private:
    CapabilityPolicy policy_;
};

}  // namespace hashfleet
