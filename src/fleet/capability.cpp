// capability.cpp - Benchmark based eligibility

#include "capability.hpp"

namespace hashfleet {

Eligibility CapabilityMatcher::check(const Agent& agent, HashType hash_type,
                                     Priority priority, Millis now) const {
    auto it = agent.benchmarks.find(hash_type);
    if (it == agent.benchmarks.end() || it->second.speed <= 0.0) {
        return Eligibility::NO_BENCHMARK;
    }

    if (policy_.max_benchmark_age > 0 && now - it->second.measured_at > policy_.max_benchmark_age) {
        return Eligibility::BENCHMARK_EXPIRED;
    }

    if (priority >= policy_.gate_priority && it->second.speed < policy_.min_performance) {
        return Eligibility::BELOW_THRESHOLD;
    }

    return Eligibility::ELIGIBLE;
}

bool CapabilityMatcher::benchmarks_stale(const Agent& agent, Millis now) const {
    if (policy_.max_benchmark_age <= 0 || agent.benchmarks.empty()) return false;
    return now - agent.newest_benchmark_at() > policy_.max_benchmark_age;
}

}  // namespace hashfleet
