/**
 * Keyspace Computation and Slicing
 *
 * Total keyspace per attack mode (computed once, when the Attack is created):
 *   dictionary      wordlist lines x rule lines (1 without rules)
 *   mask            product of per-position charset sizes; with increment,
 *                   the sum over every length in [min, max]
 *   hybrid          wordlist lines x mask keyspace (either order)
 *
 * Mask syntax: ?l ?u ?d ?h ?H ?s ?a ?b built-ins, ?1..?4 custom charsets
 * (which may use built-ins and are de-duplicated), ?? for a literal '?'.
 * Anything else is a literal character.
 */

#pragma once

#include "../core/entities.hpp"
#include "../core/result.hpp"
#include "../core/yaml_config.hpp"

#include <functional>
#include <vector>

namespace hashfleet {
namespace keyspace {

// Keyspaces must stay below 2^63 so ranges fit a signed 64-bit skip/limit
constexpr uint64_t MAX_KEYSPACE = 1ULL << 63;

using ResourceLookup = std::function<const Resource*(ResourceId)>;

// Number of candidates at each position of the mask
Result<std::vector<uint64_t>> position_sizes(const MaskPattern& pattern);

Result<uint64_t> mask_keyspace(const MaskPattern& pattern);

Result<uint64_t> compute(const AttackSpec& spec, const ResourceLookup& lookup);

// 1 (trivial) .. 5 (enormous), used to order attacks inside a campaign
int complexity_bucket(uint64_t keyspace);

}  // namespace keyspace

/**
 * Sizes new slices from the requesting agent's benchmarked speed.
 */
class KeyspaceSlicer {
public:
    struct Settings {
        int64_t target_seconds = 600;
        uint64_t min_keyspace = 1000;
        uint64_t max_keyspace = 0;      // 0 = unbounded
    };

    explicit KeyspaceSlicer(Settings settings) : settings_(settings) {}

    static Settings from_config(const CoordinatorConfig& config) {
        return Settings{config.slice_target_seconds, config.slice_min_keyspace, config.slice_max_keyspace};
    }

    // Size of the next slice for an agent hashing at `speed`, never above `remaining`
    uint64_t slice_size(double speed, uint64_t remaining) const;

    // Next [skip, skip + limit) range of `attack`; limit 0 once fully sliced
    std::pair<uint64_t, uint64_t> next_range(const Attack& attack, double speed) const;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

}  // namespace hashfleet
