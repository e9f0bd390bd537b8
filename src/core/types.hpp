/**
 * hashfleet Core Types
 *
 * Identifiers, lifecycle states and small enumerations shared by the
 * store, the scheduling components and the operator console.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <cctype>

namespace hashfleet {

// -----------------------------------------------------------------------------
// Identifiers and time
// -----------------------------------------------------------------------------

using ProjectId   = uint64_t;
using HashListId  = uint64_t;
using HashItemId  = uint64_t;
using ResourceId  = uint64_t;
using CampaignId  = uint64_t;
using AttackId    = uint64_t;
using TaskId      = uint64_t;
using AgentId     = uint64_t;
using CrackId     = uint64_t;
using AgentErrorId = uint64_t;

// Hashcat mode number (0 = MD5, 1000 = NTLM, ...)
using HashType = uint32_t;

// Milliseconds since the Unix epoch
using Millis = int64_t;

constexpr Millis MS_PER_SECOND = 1000;

// -----------------------------------------------------------------------------
// Lifecycle states
// -----------------------------------------------------------------------------

enum class AgentState : uint8_t {
    PENDING = 0,       // Registered, waiting for an accepted benchmark
    ACTIVE = 1,        // Eligible for work
    DISCONNECTED = 2,  // Heartbeat lost beyond the grace period
    RECONNECTING = 3,  // Heartbeat resumed after a disconnect
    RETIRED = 4,       // Removed by an operator (credential revoked)
    FAULTED = 5,       // Fatal fault ("error"; ERROR clashes with a Windows macro)
};

enum class CampaignState : uint8_t {
    DRAFT = 0,
    SCHEDULED = 1,
    RUNNING = 2,
    PAUSED = 3,
    COMPLETED = 4,
    FAILED = 5,
    CANCELLED = 6,
};

enum class AttackState : uint8_t {
    PENDING = 0,
    RUNNING = 1,
    PAUSED = 2,
    COMPLETED = 3,
    EXHAUSTED = 4,
    FAILED = 5,
    ABANDONED = 6,
};

enum class TaskState : uint8_t {
    PENDING = 0,
    RUNNING = 1,
    PAUSED = 2,
    COMPLETED = 3,
    EXHAUSTED = 4,
    FAILED = 5,
    ABANDONED = 6,
};

/**
 * Campaign priority. Higher values preempt lower ones inside a Project.
 */
enum class Priority : int8_t {
    DEFERRED = -1,
    ROUTINE = 0,
    HIGH = 1,
    URGENT = 2,
};

enum class Severity : uint8_t {
    INFO = 0,
    WARNING = 1,
    MINOR = 2,
    MAJOR = 3,
    CRITICAL = 4,
    FATAL = 5,
};

enum class ResourceKind : uint8_t {
    WORDLIST = 0,
    RULES = 1,
    MASKS = 2,
};

enum class EntityKind : uint8_t {
    AGENT = 0,
    CAMPAIGN = 1,
    ATTACK = 2,
    TASK = 3,
};

// -----------------------------------------------------------------------------
// Names
// -----------------------------------------------------------------------------

inline const char* to_string(AgentState s) {
    switch (s) {
        case AgentState::PENDING:      return "pending";
        case AgentState::ACTIVE:       return "active";
        case AgentState::DISCONNECTED: return "disconnected";
        case AgentState::RECONNECTING: return "reconnecting";
        case AgentState::RETIRED:      return "retired";
        case AgentState::FAULTED:      return "error";
    }
    return "?";
}

inline const char* to_string(CampaignState s) {
    switch (s) {
        case CampaignState::DRAFT:     return "draft";
        case CampaignState::SCHEDULED: return "scheduled";
        case CampaignState::RUNNING:   return "running";
        case CampaignState::PAUSED:    return "paused";
        case CampaignState::COMPLETED: return "completed";
        case CampaignState::FAILED:    return "failed";
        case CampaignState::CANCELLED: return "cancelled";
    }
    return "?";
}

inline const char* to_string(AttackState s) {
    switch (s) {
        case AttackState::PENDING:   return "pending";
        case AttackState::RUNNING:   return "running";
        case AttackState::PAUSED:    return "paused";
        case AttackState::COMPLETED: return "completed";
        case AttackState::EXHAUSTED: return "exhausted";
        case AttackState::FAILED:    return "failed";
        case AttackState::ABANDONED: return "abandoned";
    }
    return "?";
}

inline const char* to_string(TaskState s) {
    switch (s) {
        case TaskState::PENDING:   return "pending";
        case TaskState::RUNNING:   return "running";
        case TaskState::PAUSED:    return "paused";
        case TaskState::COMPLETED: return "completed";
        case TaskState::EXHAUSTED: return "exhausted";
        case TaskState::FAILED:    return "failed";
        case TaskState::ABANDONED: return "abandoned";
    }
    return "?";
}

inline const char* to_string(Priority p) {
    switch (p) {
        case Priority::DEFERRED: return "deferred";
        case Priority::ROUTINE:  return "routine";
        case Priority::HIGH:     return "high";
        case Priority::URGENT:   return "urgent";
    }
    return "?";
}

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::INFO:     return "info";
        case Severity::WARNING:  return "warning";
        case Severity::MINOR:    return "minor";
        case Severity::MAJOR:    return "major";
        case Severity::CRITICAL: return "critical";
        case Severity::FATAL:    return "fatal";
    }
    return "?";
}

inline const char* to_string(ResourceKind k) {
    switch (k) {
        case ResourceKind::WORDLIST: return "wordlist";
        case ResourceKind::RULES:    return "rules";
        case ResourceKind::MASKS:    return "masks";
    }
    return "?";
}

inline const char* to_string(EntityKind k) {
    switch (k) {
        case EntityKind::AGENT:    return "agent";
        case EntityKind::CAMPAIGN: return "campaign";
        case EntityKind::ATTACK:   return "attack";
        case EntityKind::TASK:     return "task";
    }
    return "?";
}

namespace detail {
inline std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
}  // namespace detail

inline std::optional<Priority> parse_priority(std::string_view text) {
    std::string v = detail::lower(text);
    if (v == "deferred") return Priority::DEFERRED;
    if (v == "routine" || v == "normal") return Priority::ROUTINE;
    if (v == "high") return Priority::HIGH;
    if (v == "urgent") return Priority::URGENT;
    return std::nullopt;
}

inline std::optional<Severity> parse_severity(std::string_view text) {
    std::string v = detail::lower(text);
    if (v == "info") return Severity::INFO;
    if (v == "warning") return Severity::WARNING;
    if (v == "minor") return Severity::MINOR;
    if (v == "major") return Severity::MAJOR;
    if (v == "critical") return Severity::CRITICAL;
    if (v == "fatal") return Severity::FATAL;
    return std::nullopt;
}

inline std::optional<ResourceKind> parse_resource_kind(std::string_view text) {
    std::string v = detail::lower(text);
    if (v == "wordlist") return ResourceKind::WORDLIST;
    if (v == "rules") return ResourceKind::RULES;
    if (v == "masks") return ResourceKind::MASKS;
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// State predicates
// -----------------------------------------------------------------------------

inline bool is_terminal(TaskState s) {
    return s == TaskState::COMPLETED || s == TaskState::EXHAUSTED ||
           s == TaskState::ABANDONED;
}

inline bool is_finished(TaskState s) {
    return s == TaskState::COMPLETED || s == TaskState::EXHAUSTED;
}

inline bool is_terminal(AttackState s) {
    return s == AttackState::COMPLETED || s == AttackState::EXHAUSTED ||
           s == AttackState::FAILED || s == AttackState::ABANDONED;
}

inline bool is_terminal(CampaignState s) {
    return s == CampaignState::COMPLETED || s == CampaignState::FAILED ||
           s == CampaignState::CANCELLED;
}

// Agents in these states cannot renew a lease; their claims are sweepable
inline bool is_live(AgentState s) {
    return s == AgentState::PENDING || s == AgentState::ACTIVE ||
           s == AgentState::RECONNECTING;
}

}  // namespace hashfleet
