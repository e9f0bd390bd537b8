/**
 * Transition Events
 *
 * The core emits one TransitionEvent per state change of an Agent, Campaign,
 * Attack or Task. Events are buffered by the store transaction that produced
 * them and handed to the sink only after that transaction commits, so a sink
 * never sees a change that was rolled back.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/logger.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace hashfleet {

struct TransitionEvent {
    EntityKind entity = EntityKind::TASK;
    uint64_t id = 0;
    ProjectId project_id = 0;
    std::string from;
    std::string to;
    std::string reason;
    Millis at = 0;
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const TransitionEvent& event) = 0;
};

/**
 * Writes every transition to the coordinator log.
 */
class LogEventSink : public EventSink {
public:
    void publish(const TransitionEvent& event) override {
        Logger::instance().log_transition(to_string(event.entity), event.id,
                                          event.from.c_str(), event.to.c_str(),
                                          event.reason);
    }
};

/**
 * Keeps every event in memory. Used by tests.
 */
class RecordingEventSink : public EventSink {
public:
    void publish(const TransitionEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<TransitionEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<TransitionEvent> events_for(EntityKind entity, uint64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TransitionEvent> out;
        for (const auto& e : events_) {
            if (e.entity == entity && e.id == id) out.push_back(e);
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<TransitionEvent> events_;
};

/**
 * Forwards to several sinks (e.g. the log and a recorder).
 */
class FanoutEventSink : public EventSink {
public:
    void add(EventSink* sink) { if (sink) sinks_.push_back(sink); }

    void publish(const TransitionEvent& event) override {
        for (auto* sink : sinks_) sink->publish(event);
    }

private:
    std::vector<EventSink*> sinks_;
};

}  // namespace hashfleet
