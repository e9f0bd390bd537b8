// sweeper.hpp - Background maintenance thread
// Every interval: mark silent agents disconnected, return expired leases to
// pending, re-run preemption for every project and flush the store.

#pragma once

#include "coordinator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace hashfleet {

class Sweeper {
public:
    Sweeper(Coordinator& coordinator, std::chrono::milliseconds interval);
    ~Sweeper();

    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

    // One pass on the calling thread
    SweepReport run_once();

    uint64_t passes() const { return passes_; }

private:
    void sweep_loop();

    Coordinator& coordinator_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> passes_;
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

}  // namespace hashfleet
