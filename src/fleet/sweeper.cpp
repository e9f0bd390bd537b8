// sweeper.cpp - Background maintenance thread

#include "sweeper.hpp"

namespace hashfleet {

Sweeper::Sweeper(Coordinator& coordinator, std::chrono::milliseconds interval)
    : coordinator_(coordinator)
    , interval_(interval)
    , running_(false)
    , passes_(0)
{
}

Sweeper::~Sweeper() {
    stop();
}

void Sweeper::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&Sweeper::sweep_loop, this);
    LOG_INFO("Sweeper started (interval " + std::to_string(interval_.count()) + "ms)");
}

void Sweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_) return;
        running_ = false;
    }
    wake_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("Sweeper stopped after " + std::to_string(passes_.load()) + " passes");
}

SweepReport Sweeper::run_once() {
    SweepReport report = coordinator_.sweep();
    size_t changed = coordinator_.rebalance_all();
    if (changed > 0) {
        LOG_INFO("Sweeper: preemption changed " + std::to_string(changed) + " campaign(s)");
    }

    Status flushed = coordinator_.store().flush();
    if (!flushed) {
        report.failures++;
    }
    passes_++;
    return report;
}

void Sweeper::sweep_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval_, [this] { return !running_; });
        }
        if (!running_) break;

        try {
            run_once();
        } catch (const std::exception& e) {
            // Keep the loop alive; the next pass retries
            Logger::instance().log_error(std::string("Sweeper pass failed: ") + e.what());
        }
    }
}

}  // namespace hashfleet
