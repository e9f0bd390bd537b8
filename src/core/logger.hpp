/**
 * hashfleet Logger
 *
 * File log for the coordinator: state transitions, claims, sweep passes and
 * crack ingestion. Writes <log_dir>/hashfleet.log (default ~/.hashfleet),
 * rotating to hashfleet.log.old past 10 MB. Until init() succeeds every
 * call is a no-op, so library code and tests can log unconditionally.
 */

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <ctime>

namespace hashfleet {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // ERROR collides with a Windows macro
        FATAL
    };

    static constexpr uintmax_t ROTATE_BYTES = 10ull * 1024 * 1024;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string dir = log_dir.empty() ? default_dir() : log_dir;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) return false;

        log_path_ = dir + "/hashfleet.log";
        rotate_if_large();

        if (log_file_.is_open()) log_file_.close();
        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) return false;

        initialized_ = true;
        write_line(Level::INFO, "=== hashfleet coordinator logger started ===");
        return true;
    }

    void set_min_level(Level level) { min_level_ = level; }

    void log(Level level, const std::string& message) {
        if (!initialized_ || level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        write_line(level, message);
    }

    void log_transition(const char* entity, uint64_t id, const char* from,
                        const char* to, const std::string& reason) {
        std::ostringstream ss;
        ss << "TRANSITION: " << entity << " #" << id << " " << (*from ? from : "(new)") << " -> " << to;
        if (!reason.empty()) ss << " (" << reason << ")";
        log(Level::INFO, ss.str());
    }

    void log_claim(uint64_t task_id, uint64_t agent_id, uint64_t skip, uint64_t limit,
                   int64_t expires_at) {
        std::ostringstream ss;
        ss << "CLAIM: Task #" << task_id << " -> Agent #" << agent_id
           << ", Range=[" << skip << ", " << (skip + limit) << ")"
           << ", ExpiresAt=" << expires_at;
        log(Level::INFO, ss.str());
    }

    void log_sweep(size_t disconnected, size_t reassigned, size_t failures) {
        if (disconnected == 0 && reassigned == 0 && failures == 0) return;
        std::ostringstream ss;
        ss << "SWEEP: Disconnected=" << disconnected
           << ", Reassigned=" << reassigned
           << ", Failures=" << failures;
        log(failures > 0 ? Level::WARN : Level::INFO, ss.str());
    }

    void log_crack(uint64_t hash_item_id, uint64_t task_id, uint64_t agent_id, bool duplicate) {
        std::ostringstream ss;
        ss << (duplicate ? "CRACK_DUPLICATE" : "CRACK") << ": HashItem #" << hash_item_id
           << ", Task #" << task_id << ", Agent #" << agent_id;
        log(Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    const std::string& path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== hashfleet coordinator logger stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string default_dir() {
#ifdef _WIN32
        const char* home = std::getenv("USERPROFILE");
#else
        const char* home = std::getenv("HOME");
#endif
        return home ? std::string(home) + "/.hashfleet" : std::string(".");
    }

    // Caller holds mutex_
    void rotate_if_large() {
        std::error_code ec;
        if (!std::filesystem::exists(log_path_, ec)) return;
        if (std::filesystem::file_size(log_path_, ec) <= ROTATE_BYTES || ec) return;
        std::string backup = log_path_ + ".old";
        std::filesystem::remove(backup, ec);
        std::filesystem::rename(log_path_, backup, ec);
    }

    // Caller holds mutex_. Flushed per line so a crash keeps the tail.
    void write_line(Level level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        log_file_ << std::put_time(std::localtime(&secs), "%Y-%m-%d %H:%M:%S")
                  << "." << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ')
                  << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
        }
        return "?????";
    }

    std::atomic<bool> initialized_{false};
    std::atomic<Level> min_level_{Level::DEBUG};
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

#define LOG_DEBUG(msg) hashfleet::Logger::instance().log(hashfleet::Logger::Level::DEBUG, msg)
#define LOG_INFO(msg)  hashfleet::Logger::instance().log(hashfleet::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  hashfleet::Logger::instance().log(hashfleet::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) hashfleet::Logger::instance().log(hashfleet::Logger::Level::ERR, msg)
#define LOG_FATAL(msg) hashfleet::Logger::instance().log(hashfleet::Logger::Level::FATAL, msg)

}  // namespace hashfleet
