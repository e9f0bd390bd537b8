/**
 * yaml_config.hpp - Coordinator configuration loader for hashfleet
 *
 * Parses a subset of YAML (key: value pairs with sections) without external dependencies.
 * Command-line arguments override config file settings.
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <vector>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include "types.hpp"

namespace hashfleet {

/**
 * Coordinator configuration loaded from hashfleet.yml
 */
struct CoordinatorConfig {
    // Lease manager
    int64_t lease_duration_seconds = 300;
    int64_t heartbeat_grace_seconds = 90;
    int64_t sweep_interval_seconds = 30;

    // Keyspace slicer
    int64_t slice_target_seconds = 600;     // Wall time a slice should take at benchmarked speed
    uint64_t slice_min_keyspace = 1000;
    uint64_t slice_max_keyspace = 0;        // 0 = unbounded

    // Scheduling
    bool preemption_enabled = true;
    uint32_t max_task_retries = 3;
    double min_performance = 0.0;           // Hashes/s required for gated priorities
    Priority performance_gate_priority = Priority::HIGH;
    int64_t max_benchmark_age_hours = 168;

    // Resource handles
    std::string resource_base_url = "https://storage.local/resources";
    int64_t handle_ttl_seconds = 900;
    std::string signing_secret;

    // Paths
    std::string state_file;
    std::string log_dir;

    std::string loaded_from;

    Millis lease_duration_ms() const { return lease_duration_seconds * MS_PER_SECOND; }
    Millis heartbeat_grace_ms() const { return heartbeat_grace_seconds * MS_PER_SECOND; }
    Millis max_benchmark_age_ms() const { return max_benchmark_age_hours * 3600 * MS_PER_SECOND; }

    /**
     * Candidate config files, searched in order when no path is given.
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths = {"./hashfleet.yml", "./hashfleet.yaml"};
#ifdef _WIN32
        const char* home = std::getenv("USERPROFILE");
#else
        const char* home = std::getenv("HOME");
#endif
        if (home && *home) {
            paths.push_back(std::string(home) + "/.hashfleet/config.yml");
            paths.push_back(std::string(home) + "/.hashfleet/config.yaml");
        }
        return paths;
    }

    /**
     * Load configuration from a YAML file. An explicit path must exist;
     * otherwise the default locations are searched and a miss is not an error.
     * Returns true if a file was read.
     */
    bool load(const std::string& explicit_path = "") {
        std::string config_path;
        std::error_code ec;

        if (!explicit_path.empty()) {
            if (!std::filesystem::exists(explicit_path, ec)) {
                std::cerr << "[!] Config file not found: " << explicit_path << "\n";
                return false;
            }
            config_path = explicit_path;
        } else {
            auto candidates = get_config_paths();
            auto hit = std::find_if(candidates.begin(), candidates.end(),
                                    [&](const std::string& p) { return std::filesystem::exists(p, ec); });
            if (hit == candidates.end()) return false;
            config_path = *hit;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "[!] Failed to open config file: " << config_path << "\n";
            return false;
        }

        loaded_from = config_path;
        parse(file);
        return true;
    }

    /**
     * Parse YAML text. Returns the number of rejected lines; rejected values
     * leave the defaults in place.
     */
    int parse(std::istream& in) {
        std::string line;
        std::string section;
        int line_number = 0;
        int rejected = 0;

        while (std::getline(in, line)) {
            line_number++;

            bool indented = !line.empty() && (line[0] == ' ' || line[0] == '\t');
            std::string text = trim(line);
            if (text.empty() || text[0] == '#' || text.rfind("---", 0) == 0) continue;

            size_t comment = text.find(" #");
            if (comment != std::string::npos) text = trim(text.substr(0, comment));

            size_t colon = text.find(':');
            if (colon == std::string::npos) continue;
            std::string key = trim(text.substr(0, colon));
            std::string value = unquote(trim(text.substr(colon + 1)));

            if (value.empty() && !indented) {
                section = key;
                continue;
            }

            try {
                if (!parse_value(section, key, value)) {
                    std::cerr << "[!] Config: unknown key " << section << "." << key
                              << " at line " << line_number << "\n";
                    rejected++;
                }
            } catch (const std::exception& e) {
                std::cerr << "[!] Config: bad value at line " << line_number << ": " << e.what() << "\n";
                rejected++;
            }
        }

        return rejected;
    }

private:
    bool parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "lease") {
            if (key == "duration_seconds") lease_duration_seconds = parse_positive(value);
            else if (key == "heartbeat_grace_seconds") heartbeat_grace_seconds = parse_positive(value);
            else if (key == "sweep_interval_seconds") sweep_interval_seconds = parse_positive(value);
            else return false;
        }
        else if (section == "slicing") {
            if (key == "target_seconds") slice_target_seconds = parse_positive(value);
            else if (key == "min_keyspace") slice_min_keyspace = std::stoull(value);
            else if (key == "max_keyspace") slice_max_keyspace = std::stoull(value);
            else return false;
        }
        else if (section == "scheduling") {
            if (key == "preemption") preemption_enabled = parse_bool(value);
            else if (key == "max_task_retries") max_task_retries = static_cast<uint32_t>(std::stoul(value));
            else if (key == "min_performance") min_performance = std::stod(value);
            else if (key == "performance_gate_priority") {
                auto p = parse_priority(value);
                if (!p) throw std::invalid_argument("unknown priority '" + value + "'");
                performance_gate_priority = *p;
            }
            else if (key == "max_benchmark_age_hours") max_benchmark_age_hours = parse_positive(value);
            else return false;
        }
        else if (section == "resources") {
            if (key == "base_url") resource_base_url = value;
            else if (key == "handle_ttl_seconds") handle_ttl_seconds = parse_positive(value);
            else if (key == "signing_secret") signing_secret = value;
            else return false;
        }
        else if (section == "paths") {
            if (key == "state_file") state_file = value;
            else if (key == "log_dir") log_dir = value;
            else return false;
        }
        else {
            return false;
        }
        return true;
    }

    static int64_t parse_positive(const std::string& value) {
        int64_t v = std::stoll(value);
        if (v <= 0) throw std::out_of_range("value must be positive: " + value);
        return v;
    }

    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    static std::string unquote(const std::string& s) {
        if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }

    static bool parse_bool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        return (lower == "true" || lower == "yes" || lower == "1" || lower == "on");
    }
};

}  // namespace hashfleet
