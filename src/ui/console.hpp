/**
 * Operator Console
 *
 * Line-oriented command interpreter for hashfleetd. Commands come from stdin
 * or a script file, one per line; '#' starts a comment. Every command maps to
 * one Coordinator operation and prints either the outcome or the error.
 *
 *   project create <name>
 *   list create <project> <name> <hash_type> <hash>[,<hash>...] | @<file>
 *   resource create <project> <wordlist|rules|masks> <name> <lines> [sha256]
 *   campaign create <project> <list> <name> [priority]
 *   campaign schedule|activate|pause|resume|cancel <id>
 *   attack dict <campaign> <name> <wordlist> [rules]
 *   attack mask <campaign> <name> <mask> [increment <min> <max>]
 *   attack hybrid <campaign> <name> <wordlist> <mask> [mask-first]
 *   attack pause|resume <id>
 *   task abandon|retry <id>
 *   agent register <signature> <host> [project,...]
 *   agent bench <id> <hash_type> <speed>
 *   agent heartbeat|poll <id>
 *   agent progress <id> <task> <keyspace>
 *   agent crack <id> <task> <hash> <plaintext>
 *   agent exhausted <id> <task>
 *   agent fail <id> <task> <message...>
 *   agent error <id> <severity> <task|-> <message...>
 *   agent assign <id> <project>
 *   agent fault <id> <reason...> | agent reset|retire <id>
 *   progress <campaign>
 *   status | agents | tasks <attack>
 *   sweep | flush | help | quit
 */

#pragma once

#include "../fleet/coordinator.hpp"

#include <atomic>
#include <iostream>
#include <string>
#include <vector>

namespace hashfleet {
namespace ui {

namespace colors {
    inline const char* RESET  = "\033[0m";
    inline const char* BOLD   = "\033[1m";
    inline const char* DIM    = "\033[2m";
    inline const char* GREEN  = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* RED    = "\033[31m";
    inline const char* CYAN   = "\033[36m";
}

class Console {
public:
    Console(Coordinator& coordinator, std::ostream& out, bool use_color = false);

    // Returns false when the command asks to quit
    bool execute(const std::string& line);

    // Runs until EOF, quit, or shutdown becomes true. Returns the failed command count.
    int run(std::istream& in, const std::atomic<bool>& shutdown, bool prompt);

    int failures() const { return failures_; }

    static std::vector<std::string> tokenize(const std::string& line);

private:
    using Args = std::vector<std::string>;

    void cmd_project(const Args& args);
    void cmd_list(const Args& args);
    void cmd_resource(const Args& args);
    void cmd_campaign(const Args& args);
    void cmd_attack(const Args& args);
    void cmd_task(const Args& args);
    void cmd_agent(const Args& args);
    void cmd_progress(const Args& args);
    void cmd_status();
    void cmd_agents();
    void cmd_tasks(const Args& args);
    void cmd_sweep();
    void cmd_flush();
    void print_help();

    void ok(const std::string& message);
    void error(const std::string& message);
    void report(const Status& status, const std::string& success);

    Coordinator& coordinator_;
    std::ostream& out_;
    bool use_color_;
    int failures_ = 0;
};

}  // namespace ui
}  // namespace hashfleet
