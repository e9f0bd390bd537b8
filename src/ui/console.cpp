// console.cpp - Operator command interpreter

#include "console.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hashfleet {
namespace ui {

namespace {

uint64_t to_u64(const std::string& text) {
    size_t used = 0;
    uint64_t v = std::stoull(text, &used);
    if (used != text.size()) throw std::invalid_argument("not a number: " + text);
    return v;
}

std::string join(const std::vector<std::string>& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); i++) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        if (!part.empty()) out.push_back(part);
    }
    return out;
}

std::string percent(double fraction) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return ss.str();
}

MaskPattern parse_mask(const std::vector<std::string>& args, size_t at) {
    MaskPattern pattern;
    pattern.mask = args.at(at);
    for (size_t i = at + 1; i < args.size(); i++) {
        const std::string& opt = args[i];
        if (opt == "increment" && i + 2 < args.size()) {
            pattern.increment = true;
            pattern.increment_min = static_cast<uint32_t>(to_u64(args[i + 1]));
            pattern.increment_max = static_cast<uint32_t>(to_u64(args[i + 2]));
            i += 2;
        } else if (opt.size() > 3 && opt[0] == '-' && opt[1] >= '1' && opt[1] <= '4' && opt[2] == '=') {
            pattern.custom_charsets[opt[1] - '1'] = opt.substr(3);
        }
    }
    return pattern;
}

}  // namespace

Console::Console(Coordinator& coordinator, std::ostream& out, bool use_color)
    : coordinator_(coordinator), out_(out), use_color_(use_color) {}

std::vector<std::string> Console::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool quoted = false;
    bool has_token = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            has_token = true;
        } else if (!quoted && c == '#') {
            break;
        } else if (!quoted && (c == ' ' || c == '\t' || c == '\r')) {
            if (has_token) tokens.push_back(current);
            current.clear();
            has_token = false;
        } else {
            current += c;
            has_token = true;
        }
    }
    if (has_token) tokens.push_back(current);
    return tokens;
}

void Console::ok(const std::string& message) {
    if (use_color_) out_ << colors::GREEN << "[+] " << colors::RESET;
    else out_ << "[+] ";
    out_ << message << "\n";
}

void Console::error(const std::string& message) {
    failures_++;
    if (use_color_) out_ << colors::RED << "[!] " << colors::RESET;
    else out_ << "[!] ";
    out_ << message << "\n";
}

void Console::report(const Status& status, const std::string& success) {
    if (status) ok(success);
    else error(status.error().describe());
}

bool Console::execute(const std::string& line) {
    Args args = tokenize(line);
    if (args.empty()) return true;

    const std::string& cmd = args[0];
    try {
        if (cmd == "quit" || cmd == "exit") return false;
        if (cmd == "help") print_help();
        else if (cmd == "project") cmd_project(args);
        else if (cmd == "list") cmd_list(args);
        else if (cmd == "resource") cmd_resource(args);
        else if (cmd == "campaign") cmd_campaign(args);
        else if (cmd == "attack") cmd_attack(args);
        else if (cmd == "task") cmd_task(args);
        else if (cmd == "agent") cmd_agent(args);
        else if (cmd == "progress") cmd_progress(args);
        else if (cmd == "status") cmd_status();
        else if (cmd == "agents") cmd_agents();
        else if (cmd == "tasks") cmd_tasks(args);
        else if (cmd == "sweep") cmd_sweep();
        else if (cmd == "flush") cmd_flush();
        else error("unknown command '" + cmd + "' (try: help)");
    } catch (const std::invalid_argument& e) {
        error(std::string("bad argument: ") + e.what());
    } catch (const std::out_of_range&) {
        error("missing or out-of-range argument for '" + cmd + "'");
    }
    return true;
}

int Console::run(std::istream& in, const std::atomic<bool>& shutdown, bool prompt) {
    std::string line;
    while (!shutdown) {
        if (prompt) out_ << "hashfleet> " << std::flush;
        if (!std::getline(in, line)) break;
        LOG_DEBUG("console: " + line);
        if (!execute(line)) break;
    }
    return failures_;
}

// =============================================================================
// Operator commands
// =============================================================================

void Console::cmd_project(const Args& args) {
    if (args.at(1) != "create") throw std::invalid_argument(args[1]);
    auto id = coordinator_.create_project(join(args, 2));
    if (!id) return error(id.error().describe());
    ok("project #" + std::to_string(id.value()) + " created");
}

void Console::cmd_list(const Args& args) {
    if (args.at(1) != "create") throw std::invalid_argument(args[1]);
    ProjectId project = to_u64(args.at(2));
    const std::string& name = args.at(3);
    HashType type = static_cast<HashType>(to_u64(args.at(4)));
    const std::string& source = args.at(5);

    std::vector<std::string> hashes;
    if (!source.empty() && source[0] == '@') {
        std::ifstream file(source.substr(1));
        if (!file.is_open()) return error("cannot open " + source.substr(1));
        std::string line;
        while (std::getline(file, line)) hashes.push_back(line);
    } else {
        hashes = split(source, ',');
    }

    auto id = coordinator_.create_hash_list(project, name, type, hashes);
    if (!id) return error(id.error().describe());
    auto list = coordinator_.hash_list(id.value());
    ok("hash list #" + std::to_string(id.value()) + " created with " +
       std::to_string(list ? list->item_count : 0) + " hashes");
}

void Console::cmd_resource(const Args& args) {
    if (args.at(1) != "create") throw std::invalid_argument(args[1]);
    ProjectId project = to_u64(args.at(2));
    auto kind = parse_resource_kind(args.at(3));
    if (!kind) throw std::invalid_argument(args[3]);
    std::string sha = args.size() > 6 ? args[6] : "";
    auto id = coordinator_.create_resource(project, *kind, args.at(4), to_u64(args.at(5)), sha);
    if (!id) return error(id.error().describe());
    ok("resource #" + std::to_string(id.value()) + " created");
}

void Console::cmd_campaign(const Args& args) {
    const std::string& sub = args.at(1);
    if (sub == "create") {
        Priority priority = Priority::ROUTINE;
        if (args.size() > 5) {
            auto p = parse_priority(args[5]);
            if (!p) throw std::invalid_argument(args[5]);
            priority = *p;
        }
        auto id = coordinator_.create_campaign(to_u64(args.at(2)), to_u64(args.at(3)), args.at(4), priority);
        if (!id) return error(id.error().describe());
        ok("campaign #" + std::to_string(id.value()) + " created (" + to_string(priority) + ")");
        return;
    }

    CampaignId id = to_u64(args.at(2));
    std::string label = "campaign #" + std::to_string(id);
    if (sub == "schedule") report(coordinator_.schedule_campaign(id), label + " scheduled");
    else if (sub == "activate") report(coordinator_.activate_campaign(id), label + " running");
    else if (sub == "pause") report(coordinator_.pause_campaign(id), label + " paused");
    else if (sub == "resume") report(coordinator_.resume_campaign(id), label + " resumed");
    else if (sub == "cancel") report(coordinator_.cancel_campaign(id), label + " cancelled");
    else throw std::invalid_argument(sub);
}

void Console::cmd_attack(const Args& args) {
    const std::string& sub = args.at(1);
    if (sub == "pause" || sub == "resume") {
        AttackId id = to_u64(args.at(2));
        std::string label = "attack #" + std::to_string(id);
        if (sub == "pause") report(coordinator_.pause_attack(id), label + " paused");
        else report(coordinator_.resume_attack(id), label + " resumed");
        return;
    }

    CampaignId campaign = to_u64(args.at(2));
    const std::string& name = args.at(3);
    AttackSpec spec;
    if (sub == "dict") {
        DictionaryAttack dict;
        dict.wordlist = to_u64(args.at(4));
        if (args.size() > 5) dict.rules = to_u64(args[5]);
        spec = dict;
    } else if (sub == "mask") {
        spec = MaskAttack{parse_mask(args, 4)};
    } else if (sub == "hybrid") {
        HybridAttack hybrid;
        hybrid.wordlist = to_u64(args.at(4));
        hybrid.pattern = parse_mask(args, 5);
        for (size_t i = 6; i < args.size(); i++) {
            if (args[i] == "mask-first") hybrid.mask_first = true;
        }
        spec = hybrid;
    } else {
        throw std::invalid_argument(sub);
    }

    auto id = coordinator_.add_attack(campaign, name, spec);
    if (!id) return error(id.error().describe());
    auto attack = coordinator_.attack(id.value());
    ok("attack #" + std::to_string(id.value()) + " added (" + attack_mode_name(spec) + ", keyspace " +
       std::to_string(attack ? attack->total_keyspace : 0) + ")");
}

void Console::cmd_task(const Args& args) {
    const std::string& sub = args.at(1);
    TaskId id = to_u64(args.at(2));
    std::string label = "task #" + std::to_string(id);
    if (sub == "abandon") report(coordinator_.abandon_task(id), label + " abandoned");
    else if (sub == "retry") report(coordinator_.retry_task(id), label + " queued for retry");
    else throw std::invalid_argument(sub);
}

// =============================================================================
// Agent commands (drive the agent surface from a script)
// =============================================================================

void Console::cmd_agent(const Args& args) {
    const std::string& sub = args.at(1);

    if (sub == "register") {
        std::vector<ProjectId> projects;
        if (args.size() > 4) {
            for (const auto& p : split(args[4], ',')) projects.push_back(to_u64(p));
        }
        auto reg = coordinator_.register_agent(args.at(2), args.at(3), "", projects);
        if (!reg) return error(reg.error().describe());
        ok("agent #" + std::to_string(reg->agent_id) + " registered, token " + reg->token);
        return;
    }

    AgentId id = to_u64(args.at(2));
    std::string label = "agent #" + std::to_string(id);

    if (sub == "bench") {
        report(coordinator_.submit_benchmark(id, static_cast<HashType>(to_u64(args.at(3))), std::stod(args.at(4))),
               label + " benchmark recorded");
    } else if (sub == "heartbeat") {
        auto reply = coordinator_.heartbeat(id);
        if (!reply) return error(reply.error().describe());
        std::string msg = label + " " + to_string(reply->state) + ", " + to_string(reply->disposition);
        if (reply->task_id) msg += " (task #" + std::to_string(*reply->task_id) + ")";
        if (reply->rebenchmark) msg += ", benchmark required";
        ok(msg);
    } else if (sub == "poll") {
        auto result = coordinator_.request_task(id);
        if (!result) return error(result.error().describe());
        if (!result.value()) return ok(label + ": no work");
        const TaskAssignment& a = *result.value();
        ok(label + " -> task #" + std::to_string(a.task_id) + " (attack #" + std::to_string(a.attack_id) +
           ", " + a.attack_mode + ", skip " + std::to_string(a.skip) + ", limit " + std::to_string(a.limit) +
           (a.stale ? ", stale" : "") + ")");
    } else if (sub == "progress") {
        auto reply = coordinator_.submit_progress(id, to_u64(args.at(3)), to_u64(args.at(4)));
        if (!reply) return error(reply.error().describe());
        std::ostringstream ss;
        ss << label << " task " << args[3] << ": " << std::fixed << std::setprecision(2)
           << reply->progress_percent << "% " << to_string(reply->state) << ", " << to_string(reply->disposition);
        if (reply->ignored) ss << " (ignored)";
        ok(ss.str());
    } else if (sub == "crack") {
        auto outcome = coordinator_.submit_crack_by_value(id, to_u64(args.at(3)), args.at(4), args.at(5));
        if (!outcome) return error(outcome.error().describe());
        std::string msg = "hash item #" + std::to_string(outcome->hash_item_id) +
                          (outcome->duplicate ? " already cracked" : " cracked");
        if (outcome->propagated) msg += ", " + std::to_string(outcome->propagated) + " propagated";
        if (outcome->list_cracked) msg += ", hash list complete";
        ok(msg);
    } else if (sub == "exhausted") {
        report(coordinator_.report_exhausted(id, to_u64(args.at(3))), "task #" + args[3] + " searched");
    } else if (sub == "fail") {
        report(coordinator_.report_task_failure(id, to_u64(args.at(3)), join(args, 4)),
               "task #" + args[3] + " failed");
    } else if (sub == "error") {
        auto severity = parse_severity(args.at(3));
        if (!severity) throw std::invalid_argument(args[3]);
        std::optional<TaskId> task;
        if (args.at(4) != "-") task = to_u64(args[4]);
        auto err = coordinator_.report_error(id, task, join(args, 5), *severity);
        if (!err) return error(err.error().describe());
        ok("agent error #" + std::to_string(err.value()) + " recorded");
    } else if (sub == "assign") {
        report(coordinator_.assign_agent_project(id, to_u64(args.at(3))), label + " assigned to project #" + args[3]);
    } else if (sub == "fault") {
        report(coordinator_.fault_agent(id, join(args, 3)), label + " faulted");
    } else if (sub == "reset") {
        report(coordinator_.reset_agent(id), label + " reset");
    } else if (sub == "retire") {
        report(coordinator_.retire_agent(id), label + " retired");
    } else {
        throw std::invalid_argument(sub);
    }
}

// =============================================================================
// Queries
// =============================================================================

void Console::cmd_progress(const Args& args) {
    auto progress = coordinator_.campaign_progress(to_u64(args.at(1)));
    if (!progress) return error(progress.error().describe());
    const CampaignProgress& p = progress.value();

    out_ << "campaign #" << p.campaign_id << " [" << to_string(p.state) << "] "
         << percent(p.fraction) << "  cracked " << p.cracked << "/" << p.hash_count;
    if (p.eta_seconds) {
        out_ << "  eta " << static_cast<uint64_t>(*p.eta_seconds) << "s";
    } else {
        out_ << "  eta n/a";
    }
    out_ << "\n";
    for (const auto& a : p.attacks) {
        out_ << "  attack #" << a.attack_id << " [" << to_string(a.state) << "] " << percent(a.fraction)
             << "  " << a.searched_keyspace << "/" << a.total_keyspace << "\n";
    }
}

void Console::cmd_status() {
    auto& store = coordinator_.store();
    auto projects = store.read([](const store::Tables& t) {
        std::vector<Project> out;
        for (const auto& [id, p] : t.projects.rows()) out.push_back(p);
        return out;
    });

    for (const auto& project : projects) {
        if (use_color_) out_ << colors::BOLD;
        out_ << "project #" << project.id << " " << project.name << "\n";
        if (use_color_) out_ << colors::RESET;
        for (const auto& c : coordinator_.campaigns_of(project.id)) {
            out_ << "  campaign #" << c.id << " " << c.name << " [" << to_string(c.state);
            if (c.paused_by_preemption) out_ << ", preempted";
            out_ << "] " << to_string(c.priority) << "\n";
        }
    }
    out_ << "cracks recorded: " << coordinator_.crack_count() << "\n";
}

void Console::cmd_agents() {
    for (const auto& a : coordinator_.agents()) {
        out_ << "agent #" << a.id << " " << a.signature << "@" << a.host << " [" << to_string(a.state) << "]";
        if (a.claimed_task) out_ << " task #" << *a.claimed_task;
        for (const auto& [type, bench] : a.benchmarks) {
            out_ << " " << type << ":" << static_cast<uint64_t>(bench.speed) << "H/s";
        }
        out_ << "\n";
    }
}

void Console::cmd_tasks(const Args& args) {
    for (const auto& t : coordinator_.tasks_of(to_u64(args.at(1)))) {
        out_ << "task #" << t.id << " [" << to_string(t.state) << "] skip " << t.skip << " limit " << t.limit
             << " " << std::fixed << std::setprecision(2) << t.progress_percent() << "%";
        if (t.claim) out_ << " agent #" << t.claim->agent_id;
        if (t.stale) out_ << " stale";
        if (t.retry_count) out_ << " retries " << t.retry_count;
        if (!t.last_error.empty()) out_ << " (" << t.last_error << ")";
        out_ << "\n";
    }
}

void Console::cmd_sweep() {
    SweepReport report = coordinator_.sweep();
    size_t changed = coordinator_.rebalance_all();
    ok("sweep: " + std::to_string(report.disconnected) + " disconnected, " +
       std::to_string(report.reassigned) + " reassigned, " + std::to_string(changed) + " rebalanced");
}

void Console::cmd_flush() {
    report(coordinator_.store().flush(), "state flushed");
}

void Console::print_help() {
    out_ << R"(Operator:
  project create <name>
  list create <project> <name> <hash_type> <hash>[,<hash>...] | @<file>
  resource create <project> <wordlist|rules|masks> <name> <lines> [sha256]
  campaign create <project> <list> <name> [deferred|routine|high|urgent]
  campaign schedule|activate|pause|resume|cancel <id>
  attack dict <campaign> <name> <wordlist> [rules]
  attack mask <campaign> <name> <mask> [-1=<charset>] [increment <min> <max>]
  attack hybrid <campaign> <name> <wordlist> <mask> [mask-first]
  attack pause|resume <id>
  task abandon|retry <id>

Agents:
  agent register <signature> <host> [project,...]
  agent bench <id> <hash_type> <speed>
  agent heartbeat|poll <id>
  agent progress <id> <task> <keyspace>
  agent crack <id> <task> <hash> <plaintext>
  agent exhausted <id> <task>
  agent fail <id> <task> <message>
  agent error <id> <severity> <task|-> <message>
  agent assign <id> <project>
  agent fault <id> <reason> | agent reset <id> | agent retire <id>

Queries:
  progress <campaign> | status | agents | tasks <attack>
  sweep | flush | help | quit
)";
}

}  // namespace ui
}  // namespace hashfleet
