// snapshot_backend.cpp - Checksum-protected text snapshot of the table set

#include "snapshot_backend.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#define fsync _commit
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace hashfleet {
namespace store {

namespace {

constexpr const char* HEADER = "# hashfleet state v1";
constexpr const char* CHECKSUM_KEY = "checksum=";

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '%':  out += "%25"; break;
            case '\t': out += "%09"; break;
            case '\n': out += "%0A"; break;
            case '\r': out += "%0D"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '%') {
            if (i + 2 >= s.size()) throw std::runtime_error("truncated escape sequence");
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

class RecordWriter {
public:
    RecordWriter(std::ostream& out, const char* kind) : out_(out) { out_ << kind; }
    ~RecordWriter() { out_ << '\n'; }

    RecordWriter& u(uint64_t v) { out_ << '\t' << v; return *this; }
    RecordWriter& i(int64_t v) { out_ << '\t' << v; return *this; }
    RecordWriter& f(double v) { out_ << '\t' << std::setprecision(17) << v; return *this; }
    RecordWriter& b(bool v) { out_ << '\t' << (v ? 1 : 0); return *this; }
    RecordWriter& s(const std::string& v) { out_ << '\t' << escape(v); return *this; }

private:
    std::ostream& out_;
};

class RecordReader {
public:
    explicit RecordReader(const std::string& line) {
        size_t start = 0;
        while (true) {
            size_t tab = line.find('\t', start);
            fields_.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
            if (tab == std::string::npos) break;
            start = tab + 1;
        }
    }

    const std::string& kind() const { return fields_[0]; }

    uint64_t u() { return std::stoull(next()); }
    int64_t i() { return std::stoll(next()); }
    double f() { return std::stod(next()); }
    bool b() { return next() == "1"; }
    std::string s() { return unescape(next()); }

    template<typename E>
    E e(E max) {
        int64_t v = i();
        if (v < static_cast<int64_t>(0) || v > static_cast<int64_t>(max)) {
            throw std::out_of_range("enum value out of range: " + std::to_string(v));
        }
        return static_cast<E>(v);
    }

    void expect_end() const {
        if (pos_ != fields_.size()) throw std::runtime_error("trailing fields in '" + fields_[0] + "' record");
    }

private:
    const std::string& next() {
        if (pos_ >= fields_.size()) throw std::runtime_error("missing field in '" + fields_[0] + "' record");
        return fields_[pos_++];
    }

    std::vector<std::string> fields_;
    size_t pos_ = 1;
};

void write_pattern(RecordWriter& w, const MaskPattern& p) {
    w.s(p.mask);
    for (const auto& cs : p.custom_charsets) w.s(cs);
    w.b(p.increment).u(p.increment_min).u(p.increment_max);
}

MaskPattern read_pattern(RecordReader& r) {
    MaskPattern p;
    p.mask = r.s();
    for (auto& cs : p.custom_charsets) cs = r.s();
    p.increment = r.b();
    p.increment_min = static_cast<uint32_t>(r.u());
    p.increment_max = static_cast<uint32_t>(r.u());
    return p;
}

Priority read_priority(RecordReader& r) {
    int64_t v = r.i();
    if (v < static_cast<int64_t>(Priority::DEFERRED) || v > static_cast<int64_t>(Priority::URGENT)) {
        throw std::out_of_range("priority out of range: " + std::to_string(v));
    }
    return static_cast<Priority>(v);
}

void write_body(std::ostream& out, const Tables& t) {
    {
        RecordWriter w(out, "next");
        w.u(t.projects.next_id()).u(t.hash_lists.next_id()).u(t.hash_items.next_id())
         .u(t.resources.next_id()).u(t.campaigns.next_id()).u(t.attacks.next_id())
         .u(t.tasks.next_id()).u(t.agents.next_id()).u(t.cracks.next_id())
         .u(t.agent_errors.next_id());
    }
    for (const auto& [id, p] : t.projects.rows()) {
        RecordWriter(out, "project").u(id).s(p.name).i(p.created_at);
    }
    for (const auto& [id, l] : t.hash_lists.rows()) {
        RecordWriter(out, "hash_list").u(id).u(l.project_id).s(l.name).u(l.hash_type)
            .u(l.item_count).u(l.cracked_count).i(l.created_at);
    }
    for (const auto& [id, h] : t.hash_items.rows()) {
        RecordWriter(out, "hash_item").u(id).u(h.hash_list_id).s(h.value).b(h.cracked)
            .s(h.plaintext).i(h.cracked_at).u(h.cracked_by_attack).u(h.cracked_by_agent);
    }
    for (const auto& [id, r] : t.resources.rows()) {
        RecordWriter(out, "resource").u(id).u(r.project_id).u(static_cast<uint64_t>(r.kind))
            .s(r.name).u(r.line_count).s(r.sha256).i(r.created_at);
    }
    for (const auto& [id, c] : t.campaigns.rows()) {
        RecordWriter(out, "campaign").u(id).u(c.project_id).u(c.hash_list_id).s(c.name)
            .i(static_cast<int64_t>(c.priority)).u(static_cast<uint64_t>(c.state))
            .b(c.paused_by_preemption).i(c.created_at).i(c.started_at).i(c.finished_at);
    }
    for (const auto& [id, a] : t.attacks.rows()) {
        RecordWriter w(out, "attack");
        w.u(id).u(a.campaign_id).s(a.name).u(a.hash_type).u(a.total_keyspace)
         .u(a.sliced_keyspace).i(a.complexity).u(static_cast<uint64_t>(a.state))
         .b(a.user_paused).i(a.created_at).i(a.started_at).i(a.finished_at)
         .u(a.spec.index());
        if (const auto* d = std::get_if<DictionaryAttack>(&a.spec)) {
            w.u(d->wordlist).u(d->rules.value_or(0));
        } else if (const auto* m = std::get_if<MaskAttack>(&a.spec)) {
            write_pattern(w, m->pattern);
        } else if (const auto* h = std::get_if<HybridAttack>(&a.spec)) {
            w.u(h->wordlist).b(h->mask_first);
            write_pattern(w, h->pattern);
        }
    }
    for (const auto& [id, k] : t.tasks.rows()) {
        RecordWriter(out, "task").u(id).u(k.attack_id).u(k.campaign_id).u(k.skip).u(k.limit)
            .u(static_cast<uint64_t>(k.state)).u(k.progress_keyspace).u(k.agent_id.value_or(0))
            .u(k.claim ? k.claim->agent_id : 0).i(k.claim ? k.claim->claimed_at : 0)
            .i(k.claim ? k.claim->expires_at : 0).u(k.retry_count).u(k.crack_count)
            .b(k.stale).s(k.last_error).i(k.created_at).i(k.updated_at);
    }
    for (const auto& [id, a] : t.agents.rows()) {
        RecordWriter w(out, "agent");
        w.u(id).s(a.signature).s(a.host).s(a.capabilities).s(a.token_digest)
         .u(static_cast<uint64_t>(a.state)).u(a.claimed_task.value_or(0))
         .i(a.last_seen_at).i(a.created_at).u(a.benchmarks.size());
        for (const auto& [type, bench] : a.benchmarks) w.u(type).f(bench.speed).i(bench.measured_at);
        w.u(a.project_ids.size());
        for (ProjectId p : a.project_ids) w.u(p);
    }
    for (const auto& [id, c] : t.cracks.rows()) {
        RecordWriter(out, "crack").u(id).u(c.hash_item_id).u(c.attack_id).u(c.task_id)
            .u(c.agent_id).s(c.plaintext).i(c.discovered_at);
    }
    for (const auto& [id, e] : t.agent_errors.rows()) {
        RecordWriter(out, "agent_error").u(id).u(e.agent_id).u(e.task_id.value_or(0))
            .u(e.attack_id.value_or(0)).u(static_cast<uint64_t>(e.severity)).s(e.message)
            .i(e.created_at);
    }
}

template<typename T>
std::optional<T> nonzero(uint64_t v) {
    if (v == 0) return std::nullopt;
    return static_cast<T>(v);
}

void read_record(RecordReader& r, Tables& t) {
    const std::string& kind = r.kind();

    if (kind == "next") {
        t.projects.set_next_id(r.u()); t.hash_lists.set_next_id(r.u());
        t.hash_items.set_next_id(r.u()); t.resources.set_next_id(r.u());
        t.campaigns.set_next_id(r.u()); t.attacks.set_next_id(r.u());
        t.tasks.set_next_id(r.u()); t.agents.set_next_id(r.u());
        t.cracks.set_next_id(r.u()); t.agent_errors.set_next_id(r.u());
    } else if (kind == "project") {
        Project p;
        p.id = r.u(); p.name = r.s(); p.created_at = r.i();
        t.projects.restore(std::move(p));
    } else if (kind == "hash_list") {
        HashList l;
        l.id = r.u(); l.project_id = r.u(); l.name = r.s();
        l.hash_type = static_cast<HashType>(r.u());
        l.item_count = r.u(); l.cracked_count = r.u(); l.created_at = r.i();
        t.hash_lists.restore(std::move(l));
    } else if (kind == "hash_item") {
        HashItem h;
        h.id = r.u(); h.hash_list_id = r.u(); h.value = r.s(); h.cracked = r.b();
        h.plaintext = r.s(); h.cracked_at = r.i();
        h.cracked_by_attack = r.u(); h.cracked_by_agent = r.u();
        t.hash_items.restore(std::move(h));
    } else if (kind == "resource") {
        Resource res;
        res.id = r.u(); res.project_id = r.u(); res.kind = r.e(ResourceKind::MASKS);
        res.name = r.s(); res.line_count = r.u(); res.sha256 = r.s(); res.created_at = r.i();
        t.resources.restore(std::move(res));
    } else if (kind == "campaign") {
        Campaign c;
        c.id = r.u(); c.project_id = r.u(); c.hash_list_id = r.u(); c.name = r.s();
        c.priority = read_priority(r); c.state = r.e(CampaignState::CANCELLED);
        c.paused_by_preemption = r.b();
        c.created_at = r.i(); c.started_at = r.i(); c.finished_at = r.i();
        t.campaigns.restore(std::move(c));
    } else if (kind == "attack") {
        Attack a;
        a.id = r.u(); a.campaign_id = r.u(); a.name = r.s();
        a.hash_type = static_cast<HashType>(r.u());
        a.total_keyspace = r.u(); a.sliced_keyspace = r.u();
        a.complexity = static_cast<int>(r.i()); a.state = r.e(AttackState::ABANDONED);
        a.user_paused = r.b();
        a.created_at = r.i(); a.started_at = r.i(); a.finished_at = r.i();
        uint64_t mode = r.u();
        if (mode == 0) {
            DictionaryAttack d;
            d.wordlist = r.u();
            d.rules = nonzero<ResourceId>(r.u());
            a.spec = d;
        } else if (mode == 1) {
            a.spec = MaskAttack{read_pattern(r)};
        } else if (mode == 2) {
            HybridAttack h;
            h.wordlist = r.u();
            h.mask_first = r.b();
            h.pattern = read_pattern(r);
            a.spec = h;
        } else {
            throw std::out_of_range("unknown attack mode " + std::to_string(mode));
        }
        t.attacks.restore(std::move(a));
    } else if (kind == "task") {
        Task k;
        k.id = r.u(); k.attack_id = r.u(); k.campaign_id = r.u();
        k.skip = r.u(); k.limit = r.u(); k.state = r.e(TaskState::ABANDONED);
        k.progress_keyspace = r.u();
        k.agent_id = nonzero<AgentId>(r.u());
        AgentId claimant = r.u();
        Millis claimed_at = r.i();
        Millis expires_at = r.i();
        if (claimant != 0) k.claim = Claim{claimant, claimed_at, expires_at};
        k.retry_count = static_cast<uint32_t>(r.u());
        k.crack_count = static_cast<uint32_t>(r.u());
        k.stale = r.b(); k.last_error = r.s();
        k.created_at = r.i(); k.updated_at = r.i();
        t.tasks.restore(std::move(k));
    } else if (kind == "agent") {
        Agent a;
        a.id = r.u(); a.signature = r.s(); a.host = r.s(); a.capabilities = r.s();
        a.token_digest = r.s(); a.state = r.e(AgentState::FAULTED);
        a.claimed_task = nonzero<TaskId>(r.u());
        a.last_seen_at = r.i(); a.created_at = r.i();
        uint64_t benches = r.u();
        for (uint64_t n = 0; n < benches; n++) {
            HashType type = static_cast<HashType>(r.u());
            Benchmark bench;
            bench.speed = r.f();
            bench.measured_at = r.i();
            a.benchmarks[type] = bench;
        }
        uint64_t projects = r.u();
        for (uint64_t n = 0; n < projects; n++) a.project_ids.insert(r.u());
        t.agents.restore(std::move(a));
    } else if (kind == "crack") {
        CrackResult c;
        c.id = r.u(); c.hash_item_id = r.u(); c.attack_id = r.u(); c.task_id = r.u();
        c.agent_id = r.u(); c.plaintext = r.s(); c.discovered_at = r.i();
        t.cracks.restore(std::move(c));
    } else if (kind == "agent_error") {
        AgentError e;
        e.id = r.u(); e.agent_id = r.u();
        e.task_id = nonzero<TaskId>(r.u());
        e.attack_id = nonzero<AttackId>(r.u());
        e.severity = r.e(Severity::FATAL); e.message = r.s(); e.created_at = r.i();
        t.agent_errors.restore(std::move(e));
    } else {
        throw std::runtime_error("unknown record type '" + kind + "'");
    }
    r.expect_end();
}

}  // namespace

uint32_t SnapshotBackend::compute_checksum(const std::string& body) {
    uint32_t hash = 2166136261u;  // FNV offset basis
    for (unsigned char c : body) {
        hash ^= c;
        hash *= 16777619u;        // FNV prime
    }
    return hash;
}

std::string SnapshotBackend::serialize(const Tables& tables) {
    std::ostringstream body;
    write_body(body, tables);
    std::string text = body.str();

    std::ostringstream out;
    out << HEADER << "\n";
    out << "# Do not modify manually - checksum protected\n";
    out << text;
    out << CHECKSUM_KEY << compute_checksum(text) << "\n";
    return out.str();
}

Status SnapshotBackend::deserialize(const std::string& text, Tables& tables) {
    std::istringstream in(text);
    std::string line;
    std::string body;
    std::vector<std::string> records;
    bool has_checksum = false;
    uint32_t expected = 0;
    int line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind(CHECKSUM_KEY, 0) == 0) {
            try {
                expected = static_cast<uint32_t>(std::stoul(line.substr(std::string(CHECKSUM_KEY).size())));
            } catch (const std::exception&) {
                return Error{ErrorCode::STORE_FAILURE, "bad checksum line " + std::to_string(line_number)};
            }
            has_checksum = true;
            continue;
        }
        if (has_checksum) {
            return Error{ErrorCode::STORE_FAILURE, "record after checksum at line " + std::to_string(line_number)};
        }
        body += line;
        body += '\n';
        records.push_back(line);
    }

    if (!has_checksum) {
        return Error{ErrorCode::STORE_FAILURE, "state file has no checksum (truncated?)"};
    }
    uint32_t computed = compute_checksum(body);
    if (computed != expected) {
        return Error{ErrorCode::STORE_FAILURE, "state file checksum mismatch: expected " +
                     std::to_string(expected) + ", got " + std::to_string(computed)};
    }

    Tables loaded;
    for (size_t n = 0; n < records.size(); n++) {
        try {
            RecordReader reader(records[n]);
            read_record(reader, loaded);
        } catch (const std::exception& e) {
            return Error{ErrorCode::STORE_FAILURE, "state record " + std::to_string(n + 1) + ": " + e.what()};
        }
    }

    tables = std::move(loaded);
    return Status::success();
}

Status SnapshotBackend::save(const Tables& tables) {
    std::filesystem::path path(path_);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return Error{ErrorCode::STORE_FAILURE, "cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    std::string temp_path = path_ + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            return Error{ErrorCode::STORE_FAILURE, "failed to create temp state file " + temp_path};
        }
        file << serialize(tables);
        file.flush();
        if (!file) return Error{ErrorCode::STORE_FAILURE, "failed writing " + temp_path};
    }

    // Force the bytes to disk before the rename makes them visible
#ifndef _WIN32
    {
        FILE* f = fopen(temp_path.c_str(), "r");
        if (f) {
            fsync(fileno(f));
            fclose(f);
        }
    }
#endif

    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        // Windows refuses to rename over an existing file
        std::filesystem::remove(path_, ec);
        std::filesystem::rename(temp_path, path_, ec);
        if (ec) return Error{ErrorCode::STORE_FAILURE, "failed to replace state file: " + ec.message()};
    }
    return Status::success();
}

Status SnapshotBackend::load(Tables& tables) {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return Status::success();  // No saved state yet
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return deserialize(buffer.str(), tables);
}

}  // namespace store
}  // namespace hashfleet
