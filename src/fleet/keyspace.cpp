// keyspace.cpp - Mask parsing, keyspace math and slice sizing

#include "keyspace.hpp"

#include <array>
#include <bitset>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>

namespace hashfleet {
namespace keyspace {

namespace {

using Charset = std::bitset<256>;

void add_range(Charset& set, unsigned char first, unsigned char last) {
    for (unsigned c = first; c <= last; c++) set.set(c);
}

bool builtin_charset(char symbol, Charset& out) {
    switch (symbol) {
        case 'l': add_range(out, 'a', 'z'); return true;
        case 'u': add_range(out, 'A', 'Z'); return true;
        case 'd': add_range(out, '0', '9'); return true;
        case 'h': add_range(out, '0', '9'); add_range(out, 'a', 'f'); return true;
        case 'H': add_range(out, '0', '9'); add_range(out, 'A', 'F'); return true;
        case 's':
            // Printable ASCII that is neither alphanumeric: space plus 32 symbols
            for (unsigned c = 0x20; c <= 0x7e; c++) {
                if (!std::isalnum(static_cast<int>(c))) out.set(c);
            }
            return true;
        case 'a': add_range(out, 0x20, 0x7e); return true;
        case 'b': add_range(out, 0x00, 0xff); return true;
    }
    return false;
}

Result<Charset> expand_custom(const std::string& definition, int index) {
    Charset set;
    for (size_t i = 0; i < definition.size(); i++) {
        char c = definition[i];
        if (c != '?') {
            set.set(static_cast<unsigned char>(c));
            continue;
        }
        if (i + 1 >= definition.size()) {
            return Error{ErrorCode::INVALID_ARGUMENT,
                         "custom charset ?" + std::to_string(index) + " ends with a bare '?'"};
        }
        char symbol = definition[++i];
        if (symbol == '?') {
            set.set('?');
        } else if (!builtin_charset(symbol, set)) {
            return Error{ErrorCode::INVALID_ARGUMENT, "custom charset ?" + std::to_string(index) +
                         " uses unsupported placeholder ?" + std::string(1, symbol)};
        }
    }
    if (set.none()) {
        return Error{ErrorCode::INVALID_ARGUMENT, "custom charset ?" + std::to_string(index) + " is empty"};
    }
    return set;
}

bool checked_mul(uint64_t a, uint64_t b, uint64_t& out) {
    if (a != 0 && b > (MAX_KEYSPACE - 1) / a) return false;
    out = a * b;
    return true;
}

bool checked_add(uint64_t a, uint64_t b, uint64_t& out) {
    if (b > (MAX_KEYSPACE - 1) - a) return false;
    out = a + b;
    return true;
}

Result<uint64_t> product(const std::vector<uint64_t>& sizes, size_t length) {
    uint64_t total = 1;
    for (size_t i = 0; i < length; i++) {
        if (!checked_mul(total, sizes[i], total)) {
            return Error{ErrorCode::INVALID_ARGUMENT, "mask keyspace exceeds 2^63"};
        }
    }
    return total;
}

Result<uint64_t> lines_of(const ResourceLookup& lookup, ResourceId id, ResourceKind kind) {
    const Resource* res = lookup ? lookup(id) : nullptr;
    if (!res) return Error{ErrorCode::NOT_FOUND, "resource #" + std::to_string(id) + " not found"};
    if (res->kind != kind) {
        return Error{ErrorCode::INVALID_ARGUMENT, "resource #" + std::to_string(id) + " is a " +
                     to_string(res->kind) + ", expected " + to_string(kind)};
    }
    if (res->line_count == 0) {
        return Error{ErrorCode::INVALID_ARGUMENT, "resource #" + std::to_string(id) + " is empty"};
    }
    return res->line_count;
}

}  // namespace

Result<std::vector<uint64_t>> position_sizes(const MaskPattern& pattern) {
    std::array<std::optional<Charset>, 4> custom;
    for (int n = 0; n < 4; n++) {
        if (pattern.custom_charsets[n].empty()) continue;
        auto set = expand_custom(pattern.custom_charsets[n], n + 1);
        if (!set) return set.error();
        custom[n] = set.value();
    }

    std::vector<uint64_t> sizes;
    const std::string& mask = pattern.mask;
    for (size_t i = 0; i < mask.size(); i++) {
        if (mask[i] != '?') {
            sizes.push_back(1);
            continue;
        }
        if (i + 1 >= mask.size()) {
            return Error{ErrorCode::INVALID_ARGUMENT, "mask ends with a bare '?'"};
        }
        char symbol = mask[++i];
        if (symbol == '?') {
            sizes.push_back(1);
        } else if (symbol >= '1' && symbol <= '4') {
            const auto& set = custom[symbol - '1'];
            if (!set) {
                return Error{ErrorCode::INVALID_ARGUMENT,
                             std::string("mask uses ?") + symbol + " but that charset is not defined"};
            }
            sizes.push_back(set->count());
        } else {
            Charset set;
            if (!builtin_charset(symbol, set)) {
                return Error{ErrorCode::INVALID_ARGUMENT,
                             std::string("unknown mask placeholder ?") + symbol};
            }
            sizes.push_back(set.count());
        }
    }

    if (sizes.empty()) return Error{ErrorCode::INVALID_ARGUMENT, "mask is empty"};
    return sizes;
}

Result<uint64_t> mask_keyspace(const MaskPattern& pattern) {
    auto sizes = position_sizes(pattern);
    if (!sizes) return sizes.error();
    const auto& pos = sizes.value();

    if (!pattern.increment) return product(pos, pos.size());

    size_t lo = pattern.increment_min == 0 ? 1 : pattern.increment_min;
    size_t hi = pattern.increment_max == 0 ? pos.size() : pattern.increment_max;
    if (lo > hi || hi > pos.size()) {
        return Error{ErrorCode::INVALID_ARGUMENT, "increment range [" + std::to_string(lo) + ", " +
                     std::to_string(hi) + "] does not fit a mask of length " + std::to_string(pos.size())};
    }

    uint64_t total = 0;
    for (size_t len = lo; len <= hi; len++) {
        auto part = product(pos, len);
        if (!part) return part.error();
        if (!checked_add(total, part.value(), total)) {
            return Error{ErrorCode::INVALID_ARGUMENT, "mask keyspace exceeds 2^63"};
        }
    }
    return total;
}

Result<uint64_t> compute(const AttackSpec& spec, const ResourceLookup& lookup) {
    if (const auto* d = std::get_if<DictionaryAttack>(&spec)) {
        auto words = lines_of(lookup, d->wordlist, ResourceKind::WORDLIST);
        if (!words) return words.error();
        uint64_t rules = 1;
        if (d->rules) {
            auto r = lines_of(lookup, *d->rules, ResourceKind::RULES);
            if (!r) return r.error();
            rules = r.value();
        }
        uint64_t total = 0;
        if (!checked_mul(words.value(), rules, total)) {
            return Error{ErrorCode::INVALID_ARGUMENT, "dictionary keyspace exceeds 2^63"};
        }
        return total;
    }

    if (const auto* m = std::get_if<MaskAttack>(&spec)) {
        return mask_keyspace(m->pattern);
    }

    const auto& h = std::get<HybridAttack>(spec);
    auto words = lines_of(lookup, h.wordlist, ResourceKind::WORDLIST);
    if (!words) return words.error();
    auto masks = mask_keyspace(h.pattern);
    if (!masks) return masks.error();
    uint64_t total = 0;
    if (!checked_mul(words.value(), masks.value(), total)) {
        return Error{ErrorCode::INVALID_ARGUMENT, "hybrid keyspace exceeds 2^63"};
    }
    return total;
}

int complexity_bucket(uint64_t keyspace) {
    if (keyspace < 1'000'000ULL) return 1;
    if (keyspace < 1'000'000'000ULL) return 2;
    if (keyspace < 1'000'000'000'000ULL) return 3;
    if (keyspace < 1'000'000'000'000'000ULL) return 4;
    return 5;
}

}  // namespace keyspace

uint64_t KeyspaceSlicer::slice_size(double speed, uint64_t remaining) const {
    if (remaining == 0) return 0;

    double wanted = speed * static_cast<double>(settings_.target_seconds);
    uint64_t size;
    if (!(wanted > 0.0)) {
        size = 0;
    } else if (wanted >= static_cast<double>(keyspace::MAX_KEYSPACE)) {
        size = keyspace::MAX_KEYSPACE - 1;
    } else {
        size = static_cast<uint64_t>(std::llround(wanted));
    }

    if (settings_.max_keyspace > 0 && size > settings_.max_keyspace) size = settings_.max_keyspace;
    if (size < settings_.min_keyspace) size = settings_.min_keyspace;
    if (size == 0) size = 1;
    return size < remaining ? size : remaining;
}

std::pair<uint64_t, uint64_t> KeyspaceSlicer::next_range(const Attack& attack, double speed) const {
    if (attack.fully_sliced()) return {attack.total_keyspace, 0};
    uint64_t remaining = attack.total_keyspace - attack.sliced_keyspace;
    return {attack.sliced_keyspace, slice_size(speed, remaining)};
}

}  // namespace hashfleet
