// -----------------------------------------------------------------------------
// Implementation for at_tokens.hpp
//
// Parsing is done with strtol/strtoull for predictability; failure is always
// signaled by an empty optional, never by an exception.
// -----------------------------------------------------------------------------

#include "linkstation/at_tokens.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace linkstation::tokens {

static const std::string kEmpty;

std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace((unsigned char)s[a])) ++a;
    while (b > a && std::isspace((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}

std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string upper(std::string s) {
    for (auto& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    for (char c : s) {
        if (c == '"') { in_quotes = !in_quotes; continue; }
        if (c == ',' && !in_quotes) {
            out.push_back(trim(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    out.push_back(trim(cur));
    return out;
}

std::optional<std::string> payload_after(const std::string& line, const std::string& tag) {
    std::string l = trim(line);
    if (l.rfind(tag, 0) != 0) return std::nullopt;
    return trim(l.substr(tag.size()));
}

std::vector<std::string> payloads(const std::vector<std::string>& lines, const std::string& tag) {
    std::vector<std::string> out;
    for (const auto& l : lines)
        if (auto p = payload_after(l, tag)) out.push_back(*p);
    return out;
}

std::optional<int> parse_int(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty() || s == "-") return std::nullopt;
    errno = 0;
    char* e = nullptr;
    long v = std::strtol(s.c_str(), &e, 10);
    if (!e || *e || errno == ERANGE) return std::nullopt;
    if (v == -32768) return std::nullopt;
    if (v < -2147483647L || v > 2147483647L) return std::nullopt;
    return (int)v;
}

std::optional<int> parse_int(const std::string& s, long lo, long hi) {
    auto v = parse_int(s);
    if (!v || *v < lo || *v > hi) return std::nullopt;
    return v;
}

std::optional<std::uint64_t> parse_hex(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty() || s == "-") return std::nullopt;
    errno = 0;
    char* e = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &e, 16);
    if (!e || *e || errno == ERANGE) return std::nullopt;
    return (std::uint64_t)v;
}

std::optional<std::uint64_t> parse_u64(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty() || s[0] == '-') return std::nullopt;
    errno = 0;
    char* e = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &e, 10);
    if (!e || *e || errno == ERANGE) return std::nullopt;
    return (std::uint64_t)v;
}

const std::string& at(const std::vector<std::string>& v, std::size_t i) {
    return i < v.size() ? v[i] : kEmpty;
}

std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty() || s == "-") return std::nullopt;
    return s;
}

} // namespace linkstation::tokens
