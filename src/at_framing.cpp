#include "linkstation/transport/at_framing.hpp"

namespace linkstation::transport {

static std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t')) --b;
    return s.substr(a, b - a);
}

Terminal detect_terminal(const std::string& buf, std::string* error_line) {
    if (buf.empty()) return Terminal::None;
    char last = buf.back();
    if (last != '\n' && last != '\r') return Terminal::None;   // last line still open

    // Walk back over the line terminator(s) to the start of the last complete line.
    std::size_t end = buf.size();
    while (end > 0 && (buf[end - 1] == '\n' || buf[end - 1] == '\r')) --end;
    if (end == 0) return Terminal::None;
    std::size_t start = buf.find_last_of("\r\n", end - 1);
    start = (start == std::string::npos) ? 0 : start + 1;

    const std::string line = trim(buf.substr(start, end - start));
    if (line == "OK") return Terminal::Ok;
    if (line == "ERROR" || line.rfind("+CME ERROR", 0) == 0 || line.rfind("+CMS ERROR", 0) == 0) {
        if (error_line) *error_line = line;
        return Terminal::Error;
    }
    return Terminal::None;
}

std::vector<std::string> split_lines(const std::string& buf) {
    std::vector<std::string> lines;
    std::string cur;
    for (std::size_t i = 0; i < buf.size(); ++i) {
        char c = buf[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(cur);
            cur.clear();
            if (c == '\r' && i + 1 < buf.size() && buf[i + 1] == '\n') ++i;
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) lines.push_back(cur);
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    // A reply usually starts with "\r\n"; that leading empty line carries nothing.
    if (!lines.empty() && lines.front().empty()) lines.erase(lines.begin());
    return lines;
}

} // namespace linkstation::transport
