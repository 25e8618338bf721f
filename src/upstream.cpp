// ============================================================================
// upstream.cpp — shared helpers for upstream.hpp
// ============================================================================

#include "linkstation/stream/upstream.hpp"

#include <algorithm>
#include <cctype>

namespace linkstation::stream {

const char* to_string(UpstreamStatus s) {
    switch (s) {
        case UpstreamStatus::Ok:          return "ok";
        case UpstreamStatus::Unreachable: return "unreachable";
        case UpstreamStatus::Timeout:     return "timeout";
        case UpstreamStatus::TooLarge:    return "too-large";
        case UpstreamStatus::Aborted:     return "aborted";
    }
    return "unknown";
}

static std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool BodyBuffer::append(const char* data, std::size_t n) {
    if (overflowed_) return false;
    if (limit_ != 0 && n > limit_ - std::min(limit_, out_.size())) {
        overflowed_ = true;
        return false;
    }
    out_.append(data, n);
    return true;
}

const std::string* UpstreamResponse::header(const std::string& name) const {
    auto it = headers.find(lower_copy(name));
    return it == headers.end() ? nullptr : &it->second;
}

} // namespace linkstation::stream
