// ============================================================================
// url_rewrite.cpp — implementation for url_rewrite.hpp
// ============================================================================

#include "linkstation/stream/url_rewrite.hpp"

#include <array>
#include <cstdlib>
#include <cerrno>

namespace linkstation::stream {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// dotted_quad()
// -------------
// Strict a.b.c.d with 1-3 digits per part and each part <= 255.
// ---------------------------------------------------------------------------
static std::optional<std::array<int, 4>> dotted_quad(const std::string& s) {
    std::array<int, 4> out{};
    int parts = 0;
    std::size_t pos = 0;
    while (pos <= s.size()) {
        std::size_t dot = s.find('.', pos);
        std::string part = s.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 3 || parts == 4) return std::nullopt;
        for (char c : part) if (c < '0' || c > '9') return std::nullopt;
        errno = 0;
        long value = std::strtol(part.c_str(), nullptr, 10);
        if (errno != 0 || value > 255) return std::nullopt;
        out[parts++] = static_cast<int>(value);
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    if (parts != 4) return std::nullopt;
    return out;
}

static std::string lower(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    return s;
}

// Parsed pieces of scheme://[userinfo@]host[:port][path]
struct Location {
    std::string scheme;    // lower-cased
    std::string userinfo;  // including the trailing '@'
    std::string host;      // lower-cased, brackets stripped
    std::string rest;      // path, query and fragment
};

static std::optional<Location> split_location(const std::string& url) {
    const auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;
    const char first = url[0];
    if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z'))) return std::nullopt;
    for (std::size_t i = 1; i < sep; ++i) {
        const char c = url[i];
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '+' || c == '-' || c == '.';
        if (!ok) return std::nullopt;
    }

    Location loc;
    loc.scheme = lower(url.substr(0, sep));
    const std::size_t auth_begin = sep + 3;
    std::size_t auth_end = url.find_first_of("/?#", auth_begin);
    if (auth_end == std::string::npos) auth_end = url.size();
    std::string authority = url.substr(auth_begin, auth_end - auth_begin);
    loc.rest = url.substr(auth_end);

    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        loc.userinfo = authority.substr(0, at + 1);
        authority.erase(0, at + 1);
    }
    if (!authority.empty() && authority[0] == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        loc.host = authority.substr(1, close - 1);
    } else {
        loc.host = authority.substr(0, authority.find(':'));
    }
    if (loc.host.empty()) return std::nullopt;
    loc.host = lower(loc.host);
    return loc;
}

std::optional<int> public_port(const std::string& id, const PublicEndpoint& ep) {
    auto quad = dotted_quad(id);
    if (!quad) return std::nullopt;
    const int offset = (*quad)[3] - ep.octet_base;
    if (offset < 1) return std::nullopt;
    const int port = ep.base_port + offset;
    if (port > 65535) return std::nullopt;
    return port;
}

bool is_stream_location(const std::string& s) {
    auto loc = split_location(s);
    if (!loc) return false;
    return loc->scheme == "rtsp" || loc->scheme == "rtsps" || loc->scheme == "rtmp";
}

std::string location_host(const std::string& s) {
    auto loc = split_location(s);
    return loc ? loc->host : std::string();
}

bool is_private_address(const std::string& host) {
    const std::string h = lower(host);
    if (auto q = dotted_quad(h)) {
        const auto& o = *q;
        if (o[0] == 10 || o[0] == 127) return true;
        if (o[0] == 172 && o[1] >= 16 && o[1] <= 31) return true;
        if (o[0] == 192 && o[1] == 168) return true;
        if (o[0] == 169 && o[1] == 254) return true;
        if (o[0] == 0) return true;
        return false;
    }
    if (h.find(':') == std::string::npos) return false;
    if (h == "::1" || h == "::") return true;
    if (h.rfind("::ffff:", 0) == 0) return is_private_address(h.substr(7));
    if (h.size() >= 2 && (h.compare(0, 2, "fc") == 0 || h.compare(0, 2, "fd") == 0)) return true;
    if (h.size() >= 3 && h.compare(0, 2, "fe") == 0 && h[2] >= '8' && h[2] <= 'b') return true;
    return false;
}

std::optional<std::string> rewrite_location(const std::string& url, const std::string& id,
                                            const PublicEndpoint& ep) {
    if (ep.host.empty()) return std::nullopt;
    auto port = public_port(id, ep);
    if (!port) return std::nullopt;

    const auto sep = url.find("://");
    auto loc = split_location(url);
    if (!loc) return std::nullopt;
    return url.substr(0, sep) + "://" + loc->userinfo + ep.host + ":" + std::to_string(*port) + loc->rest;
}

std::optional<std::string> gateway_path(const std::string& url) {
    auto loc = split_location(url);
    if (!loc || (loc->scheme != "http" && loc->scheme != "https")) return std::nullopt;
    std::string path = loc->rest.substr(0, loc->rest.find('#'));

    static const std::string kLive = "/live/";
    static const std::string kRecordings = "/v1/recordings/";
    if (path.compare(0, kLive.size(), kLive) == 0 && path.size() > kLive.size()) return path;
    if (path.compare(0, kRecordings.size(), kRecordings) == 0 && path.size() > kRecordings.size())
        return "/v1/nvr/recordings/" + path.substr(kRecordings.size());
    return std::nullopt;
}

static bool internal_host(const std::string& host, const std::string& scope, const std::string& upstream_host) {
    if (host.empty()) return false;
    if (!upstream_host.empty() && host == lower(upstream_host)) return true;
    if (!scope.empty() && host == lower(scope)) return true;
    if (host == "localhost") return true;
    return is_private_address(host);
}

static std::size_t walk(json& node, const std::string& id, const PublicEndpoint& ep,
                        const std::string& upstream_host) {
    std::size_t touched = 0;
    if (node.is_object()) {
        std::string scope = id;
        auto ip = node.find("ip");
        if (ip != node.end() && ip->is_string()) scope = ip->get<std::string>();
        for (auto& item : node.items()) touched += walk(item.value(), scope, ep, upstream_host);
    } else if (node.is_array()) {
        for (auto& item : node) touched += walk(item, id, ep, upstream_host);
    } else if (node.is_string()) {
        const auto s = node.get<std::string>();
        if (is_stream_location(s)) {
            auto rewritten = rewrite_location(s, id, ep);
            if (rewritten) node = *rewritten;
            else node = nullptr;
            ++touched;
        } else if (internal_host(location_host(s), id, upstream_host)) {
            auto path = gateway_path(s);
            if (path) node = *path;
            else node = nullptr;
            ++touched;
        }
    }
    return touched;
}

std::size_t rewrite_locations(json& doc, const std::string& id, const PublicEndpoint& ep,
                              const std::string& upstream_host) {
    return walk(doc, id, ep, upstream_host);
}

bool safe_component(const std::string& s) {
    if (s.empty() || s == "." || s.find("..") != std::string::npos) return false;
    for (unsigned char c : s) {
        if (c == '/' || c == '\\' || c == '?' || c == '#' || c == '%' || c <= 0x20 || c == 0x7f)
            return false;
    }
    return true;
}

} // namespace linkstation::stream
