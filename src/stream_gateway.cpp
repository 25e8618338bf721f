// ============================================================================
// stream_gateway.cpp — implementation for stream_gateway.hpp
// ============================================================================

#include "linkstation/stream/stream_gateway.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace linkstation::stream {

using json = nlohmann::json;

const char* to_string(GatewayError e) {
    switch (e) {
        case GatewayError::None:           return "none";
        case GatewayError::Unreachable:    return "upstream-unreachable";
        case GatewayError::Timeout:        return "upstream-timeout";
        case GatewayError::Disabled:       return "disabled";
        case GatewayError::Validation:     return "validation";
        case GatewayError::UpstreamStatus: return "upstream-status";
        case GatewayError::TooLarge:       return "upstream-too-large";
        case GatewayError::Aborted:        return "aborted";
    }
    return "unknown";
}

static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

const std::string* GatewayResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return &h.second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// response builders
// ---------------------------------------------------------------------------
static std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static GatewayResponse failure(int status, GatewayError e, std::string detail) {
    GatewayResponse r;
    r.status = status;
    r.error = e;
    r.detail = std::move(detail);
    r.headers.emplace_back("Content-Type", "application/json");
    r.body = dump(json{{"ok", false}, {"error", to_string(e)}, {"detail", r.detail}});
    return r;
}

static GatewayResponse disabled() {
    return failure(503, GatewayError::Disabled, "media integration disabled");
}

static GatewayResponse invalid(const std::string& detail) {
    return failure(400, GatewayError::Validation, detail);
}

// Transport failure or non-2xx; nullopt when the upstream answer is usable.
static std::optional<GatewayResponse> upstream_failure(const std::string& what, const UpstreamResponse& up) {
    if (up.status == UpstreamStatus::Timeout)
        return failure(502, GatewayError::Timeout, what + " failed: " + up.error);
    if (up.status == UpstreamStatus::Unreachable)
        return failure(502, GatewayError::Unreachable, what + " failed: " + up.error);
    if (up.status == UpstreamStatus::TooLarge)
        return failure(502, GatewayError::TooLarge, what + " failed: " + up.error);
    if (up.status == UpstreamStatus::Aborted)
        return failure(502, GatewayError::Aborted, what + " failed: " + up.error);
    if (up.http_status < 200 || up.http_status > 299)
        return failure(502, GatewayError::UpstreamStatus,
                       what + " failed: upstream returned " + std::to_string(up.http_status));
    return std::nullopt;
}

static GatewayResponse json_response(const json& data) {
    GatewayResponse r;
    r.status = 200;
    r.headers.emplace_back("Content-Type", "application/json");
    r.body = dump(data);
    return r;
}

static void log_result(const std::string& what, const std::string& id, const GatewayResponse& r) {
    if (r.ok()) spdlog::debug("[gateway] {} id={} status={}", what, id.empty() ? "-" : id, r.status);
    else spdlog::warn("[gateway] {} id={} status={} error={} reason={}",
                      what, id.empty() ? "-" : id, r.status, to_string(r.error), r.detail);
}

// ---------------------------------------------------------------------------
// StreamGateway
// ---------------------------------------------------------------------------
StreamGateway::StreamGateway(IUpstream& upstream, GatewayConfig cfg)
: up_(upstream), cfg_(std::move(cfg)), upstream_host_(location_host(cfg_.base_url)), enabled_(cfg_.enabled) {}

bool StreamGateway::describe(const std::string& id, const std::string& profile,
                             StreamDescriptor& out, std::string& err) const {
    if (profile != "sub" && profile != "main") {
        err = "invalid profile: " + profile + " (expected sub or main)";
        return false;
    }
    if (!safe_component(id)) {
        err = "invalid camera id";
        return false;
    }
    out.camera_id = id;
    out.profile = profile;
    out.playlist_path = "/live/" + id + "/" + profile + "/index.m3u8";
    out.upstream_base = cfg_.base_url;
    return true;
}

UpstreamResponse StreamGateway::fetch(const std::string& path, std::chrono::milliseconds timeout,
                                      std::vector<std::pair<std::string, std::string>> headers,
                                      std::size_t max_body, IBodySink* sink) {
    std::string base = cfg_.base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();

    UpstreamRequest req;
    req.url = base + path;
    req.headers = std::move(headers);
    req.timeout = timeout;
    req.max_body = max_body ? max_body : cfg_.max_body_bytes;
    req.sink = sink;
    return up_.get(req);
}

GatewayResponse StreamGateway::fetch_json(const std::string& what, const std::string& path, json& out) {
    auto up = fetch(path, cfg_.timeout);
    if (auto bad = upstream_failure(what, up)) return *bad;

    out = json::parse(up.body, nullptr, false);
    if (out.is_discarded())
        return failure(502, GatewayError::UpstreamStatus, what + " failed: upstream body is not JSON");
    return GatewayResponse{};
}

GatewayResponse StreamGateway::proxy_live(const std::string& what, const std::string& id,
                                          const std::string& profile, const std::string& file,
                                          const char* default_type) {
    if (!enabled()) return disabled();

    StreamDescriptor d;
    std::string err;
    if (!describe(id, profile, d, err)) return invalid(err);
    if (!safe_component(file)) return invalid("invalid file name");

    auto up = fetch("/live/" + id + "/" + profile + "/" + file, cfg_.timeout);
    if (auto bad = upstream_failure(what, up)) return *bad;

    GatewayResponse r;
    r.status = 200;
    const std::string* ct = up.header("content-type");
    r.headers.emplace_back("Content-Type", ct ? *ct : std::string(default_type));
    r.body = std::move(up.body);
    return r;
}

GatewayResponse StreamGateway::playlist(const std::string& id, const std::string& profile) {
    auto r = proxy_live("playlist", id, profile, "index.m3u8", "application/vnd.apple.mpegurl");
    if (r.ok()) {
        r.headers.emplace_back("Cache-Control", "no-cache, no-store, must-revalidate");
        r.headers.emplace_back("Pragma", "no-cache");
        r.headers.emplace_back("Expires", "0");
    }
    log_result("playlist", id, r);
    return r;
}

GatewayResponse StreamGateway::segment(const std::string& id, const std::string& profile,
                                       const std::string& file) {
    if (file == "index.m3u8") return playlist(id, profile);
    auto r = proxy_live("segment", id, profile, file, "video/mp2t");
    if (r.ok())
        r.headers.emplace_back("Cache-Control", "public, max-age=" + std::to_string(cfg_.segment_max_age_s));
    log_result("segment", id, r);
    return r;
}

// ---------------------------------------------------------------------------
// recording files
// ---------------
// Byte-range passthrough. 2xx and 4xx answers are mirrored with their status
// (206 with Content-Range, 416 with "bytes */size"); without a Range header the
// full file comes back as 200. 3xx, 5xx and transport failures are 502.
// ---------------------------------------------------------------------------
static bool passthrough(long http_status) {
    return (http_status >= 200 && http_status <= 299) || (http_status >= 400 && http_status <= 499);
}

static const std::string* find_header(const std::map<std::string, std::string>& hdrs, const char* name) {
    auto it = hdrs.find(name);
    return it == hdrs.end() ? nullptr : &it->second;
}

// `body_size` stands in for a missing Content-Length when the body was buffered.
static std::vector<std::pair<std::string, std::string>>
recording_headers(long http_status, const std::map<std::string, std::string>& up,
                  std::optional<std::size_t> body_size) {
    std::vector<std::pair<std::string, std::string>> out;
    const bool success = http_status >= 200 && http_status <= 299;

    if (const std::string* ct = find_header(up, "content-type")) out.emplace_back("Content-Type", *ct);
    else if (success) out.emplace_back("Content-Type", "video/mp4");

    if (const std::string* cl = find_header(up, "content-length")) out.emplace_back("Content-Length", *cl);
    else if (body_size) out.emplace_back("Content-Length", std::to_string(*body_size));

    if (const std::string* cr = find_header(up, "content-range")) out.emplace_back("Content-Range", *cr);

    const std::string* ar = find_header(up, "accept-ranges");
    out.emplace_back("Accept-Ranges", ar ? *ar : std::string("bytes"));

    if (const std::string* etag = find_header(up, "etag")) out.emplace_back("ETag", *etag);
    return out;
}

bool StreamGateway::recording_request(const std::string& id, const std::string& date, const std::string& file,
                                      const std::optional<std::string>& range,
                                      const std::optional<std::string>& if_range,
                                      std::string& path, std::vector<std::pair<std::string, std::string>>& fwd,
                                      GatewayResponse& bad) const {
    if (!enabled()) { bad = disabled(); return false; }
    if (!safe_component(id) || !safe_component(date) || !safe_component(file)) {
        bad = invalid("invalid recording path");
        return false;
    }
    path = "/v1/recordings/" + id + "/files/" + date + "/" + file;
    if (range && !range->empty()) fwd.emplace_back("Range", *range);
    if (if_range && !if_range->empty()) fwd.emplace_back("If-Range", *if_range);
    return true;
}

static std::optional<GatewayResponse> recording_failure(const UpstreamResponse& up) {
    if (up.status == UpstreamStatus::Ok && passthrough(up.http_status)) return std::nullopt;
    auto bad = upstream_failure("recording file", up);
    if (bad) return bad;
    return failure(502, GatewayError::UpstreamStatus,
                   "recording file failed: upstream returned " + std::to_string(up.http_status));
}

GatewayResponse StreamGateway::recording_file(const std::string& id, const std::string& date,
                                              const std::string& file,
                                              const std::optional<std::string>& range,
                                              const std::optional<std::string>& if_range) {
    std::string path;
    std::vector<std::pair<std::string, std::string>> fwd;
    GatewayResponse r;
    if (!recording_request(id, date, file, range, if_range, path, fwd, r)) return r;

    auto up = fetch(path, cfg_.file_timeout, std::move(fwd), cfg_.max_file_bytes);
    if (auto bad = recording_failure(up)) {
        log_result("recording", id, *bad);
        return *bad;
    }

    r.status = static_cast<int>(up.http_status);
    r.headers = recording_headers(up.http_status, up.headers, up.body.size());
    r.body = std::move(up.body);
    log_result("recording", id, r);
    return r;
}

namespace {

// Forwards passthrough answers to the client sink as they arrive.
class RecordingRelay : public IBodySink {
public:
    explicit RecordingRelay(IResponseSink& out) : out_(out) {}

    bool begin(long http_status, const std::map<std::string, std::string>& headers) override {
        if (!passthrough(http_status)) return false;
        status_ = static_cast<int>(http_status);
        headers_ = recording_headers(http_status, headers, std::nullopt);
        refused_ = !out_.begin(status_, headers_);
        return true;
    }
    bool write(const char* data, std::size_t n) override {
        if (refused_) return false;
        bytes_ += n;
        return out_.write(data, n);
    }

    int status() const { return status_; }
    const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }
    std::size_t bytes() const { return bytes_; }

private:
    IResponseSink& out_;
    int status_{0};
    std::vector<std::pair<std::string, std::string>> headers_;
    bool refused_{false};
    std::size_t bytes_{0};
};

} // namespace

GatewayResponse StreamGateway::stream_recording_file(const std::string& id, const std::string& date,
                                                     const std::string& file,
                                                     const std::optional<std::string>& range,
                                                     const std::optional<std::string>& if_range,
                                                     IResponseSink& out) {
    std::string path;
    std::vector<std::pair<std::string, std::string>> fwd;
    GatewayResponse r;
    if (!recording_request(id, date, file, range, if_range, path, fwd, r)) return r;

    RecordingRelay relay(out);
    auto up = fetch(path, cfg_.file_timeout, std::move(fwd), cfg_.max_body_bytes, &relay);

    if (!up.streamed) {
        auto bad = recording_failure(up);
        if (!bad) bad = failure(502, GatewayError::UpstreamStatus, "recording file failed: relay not started");
        log_result("recording", id, *bad);
        return *bad;
    }

    r.streamed = true;
    r.status = relay.status();
    r.headers = relay.headers();
    if (up.status != UpstreamStatus::Ok) {
        r.error = up.status == UpstreamStatus::Timeout ? GatewayError::Timeout
                : up.status == UpstreamStatus::Aborted ? GatewayError::Aborted
                : GatewayError::Unreachable;
        r.detail = "recording file interrupted after " + std::to_string(relay.bytes()) + " bytes: " + up.error;
    }
    log_result("recording", id, r);
    return r;
}

// ---------------------------------------------------------------------------
// metadata
// ---------------------------------------------------------------------------
GatewayResponse StreamGateway::health() {
    if (!enabled()) return disabled();
    json data;
    auto r = fetch_json("health", "/v1/health", data);
    if (!r.ok()) { log_result("health", "", r); return r; }

    json out = {{"ok", true}, {"ts", data.is_object() && data.contains("ts") ? data["ts"] : json(nullptr)}};
    rewrite_locations(data, "", cfg_.public_endpoint, upstream_host_);
    out["nvr"] = std::move(data);
    return json_response(out);
}

GatewayResponse StreamGateway::cameras() {
    if (!enabled()) return disabled();
    json data;
    auto r = fetch_json("cameras", "/v1/cameras", data);
    if (!r.ok()) { log_result("cameras", "", r); return r; }

    auto n = rewrite_locations(data, "", cfg_.public_endpoint, upstream_host_);
    spdlog::debug("[gateway] cameras rewritten={}", n);
    return json_response(data);
}

GatewayResponse StreamGateway::camera_stream(const std::string& id) {
    if (!enabled()) return disabled();
    if (!safe_component(id)) return invalid("invalid camera id");

    json data;
    auto r = fetch_json("stream", "/v1/cameras/" + id + "/stream", data);
    if (!r.ok()) { log_result("stream", id, r); return r; }

    rewrite_locations(data, id, cfg_.public_endpoint, upstream_host_);
    return json_response(data);
}

GatewayResponse StreamGateway::live_hls(const std::string& id, const std::string& profile) {
    if (!enabled()) return disabled();
    StreamDescriptor d;
    std::string err;
    if (!describe(id, profile, d, err)) return invalid(err);

    json data;
    auto r = fetch_json("live-hls", "/v1/cameras/" + id + "/live-hls?profile=" + profile, data);
    if (!r.ok()) { log_result("live-hls", id, r); return r; }

    // A descriptor was issued, so the camera answered and accepted our credentials.
    if (data.is_object()) {
        auto cam = data.find("camera");
        if (cam != data.end() && cam->is_object()) {
            (*cam)["online"] = true;
            (*cam)["auth"] = "ok";
            if (cam->contains("auth_status")) (*cam)["auth_status"] = "ok";
        }
    }
    rewrite_locations(data, id, cfg_.public_endpoint, upstream_host_);
    return json_response(data);
}

GatewayResponse StreamGateway::recordings() {
    if (!enabled()) return disabled();
    json data;
    auto r = fetch_json("recordings", "/v1/recordings", data);
    if (!r.ok()) { log_result("recordings", "", r); return r; }

    rewrite_locations(data, "", cfg_.public_endpoint, upstream_host_);
    return json_response(data);
}

GatewayResponse StreamGateway::recording_days(const std::string& id) {
    if (!enabled()) return disabled();
    if (!safe_component(id)) return invalid("invalid camera id");

    json data;
    auto r = fetch_json("recording days", "/v1/recordings/" + id + "/days", data);
    if (!r.ok()) { log_result("days", id, r); return r; }

    rewrite_locations(data, id, cfg_.public_endpoint, upstream_host_);
    return json_response(data);
}

// Last path element of an absolute or relative URL, query and fragment dropped.
static std::string file_of(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = (slash == std::string::npos) ? std::string() : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto last = path.rfind('/');
    return last == std::string::npos ? path : path.substr(last + 1);
}

GatewayResponse StreamGateway::recording_segments(const std::string& id, const std::string& date,
                                                  const std::string& public_base) {
    if (!enabled()) return disabled();
    if (!safe_component(id) || !safe_component(date)) return invalid("invalid recording path");

    json data;
    auto r = fetch_json("recording segments", "/v1/recordings/" + id + "/days/" + date + "/segments", data);
    if (!r.ok()) { log_result("segments", id, r); return r; }

    std::string base = public_base;
    while (!base.empty() && base.back() == '/') base.pop_back();

    // File names come from the upstream URLs, so collect them before the walk
    // nulls those; the gateway URLs are set after it.
    std::vector<std::string> files;
    json* segs = nullptr;
    if (data.is_object()) {
        auto it = data.find("segments");
        if (it != data.end() && it->is_array()) segs = &*it;
    }
    if (segs) {
        for (auto& seg : *segs) {
            std::string file;
            if (seg.is_object() && seg.contains("url")) {
                auto fn = seg.find("filename");
                if (fn != seg.end() && fn->is_string()) file = fn->get<std::string>();
                else if (seg["url"].is_string()) file = file_of(seg["url"].get<std::string>());
            }
            files.push_back(std::move(file));
        }
    }

    rewrite_locations(data, id, cfg_.public_endpoint, upstream_host_);

    if (segs) {
        for (std::size_t i = 0; i < segs->size() && i < files.size(); ++i) {
            auto& seg = (*segs)[i];
            if (!seg.is_object() || !seg.contains("url")) continue;
            if (safe_component(files[i]))
                seg["url"] = base + "/v1/nvr/recordings/" + id + "/files/" + date + "/" + files[i];
            else
                seg["url"] = nullptr;
        }
    }
    return json_response(data);
}

} // namespace linkstation::stream
