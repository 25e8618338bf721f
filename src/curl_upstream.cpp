// ============================================================================
// curl_upstream.cpp — implementation for curl_upstream.hpp
// ============================================================================

#include "linkstation/stream/curl_upstream.hpp"

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>

namespace linkstation::stream {

// ---------------------------------------------------------------------------
// Transfer
// --------
// Per-request state shared by the write callback. The sink is offered the body
// on the first chunk, when status and headers are complete.
// ---------------------------------------------------------------------------
struct Transfer {
    CURL* curl{nullptr};
    IBodySink* sink{nullptr};
    UpstreamResponse* resp{nullptr};
    BodyBuffer buffer;
    bool offered{false};
    bool aborted{false};

    Transfer(CURL* c, const UpstreamRequest& req, UpstreamResponse& r)
    : curl(c), sink(req.sink), resp(&r), buffer(r.body, req.max_body) {}

    void offer() {
        if (offered || !sink) return;
        offered = true;
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        resp->streamed = sink->begin(code, resp->headers);
    }
};

// ---------------------------------------------------------------------------
// curl callbacks
// ---------------------------------------------------------------------------
static std::size_t write_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const std::size_t n = size * nmemb;
    t->offer();
    if (t->resp->streamed) {
        if (!t->sink->write(ptr, n)) {
            t->aborted = true;
            return 0;
        }
        return n;
    }
    return t->buffer.append(ptr, n) ? n : 0;
}

// Called once per header line, status line included. A new status line starts a
// fresh header set (100-continue, proxies).
static std::size_t header_cb(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    auto* hdrs = static_cast<std::map<std::string, std::string>*>(userdata);
    const std::size_t n = size * nitems;
    std::string line(buffer, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    if (line.compare(0, 5, "HTTP/") == 0) {
        hdrs->clear();
        return n;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos) return n;

    std::string key = line.substr(0, colon);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string val = line.substr(colon + 1);
    auto b = val.find_first_not_of(" \t");
    val = (b == std::string::npos) ? std::string() : val.substr(b);
    (*hdrs)[key] = val;
    return n;
}

// ---------------------------------------------------------------------------
// CurlGlobal
// ---------------------------------------------------------------------------
CurlGlobal::CurlGlobal() {
    ok_ = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
    if (!ok_) spdlog::error("[upstream] status=error reason=curl_global_init-failed");
}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

// ---------------------------------------------------------------------------
// CurlUpstream
// ---------------------------------------------------------------------------
CurlUpstream::CurlUpstream(std::chrono::milliseconds connect_timeout)
: connect_timeout_(connect_timeout) {}

UpstreamResponse CurlUpstream::get(const UpstreamRequest& req) {
    UpstreamResponse r;

    CURL* curl = curl_easy_init();
    if (!curl) {
        r.error = "curl_easy_init failed";
        return r;
    }

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min(connect_timeout_, req.timeout).count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    Transfer transfer(curl, req, r);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &r.headers);

    struct curl_slist* headers = nullptr;
    for (const auto& h : req.headers) {
        const std::string line = h.first + ": " + h.second;
        headers = curl_slist_append(headers, line.c_str());
    }
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) transfer.offer();   // empty body

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OK) {
        r.status = UpstreamStatus::Ok;
        r.http_status = http_code;
        spdlog::debug("[upstream] GET {} http={} bytes={}", req.url, http_code, r.body.size());
        return r;
    }

    if (res == CURLE_WRITE_ERROR && transfer.buffer.overflowed()) {
        r.status = UpstreamStatus::TooLarge;
        r.error = "body exceeds " + std::to_string(req.max_body) + " bytes";
    } else if (res == CURLE_WRITE_ERROR && transfer.aborted) {
        r.status = UpstreamStatus::Aborted;
        r.error = "receiver stopped the transfer";
    } else {
        r.status = (res == CURLE_OPERATION_TIMEDOUT) ? UpstreamStatus::Timeout : UpstreamStatus::Unreachable;
        r.error = curl_easy_strerror(res);
    }
    r.http_status = http_code;
    if (!r.streamed) r.headers.clear();
    r.body.clear();
    spdlog::warn("[upstream] GET {} status={} reason={}", req.url, to_string(r.status), r.error);
    return r;
}

} // namespace linkstation::stream
