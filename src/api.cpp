// ============================================================================
// api.cpp — implementation for api.hpp
// ============================================================================

#include "linkstation/api.hpp"
#include "linkstation/decoder.hpp"
#include "linkstation/json_codec.hpp"

#include <spdlog/spdlog.h>

namespace linkstation {

using json = nlohmann::json;
namespace cmd = decoder::cmd;

Api::Api(Context& ctx) : ctx_(ctx) {}

ApiReply Api::live(bool include_raw) const {
    return {200, codec::live_response(ctx_.cache().current(), include_raw)};
}

// ---------------------------------------------------------------------------
// info()
// ------
// Identity is not part of the poll battery; it is read on demand.
// ---------------------------------------------------------------------------
ApiReply Api::info() {
    decoder::ReplyBatch batch;
    json failed = json::array();
    json raw = json::object();

    for (const auto& c : decoder::info_battery()) {
        auto ex = ctx_.planner().query(c);
        if (!ex) continue;
        raw[c] = ex->lines;
        if (ex->ok()) batch[c] = ex->lines;
        else failed.push_back(c);
    }

    const bool any = !batch.empty();
    json body{{"ok", any}, {"timestamp", codec::now_ms()},
              {"error", any ? json(nullptr) : json("modem did not answer any identity query")},
              {"info", codec::to_json(decoder::decode_info(batch))},
              {"failed", std::move(failed)}, {"raw", std::move(raw)}};
    return {any ? 200 : 502, std::move(body)};
}

ApiReply Api::health() const {
    const auto s = ctx_.transport().session();
    const auto d = ctx_.cache().diagnostics();
    const auto snap = ctx_.cache().current();

    json recent = json::array();
    for (const auto& f : d.recent_failures)
        recent.push_back({{"cycle", f.cycle}, {"command", f.command}, {"reason", f.reason}});

    json body{
        {"ok", true},
        {"timestamp", codec::now_ms()},
        {"serial", {{"device", s.device_path.empty() ? json(nullptr) : json(s.device_path)},
                    {"baud", s.baud}, {"open", s.open},
                    {"interface", s.interface_id.empty() ? json(nullptr) : json(s.interface_id)},
                    {"reconnect_attempts", s.reconnect_attempts},
                    {"last_error", s.last_error.empty() ? json(nullptr) : json(s.last_error)}}},
        {"poller", {{"running", ctx_.cache().running()},
                    {"cycles_run", d.cycles_run}, {"cycles_published", d.cycles_published},
                    {"last_cycle", snap ? json(snap->cycle) : json(nullptr)},
                    {"recent_failures", std::move(recent)}}},
        {"control", {{"enabled", ctx_.switches().enabled.load()},
                     {"allow_dangerous", ctx_.switches().allow_dangerous.load()}}},
        {"gateway", {{"enabled", ctx_.gateway().enabled()}}}};
    return {200, std::move(body)};
}

ApiReply Api::control(const std::string& action, const json& body) {
    ActionKind kind;
    if (!name_to_action(action, kind)) {
        spdlog::info("[ctrl] action={} status=rejected reason=unknown-action", action);
        return {404, json{{"ok", false}, {"timestamp", codec::now_ms()}, {"action", action},
                          {"error", "unknown action: " + action}, {"detail", nullptr}}};
    }

    ActionRequest req;
    std::string err;
    if (!codec::parse_request(kind, body, req, err))
        return {400, codec::rejected_envelope(kind, err)};

    ControlAction a;
    if (!ctx_.planner().run(kind, req, a, err))
        return {400, codec::rejected_envelope(kind, err)};

    return {200, codec::envelope(a)};
}

// ---------------------------------------------------------------------------
// preference state (read-only, never gated)
// ---------------------------------------------------------------------------
static json query_error(const transport::CommandExchange& ex) {
    return ex.error.empty() ? json(transport::to_string(ex.outcome)) : json(ex.error);
}

ApiReply Api::roaming_state() {
    auto ex = ctx_.planner().query(cmd::kRoamPref);
    json body{{"timestamp", codec::now_ms()}};
    if (!ex || !ex->ok()) {
        body["ok"] = false;
        body["error"] = ex ? query_error(*ex) : json("query not permitted");
        body["roaming"] = {{"enabled", nullptr}, {"roam_pref", nullptr}};
        body["raw"] = nullptr;
        return {502, std::move(body)};
    }

    auto pref = decoder::decode_roam_pref(ex->lines);
    body["ok"] = pref.has_value();
    body["error"] = pref ? json(nullptr) : json("modem did not return a roam_pref value");
    // 1 = home network only; any other value allows roaming.
    body["roaming"] = {{"enabled", pref ? json(decoder::roaming_enabled(*pref)) : json(nullptr)},
                       {"roam_pref", pref ? json(*pref) : json(nullptr)}};
    body["raw"] = ex->lines;
    return {200, std::move(body)};
}

ApiReply Api::network_mode_state() {
    auto ex = ctx_.planner().query(cmd::kModePref);
    json body{{"timestamp", codec::now_ms()}};
    if (!ex || !ex->ok()) {
        body["ok"] = false;
        body["error"] = ex ? query_error(*ex) : json("query not permitted");
        body["mode"] = {{"mode_pref", nullptr}};
        body["raw"] = nullptr;
        return {502, std::move(body)};
    }

    auto mode = decoder::decode_mode_pref(ex->lines);
    body["ok"] = mode.has_value();
    body["error"] = mode ? json(nullptr) : json("modem did not return a mode_pref value");
    body["mode"] = {{"mode_pref", mode ? json(*mode) : json(nullptr)}};
    body["raw"] = ex->lines;
    return {200, std::move(body)};
}

ApiReply Api::band_preference_state() {
    struct Row { const char* command; const char* key; const char* field; };
    static const Row rows[] = {
        {cmd::kLteBandPref, "lte_band",      "lte_bands"},
        {cmd::kNsaBandPref, "nsa_nr5g_band", "nsa_nr5g_bands"},
        {cmd::kNrBandPref,  "nr5g_band",     "nr5g_bands"},
    };

    json bands = json::object();
    json raw = json::array();
    json errors = json::array();
    std::size_t answered = 0;

    for (const auto& row : rows) {
        auto ex = ctx_.planner().query(row.command);
        bands[row.field] = nullptr;
        if (!ex) continue;
        for (const auto& l : ex->lines) raw.push_back(l);
        if (!ex->ok()) {
            errors.push_back(std::string(row.command) + ": " + query_error(*ex).get<std::string>());
            continue;
        }
        ++answered;
        if (auto list = decoder::decode_band_pref(ex->lines, row.key)) bands[row.field] = *list;
    }

    json body{{"ok", answered > 0}, {"timestamp", codec::now_ms()},
              {"error", errors.empty() ? json(nullptr) : json(errors)},
              {"bands", std::move(bands)}, {"raw", std::move(raw)}};
    return {answered > 0 ? 200 : 502, std::move(body)};
}

} // namespace linkstation
