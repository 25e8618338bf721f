// ============================================================================
// json_codec.cpp — implementation for json_codec.hpp
// ============================================================================

#include "linkstation/json_codec.hpp"
#include "linkstation/decoder.hpp"

namespace linkstation::codec {

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------
template <typename T>
static json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

static json opt_quality(const std::optional<Quality>& q) {
    return q ? json(to_string(*q)) : json(nullptr);
}

std::int64_t to_ms(std::chrono::system_clock::time_point t) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

std::int64_t now_ms() { return to_ms(std::chrono::system_clock::now()); }

// ---------------------------------------------------------------------------
// telemetry blocks
// ---------------------------------------------------------------------------
static json reg_json(const std::optional<RegStatus>& r) {
    if (!r) return nullptr;
    return json{{"code", r->code}, {"text", r->text}};
}

static json block_json(const std::optional<SignalBlock>& b) {
    if (!b) return nullptr;
    return json{{"rsrp", opt(b->rsrp)}, {"rsrq", opt(b->rsrq)}, {"rssi", opt(b->rssi)},
                {"sinr", opt(b->sinr)}, {"quality", opt_quality(b->quality)}};
}

static json lte_serving_json(const LteServing& s) {
    return json{
        {"state", opt(s.state)}, {"duplex", opt(s.duplex)}, {"mcc", opt(s.mcc)}, {"mnc", opt(s.mnc)},
        {"cell_id", opt(s.cell_id)}, {"pci", opt(s.pci)}, {"earfcn", opt(s.earfcn)},
        {"band", opt(s.band)}, {"tac", opt(s.tac)},
        {"ul_bw_mhz", opt(s.ul_bw_mhz)}, {"dl_bw_mhz", opt(s.dl_bw_mhz)},
        {"rsrp", opt(s.rsrp)}, {"rsrq", opt(s.rsrq)}, {"rssi", opt(s.rssi)}, {"sinr", opt(s.sinr)},
        {"cqi", opt(s.cqi)}, {"tx_power", opt(s.tx_power)}, {"srxlev", opt(s.srxlev)}};
}

static json nr_serving_json(const NrServing& s) {
    return json{
        {"state", opt(s.state)}, {"duplex", opt(s.duplex)}, {"mcc", opt(s.mcc)}, {"mnc", opt(s.mnc)},
        {"cell_id", opt(s.cell_id)}, {"pci", opt(s.pci)}, {"tac", opt(s.tac)},
        {"arfcn", opt(s.arfcn)}, {"band", opt(s.band)}, {"dl_bw_mhz", opt(s.dl_bw_mhz)},
        {"rsrp", opt(s.rsrp)}, {"rsrq", opt(s.rsrq)}, {"sinr", opt(s.sinr)},
        {"scs_khz", opt(s.scs_khz)}, {"srxlev", opt(s.srxlev)}};
}

static json carrier_json(const ComponentCarrier& c) {
    return json{{"index", c.index}, {"rat", opt(c.rat)}, {"band", opt(c.band)}, {"arfcn", opt(c.arfcn)},
                {"dl_bw_mhz", opt(c.dl_bw_mhz)}, {"pci", opt(c.pci)}, {"rsrp", opt(c.rsrp)},
                {"rsrq", opt(c.rsrq)}, {"rssi", opt(c.rssi)}, {"sinr", opt(c.sinr)}};
}

static json temps_json(const Temperatures& t) {
    return json{{"sensors", t.sensors}, {"ambient", opt(t.ambient)}, {"mmw", opt(t.mmw)},
                {"pa", t.pa}, {"baseband", t.baseband}, {"max_c", opt(t.max_c)}};
}

json to_json(const TelemetryRecord& rec) {
    json d;

    if (rec.registration)
        d["registration"] = {{"ps", reg_json(rec.registration->ps)},
                             {"eps", reg_json(rec.registration->eps)},
                             {"nr5g", reg_json(rec.registration->nr5g)}};
    else d["registration"] = nullptr;

    if (rec.mode)
        d["mode"] = {{"rat", opt(rec.mode->rat)}, {"duplex", opt(rec.mode->duplex)},
                     {"access", opt(rec.mode->access)}, {"band", opt(rec.mode->band)},
                     {"channel", opt(rec.mode->channel)}};
    else d["mode"] = nullptr;

    if (rec.op)
        d["operator"] = {{"name", opt(rec.op->name)}, {"plmn", opt(rec.op->plmn)},
                         {"mcc", opt(rec.op->mcc)}, {"mnc", opt(rec.op->mnc)}};
    else d["operator"] = nullptr;

    if (rec.signal)
        d["signal"] = {{"rsrp", opt(rec.signal->rsrp)}, {"rsrq", opt(rec.signal->rsrq)},
                       {"sinr", opt(rec.signal->sinr)}, {"quality", opt_quality(rec.signal->quality)},
                       {"lte", block_json(rec.signal->lte)}, {"nr", block_json(rec.signal->nr)}};
    else d["signal"] = nullptr;

    if (rec.serving) {
        const auto& s = *rec.serving;
        d["serving"] = {{"rat", to_string(s.rat)}, {"state", opt(s.state)}, {"band", opt(s.band_label)},
                        {"lte", s.lte ? lte_serving_json(*s.lte) : json(nullptr)},
                        {"nr", s.nr ? nr_serving_json(*s.nr) : json(nullptr)}};
        d["cell_id"] = {{"rat", to_string(s.rat)},
                        {"enb_id", opt(s.identity.enb_id)}, {"lte_cell", opt(s.identity.lte_cell)},
                        {"gnb_id", opt(s.identity.gnb_id)}, {"nr_cell", opt(s.identity.nr_cell)}};
    } else {
        d["serving"] = nullptr;
        d["cell_id"] = nullptr;
    }

    if (rec.ca) {
        json secondary = json::array();
        for (const auto& c : rec.ca->secondary) secondary.push_back(carrier_json(c));
        d["ca"] = {{"primary", rec.ca->primary ? carrier_json(*rec.ca->primary) : json(nullptr)},
                   {"secondary", std::move(secondary)}, {"summary", opt(rec.ca->summary)}};
    } else d["ca"] = nullptr;

    if (rec.neighbours) {
        json lte = json::array(), nr = json::array();
        for (const auto& n : rec.neighbours->lte)
            lte.push_back({{"scope", n.scope}, {"earfcn", opt(n.earfcn)}, {"pci", opt(n.pci)},
                           {"rsrp", opt(n.rsrp)}, {"rsrq", opt(n.rsrq)}, {"rssi", opt(n.rssi)},
                           {"sinr", opt(n.sinr)}, {"srxlev", opt(n.srxlev)}, {"band", opt(n.band)}});
        for (const auto& n : rec.neighbours->nr)
            nr.push_back({{"arfcn", opt(n.arfcn)}, {"pci", opt(n.pci)}, {"rsrp", opt(n.rsrp)},
                          {"rsrq", opt(n.rsrq)}, {"sinr", opt(n.sinr)}, {"scs_khz", opt(n.scs_khz)},
                          {"band", opt(n.band)}});
        d["neighbors"] = {{"lte", std::move(lte)}, {"nr", std::move(nr)}};
    } else d["neighbors"] = nullptr;

    if (rec.netdev) {
        const auto& n = *rec.netdev;
        d["netdev"] = {{"iface", opt(n.iface)}, {"state", opt(n.state)}, {"ipv4", opt(n.ipv4)},
                       {"rx_bytes", opt(n.rx_bytes)}, {"tx_bytes", opt(n.tx_bytes)},
                       {"rx_bps", opt(n.rx_bps)}, {"tx_bps", opt(n.tx_bps)}, {"source", n.source}};
    } else d["netdev"] = nullptr;

    if (rec.session) {
        json ctx = json::array();
        for (const auto& c : rec.session->contexts)
            ctx.push_back({{"cid", c.cid}, {"type", opt(c.type)}, {"apn", opt(c.apn)}, {"ip", opt(c.ip)},
                           {"dns1", opt(c.dns1)}, {"dns2", opt(c.dns2)}, {"state", opt(c.state)}});
        d["session"] = {{"default_cid", opt(rec.session->default_cid)}, {"contexts", std::move(ctx)}};
    } else d["session"] = nullptr;

    d["temperatures"] = rec.temperatures ? temps_json(*rec.temperatures) : json(nullptr);
    return d;
}

json to_json(const ModemInfo& info) {
    return json{
        {"manufacturer", opt(info.manufacturer)}, {"model", opt(info.model)},
        {"revision", opt(info.revision)}, {"imei", opt(info.imei)},
        {"sim", {{"imsi", opt(info.sim.imsi)}, {"iccid", opt(info.sim.iccid)},
                 {"msisdn", opt(info.sim.msisdn)}, {"enabled", opt(info.sim.enabled)},
                 {"inserted", opt(info.sim.inserted)}}},
        {"usb", {{"code", opt(info.usb_speed_code)}, {"label", opt(info.usb_speed)}}}};
}

json to_json(const transport::CommandExchange& ex) {
    return json{{"command", ex.command}, {"outcome", transport::to_string(ex.outcome)},
                {"lines", ex.lines}, {"error", ex.error.empty() ? json(nullptr) : json(ex.error)}};
}

// ---------------------------------------------------------------------------
// live_response()
// ---------------------------------------------------------------------------
json live_response(const std::shared_ptr<const TelemetrySnapshot>& snap, bool include_raw) {
    json out{{"ok", true}, {"timestamp", now_ms()}};

    if (!snap) {
        out["cycle"] = nullptr;
        out["captured_at"] = nullptr;
        out["age_ms"] = nullptr;
        out["data"] = to_json(TelemetryRecord{});
        out["failed"] = json::array();
        if (include_raw) out["raw"] = nullptr;
        return out;
    }

    using namespace std::chrono;
    out["cycle"] = snap->cycle;
    out["captured_at"] = to_ms(snap->captured_at);
    out["age_ms"] = duration_cast<milliseconds>(steady_clock::now() - snap->captured_mono).count();
    out["data"] = to_json(snap->data);
    out["failed"] = snap->failed;
    if (include_raw) out["raw"] = snap->raw.empty() ? json(nullptr) : json(snap->raw);
    return out;
}

// ---------------------------------------------------------------------------
// envelopes
// ---------------------------------------------------------------------------

// Raw exchange plus the decoded preference; decoded keys are null when the
// modem's answer could not be read.
static json readback_json(ActionKind kind, const transport::CommandExchange& ex) {
    json out = to_json(ex);
    if (kind == ActionKind::Roaming) {
        auto pref = decoder::decode_roam_pref(ex.lines);
        out["roam_pref"] = pref ? json(*pref) : json(nullptr);
        out["enabled"] = pref ? json(decoder::roaming_enabled(*pref)) : json(nullptr);
    } else if (kind == ActionKind::NetworkMode) {
        auto mode = decoder::decode_mode_pref(ex.lines);
        out["mode_pref"] = mode ? json(*mode) : json(nullptr);
    }
    return out;
}

json envelope(const ControlAction& a) {
    json results = json::array();
    for (const auto& o : a.outcomes)
        results.push_back({{"command", o.command}, {"outcome", transport::to_string(o.outcome)},
                           {"lines", o.lines}, {"error", o.error.empty() ? json(nullptr) : json(o.error)}});

    json detail{
        {"dry_run", a.dry_run},
        {"dangerous", a.danger == Danger::Dangerous},
        {"executed", a.executed},
        {"blocked_reason", opt(a.blocked_reason)},
        {"planned", a.plan},
        {"errors", a.errors},
        {"state", to_string(a.state)},
        {"results", std::move(results)}};
    if (a.classification_note) detail["classification_note"] = *a.classification_note;
    if (a.readback) detail["readback"] = readback_json(a.kind, *a.readback);

    return json{{"ok", a.ok()}, {"timestamp", now_ms()}, {"action", a.name},
                {"error", opt(a.error)}, {"detail", std::move(detail)}};
}

json rejected_envelope(ActionKind kind, const std::string& error) {
    const ActionSpec& spec = action_spec(kind);
    json detail{
        {"dry_run", true},
        {"dangerous", spec.danger == Danger::Dangerous},
        {"executed", false},
        {"blocked_reason", nullptr},
        {"planned", json::array()},
        {"errors", json::array({error})},
        {"state", to_string(ActionState::Received)}};
    if (spec.classification_note) detail["classification_note"] = spec.classification_note;
    return json{{"ok", false}, {"timestamp", now_ms()}, {"action", spec.name},
                {"error", error}, {"detail", std::move(detail)}};
}

// ---------------------------------------------------------------------------
// parse_request()
// ---------------------------------------------------------------------------
template <typename T>
static void take(const json& body, const char* key, T& dst) {
    auto it = body.find(key);
    if (it != body.end() && !it->is_null()) dst = it->template get<T>();
}

template <typename T>
static void take(const json& body, const char* key, std::optional<T>& dst) {
    auto it = body.find(key);
    if (it != body.end() && !it->is_null()) dst = it->template get<T>();
}

// Band lists for the lock action arrive as strings but numbers are tolerated.
static std::vector<std::string> band_strings(const json& v) {
    std::vector<std::string> out;
    for (const auto& b : v) {
        if (b.is_number_integer()) out.push_back(std::to_string(b.get<long long>()));
        else out.push_back(b.get<std::string>());
    }
    return out;
}

bool parse_request(ActionKind kind, const json& body, ActionRequest& out, std::string& err) {
    out = ActionRequest{};
    if (body.is_null()) return true;
    if (!body.is_object()) { err = "request body must be a JSON object"; return false; }

    try {
        take(body, "dry_run", out.dry_run);

        switch (kind) {
            case ActionKind::Reboot:
                take(body, "mode", out.mode);
                break;
            case ActionKind::UsbNet:
                take(body, "mode", out.mode);
                take(body, "reboot_modem", out.reboot_modem);
                break;
            case ActionKind::Apn: {
                take(body, "cid", out.cid);
                take(body, "apn", out.apn);
                take(body, "pdp_type", out.pdp_type);
                take(body, "activate", out.activate);
                auto auth = body.find("auth");
                if (auth != body.end() && auth->is_object()) {
                    take(*auth, "type", out.auth_type);
                    take(*auth, "user", out.auth_user);
                    take(*auth, "password", out.auth_password);
                }
                break;
            }
            case ActionKind::Roaming:
                take(body, "enable", out.enable);
                break;
            case ActionKind::Band: {
                take(body, "rat", out.rat);
                take(body, "reset", out.reset);
                auto lte = body.find("lte_bands");
                if (lte != body.end() && !lte->is_null()) out.lte_bands = band_strings(*lte);
                auto nr = body.find("nr_bands");
                if (nr != body.end() && !nr->is_null()) out.nr_bands = band_strings(*nr);
                break;
            }
            case ActionKind::CellLock:
                take(body, "enable", out.enable);
                out.rat.clear();
                take(body, "rat", out.rat);
                take(body, "pci", out.pci);
                take(body, "tac", out.tac);
                take(body, "cell_id", out.cell_id);
                break;
            case ActionKind::CarrierAggregation:
                take(body, "lte_ca_enable", out.lte_ca);
                take(body, "nr_ca_enable", out.nr_ca);
                break;
            case ActionKind::Gnss:
                take(body, "enable", out.enable);
                take(body, "mode", out.mode);
                take(body, "cold_start", out.cold_start);
                break;
            case ActionKind::NetworkMode:
                take(body, "mode_pref", out.mode_pref);
                break;
            case ActionKind::BandPreference:
                take(body, "lte_bands", out.lte_band_pref);
                take(body, "nsa_nr5g_bands", out.nsa_nr5g_band_pref);
                take(body, "nr5g_bands", out.nr5g_band_pref);
                break;
            case ActionKind::ResetProfile:
                take(body, "profile", out.profile);
                break;
        }
    } catch (const json::exception& e) {
        err = std::string("invalid request: ") + e.what();
        return false;
    }
    return true;
}

} // namespace linkstation::codec
