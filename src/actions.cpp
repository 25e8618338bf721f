// -----------------------------------------------------------------------------
// Implementation for actions.hpp
//
// One validator + one planner per action, wired together in action_table().
// Planners are pure: same request in, same command list out. They assume the
// validator already ran.
// -----------------------------------------------------------------------------

#include "linkstation/actions.hpp"
#include "linkstation/at_tokens.hpp"
#include "linkstation/decoder.hpp"

#include <algorithm>
#include <cctype>

namespace linkstation {

// ---------- local helpers ----------

// Characters allowed inside a quoted AT string argument.
static bool safe_quoted(const std::string& s, std::size_t max_len = 64) {
    if (s.size() > max_len) return false;
    for (unsigned char c : s) {
        if (c < 0x20 || c > 0x7e) return false;
        if (c == '"' || c == ';' || c == '\\') return false;
    }
    return true;
}

static bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static bool is_word(const std::string& s) {
    return !s.empty() && s.size() <= 32 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_' || c == '-'; });
}

static std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

static std::string join_ints(const std::vector<int>& v, const char* sep) {
    std::vector<std::string> s;
    s.reserve(v.size());
    for (int b : v) s.push_back(std::to_string(b));
    return join(s, sep);
}

static const char* bit(bool b) { return b ? "1" : "0"; }

// "lte" / "nr5g" / "nr" / "5g" -> "LTE" / "NR5G"; empty when unknown.
static std::string lock_rat(const std::string& raw) {
    const std::string r = tokens::lower(raw);
    if (r == "lte") return "LTE";
    if (r == "nr5g" || r == "nr" || r == "5g") return "NR5G";
    return {};
}

int usbnet_mode_value(const std::string& mode) {
    const std::string m = tokens::lower(mode);
    if (m == "ecm" || m == "auto") return 0;
    if (m == "rndis") return 1;
    if (m == "ncm" || m == "mbim") return 2;
    return -1;
}

// ---------------------------------------------------------------------------
// reboot
// ---------------------------------------------------------------------------
static bool validate_reboot(const ActionRequest& r, std::string& err) {
    const std::string m = tokens::lower(r.mode.value_or("soft"));
    if (m != "soft" && m != "full" && m != "rf_off") { err = "mode must be soft|full|rf_off"; return false; }
    return true;
}

static std::vector<std::string> plan_reboot(const ActionRequest& r) {
    const std::string m = tokens::lower(r.mode.value_or("soft"));
    if (m == "full")   return {"AT+CFUN=4", "AT+CFUN=1,1"};
    if (m == "rf_off") return {"AT+CFUN=4"};
    return {"AT+CFUN=1,1"};
}

// ---------------------------------------------------------------------------
// usbnet
// ---------------------------------------------------------------------------
static bool validate_usbnet(const ActionRequest& r, std::string& err) {
    if (!r.mode) { err = "mode is required"; return false; }
    if (usbnet_mode_value(*r.mode) < 0) { err = "mode must be ecm|rndis|ncm|mbim|auto"; return false; }
    return true;
}

static std::vector<std::string> plan_usbnet(const ActionRequest& r) {
    std::vector<std::string> cmds{"AT+QCFG=\"usbnet\"," + std::to_string(usbnet_mode_value(*r.mode))};
    if (r.reboot_modem) cmds.push_back("AT+CFUN=1,1");
    return cmds;
}

// ---------------------------------------------------------------------------
// apn
// ---------------------------------------------------------------------------
static bool validate_apn(const ActionRequest& r, std::string& err) {
    if (r.cid < 1 || r.cid > 15) { err = "cid must be 1..15"; return false; }
    if (r.apn.empty() || !safe_quoted(r.apn, 100)) { err = "apn is required and must be printable without quotes"; return false; }
    const std::string t = tokens::upper(r.pdp_type);
    if (t != "IP" && t != "IPV6" && t != "IPV4V6") { err = "pdp_type must be IP|IPV6|IPV4V6"; return false; }
    const std::string a = tokens::lower(r.auth_type);
    if (a != "none" && a != "pap" && a != "chap") { err = "auth.type must be none|pap|chap"; return false; }
    if (r.auth_user && !safe_quoted(*r.auth_user)) { err = "auth.user contains forbidden characters"; return false; }
    if (r.auth_password && !safe_quoted(*r.auth_password)) { err = "auth.password contains forbidden characters"; return false; }
    return true;
}

static std::vector<std::string> plan_apn(const ActionRequest& r) {
    const std::string cid = std::to_string(r.cid);
    std::vector<std::string> cmds{
        "AT+CGDCONT=" + cid + ",\"" + tokens::upper(r.pdp_type) + "\",\"" + r.apn + "\""};

    const std::string a = tokens::lower(r.auth_type);
    if ((a == "pap" || a == "chap") && r.auth_user && r.auth_password) {
        cmds.push_back("AT+CGAUTH=" + cid + "," + (a == "pap" ? "1" : "2") + ",\"" +
                       *r.auth_user + "\",\"" + *r.auth_password + "\"");
    }
    if (r.activate) cmds.push_back("AT+CGACT=1," + cid);
    return cmds;
}

// ---------------------------------------------------------------------------
// roaming
// ---------------------------------------------------------------------------
static bool validate_roaming(const ActionRequest& r, std::string& err) {
    if (!r.enable) { err = "enable is required"; return false; }
    return true;
}

static std::vector<std::string> plan_roaming(const ActionRequest& r) {
    // roam_pref: 1 = home network only, 255 = roaming on any network.
    return {std::string("AT+QNWPREFCFG=\"roam_pref\",") + (*r.enable ? "255" : "1")};
}

// ---------------------------------------------------------------------------
// band (lock)
// ---------------------------------------------------------------------------
static bool validate_band(const ActionRequest& r, std::string& err) {
    const std::string rat = tokens::upper(r.rat);
    if (rat != "LTE" && rat != "NR5G" && rat != "BOTH") { err = "rat must be LTE|NR5G|BOTH"; return false; }
    for (const auto* list : {&r.lte_bands, &r.nr_bands})
        for (const auto& b : *list)
            if (!is_digits(b) || b.size() > 3) { err = "band '" + b + "' is not a band number"; return false; }
    return true;
}

static std::vector<std::string> plan_band(const ActionRequest& r) {
    const std::string rat = tokens::upper(r.rat);
    const bool lte = rat == "LTE" || rat == "BOTH";
    const bool nr  = rat == "NR5G" || rat == "BOTH";
    std::vector<std::string> cmds;

    if (r.reset) {
        if (lte) cmds.push_back("AT+QCFG=\"lte/band\",\"0\"");
        if (nr)  cmds.push_back("AT+QCFG=\"nr5g/band\",\"0\"");
        return cmds;
    }
    if (lte && !r.lte_bands.empty()) cmds.push_back("AT+QCFG=\"band\",\"LTE\",\"" + join(r.lte_bands, ",") + "\"");
    if (nr && !r.nr_bands.empty())   cmds.push_back("AT+QCFG=\"band\",\"NR5G\",\"" + join(r.nr_bands, ",") + "\"");
    return cmds;
}

// ---------------------------------------------------------------------------
// cell_lock
// ---------------------------------------------------------------------------
static bool validate_cell_lock(const ActionRequest& r, std::string& err) {
    if (!r.enable) { err = "enable is required"; return false; }
    if (*r.enable && (r.rat.empty() || tokens::upper(r.rat) == "BOTH" || lock_rat(r.rat).empty())) {
        err = "rat must be lte|nr5g when enabling a lock";
        return false;
    }
    if (r.pci && (*r.pci < 0 || *r.pci > 1007)) { err = "pci must be 0..1007"; return false; }
    if (r.tac && !tokens::parse_hex(*r.tac)) { err = "tac must be hexadecimal"; return false; }
    if (r.cell_id && !tokens::parse_hex(*r.cell_id)) { err = "cell_id must be hexadecimal"; return false; }
    return true;
}

static std::vector<std::string> plan_cell_lock(const ActionRequest& r) {
    if (!*r.enable) return {"AT+QNWLOCK=0"};
    return {"AT+QNWLOCK=1,\"" + lock_rat(r.rat) + "\""};
}

// ---------------------------------------------------------------------------
// ca
// Per-RAT toggles when given; the global toggle follows a single flag; with no
// flag at all the global toggle is switched on.
// ---------------------------------------------------------------------------
static bool validate_ca(const ActionRequest&, std::string&) { return true; }

static std::vector<std::string> plan_ca(const ActionRequest& r) {
    std::vector<std::string> cmds;
    if (r.lte_ca) cmds.push_back(std::string("AT+QCFG=\"lte/ca\",") + bit(*r.lte_ca));
    if (r.nr_ca)  cmds.push_back(std::string("AT+QCFG=\"nr5g/ca\",") + bit(*r.nr_ca));

    if (!r.lte_ca && !r.nr_ca)      cmds.push_back("AT+QCFG=\"ca\",1");
    else if (r.lte_ca && !r.nr_ca)  cmds.push_back(std::string("AT+QCFG=\"ca\",") + bit(*r.lte_ca));
    else if (!r.lte_ca && r.nr_ca)  cmds.push_back(std::string("AT+QCFG=\"ca\",") + bit(*r.nr_ca));
    return cmds;
}

// ---------------------------------------------------------------------------
// gnss
// ---------------------------------------------------------------------------
static bool validate_gnss(const ActionRequest& r, std::string& err) {
    if (!r.enable) { err = "enable is required"; return false; }
    if (r.mode && !is_word(*r.mode)) { err = "mode must be a single word"; return false; }
    return true;
}

static std::vector<std::string> plan_gnss(const ActionRequest& r) {
    const char* on = bit(*r.enable);
    if (r.mode) return {"AT+QCFG=\"gnss\"," + *r.mode + "," + on};
    return {std::string("AT+QCFG=\"gnss\",\"all\",") + on};
}

// ---------------------------------------------------------------------------
// network_mode
// ---------------------------------------------------------------------------
static bool validate_network_mode(const ActionRequest& r, std::string& err) {
    if (!r.mode_pref || r.mode_pref->empty()) { err = "mode_pref is required"; return false; }
    const std::string m = tokens::upper(*r.mode_pref);
    std::size_t start = 0;
    for (;;) {
        std::size_t colon = m.find(':', start);
        std::string part = m.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (part != "AUTO" && part != "WCDMA" && part != "LTE" && part != "NR5G") {
            err = "mode_pref must be AUTO|WCDMA|LTE|NR5G or a ':' combination";
            return false;
        }
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    if (m.find("AUTO") != std::string::npos && m != "AUTO") { err = "AUTO cannot be combined"; return false; }
    return true;
}

static std::vector<std::string> plan_network_mode(const ActionRequest& r) {
    return {"AT+QNWPREFCFG=\"mode_pref\"," + tokens::upper(*r.mode_pref)};
}

// ---------------------------------------------------------------------------
// band_preference (search order, not a lock)
// ---------------------------------------------------------------------------
static bool validate_band_preference(const ActionRequest& r, std::string& err) {
    for (const auto* list : {&r.lte_band_pref, &r.nsa_nr5g_band_pref, &r.nr5g_band_pref}) {
        if (!*list) continue;
        for (int b : **list)
            if (b < 1 || b > 1024) { err = "band " + std::to_string(b) + " out of range"; return false; }
    }
    return true;
}

static std::vector<std::string> plan_band_preference(const ActionRequest& r) {
    std::vector<std::string> cmds;
    if (r.lte_band_pref && !r.lte_band_pref->empty())
        cmds.push_back("AT+QNWPREFCFG=\"lte_band\"," + join_ints(*r.lte_band_pref, ":"));
    if (r.nsa_nr5g_band_pref && !r.nsa_nr5g_band_pref->empty())
        cmds.push_back("AT+QNWPREFCFG=\"nsa_nr5g_band\"," + join_ints(*r.nsa_nr5g_band_pref, ":"));
    if (r.nr5g_band_pref && !r.nr5g_band_pref->empty())
        cmds.push_back("AT+QNWPREFCFG=\"nr5g_band\"," + join_ints(*r.nr5g_band_pref, ":"));
    return cmds;
}

// ---------------------------------------------------------------------------
// reset_profile
// ---------------------------------------------------------------------------
static bool validate_reset_profile(const ActionRequest& r, std::string& err) {
    if (r.profile != "modem_safe") { err = "profile must be modem_safe"; return false; }
    return true;
}

static std::vector<std::string> plan_reset_profile(const ActionRequest&) {
    return {
        "AT+QCFG=\"lte/band\",\"0\"",
        "AT+QCFG=\"nr5g/band\",\"0\"",
        "AT+QNWLOCK=0",
        "AT+QCFG=\"lte/ca\",1",
        "AT+QCFG=\"nr5g/ca\",1",
        "AT+QNWPREFCFG=\"roam_pref\",255",
        "AT+QCFG=\"usbnet\",1",
    };
}

// ---------------------------------------------------------------------------
// table
// ---------------------------------------------------------------------------
static const char* const kCaNote =
    "classification disputed: carrier aggregation toggles are treated as safe here, "
    "but some deployments report loss of service after changing them";

const std::vector<ActionSpec>& action_table() {
    static const std::vector<ActionSpec> table = {
        {ActionKind::Reboot,             "reboot",          Danger::Dangerous, validate_reboot,          plan_reboot,          nullptr,                   nullptr},
        {ActionKind::UsbNet,             "usbnet",          Danger::Dangerous, validate_usbnet,          plan_usbnet,          nullptr,                   nullptr},
        {ActionKind::Apn,                "apn",             Danger::Dangerous, validate_apn,             plan_apn,             nullptr,                   nullptr},
        {ActionKind::Roaming,            "roaming",         Danger::Safe,      validate_roaming,         plan_roaming,         decoder::cmd::kRoamPref,   nullptr},
        {ActionKind::Band,               "band",            Danger::Dangerous, validate_band,            plan_band,            nullptr,                   nullptr},
        {ActionKind::CellLock,           "cell_lock",       Danger::Dangerous, validate_cell_lock,       plan_cell_lock,       nullptr,                   nullptr},
        {ActionKind::CarrierAggregation, "ca",              Danger::Safe,      validate_ca,              plan_ca,              nullptr,                   kCaNote},
        {ActionKind::Gnss,               "gnss",            Danger::Safe,      validate_gnss,            plan_gnss,            nullptr,                   nullptr},
        {ActionKind::NetworkMode,        "network_mode",    Danger::Safe,      validate_network_mode,    plan_network_mode,    decoder::cmd::kModePref,   nullptr},
        {ActionKind::BandPreference,     "band_preference", Danger::Safe,      validate_band_preference, plan_band_preference, nullptr,                   nullptr},
        {ActionKind::ResetProfile,       "reset_profile",   Danger::Dangerous, validate_reset_profile,   plan_reset_profile,   nullptr,                   nullptr},
    };
    return table;
}

const ActionSpec& action_spec(ActionKind kind) {
    const auto& t = action_table();
    for (const auto& s : t) if (s.kind == kind) return s;
    return t.front();   // unreachable for valid enum values
}

bool name_to_action(const std::string& raw, ActionKind& out) {
    std::string name = tokens::lower(raw);
    std::replace(name.begin(), name.end(), '-', '_');
    for (const auto& s : action_table()) {
        if (name == s.name) { out = s.kind; return true; }
    }
    return false;
}

const char* to_string(ActionKind kind) { return action_spec(kind).name; }

} // namespace linkstation
