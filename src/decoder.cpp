// -----------------------------------------------------------------------------
// Implementation for decoder.hpp
//
// Field layouts follow the Quectel RM5xx AT manual. Index constants are spelled
// out per record so a firmware that appends fields keeps decoding; a firmware
// that drops fields below the minimum yields an empty record.
// -----------------------------------------------------------------------------

#include "linkstation/decoder.hpp"
#include "linkstation/at_tokens.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <sstream>

namespace linkstation::decoder {

using tokens::at;
using tokens::parse_int;
using tokens::split_csv;

namespace {

const std::vector<std::string>* find(const ReplyBatch& b, const char* command) {
    auto it = b.find(command);
    return it == b.end() ? nullptr : &it->second;
}

// Run one field decoder; an exception empties that field and nothing else.
template <class Fn>
auto guarded(const char* field, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        spdlog::debug("[decoder] field={} status=error reason={}", field, e.what());
        return {};
    }
}

// First line of a plain (tag-less) reply: skip the echo, blanks and the terminal.
std::optional<std::string> plain_value(const std::vector<std::string>& lines) {
    for (const auto& raw : lines) {
        std::string l = tokens::trim(raw);
        if (l.empty() || l == "OK" || l.rfind("AT", 0) == 0) continue;
        return l;
    }
    return std::nullopt;
}

std::optional<std::string> duplex_of(const std::string& s) {
    std::string u = tokens::upper(s);
    if (u.find("TDD") != std::string::npos) return std::string("TDD");
    if (u.find("FDD") != std::string::npos) return std::string("FDD");
    return std::nullopt;
}

std::optional<std::string> band_short(const std::optional<std::string>& label) {
    if (!label) return std::nullopt;
    const std::string& s = *label;
    if (s.rfind("NR5G BAND ", 0) == 0) return "n" + s.substr(10);
    if (s.rfind("LTE BAND ", 0) == 0)  return "B" + s.substr(9);
    return s;
}

std::string fmt_mhz(double v) {
    std::ostringstream os;
    if (std::fabs(v - std::round(v)) < 1e-9) os << static_cast<long>(std::lround(v));
    else os << v;
    return os.str();
}

// RSRP lives in -140..-44 dBm, RSRQ in -20..-3 dB. Some firmwares swap them in
// neighbour rows; values on the wrong side of -44 give that away.
void fix_swapped(std::optional<int>& rsrp, std::optional<int>& rsrq) {
    if (rsrp && rsrq && *rsrp > -44 && *rsrq <= -44) std::swap(rsrp, rsrq);
}

} // namespace

// ---------------------------------------------------------------------------
// Batteries
// ---------------------------------------------------------------------------
const std::vector<std::string>& telemetry_battery() {
    static const std::vector<std::string> b = {
        cmd::kCgreg, cmd::kCereg, cmd::kC5greg, cmd::kQnwinfo, cmd::kCops,
        cmd::kQrsrp, cmd::kQrsrq, cmd::kQsinr, cmd::kServing, cmd::kNeighbour,
        cmd::kQcainfo, cmd::kQtemp, cmd::kQnetdev, cmd::kCgdcont, cmd::kCgact,
        cmd::kCgcontrdp, cmd::kQidnscfg,
    };
    return b;
}

const std::vector<std::string>& info_battery() {
    static const std::vector<std::string> b = {
        cmd::kGmi, cmd::kCgmm, cmd::kGmr, cmd::kGsn, cmd::kCimi,
        cmd::kIccid, cmd::kCnum, cmd::kQsimstat, cmd::kUsbspeed,
    };
    return b;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
RegStatus reg_status(int code) {
    static const char* const kText[] = {
        "not registered / MT is not currently searching",
        "registered (home)",
        "searching",
        "registration denied",
        "unknown",
        "registered (roaming)",
        "registered for SMS only",
        "registered for CSFB or SMS only",
        "attached for emergency only",
        "registered (CSFB not preferred)",
        "registered (home, emergency only)",
    };
    RegStatus r;
    r.code = code;
    if (code >= 0 && code <= 10) {
        r.state = static_cast<RegState>(code);
        r.text = kText[code];
    } else {
        r.state = RegState::Other;
        r.text = "stat=" + std::to_string(code);
    }
    return r;
}

std::optional<RegStatus> decode_registration(const std::vector<std::string>& lines, const std::string& tag) {
    for (const auto& p : tokens::payloads(lines, tag)) {
        auto toks = split_csv(p);
        // "<n>,<stat>[,...]" for the read command, "<stat>" for the URC form.
        auto stat = parse_int(toks.size() >= 2 ? toks[1] : toks[0]);
        if (stat) return reg_status(*stat);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Mode / operator
// ---------------------------------------------------------------------------
std::optional<RadioMode> decode_qnwinfo(const std::vector<std::string>& lines) {
    auto ps = tokens::payloads(lines, "+QNWINFO:");
    if (ps.empty()) return std::nullopt;
    auto toks = split_csv(ps.front());
    const std::string& access = at(toks, 0);
    if (access.empty()) return std::nullopt;

    RadioMode m;
    m.access = access;
    const std::string u = tokens::upper(access);
    if (u.find("NO SERVICE") != std::string::npos) {
        m.rat = std::string("NONE");
    } else if (u.find("NR5G-NSA") != std::string::npos) {
        m.rat = std::string("NSA");
    } else if (u.find("NR5G") != std::string::npos) {
        m.rat = std::string("SA");
    } else if (u.find("LTE") != std::string::npos) {
        m.rat = std::string("LTE");
    } else {
        m.rat = access;
    }
    m.duplex = duplex_of(access);
    if (auto b = tokens::non_empty(at(toks, 2))) m.band = bands::pretty(*b);
    m.channel = parse_int(at(toks, 3));
    return m;
}

std::optional<std::string> decode_cops(const std::vector<std::string>& lines) {
    for (const auto& p : tokens::payloads(lines, "+COPS:")) {
        auto toks = split_csv(p);
        if (auto name = tokens::non_empty(at(toks, 2))) return name;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Signal
// ---------------------------------------------------------------------------
std::optional<int> decode_first_metric(const std::vector<std::string>& lines, const std::string& tag) {
    auto ps = tokens::payloads(lines, tag);
    if (ps.empty()) return std::nullopt;
    return parse_int(at(split_csv(ps.front()), 0));
}

std::optional<Quality> rate_quality(std::optional<int> rsrp, std::optional<int> sinr, bands::Rat rat) {
    if (!rsrp && !sinr) return std::nullopt;

    Quality q = Quality::Fair;
    if (rsrp) {
        if      (*rsrp >= -80)  q = Quality::Excellent;
        else if (*rsrp >= -90)  q = Quality::Good;
        else if (*rsrp >= -100) q = Quality::Fair;
        else                    q = Quality::Poor;
    }
    if (sinr) {
        const int strong = (rat == bands::Rat::Nr) ? 15 : 20;
        if (*sinr >= strong && (q == Quality::Good || q == Quality::Fair)) q = Quality::Excellent;
        else if (*sinr < 0 && (q == Quality::Good || q == Quality::Excellent)) q = Quality::Fair;
    }
    return q;
}

// ---------------------------------------------------------------------------
// Serving cell
// ---------------------------------------------------------------------------
namespace {

// Shared LTE tail: is_tdd,mcc,mnc,cellid,pcid,earfcn,band,ul_bw,dl_bw,tac,rsrp,rsrq,rssi,sinr,cqi,tx_power,srxlev
// `o` is the index of is_tdd in `t`.
std::optional<LteServing> lte_from(const std::vector<std::string>& t, std::size_t o) {
    if (t.size() < o + 11) return std::nullopt;   // need at least through rsrp
    LteServing s;
    s.duplex   = duplex_of(at(t, o));
    s.mcc      = tokens::non_empty(at(t, o + 1));
    s.mnc      = tokens::non_empty(at(t, o + 2));
    s.cell_id  = tokens::parse_hex(at(t, o + 3));
    s.pci      = parse_int(at(t, o + 4));
    s.earfcn   = parse_int(at(t, o + 5));
    s.band     = parse_int(at(t, o + 6));
    if (auto c = parse_int(at(t, o + 7))) s.ul_bw_mhz = bands::lte_bw_code_mhz(*c);
    if (auto c = parse_int(at(t, o + 8))) s.dl_bw_mhz = bands::lte_bw_code_mhz(*c);
    if (auto tac = tokens::parse_hex(at(t, o + 9))) s.tac = static_cast<int>(*tac);
    s.rsrp     = parse_int(at(t, o + 10));
    s.rsrq     = parse_int(at(t, o + 11));
    s.rssi     = parse_int(at(t, o + 12));
    s.sinr     = parse_int(at(t, o + 13));
    s.cqi      = parse_int(at(t, o + 14));
    s.tx_power = parse_int(at(t, o + 15));
    s.srxlev   = parse_int(at(t, o + 16));
    return s;
}

// "servingcell",state,"NR5G-SA",duplex,MCC,MNC,cellID,PCID,TAC,ARFCN,band,NR_DL_bw,RSRP,RSRQ,SINR,scs,srxlev
std::optional<NrServing> sa_from(const std::vector<std::string>& t) {
    if (t.size() < 17) return std::nullopt;
    NrServing s;
    s.state   = tokens::non_empty(at(t, 1));
    s.duplex  = duplex_of(at(t, 3));
    s.mcc     = tokens::non_empty(at(t, 4));
    s.mnc     = tokens::non_empty(at(t, 5));
    s.cell_id = tokens::parse_hex(at(t, 6));
    s.pci     = parse_int(at(t, 7));
    if (auto tac = tokens::parse_hex(at(t, 8))) s.tac = static_cast<int>(*tac);
    s.arfcn   = parse_int(at(t, 9));
    s.band    = parse_int(at(t, 10));
    if (auto c = parse_int(at(t, 11))) s.dl_bw_mhz = bands::nr_bw_code_mhz(*c);
    s.rsrp    = parse_int(at(t, 12));
    s.rsrq    = parse_int(at(t, 13));
    s.sinr    = parse_int(at(t, 14));
    if (auto c = parse_int(at(t, 15))) s.scs_khz = bands::scs_code_khz(*c);
    s.srxlev  = parse_int(at(t, 16));
    return s;
}

// "NR5G-NSA",MCC,MNC,PCID,RSRP,SINR,RSRQ,ARFCN,band,NR_DL_bw,scs
std::optional<NrServing> nsa_from(const std::vector<std::string>& t) {
    if (t.size() < 11) return std::nullopt;
    NrServing s;
    s.mcc   = tokens::non_empty(at(t, 1));
    s.mnc   = tokens::non_empty(at(t, 2));
    s.pci   = parse_int(at(t, 3));
    s.rsrp  = parse_int(at(t, 4));
    s.sinr  = parse_int(at(t, 5));
    s.rsrq  = parse_int(at(t, 6));
    s.arfcn = parse_int(at(t, 7));
    s.band  = parse_int(at(t, 8));
    if (auto c = parse_int(at(t, 9)))  s.dl_bw_mhz = bands::nr_bw_code_mhz(*c);
    if (auto c = parse_int(at(t, 10))) s.scs_khz = bands::scs_code_khz(*c);
    return s;
}

} // namespace

std::optional<ServingCell> decode_serving(const std::vector<std::string>& lines) {
    std::optional<std::string> state;
    std::optional<LteServing> lte;
    std::optional<NrServing> sa, nsa;

    for (const auto& p : tokens::payloads(lines, "+QENG:")) {
        auto t = split_csv(p);
        const std::string& tag = at(t, 0);
        if (tag == "servingcell") {
            state = tokens::non_empty(at(t, 1));
            const std::string& rat = at(t, 2);
            if (rat == "NR5G-SA") sa = sa_from(t);
            else if (rat == "LTE") {
                lte = lte_from(t, 3);
                if (lte) lte->state = state;
            }
        } else if (tag == "LTE") {
            lte = lte_from(t, 1);
        } else if (tag == "NR5G-NSA") {
            nsa = nsa_from(t);
        }
    }

    ServingCell sc;
    sc.state = state;
    if (sa) {
        sc.rat = ServingRat::NrSa;
        sc.nr = sa;
    } else if (nsa) {
        sc.rat = ServingRat::NrNsa;
        sc.nr = nsa;
        sc.lte = lte;
    } else if (lte) {
        sc.rat = ServingRat::Lte;
        sc.lte = lte;
    } else {
        return std::nullopt;
    }

    if (sc.lte && sc.lte->cell_id) {
        sc.identity.enb_id   = *sc.lte->cell_id >> 8;
        sc.identity.lte_cell = *sc.lte->cell_id & 0xFF;
    }
    if (sc.nr && sc.nr->cell_id) {
        sc.identity.gnb_id  = *sc.nr->cell_id >> 12;
        sc.identity.nr_cell = *sc.nr->cell_id & 0xFFF;
    }

    std::string label;
    if (sc.lte && sc.lte->band) label = bands::describe(bands::Rat::Lte, *sc.lte->band);
    if (sc.nr && sc.nr->band) {
        if (!label.empty()) label += " + ";
        label += bands::describe(bands::Rat::Nr, *sc.nr->band);
    }
    if (!label.empty()) sc.band_label = label;
    return sc;
}

// ---------------------------------------------------------------------------
// Carrier aggregation
// "PCC"|"SCC",<freq>,<bandwidth>,<band>,<state>,<PCID>,<RSRP>,<RSRQ>,<RSSI>,<RSSNR>
// ---------------------------------------------------------------------------
std::optional<CarrierAggregation> decode_qcainfo(const std::vector<std::string>& lines) {
    CarrierAggregation ca;
    int next_scc = 1;
    for (const auto& p : tokens::payloads(lines, "+QCAINFO:")) {
        auto t = split_csv(p);
        const std::string kind = tokens::upper(at(t, 0));
        if (kind != "PCC" && kind != "SCC") continue;

        ComponentCarrier cc;
        cc.arfcn = parse_int(at(t, 1));
        if (auto b = tokens::non_empty(at(t, 3))) {
            cc.band = bands::pretty(*b);
            cc.rat = std::string(cc.band->rfind("NR5G", 0) == 0 ? "NR5G" : "LTE");
        }
        if (auto code = parse_int(at(t, 2))) {
            cc.dl_bw_mhz = (cc.rat && *cc.rat == "NR5G") ? bands::nr_bw_code_mhz(*code)
                                                          : bands::lte_rb_mhz(*code);
        }
        cc.pci  = parse_int(at(t, 5));
        cc.rsrp = parse_int(at(t, 6));
        cc.rsrq = parse_int(at(t, 7));
        cc.rssi = parse_int(at(t, 8));
        cc.sinr = parse_int(at(t, 9));

        if (kind == "PCC") {
            cc.index = 0;
            ca.primary = cc;
        } else {
            cc.index = next_scc++;
            ca.secondary.push_back(cc);
        }
    }
    if (ca.primary) ca.summary = ca_summary(ca);
    return ca;
}

std::string ca_summary(const CarrierAggregation& ca) {
    std::ostringstream os;
    auto carrier = [&](const ComponentCarrier& c) {
        os << band_short(c.band).value_or("?");
        if (c.arfcn) os << "@" << *c.arfcn;
    };
    if (ca.primary) {
        os << ca.primary->rat.value_or("LTE") << " PCC ";
        carrier(*ca.primary);
        if (ca.primary->dl_bw_mhz) os << " (BW " << fmt_mhz(*ca.primary->dl_bw_mhz) << "MHz)";
        os << ", ";
    }
    os << "SCC\xC3\x97" << ca.secondary.size();
    for (std::size_t i = 0; i < ca.secondary.size(); ++i) {
        os << (i == 0 ? ": " : ", ");
        carrier(ca.secondary[i]);
    }
    return os.str();
}

// ---------------------------------------------------------------------------
// Neighbour cells
// "neighbourcell intra"|"neighbourcell inter","LTE",earfcn,pci,rsrq,rsrp,rssi,sinr,srxlev,...
// "neighbourcell","NR5G",[scs,]arfcn,pci,rsrp,rsrq,sinr,...
// ---------------------------------------------------------------------------
std::optional<Neighbours> decode_neighbours(const std::vector<std::string>& lines) {
    Neighbours n;
    for (const auto& p : tokens::payloads(lines, "+QENG:")) {
        auto t = split_csv(p);
        const std::string& head = at(t, 0);
        if (head.rfind("neighbourcell", 0) != 0) continue;
        const std::string rat = tokens::upper(at(t, 1));

        if (rat == "LTE") {
            LteNeighbour c;
            auto sp = head.find(' ');
            c.scope  = sp == std::string::npos ? std::string() : head.substr(sp + 1);
            c.earfcn = parse_int(at(t, 2));
            c.pci    = parse_int(at(t, 3));
            c.rsrq   = parse_int(at(t, 4));
            c.rsrp   = parse_int(at(t, 5));
            c.rssi   = parse_int(at(t, 6));
            c.sinr   = parse_int(at(t, 7));
            c.srxlev = parse_int(at(t, 8));
            if (!c.earfcn || !c.pci) continue;
            fix_swapped(c.rsrp, c.rsrq);
            c.band = bands::guess_lte_band(*c.earfcn);
            n.lte.push_back(c);
        } else if (rat == "NR5G") {
            NrNeighbour c;
            std::size_t i = 2;
            auto first = parse_int(at(t, 2));
            if (first && t.size() > 5 &&
                (*first == 15 || *first == 30 || *first == 60 || *first == 120)) {
                c.scs_khz = first;
                i = 3;
            }
            c.arfcn = parse_int(at(t, i));
            c.pci   = parse_int(at(t, i + 1));
            c.rsrp  = parse_int(at(t, i + 2));
            c.rsrq  = parse_int(at(t, i + 3));
            c.sinr  = parse_int(at(t, i + 4));
            if (!c.arfcn || !c.pci) continue;
            fix_swapped(c.rsrp, c.rsrq);
            c.band = bands::guess_nr_band(*c.arfcn);
            n.nr.push_back(c);
        }
    }
    return n;
}

// ---------------------------------------------------------------------------
// Network interface
// ---------------------------------------------------------------------------
std::optional<NetDevStats> decode_qnetdevstatus(const std::vector<std::string>& lines) {
    auto ps = tokens::payloads(lines, "+QNETDEVSTATUS:");
    if (ps.empty()) return std::nullopt;
    auto t = split_csv(ps.front());

    NetDevStats s;
    s.source = "modem";
    auto rx = tokens::parse_u64(at(t, 3));
    auto tx = tokens::parse_u64(at(t, 4));
    if (rx && tx) {
        // iface,state,ipv4,rx_bytes,tx_bytes
        s.iface    = tokens::non_empty(at(t, 0));
        s.state    = tokens::non_empty(at(t, 1));
        s.ipv4     = tokens::non_empty(at(t, 2));
        s.rx_bytes = rx;
        s.tx_bytes = tx;
        return s;
    }
    // Address-only form: ipv4,mask,gateway,dhcp,dns1,dns2
    const std::string& first = at(t, 0);
    if (std::count(first.begin(), first.end(), '.') == 3) {
        s.ipv4 = first;
        s.state = std::string("up");
        return s;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Data sessions
// ---------------------------------------------------------------------------
namespace {

// +CGCONTRDP packs "addr.mask" into one dotted string for IPv4 (8 groups).
std::string strip_mask(const std::string& a) {
    if (std::count(a.begin(), a.end(), '.') != 7) return a;
    std::size_t pos = 0;
    for (int i = 0; i < 4; ++i) pos = a.find('.', pos) + 1;
    return a.substr(0, pos - 1);
}

} // namespace

std::optional<DataSession> decode_sessions(const std::vector<std::string>* cgdcont,
                                           const std::vector<std::string>* cgact,
                                           const std::vector<std::string>* cgcontrdp,
                                           const std::vector<std::string>* qidnscfg) {
    if (!cgdcont && !cgact && !cgcontrdp && !qidnscfg) return std::nullopt;

    std::map<int, PdpContext> by_cid;
    auto ctx = [&](int cid) -> PdpContext& {
        auto& c = by_cid[cid];
        c.cid = cid;
        return c;
    };

    if (cgdcont) {
        for (const auto& p : tokens::payloads(*cgdcont, "+CGDCONT:")) {
            auto t = split_csv(p);
            auto cid = parse_int(at(t, 0), 1, 255);
            if (!cid) continue;
            auto& c = ctx(*cid);
            c.type = tokens::non_empty(at(t, 1));
            c.apn  = tokens::non_empty(at(t, 2));
        }
    }
    if (cgact) {
        for (const auto& p : tokens::payloads(*cgact, "+CGACT:")) {
            auto t = split_csv(p);
            auto cid = parse_int(at(t, 0), 1, 255);
            auto state = parse_int(at(t, 1), 0, 1);
            if (!cid || !state) continue;
            ctx(*cid).state = state;
        }
    }
    if (cgcontrdp) {
        for (const auto& p : tokens::payloads(*cgcontrdp, "+CGCONTRDP:")) {
            auto t = split_csv(p);
            auto cid = parse_int(at(t, 0), 1, 255);
            if (!cid) continue;
            auto& c = ctx(*cid);
            if (!c.apn) c.apn = tokens::non_empty(at(t, 2));
            if (auto ip = tokens::non_empty(at(t, 3))) c.ip = strip_mask(*ip);
            c.dns1 = tokens::non_empty(at(t, 5));
            c.dns2 = tokens::non_empty(at(t, 6));
        }
    }
    if (qidnscfg) {
        for (const auto& p : tokens::payloads(*qidnscfg, "+QIDNSCFG:")) {
            auto t = split_csv(p);
            auto cid = parse_int(at(t, 0), 1, 255);
            if (!cid) continue;
            auto& c = ctx(*cid);
            if (!c.dns1) c.dns1 = tokens::non_empty(at(t, 1));
            if (!c.dns2) c.dns2 = tokens::non_empty(at(t, 2));
        }
    }

    DataSession s;
    for (auto& kv : by_cid) {
        if (!s.default_cid && kv.second.state && *kv.second.state == 1) s.default_cid = kv.first;
        s.contexts.push_back(kv.second);
    }
    return s;
}

// ---------------------------------------------------------------------------
// Temperatures  +QTEMP:"name","value"
// ---------------------------------------------------------------------------
std::optional<Temperatures> decode_qtemp(const std::vector<std::string>& lines) {
    struct Alias { const char* name; const char* group; const char* key; };
    static const Alias kAliases[] = {
        {"modem-lte-sub6-pa1", "pa", "lte_pa1"},
        {"modem-lte-sub6-pa2", "pa", "lte_pa2"},
        {"modem-sdr0-pa0", "pa", "sdr0_pa0"},
        {"modem-sdr0-pa1", "pa", "sdr0_pa1"},
        {"modem-sdr0-pa2", "pa", "sdr0_pa2"},
        {"modem-sdr1-pa0", "pa", "sdr1_pa0"},
        {"modem-sdr1-pa1", "pa", "sdr1_pa1"},
        {"modem-sdr1-pa2", "pa", "sdr1_pa2"},
        {"modem-mmw0", "mmw", nullptr},
        {"modem-ambient-usr", "ambient", nullptr},
        {"aoss-0-usr", "baseband", "aoss_0_usr"},
        {"cpuss-0-usr", "baseband", "cpuss_0_usr"},
        {"mdmq6-0-usr", "baseband", "mdmq6_0_usr"},
        {"mdmss-0-usr", "baseband", "mdmss_0_usr"},
        {"mdmss-1-usr", "baseband", "mdmss_1_usr"},
        {"mdmss-2-usr", "baseband", "mdmss_2_usr"},
        {"mdmss-3-usr", "baseband", "mdmss_3_usr"},
    };

    auto ps = tokens::payloads(lines, "+QTEMP:");
    if (ps.empty()) return std::nullopt;

    Temperatures out;
    for (const auto& p : ps) {
        auto t = split_csv(p);
        const std::string& name = at(t, 0);
        auto v = parse_int(at(t, 1));
        if (name.empty() || !v || *v == -273) continue;

        out.sensors[name] = *v;
        if (!out.max_c || *v > *out.max_c) out.max_c = *v;

        const Alias* hit = nullptr;
        for (const auto& a : kAliases) if (name == a.name) { hit = &a; break; }
        if (!hit) {
            std::string key = name;
            std::replace(key.begin(), key.end(), '-', '_');
            out.baseband[key] = *v;
            continue;
        }
        const std::string group = hit->group;
        if (group == "ambient")    out.ambient = *v;
        else if (group == "mmw")   out.mmw = *v;
        else if (group == "pa")    out.pa[hit->key] = *v;
        else                       out.baseband[hit->key] = *v;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Control read-backs  +QNWPREFCFG: "<key>",<value>
// ---------------------------------------------------------------------------
namespace {

std::optional<std::string> prefcfg_value(const std::vector<std::string>& lines, const std::string& key) {
    for (const auto& p : tokens::payloads(lines, "+QNWPREFCFG:")) {
        auto t = split_csv(p);
        if (tokens::lower(at(t, 0)) == key) return tokens::non_empty(at(t, 1));
    }
    return std::nullopt;
}

} // namespace

std::optional<int> decode_roam_pref(const std::vector<std::string>& lines) {
    auto v = prefcfg_value(lines, "roam_pref");
    if (!v) return std::nullopt;
    return parse_int(*v, 0, 255);
}

bool roaming_enabled(int roam_pref) {
    return roam_pref != 1;
}

std::optional<std::string> decode_mode_pref(const std::vector<std::string>& lines) {
    auto v = prefcfg_value(lines, "mode_pref");
    if (!v) return std::nullopt;
    return tokens::upper(*v);
}

std::optional<std::vector<int>> decode_band_pref(const std::vector<std::string>& lines, const std::string& key) {
    auto v = prefcfg_value(lines, key);
    if (!v) return std::nullopt;
    std::vector<int> out;
    std::stringstream ss(*v);
    std::string item;
    while (std::getline(ss, item, ':')) {
        auto b = parse_int(item, 1, 1024);
        if (!b) return std::nullopt;
        out.push_back(*b);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Identity
// ---------------------------------------------------------------------------
std::optional<std::string> usb_speed_label(const std::string& code) {
    if (code == "20")  return std::string("USB 2.0 high speed, 480 Mbps");
    if (code == "311") return std::string("USB 3.1 Gen1, 5 Gbps");
    if (code == "312") return std::string("USB 3.1 Gen2, 10 Gbps");
    return std::nullopt;
}

ModemInfo decode_info(const ReplyBatch& batch) {
    ModemInfo m;
    auto plain = [&](const char* c) -> std::optional<std::string> {
        const auto* l = find(batch, c);
        return l ? plain_value(*l) : std::nullopt;
    };
    m.manufacturer = guarded("manufacturer", [&] { return plain(cmd::kGmi); });
    m.model        = guarded("model", [&] { return plain(cmd::kCgmm); });
    m.revision     = guarded("revision", [&] { return plain(cmd::kGmr); });
    m.imei         = guarded("imei", [&] { return plain(cmd::kGsn); });
    m.sim.imsi     = guarded("imsi", [&] { return plain(cmd::kCimi); });

    if (const auto* l = find(batch, cmd::kIccid)) {
        auto ps = tokens::payloads(*l, "+ICCID:");
        if (!ps.empty()) m.sim.iccid = tokens::non_empty(ps.front());
    }
    if (const auto* l = find(batch, cmd::kCnum)) {
        // +CNUM: "<alpha>","<number>",<type>  (alpha may be empty or missing)
        for (const auto& p : tokens::payloads(*l, "+CNUM:")) {
            auto t = split_csv(p);
            for (const auto& tok : t) {
                if (!tok.empty() && (tok[0] == '+' || std::isdigit((unsigned char)tok[0])) && tok.size() > 4) {
                    m.sim.msisdn = tok;
                    break;
                }
            }
            if (m.sim.msisdn) break;
        }
    }
    if (const auto* l = find(batch, cmd::kQsimstat)) {
        auto ps = tokens::payloads(*l, "+QSIMSTAT:");
        if (!ps.empty()) {
            auto t = split_csv(ps.front());
            if (auto e = parse_int(at(t, 0), 0, 1)) m.sim.enabled = (*e == 1);
            if (auto i = parse_int(at(t, 1), 0, 2)) m.sim.inserted = (*i == 1);
        }
    }
    if (const auto* l = find(batch, cmd::kUsbspeed)) {
        for (const auto& p : tokens::payloads(*l, "+QCFG:")) {
            auto t = split_csv(p);
            if (tokens::lower(at(t, 0)) != "usbspeed") continue;
            m.usb_speed_code = tokens::non_empty(at(t, 1));
            if (m.usb_speed_code) m.usb_speed = usb_speed_label(*m.usb_speed_code);
        }
    }
    return m;
}

// ---------------------------------------------------------------------------
// decode()
// ---------------------------------------------------------------------------
TelemetryRecord decode(const ReplyBatch& batch) {
    TelemetryRecord r;
    auto lines_of = [&](const char* c) { return find(batch, c); };

    r.registration = guarded("registration", [&]() -> std::optional<Registration> {
        Registration reg;
        if (auto l = lines_of(cmd::kCgreg))  reg.ps   = decode_registration(*l, "+CGREG:");
        if (auto l = lines_of(cmd::kCereg))  reg.eps  = decode_registration(*l, "+CEREG:");
        if (auto l = lines_of(cmd::kC5greg)) reg.nr5g = decode_registration(*l, "+C5GREG:");
        if (!reg.ps && !reg.eps && !reg.nr5g) return std::nullopt;
        return reg;
    });

    r.mode = guarded("mode", [&]() -> std::optional<RadioMode> {
        auto l = lines_of(cmd::kQnwinfo);
        return l ? decode_qnwinfo(*l) : std::nullopt;
    });

    r.serving = guarded("serving", [&]() -> std::optional<ServingCell> {
        auto l = lines_of(cmd::kServing);
        return l ? decode_serving(*l) : std::nullopt;
    });

    r.op = guarded("operator", [&]() -> std::optional<OperatorInfo> {
        OperatorInfo op;
        if (auto l = lines_of(cmd::kCops)) op.name = decode_cops(*l);
        if (auto l = lines_of(cmd::kQnwinfo)) {
            auto ps = tokens::payloads(*l, "+QNWINFO:");
            if (!ps.empty()) op.plmn = tokens::non_empty(at(split_csv(ps.front()), 1));
        }
        if (r.serving) {
            const auto& s = *r.serving;
            if (s.nr && s.nr->mcc)        { op.mcc = s.nr->mcc;  op.mnc = s.nr->mnc; }
            else if (s.lte && s.lte->mcc) { op.mcc = s.lte->mcc; op.mnc = s.lte->mnc; }
        }
        if (!op.mcc && op.plmn && op.plmn->size() >= 5) {
            op.mcc = op.plmn->substr(0, 3);
            op.mnc = op.plmn->substr(3);
        }
        if (!op.name && !op.plmn && !op.mcc) return std::nullopt;
        return op;
    });

    r.signal = guarded("signal", [&]() -> std::optional<Signal> {
        Signal s;
        if (auto l = lines_of(cmd::kQrsrp)) s.rsrp = decode_first_metric(*l, "+QRSRP:");
        if (auto l = lines_of(cmd::kQrsrq)) s.rsrq = decode_first_metric(*l, "+QRSRQ:");
        if (auto l = lines_of(cmd::kQsinr)) s.sinr = decode_first_metric(*l, "+QSINR:");

        const ServingCell* sc = r.serving ? &*r.serving : nullptr;
        if (sc && sc->lte) {
            SignalBlock b{sc->lte->rsrp, sc->lte->rsrq, sc->lte->rssi, sc->lte->sinr, std::nullopt};
            b.quality = rate_quality(b.rsrp, b.sinr, bands::Rat::Lte);
            s.lte = b;
        }
        if (sc && sc->nr) {
            SignalBlock b{sc->nr->rsrp, sc->nr->rsrq, std::nullopt, sc->nr->sinr, std::nullopt};
            b.quality = rate_quality(b.rsrp, b.sinr, bands::Rat::Nr);
            s.nr = b;
        }

        const bool nr_primary = sc && sc->rat == ServingRat::NrSa;
        if (nr_primary && s.nr)   s.quality = s.nr->quality;
        else if (s.lte)           s.quality = s.lte->quality;
        else s.quality = rate_quality(s.rsrp, s.sinr, nr_primary ? bands::Rat::Nr : bands::Rat::Lte);

        if (!s.rsrp && !s.rsrq && !s.sinr && !s.lte && !s.nr) return std::nullopt;
        return s;
    });

    r.ca = guarded("ca", [&]() -> std::optional<CarrierAggregation> {
        auto l = lines_of(cmd::kQcainfo);
        return l ? decode_qcainfo(*l) : std::nullopt;
    });

    r.neighbours = guarded("neighbours", [&]() -> std::optional<Neighbours> {
        auto l = lines_of(cmd::kNeighbour);
        return l ? decode_neighbours(*l) : std::nullopt;
    });

    r.netdev = guarded("netdev", [&]() -> std::optional<NetDevStats> {
        auto l = lines_of(cmd::kQnetdev);
        return l ? decode_qnetdevstatus(*l) : std::nullopt;
    });

    r.session = guarded("session", [&]() -> std::optional<DataSession> {
        return decode_sessions(lines_of(cmd::kCgdcont), lines_of(cmd::kCgact),
                               lines_of(cmd::kCgcontrdp), lines_of(cmd::kQidnscfg));
    });

    r.temperatures = guarded("temperatures", [&]() -> std::optional<Temperatures> {
        auto l = lines_of(cmd::kQtemp);
        return l ? decode_qtemp(*l) : std::nullopt;
    });

    return r;
}

} // namespace linkstation::decoder
