#pragma once
/**
 * @page ls-telemetry Telemetry data model
 * @file telemetry.hpp
 * @brief Typed, partial view of the modem's radio state.
 *
 * @details
 * Every field is std::optional: a reply that fails to arrive or fails to parse
 * leaves exactly that field empty. Nothing here is a loose string map except the
 * temperature sensors, whose names differ per firmware.
 *
 * A TelemetrySnapshot is what the poller publishes: one decoded record plus the
 * cycle id and capture time. Snapshots are immutable once published.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace linkstation {

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
enum class RegState {
  NotRegistered = 0, Home, Searching, Denied, Unknown, Roaming,
  SmsOnly, CsfbSmsOnly, EmergencyOnly, CsfbNotPreferred, HomeEmergencyOnly,
  Other
};

struct RegStatus {
  int code{0};
  RegState state{RegState::Other};
  std::string text;
};

struct Registration {
  std::optional<RegStatus> ps;    ///< +CGREG (packet switched)
  std::optional<RegStatus> eps;   ///< +CEREG (LTE)
  std::optional<RegStatus> nr5g;  ///< +C5GREG (5GS)
};

// ---------------------------------------------------------------------------
// Mode / operator
// ---------------------------------------------------------------------------
struct RadioMode {
  std::optional<std::string> rat;     ///< "LTE", "SA", "NSA", "WCDMA", ...
  std::optional<std::string> duplex;  ///< "FDD" / "TDD"
  std::optional<std::string> access;  ///< raw +QNWINFO access technology
  std::optional<std::string> band;    ///< "LTE BAND 3" as reported by +QNWINFO
  std::optional<int> channel;
};

struct OperatorInfo {
  std::optional<std::string> name;    ///< +COPS long name
  std::optional<std::string> plmn;    ///< MCCMNC from +QNWINFO
  std::optional<std::string> mcc;
  std::optional<std::string> mnc;
};

// ---------------------------------------------------------------------------
// Signal
// ---------------------------------------------------------------------------
enum class Quality { Excellent, Good, Fair, Poor };

struct SignalBlock {
  std::optional<int> rsrp, rsrq, rssi, sinr;
  std::optional<Quality> quality;
};

struct Signal {
  std::optional<int> rsrp, rsrq, sinr;   ///< first values of +QRSRP/+QRSRQ/+QSINR
  std::optional<SignalBlock> lte;
  std::optional<SignalBlock> nr;
  std::optional<Quality> quality;        ///< bucket of the primary RAT
};

// ---------------------------------------------------------------------------
// Serving cell (type tag selects which sub-record is meaningful)
// ---------------------------------------------------------------------------
enum class ServingRat { Lte, NrSa, NrNsa };

struct LteServing {
  std::optional<std::string> state, duplex, mcc, mnc;
  std::optional<std::uint64_t> cell_id;
  std::optional<int> pci, earfcn, band, tac;
  std::optional<double> ul_bw_mhz, dl_bw_mhz;
  std::optional<int> rsrp, rsrq, rssi, sinr, cqi, tx_power, srxlev;
};

struct NrServing {
  std::optional<std::string> state, duplex, mcc, mnc;
  std::optional<std::uint64_t> cell_id;
  std::optional<int> pci, tac, arfcn, band;
  std::optional<double> dl_bw_mhz;
  std::optional<int> rsrp, rsrq, sinr, scs_khz, srxlev;
};

struct CellIdentity {
  std::optional<std::uint64_t> enb_id, lte_cell;   ///< ECI = eNB(20) | cell(8)
  std::optional<std::uint64_t> gnb_id, nr_cell;    ///< NCI = gNB(24) | cell(12)
};

struct ServingCell {
  ServingRat rat{ServingRat::Lte};
  std::optional<std::string> state;
  std::optional<LteServing> lte;     ///< LTE, or the NSA anchor
  std::optional<NrServing>  nr;      ///< SA, or the NSA secondary leg
  std::optional<std::string> band_label;
  CellIdentity identity;
};

// ---------------------------------------------------------------------------
// Carrier aggregation
// ---------------------------------------------------------------------------
struct ComponentCarrier {
  int index{0};                       ///< 0 = PCC, SCCs count from 1
  std::optional<std::string> rat;     ///< "LTE" / "NR5G"
  std::optional<std::string> band;    ///< "LTE BAND 3", "NR5G BAND 78"
  std::optional<int> arfcn;
  std::optional<double> dl_bw_mhz;
  std::optional<int> pci, rsrp, rsrq, rssi, sinr;
};

struct CarrierAggregation {
  std::optional<ComponentCarrier> primary;
  std::vector<ComponentCarrier> secondary;
  std::optional<std::string> summary;
};

// ---------------------------------------------------------------------------
// Neighbours
// ---------------------------------------------------------------------------
struct LteNeighbour {
  std::string scope;                  ///< "intra" / "inter"
  std::optional<int> earfcn, pci, rsrq, rsrp, rssi, sinr, srxlev;
  std::optional<std::string> band;
};

struct NrNeighbour {
  std::optional<int> arfcn, pci, rsrp, rsrq, sinr, scs_khz;
  std::optional<std::string> band;
};

struct Neighbours {
  std::vector<LteNeighbour> lte;
  std::vector<NrNeighbour> nr;
};

// ---------------------------------------------------------------------------
// Network interface / data sessions / temperatures
// ---------------------------------------------------------------------------
struct NetDevStats {
  std::optional<std::string> iface, state, ipv4;
  std::optional<std::uint64_t> rx_bytes, tx_bytes;
  std::optional<double> rx_bps, tx_bps;
  std::string source;                 ///< "modem" or "sysfs"
};

struct PdpContext {
  int cid{0};
  std::optional<std::string> type, apn, ip, dns1, dns2;
  std::optional<int> state;           ///< +CGACT, 1 = active
};

struct DataSession {
  std::optional<int> default_cid;
  std::vector<PdpContext> contexts;
};

struct Temperatures {
  std::map<std::string, int> sensors;            ///< raw name -> degC, -273 dropped
  std::optional<int> ambient, mmw;
  std::map<std::string, int> pa;
  std::map<std::string, int> baseband;
  std::optional<int> max_c;
};

// ---------------------------------------------------------------------------
// Modem identity (one-shot, not part of the poll battery)
// ---------------------------------------------------------------------------
struct SimInfo {
  std::optional<std::string> imsi, iccid, msisdn;
  std::optional<bool> enabled, inserted;
};

struct ModemInfo {
  std::optional<std::string> manufacturer, model, revision, imei;
  SimInfo sim;
  std::optional<std::string> usb_speed_code, usb_speed;
};

// ---------------------------------------------------------------------------
// Decoded record and published snapshot
// ---------------------------------------------------------------------------
struct TelemetryRecord {
  std::optional<Registration> registration;
  std::optional<RadioMode> mode;
  std::optional<OperatorInfo> op;
  std::optional<Signal> signal;
  std::optional<ServingCell> serving;
  std::optional<CarrierAggregation> ca;
  std::optional<Neighbours> neighbours;
  std::optional<NetDevStats> netdev;
  std::optional<DataSession> session;
  std::optional<Temperatures> temperatures;
};

struct TelemetrySnapshot {
  std::uint64_t cycle{0};
  std::chrono::system_clock::time_point captured_at{};
  std::chrono::steady_clock::time_point captured_mono{};
  TelemetryRecord data;
  std::vector<std::string> failed;                          ///< commands with no usable reply
  std::map<std::string, std::vector<std::string>> raw;      ///< only when raw capture is on
};

const char* to_string(Quality q);
const char* to_string(ServingRat r);

} // namespace linkstation
