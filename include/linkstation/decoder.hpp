#pragma once
/**
 * @page ls-decoder Reply decoder
 * @file decoder.hpp
 * @brief Pure functions turning Quectel AT reply lines into typed telemetry.
 *
 * @details
 * PURPOSE
 * -------
 * Replies are loosely structured text whose shape depends on firmware and on the
 * radio state (LTE, SA, NSA, no service). Every decode function here takes the
 * captured reply lines of one command and returns an optional typed value. A
 * reply that is missing or malformed yields nullopt for that field only.
 *
 * ISOLATION
 * ---------
 * decode() runs each field decoder behind a guard that converts any exception
 * (bad_alloc, out_of_range from a substr on a truncated line) into an empty field
 * plus a debug log line. One broken reply never takes down the whole record.
 *
 * BATTERY
 * -------
 * telemetry_battery() is the fixed, read-only command list the poller sends every
 * cycle. info_battery() is the one-shot identity query list. Neither ever contains
 * a state-changing command.
 */

#include "linkstation/band_table.hpp"
#include "linkstation/telemetry.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace linkstation::decoder {

namespace cmd {
constexpr const char* kCgreg        = "AT+CGREG?";
constexpr const char* kCereg        = "AT+CEREG?";
constexpr const char* kC5greg       = "AT+C5GREG?";
constexpr const char* kQnwinfo      = "AT+QNWINFO";
constexpr const char* kCops         = "AT+COPS?";
constexpr const char* kQrsrp        = "AT+QRSRP";
constexpr const char* kQrsrq        = "AT+QRSRQ";
constexpr const char* kQsinr        = "AT+QSINR";
constexpr const char* kServing      = "AT+QENG=\"servingcell\"";
constexpr const char* kNeighbour    = "AT+QENG=\"neighbourcell\"";
constexpr const char* kQcainfo      = "AT+QCAINFO";
constexpr const char* kQtemp        = "AT+QTEMP";
constexpr const char* kQnetdev      = "AT+QNETDEVSTATUS";
constexpr const char* kCgdcont      = "AT+CGDCONT?";
constexpr const char* kCgact        = "AT+CGACT?";
constexpr const char* kCgcontrdp    = "AT+CGCONTRDP";
constexpr const char* kQidnscfg     = "AT+QIDNSCFG=1";

constexpr const char* kGmi          = "AT+GMI";
constexpr const char* kCgmm         = "AT+CGMM";
constexpr const char* kGmr          = "AT+GMR";
constexpr const char* kGsn          = "AT+GSN";
constexpr const char* kCimi         = "AT+CIMI";
constexpr const char* kIccid        = "AT+ICCID";
constexpr const char* kCnum         = "AT+CNUM";
constexpr const char* kQsimstat     = "AT+QSIMSTAT?";
constexpr const char* kUsbspeed     = "AT+QCFG=\"usbspeed\"";

constexpr const char* kRoamPref     = "AT+QNWPREFCFG=\"roam_pref\"";
constexpr const char* kModePref     = "AT+QNWPREFCFG=\"mode_pref\"";
constexpr const char* kLteBandPref  = "AT+QNWPREFCFG=\"lte_band\"";
constexpr const char* kNsaBandPref  = "AT+QNWPREFCFG=\"nsa_nr5g_band\"";
constexpr const char* kNrBandPref   = "AT+QNWPREFCFG=\"nr5g_band\"";
} // namespace cmd

/// command -> reply lines; a command missing from the map failed this cycle.
using ReplyBatch = std::map<std::string, std::vector<std::string>>;

const std::vector<std::string>& telemetry_battery();
const std::vector<std::string>& info_battery();

// ---- registration / mode / operator ----
RegStatus reg_status(int code);
std::optional<RegStatus> decode_registration(const std::vector<std::string>& lines, const std::string& tag);
std::optional<RadioMode> decode_qnwinfo(const std::vector<std::string>& lines);
std::optional<std::string> decode_cops(const std::vector<std::string>& lines);

// ---- signal ----
std::optional<int> decode_first_metric(const std::vector<std::string>& lines, const std::string& tag);
std::optional<Quality> rate_quality(std::optional<int> rsrp, std::optional<int> sinr, bands::Rat rat);

// ---- cells ----
std::optional<ServingCell> decode_serving(const std::vector<std::string>& lines);
std::optional<CarrierAggregation> decode_qcainfo(const std::vector<std::string>& lines);
std::string ca_summary(const CarrierAggregation& ca);
std::optional<Neighbours> decode_neighbours(const std::vector<std::string>& lines);

// ---- data path ----
std::optional<NetDevStats> decode_qnetdevstatus(const std::vector<std::string>& lines);
std::optional<DataSession> decode_sessions(const std::vector<std::string>* cgdcont,
                                           const std::vector<std::string>* cgact,
                                           const std::vector<std::string>* cgcontrdp,
                                           const std::vector<std::string>* qidnscfg);

// ---- temperatures ----
std::optional<Temperatures> decode_qtemp(const std::vector<std::string>& lines);

// ---- control read-backs ----
std::optional<int> decode_roam_pref(const std::vector<std::string>& lines);
/// roam_pref 1 is home network only; every other value permits roaming.
bool roaming_enabled(int roam_pref);
std::optional<std::string> decode_mode_pref(const std::vector<std::string>& lines);
std::optional<std::vector<int>> decode_band_pref(const std::vector<std::string>& lines, const std::string& key);

// ---- identity ----
std::optional<std::string> usb_speed_label(const std::string& code);
ModemInfo decode_info(const ReplyBatch& batch);

/// Whole-battery decode; each field is decoded independently.
TelemetryRecord decode(const ReplyBatch& batch);

} // namespace linkstation::decoder
