#pragma once
/**
 * @page ls-actions Control action table
 * @file actions.hpp
 * @brief The one table that turns a control request into an AT command plan.
 *
 * @details
 * PURPOSE
 * -------
 * Every state-changing request the gateway accepts is an entry in this table:
 * name, danger class, a validator, a pure planner and an optional read-back query.
 * Nothing outside the table builds write commands, so the safety gate in Planner
 * sees every one of them.
 *
 * VOCABULARY
 * ----------
 *   reboot           dangerous  AT+CFUN
 *   usbnet           dangerous  AT+QCFG="usbnet"
 *   apn              dangerous  AT+CGDCONT / AT+CGAUTH / AT+CGACT
 *   roaming          safe       AT+QNWPREFCFG="roam_pref"      (read-back)
 *   band             dangerous  AT+QCFG="band" / "lte/band" / "nr5g/band"
 *   cell_lock        dangerous  AT+QNWLOCK
 *   ca               safe       AT+QCFG="ca" / "lte/ca" / "nr5g/ca"
 *   gnss             safe       AT+QCFG="gnss"
 *   network_mode     safe       AT+QNWPREFCFG="mode_pref"      (read-back)
 *   band_preference  safe       AT+QNWPREFCFG="lte_band" ...
 *   reset_profile    dangerous  fixed "modem_safe" sequence
 *
 * The carrier-aggregation entry carries a classification note: field reports and
 * vendor guidance disagree on whether toggling CA can strand the modem, so the
 * entry says so in every response instead of silently picking a side.
 *
 * VALIDATION
 * ----------
 * Values that end up inside a quoted AT argument are restricted to characters
 * that cannot close the quote or start a second command (no `"`, `;`, CR, LF).
 * Validation runs before planning; a failed request never reaches the transport.
 */

#include <optional>
#include <string>
#include <vector>

namespace linkstation {

enum class Danger { Safe, Dangerous };

enum class ActionKind {
  Reboot, UsbNet, Apn, Roaming, Band, CellLock, CarrierAggregation,
  Gnss, NetworkMode, BandPreference, ResetProfile
};

/// Union of every action's parameters; each entry reads only its own fields.
struct ActionRequest {
  bool dry_run{false};

  std::optional<bool> enable;              // roaming, cell_lock, gnss
  std::optional<std::string> mode;         // reboot, usbnet, gnss
  bool reboot_modem{false};                // usbnet

  int cid{1};                              // apn
  std::string apn;
  std::string pdp_type{"IPV4V6"};
  std::string auth_type{"none"};           // none | pap | chap
  std::optional<std::string> auth_user, auth_password;
  bool activate{true};

  std::string rat{"BOTH"};                 // band: LTE|NR5G|BOTH ; cell_lock: lte|nr5g|nr|5g
  std::vector<std::string> lte_bands, nr_bands;
  bool reset{false};

  std::optional<int> pci;                  // cell_lock (accepted, not yet used by the modem command)
  std::optional<std::string> tac, cell_id;

  std::optional<bool> lte_ca, nr_ca;       // ca
  bool cold_start{false};                  // gnss

  std::optional<std::string> mode_pref;    // network_mode
  std::optional<std::vector<int>> lte_band_pref, nsa_nr5g_band_pref, nr5g_band_pref;

  std::string profile{"modem_safe"};       // reset_profile
};

struct ActionSpec {
  ActionKind kind;
  const char* name;
  Danger danger;
  bool (*validate)(const ActionRequest&, std::string& err);
  std::vector<std::string> (*plan)(const ActionRequest&);
  const char* readback;                    // nullptr when the action has none
  const char* classification_note;         // nullptr unless the danger class is disputed
};

/// The full table, in a stable order.
const std::vector<ActionSpec>& action_table();

/// Lookup by enum; always succeeds for a valid enum value.
const ActionSpec& action_spec(ActionKind kind);

/// Lookup by name ("cell_lock"); '-' is accepted for '_'. Case-insensitive.
bool name_to_action(const std::string& name, ActionKind& out);

const char* to_string(ActionKind kind);

/// Values accepted by the reboot / usbnet mode fields.
int usbnet_mode_value(const std::string& mode);   ///< -1 when unknown

} // namespace linkstation
