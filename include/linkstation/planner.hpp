#pragma once
/**
 * @page ls-planner Control planner / executor
 * @file planner.hpp
 * @brief Safety-gated execution of control actions.
 *
 * @details
 * STATE MACHINE
 * -------------
 *   Received -> Planned -> Blocked                      (preview only)
 *                       -> Executing -> Completed       (every command OK)
 *                                    -> PartiallyFailed (stopped at first failure)
 *
 * GATE (evaluated in this order, switches read per request)
 * ----
 *  1. control switch off                 -> preview, blocked_reason "disabled"
 *  2. empty plan                         -> preview, nothing to block
 *  3. dangerous action, dangerous off    -> preview, blocked_reason "dangerous-blocked"
 *                                           (whatever dry_run the caller asked for)
 *  4. dry_run requested                  -> preview
 *  5. otherwise execute
 *
 * EXECUTION
 * ---------
 * Commands run in plan order through AtTransport. The first ProtocolError or
 * transport failure stops the plan and becomes the action-level error; commands
 * already sent are not rolled back. A clean run issues the entry's read-back
 * query, if it has one.
 */

#include "linkstation/actions.hpp"
#include "linkstation/transport/at_transport.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace linkstation {

/// Runtime control switches; flipped while the process runs, read per request.
struct ControlSwitches {
  std::atomic<bool> enabled{true};
  std::atomic<bool> allow_dangerous{false};
};

enum class ActionState { Received, Planned, Blocked, Executing, Completed, PartiallyFailed };

const char* to_string(ActionState s);

struct CommandOutcome {
  std::string command;
  transport::ExchangeOutcome outcome{transport::ExchangeOutcome::Ok};
  std::vector<std::string> lines;
  std::string error;
};

struct ControlAction {
  ActionKind kind{ActionKind::Reboot};
  std::string name;
  Danger danger{Danger::Safe};
  bool requested_dry_run{false};
  bool dry_run{false};                       ///< effective: true whenever nothing was sent
  std::vector<std::string> plan;
  std::vector<CommandOutcome> outcomes;
  bool executed{false};
  std::optional<std::string> blocked_reason;
  std::vector<std::string> errors;
  std::optional<std::string> error;          ///< action-level failure
  ActionState state{ActionState::Received};
  std::optional<transport::CommandExchange> readback;
  std::optional<std::string> classification_note;

  bool ok() const { return !error.has_value(); }
};

class Planner {
public:
  Planner(transport::AtTransport& at, const ControlSwitches& switches);

  /// Validate and plan without touching the gate or the transport.
  bool plan(ActionKind kind, const ActionRequest& req, ControlAction& out, std::string& err) const;

  /// Full request: validate, plan, gate, execute. false + err only on validation failure.
  bool run(ActionKind kind, const ActionRequest& req, ControlAction& out, std::string& err);

  /// Read-only preference query (roam_pref, mode_pref, band prefs, identity).
  /// Never gated; nullopt for anything outside that read-only set.
  std::optional<transport::CommandExchange> query(const std::string& command);

private:
  void execute(ControlAction& a);

  transport::AtTransport& at_;
  const ControlSwitches& switches_;
};

} // namespace linkstation
