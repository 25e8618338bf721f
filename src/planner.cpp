// ============================================================================
// planner.cpp — implementation for planner.hpp
// ============================================================================

#include "linkstation/planner.hpp"
#include "linkstation/decoder.hpp"

#include <spdlog/spdlog.h>

namespace linkstation {

using transport::ExchangeOutcome;

const char* to_string(ActionState s) {
    switch (s) {
        case ActionState::Received:        return "received";
        case ActionState::Planned:         return "planned";
        case ActionState::Blocked:         return "blocked";
        case ActionState::Executing:       return "executing";
        case ActionState::Completed:       return "completed";
        case ActionState::PartiallyFailed: return "partially-failed";
    }
    return "unknown";
}

Planner::Planner(transport::AtTransport& at, const ControlSwitches& switches)
: at_(at), switches_(switches) {}

bool Planner::plan(ActionKind kind, const ActionRequest& req, ControlAction& out, std::string& err) const {
    const ActionSpec& spec = action_spec(kind);

    out = ControlAction{};
    out.kind = kind;
    out.name = spec.name;
    out.danger = spec.danger;
    out.requested_dry_run = req.dry_run;
    out.dry_run = true;
    if (spec.classification_note) out.classification_note = std::string(spec.classification_note);

    if (!spec.validate(req, err)) {
        spdlog::info("[ctrl] action={} status=invalid reason={}", spec.name, err);
        return false;
    }
    out.plan = spec.plan(req);
    out.state = ActionState::Planned;
    return true;
}

bool Planner::run(ActionKind kind, const ActionRequest& req, ControlAction& out, std::string& err) {
    if (!plan(kind, req, out, err)) return false;

    if (!switches_.enabled.load()) {
        out.blocked_reason = std::string("disabled");
        out.state = ActionState::Blocked;
    } else if (out.plan.empty()) {
        out.state = ActionState::Blocked;
    } else if (out.danger == Danger::Dangerous && !switches_.allow_dangerous.load()) {
        out.blocked_reason = std::string("dangerous-blocked");
        out.state = ActionState::Blocked;
    } else if (req.dry_run) {
        out.state = ActionState::Blocked;
    } else {
        execute(out);
    }

    spdlog::info("[ctrl] action={} dangerous={} dry_run={} executed={} state={} blocked={} planned={}",
                 out.name, out.danger == Danger::Dangerous, out.dry_run, out.executed,
                 to_string(out.state), out.blocked_reason.value_or("-"), out.plan.size());
    return true;
}

void Planner::execute(ControlAction& a) {
    a.state = ActionState::Executing;
    a.dry_run = false;

    for (const auto& cmd : a.plan) {
        auto ex = at_.send(cmd);
        a.outcomes.push_back({ex.command, ex.outcome, ex.lines, ex.error});
        if (ex.ok()) continue;

        const std::string reason = ex.error.empty() ? transport::to_string(ex.outcome) : ex.error;
        a.errors.push_back(cmd + ": " + reason);
        a.error = (ex.outcome == ExchangeOutcome::ProtocolError ? "modem rejected " : "transport failure on ") +
                  cmd + " (" + reason + ")";
        a.state = ActionState::PartiallyFailed;
        spdlog::warn("[ctrl] action={} status=error cmd={} outcome={} reason={}",
                     a.name, cmd, transport::to_string(ex.outcome), reason);
        return;
    }

    a.executed = true;
    a.state = ActionState::Completed;

    const char* rb = action_spec(a.kind).readback;
    if (rb) {
        auto ex = at_.send(rb);
        if (!ex.ok()) a.errors.push_back(std::string("readback ") + rb + ": " + ex.error);
        a.readback = std::move(ex);
    }
}

std::optional<transport::CommandExchange> Planner::query(const std::string& command) {
    static const char* const kReadOnly[] = {
        decoder::cmd::kRoamPref, decoder::cmd::kModePref, decoder::cmd::kLteBandPref,
        decoder::cmd::kNsaBandPref, decoder::cmd::kNrBandPref,
    };
    for (const char* q : kReadOnly) {
        if (command == q) return at_.send(command);
    }
    for (const auto& q : decoder::info_battery()) {
        if (command == q) return at_.send(command);
    }
    spdlog::warn("[ctrl] status=rejected reason=not-a-read-only-query cmd={}", command);
    return std::nullopt;
}

} // namespace linkstation
