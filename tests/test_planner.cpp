#include <doctest/doctest.h>
#include "linkstation/planner.hpp"
#include "linkstation/decoder.hpp"

#include "sim_modem.hpp"
#include "test_util.hpp"

using namespace linkstation;
using testutil::SimState;
using testutil::TempDir;

namespace {

struct Rig {
    TempDir dir;
    std::shared_ptr<SimState> st = std::make_shared<SimState>();
    std::unique_ptr<transport::AtTransport> at = testutil::make_transport(dir, st);
    ControlSwitches sw;
    Planner planner{*at, sw};

    Rig() {
        st->handler = [](const std::string& cmd) -> std::string {
            if (cmd == decoder::cmd::kRoamPref) return testutil::ok_reply("+QNWPREFCFG: \"roam_pref\",255");
            if (cmd == decoder::cmd::kModePref) return testutil::ok_reply("+QNWPREFCFG: \"mode_pref\",AUTO");
            return testutil::ok_reply();
        };
    }

    ControlAction run(ActionKind kind, const ActionRequest& req) {
        ControlAction a;
        std::string err;
        REQUIRE_MESSAGE(planner.run(kind, req, a, err), err);
        return a;
    }
};

} // namespace

TEST_CASE("Dangerous actions are previewed, never sent, while dangerous control is off") {
    Rig rig;
    ActionRequest req;
    req.mode = "full";
    req.dry_run = false;

    auto a = rig.run(ActionKind::Reboot, req);
    CHECK(a.dry_run);
    CHECK_FALSE(a.requested_dry_run);
    CHECK_FALSE(a.executed);
    CHECK(a.blocked_reason == std::optional<std::string>("dangerous-blocked"));
    CHECK(a.state == ActionState::Blocked);
    CHECK(a.plan.size() == 2);
    CHECK(rig.st->sent().empty());
}

TEST_CASE("Dangerous actions run once dangerous control is allowed") {
    Rig rig;
    rig.sw.allow_dangerous = true;
    ActionRequest req;
    req.mode = "rndis";

    auto a = rig.run(ActionKind::UsbNet, req);
    CHECK(a.executed);
    CHECK_FALSE(a.dry_run);
    CHECK(a.state == ActionState::Completed);
    CHECK(a.ok());
    CHECK(rig.st->sent() == std::vector<std::string>{"AT+QCFG=\"usbnet\",1"});
}

TEST_CASE("Disabled control blocks even safe actions") {
    Rig rig;
    rig.sw.enabled = false;
    rig.sw.allow_dangerous = true;
    ActionRequest req;
    req.enable = true;

    auto a = rig.run(ActionKind::Roaming, req);
    CHECK(a.blocked_reason == std::optional<std::string>("disabled"));
    CHECK_FALSE(a.executed);
    CHECK(rig.st->sent().empty());
}

TEST_CASE("dry_run previews a safe action without a blocked reason") {
    Rig rig;
    ActionRequest req;
    req.enable = true;
    req.dry_run = true;

    auto a = rig.run(ActionKind::Gnss, req);
    CHECK(a.dry_run);
    CHECK(a.requested_dry_run);
    CHECK_FALSE(a.blocked_reason.has_value());
    CHECK(a.state == ActionState::Blocked);
    CHECK(a.plan == std::vector<std::string>{"AT+QCFG=\"gnss\",\"all\",1"});
    CHECK(rig.st->sent().empty());
}

TEST_CASE("Safe action executes and issues its read-back") {
    Rig rig;
    ActionRequest req;
    req.enable = true;

    auto a = rig.run(ActionKind::Roaming, req);
    CHECK(a.executed);
    CHECK(a.state == ActionState::Completed);
    REQUIRE(a.readback.has_value());
    CHECK(a.readback->ok());
    CHECK(decoder::decode_roam_pref(a.readback->lines) == std::optional<int>(255));
    CHECK(rig.st->sent() == std::vector<std::string>({"AT+QNWPREFCFG=\"roam_pref\",255",
                                                      decoder::cmd::kRoamPref}));
}

TEST_CASE("Carrier aggregation result carries the classification note") {
    Rig rig;
    auto a = rig.run(ActionKind::CarrierAggregation, ActionRequest{});
    CHECK(a.danger == Danger::Safe);
    CHECK(a.executed);
    REQUIRE(a.classification_note.has_value());
    CHECK(a.classification_note->rfind("classification disputed", 0) == 0);
}

TEST_CASE("Carrier aggregation dry run with both flags previews two commands and sends nothing") {
    Rig rig;
    ActionRequest req;
    req.lte_ca = true;
    req.nr_ca = true;
    req.dry_run = true;

    auto a = rig.run(ActionKind::CarrierAggregation, req);
    const std::vector<std::string> expected{"AT+QCFG=\"lte/ca\",1", "AT+QCFG=\"nr5g/ca\",1"};
    CHECK(a.plan == expected);
    CHECK(a.dry_run);
    CHECK_FALSE(a.executed);
    CHECK_FALSE(a.blocked_reason.has_value());
    CHECK(a.state == ActionState::Blocked);
    CHECK(a.outcomes.empty());
    REQUIRE(a.classification_note.has_value());
    CHECK(a.classification_note->rfind("classification disputed", 0) == 0);
    CHECK(rig.st->sent().empty());
}

TEST_CASE("First rejected command stops the plan and is the action error") {
    Rig rig;
    rig.sw.allow_dangerous = true;
    rig.st->handler = [](const std::string& cmd) -> std::string {
        if (cmd == "AT+QNWLOCK=0") return testutil::error_reply("+CME ERROR: 3");
        return testutil::ok_reply();
    };

    auto a = rig.run(ActionKind::ResetProfile, ActionRequest{});
    CHECK(a.state == ActionState::PartiallyFailed);
    CHECK_FALSE(a.executed);
    CHECK_FALSE(a.ok());
    CHECK(a.outcomes.size() == 3);
    REQUIRE(a.errors.size() == 1);
    CHECK(a.errors[0] == "AT+QNWLOCK=0: +CME ERROR: 3");
    CHECK(a.error == std::optional<std::string>("modem rejected AT+QNWLOCK=0 (+CME ERROR: 3)"));
    CHECK(rig.st->sent().size() == 3);
}

TEST_CASE("Validation failure never reaches the modem") {
    Rig rig;
    rig.sw.allow_dangerous = true;
    ActionRequest req;
    req.apn = "bad\"apn";

    ControlAction a;
    std::string err;
    CHECK_FALSE(rig.planner.run(ActionKind::Apn, req, a, err));
    CHECK_FALSE(err.empty());
    CHECK(a.state == ActionState::Received);
    CHECK(rig.st->sent().empty());
}

TEST_CASE("Switches are read per request") {
    Rig rig;
    ActionRequest req;
    req.enable = false;

    CHECK(rig.run(ActionKind::CellLock, req).blocked_reason == std::optional<std::string>("dangerous-blocked"));
    rig.sw.allow_dangerous = true;
    CHECK(rig.run(ActionKind::CellLock, req).executed);
    rig.sw.allow_dangerous = false;
    CHECK_FALSE(rig.run(ActionKind::CellLock, req).executed);
    CHECK(rig.st->count("AT+QNWLOCK=0") == 1);
}

TEST_CASE("query() only sends read-only preference and identity commands") {
    Rig rig;
    auto ok = rig.planner.query(decoder::cmd::kModePref);
    REQUIRE(ok.has_value());
    CHECK(decoder::decode_mode_pref(ok->lines) == std::optional<std::string>("AUTO"));

    CHECK(rig.planner.query(decoder::cmd::kGmi).has_value());
    CHECK_FALSE(rig.planner.query("AT+CFUN=1,1").has_value());
    CHECK_FALSE(rig.planner.query("AT+QNWPREFCFG=\"roam_pref\",1").has_value());
    CHECK(rig.st->count("AT+CFUN=1,1") == 0);
}

TEST_CASE("Empty plan is a preview with nothing to block") {
    Rig rig;
    auto a = rig.run(ActionKind::BandPreference, ActionRequest{});
    CHECK(a.plan.empty());
    CHECK_FALSE(a.executed);
    CHECK_FALSE(a.blocked_reason.has_value());
    CHECK(rig.st->sent().empty());
}
