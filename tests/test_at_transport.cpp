#include <doctest/doctest.h>
#include "linkstation/transport/at_transport.hpp"

#include "sim_modem.hpp"
#include "test_util.hpp"

#include <thread>
#include <vector>

using namespace linkstation::transport;
using namespace std::chrono_literals;
using testutil::SimState;
using testutil::TempDir;

TEST_CASE("Successful exchange captures reply lines up to OK") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->set("AT+QRSRP", testutil::ok_reply("+QRSRP: -95,-97,-32768,-32768"));
    auto at = testutil::make_transport(dir, st);

    auto ex = at->send("AT+QRSRP\r\n");
    CHECK(ex.ok());
    CHECK(ex.command == "AT+QRSRP");
    REQUIRE(ex.lines.size() == 3);
    CHECK(ex.lines[0] == "+QRSRP: -95,-97,-32768,-32768");
    CHECK(ex.lines.back() == "OK");
    CHECK(st->sent() == std::vector<std::string>{"AT+QRSRP"});

    auto s = at->session();
    CHECK(s.open);
    CHECK(s.baud == 115200);
    CHECK(s.device_path == (dir / "ttyUSB2").string());
}

TEST_CASE("Reply split over many reads is reassembled") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->chunk = 3;
    st->set("AT+COPS?", testutil::ok_reply("+COPS: 0,0,\"Telekom.de\",13"));
    auto at = testutil::make_transport(dir, st);

    auto ex = at->send("AT+COPS?");
    REQUIRE(ex.ok());
    CHECK(ex.lines[0] == "+COPS: 0,0,\"Telekom.de\",13");
}

TEST_CASE("ERROR and +CME ERROR are protocol errors, not channel failures") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->set("AT+CIMI", testutil::error_reply("+CME ERROR: 10"));
    auto at = testutil::make_transport(dir, st);

    auto ex = at->send("AT+CIMI");
    CHECK(ex.outcome == ExchangeOutcome::ProtocolError);
    CHECK(ex.error == "+CME ERROR: 10");
    CHECK_FALSE(ex.transport_failed());

    auto unknown = at->send("AT+NOPE");
    CHECK(unknown.outcome == ExchangeOutcome::ProtocolError);
    CHECK(unknown.error == "ERROR");
    CHECK(st->opens() == 1);
}

TEST_CASE("Silence ends in Timeout without reconnecting") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->handler = [](const std::string& cmd) -> std::string {
        if (cmd == "AT+QENG=\"servingcell\"") return "";
        if (cmd == "AT+QTEMP") return "\r\n+QTEMP: \"modem-ambient-usr\",\"38\"\r\n";
        return testutil::ok_reply();
    };
    auto at = testutil::make_transport(dir, st);

    auto silent = at->send("AT+QENG=\"servingcell\"", 40ms);
    CHECK(silent.outcome == ExchangeOutcome::Timeout);
    CHECK(silent.error == "no response");
    CHECK(silent.transport_failed());

    auto partial = at->send("AT+QTEMP", 40ms);
    CHECK(partial.outcome == ExchangeOutcome::Timeout);
    CHECK(partial.error == "incomplete response");
    REQUIRE(partial.lines.size() == 1);

    CHECK(st->opens() == 1);
    CHECK(at->session().reconnect_attempts == 0);
    CHECK(at->send("AT").ok());
}

TEST_CASE("Read failure reconnects and replays the command exactly once") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->set("AT+CSQ", testutil::ok_reply("+CSQ: 20,99"));
    st->fail_reads = 1;
    auto at = testutil::make_transport(dir, st, testutil::immediate_retries(3));

    auto ex = at->send("AT+CSQ");
    CHECK(ex.ok());
    CHECK(st->count("AT+CSQ") == 2);
    CHECK(st->opens() == 2);

    auto s = at->session();
    CHECK(s.open);
    CHECK(s.reconnect_attempts == 1);
    CHECK(s.last_error == "read failed");
}

TEST_CASE("Exhausted reconnect schedule reports IoError and leaves the session closed") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->set("AT+CSQ", testutil::ok_reply("+CSQ: 20,99"));

    std::vector<std::chrono::milliseconds> slept;
    RetryPolicy policy;
    policy.delays = {0ms, 10ms, 20ms};
    policy.max_attempts = 3;
    auto at = testutil::make_transport(dir, st, policy,
                                       [&](std::chrono::milliseconds d) { slept.push_back(d); });

    REQUIRE(at->send("AT+CSQ").ok());
    {
        std::lock_guard<std::mutex> lk(st->mu);
        st->fail_reads = 1;
        st->fail_opens = 3;
    }

    auto ex = at->send("AT+CSQ");
    CHECK(ex.outcome == ExchangeOutcome::IoError);
    CHECK(ex.error.rfind("reconnect failed", 0) == 0);
    CHECK(st->count("AT+CSQ") == 2);   // no replay without a session
    const std::vector<std::chrono::milliseconds> expected_waits{10ms, 20ms};
    CHECK(slept == expected_waits);

    auto s = at->session();
    CHECK_FALSE(s.open);
    CHECK(s.reconnect_attempts == 3);

    // The next caller reopens on its own.
    CHECK(at->send("AT+CSQ").ok());
    CHECK(at->session().open);
}

TEST_CASE("A replay that fails again is an IoError") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->set("AT+CSQ", testutil::ok_reply("+CSQ: 20,99"));
    st->fail_reads = 2;
    auto at = testutil::make_transport(dir, st, testutil::immediate_retries(1));

    auto ex = at->send("AT+CSQ");
    CHECK(ex.outcome == ExchangeOutcome::IoError);
    CHECK(st->count("AT+CSQ") == 2);
    CHECK_FALSE(at->session().open);
}

TEST_CASE("Write failure takes the same reconnect path") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->set("AT", testutil::ok_reply());
    st->fail_writes = 1;
    auto at = testutil::make_transport(dir, st);

    CHECK(at->send("AT").ok());
    CHECK(st->count("AT") == 1);
    CHECK(at->session().reconnect_attempts == 1);
}

TEST_CASE("No device node gives DeviceNotFound without opening anything") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    ResolverConfig rc;
    rc.configured_path = (dir / "ttyUSB2").string();   // never created
    rc.dev_root = dir.str();
    rc.tty_root = (dir / "none").string();
    rc.usb_root = (dir / "none").string();
    AtTransport at(std::make_unique<testutil::SimModem>(st), DeviceResolver(rc), 115200,
                   testutil::immediate_retries(1));

    auto ex = at.send("AT");
    CHECK(ex.outcome == ExchangeOutcome::DeviceNotFound);
    CHECK(ex.error == "no modem AT port found");
    CHECK(st->opens() == 0);
    CHECK(at.session().last_error == "no modem AT port found");
}

TEST_CASE("reset() closes the session and the next send reopens it") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->set("AT", testutil::ok_reply());
    auto at = testutil::make_transport(dir, st);

    REQUIRE(at->send("AT").ok());
    at->reset();
    CHECK_FALSE(at->session().open);
    CHECK(at->send("AT").ok());
    CHECK(st->opens() == 2);
}

TEST_CASE("Concurrent callers never interleave on the channel") {
    TempDir dir;
    auto st = std::make_shared<SimState>();
    st->write_delay = 1ms;
    st->chunk = 7;
    st->handler = [](const std::string& cmd) {
        return testutil::ok_reply("+ECHO: " + cmd);
    };
    auto at = testutil::make_transport(dir, st);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 20;
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const std::string cmd = "AT+T" + std::to_string(t) + "I" + std::to_string(i);
                auto ex = at->send(cmd);
                if (!ex.ok() || ex.lines.empty() || ex.lines[0] != "+ECHO: " + cmd) ++mismatches;
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(mismatches.load() == 0);
    CHECK_FALSE(st->interleaved.load());
    CHECK(st->sent().size() == static_cast<std::size_t>(kThreads * kPerThread));
}
