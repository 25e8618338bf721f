#include <doctest/doctest.h>
#include "linkstation/decoder.hpp"

#include "replies.hpp"

using namespace linkstation;
using testutil::lines_of;
namespace cmd = decoder::cmd;

TEST_CASE("LTE serving cell: fields, identity split and band label") {
    auto sc = decoder::decode_serving(lines_of(testutil::kServingLte));
    REQUIRE(sc.has_value());
    CHECK(sc->rat == ServingRat::Lte);
    CHECK(sc->state == std::optional<std::string>("NOCONN"));
    REQUIRE(sc->lte.has_value());
    CHECK_FALSE(sc->nr.has_value());

    const auto& l = *sc->lte;
    CHECK(l.duplex == std::optional<std::string>("FDD"));
    CHECK(l.mcc == std::optional<std::string>("262"));
    CHECK(l.mnc == std::optional<std::string>("01"));
    CHECK(l.cell_id == std::optional<std::uint64_t>(0x1A2B3C4));
    CHECK(l.pci == std::optional<int>(123));
    CHECK(l.earfcn == std::optional<int>(1300));
    CHECK(l.band == std::optional<int>(3));
    CHECK(l.dl_bw_mhz == std::optional<double>(20.0));
    CHECK(l.tac == std::optional<int>(0xBE40));
    CHECK(l.rsrp == std::optional<int>(-95));
    CHECK(l.sinr == std::optional<int>(12));
    CHECK(l.srxlev == std::optional<int>(45));

    CHECK(sc->identity.enb_id == std::optional<std::uint64_t>(107187));
    CHECK(sc->identity.lte_cell == std::optional<std::uint64_t>(196));
    CHECK_FALSE(sc->identity.gnb_id.has_value());
    CHECK(sc->band_label == std::optional<std::string>("LTE BAND 3 (1800 MHz)"));
}

TEST_CASE("NSA serving cell keeps the LTE anchor and the NR leg") {
    auto sc = decoder::decode_serving(lines_of(testutil::kServingNsa));
    REQUIRE(sc.has_value());
    CHECK(sc->rat == ServingRat::NrNsa);
    REQUIRE(sc->lte.has_value());
    REQUIRE(sc->nr.has_value());
    CHECK(sc->nr->pci == std::optional<int>(500));
    CHECK(sc->nr->rsrp == std::optional<int>(-88));
    CHECK(sc->nr->sinr == std::optional<int>(15));
    CHECK(sc->nr->rsrq == std::optional<int>(-11));
    CHECK(sc->nr->band == std::optional<int>(78));
    CHECK(sc->nr->dl_bw_mhz == std::optional<double>(100.0));
    CHECK(sc->nr->scs_khz == std::optional<int>(30));
    CHECK(sc->band_label == std::optional<std::string>("LTE BAND 3 (1800 MHz) + NR5G BAND 78 (3500 MHz)"));
}

TEST_CASE("SA serving cell splits the NR cell identity into gNB and cell") {
    auto sc = decoder::decode_serving(lines_of(testutil::kServingSa));
    REQUIRE(sc.has_value());
    CHECK(sc->rat == ServingRat::NrSa);
    REQUIRE(sc->nr.has_value());
    CHECK(sc->nr->duplex == std::optional<std::string>("TDD"));
    CHECK(sc->nr->tac == std::optional<int>(0x3E8));
    CHECK(sc->nr->arfcn == std::optional<int>(636672));
    CHECK(sc->identity.gnb_id == std::optional<std::uint64_t>(14939553));
    CHECK(sc->identity.nr_cell == std::optional<std::uint64_t>(2));
    CHECK_FALSE(sc->identity.enb_id.has_value());
}

TEST_CASE("Truncated or searching serving cell replies decode to nothing") {
    CHECK_FALSE(decoder::decode_serving(lines_of("\r\n+QENG: \"servingcell\",\"SEARCH\"\r\n\r\nOK\r\n")).has_value());
    CHECK_FALSE(decoder::decode_serving(lines_of("\r\n+QENG: \"servingcell\",\"NOCONN\",\"LTE\",\"FDD\",262\r\n\r\nOK\r\n")).has_value());
    CHECK_FALSE(decoder::decode_serving({}).has_value());
}

TEST_CASE("Carrier aggregation: PCC, ordered SCCs and a summary line") {
    auto ca = decoder::decode_qcainfo(lines_of(testutil::kQcainfo));
    REQUIRE(ca.has_value());
    REQUIRE(ca->primary.has_value());
    CHECK(ca->primary->index == 0);
    CHECK(ca->primary->rat == std::optional<std::string>("LTE"));
    CHECK(ca->primary->dl_bw_mhz == std::optional<double>(20.0));
    REQUIRE(ca->secondary.size() == 2);
    CHECK(ca->secondary[0].index == 1);
    CHECK(ca->secondary[0].band == std::optional<std::string>("LTE BAND 20"));
    CHECK(ca->secondary[0].dl_bw_mhz == std::optional<double>(10.0));
    CHECK(ca->secondary[1].rat == std::optional<std::string>("NR5G"));
    CHECK(ca->secondary[1].dl_bw_mhz == std::optional<double>(100.0));
    CHECK(ca->summary == std::optional<std::string>(
              "LTE PCC B3@1300 (BW 20MHz), SCC\xC3\x97" "2: B20@6300, n78@636672"));
}

TEST_CASE("No aggregation yields an empty record without a summary") {
    auto ca = decoder::decode_qcainfo(lines_of("\r\nOK\r\n"));
    REQUIRE(ca.has_value());
    CHECK_FALSE(ca->primary.has_value());
    CHECK(ca->secondary.empty());
    CHECK_FALSE(ca->summary.has_value());
}

TEST_CASE("Neighbour cells: scope, band guess and swapped RSRP/RSRQ") {
    auto n = decoder::decode_neighbours(lines_of(testutil::kNeighbours));
    REQUIRE(n.has_value());
    REQUIRE(n->lte.size() == 2);
    CHECK(n->lte[0].scope == "intra");
    CHECK(n->lte[0].rsrp == std::optional<int>(-98));
    CHECK(n->lte[0].rsrq == std::optional<int>(-12));
    CHECK(n->lte[0].band == std::optional<std::string>("B3"));

    CHECK(n->lte[1].scope == "inter");
    CHECK(n->lte[1].rsrp == std::optional<int>(-101));
    CHECK(n->lte[1].rsrq == std::optional<int>(-14));
    CHECK(n->lte[1].band == std::optional<std::string>("B20"));

    REQUIRE(n->nr.size() == 2);
    CHECK(n->nr[0].scs_khz == std::optional<int>(30));
    CHECK(n->nr[0].pci == std::optional<int>(501));
    CHECK(n->nr[0].band == std::optional<std::string>("n78"));
    CHECK_FALSE(n->nr[1].scs_khz.has_value());
    CHECK(n->nr[1].arfcn == std::optional<int>(636672));
    CHECK(n->nr[1].pci == std::optional<int>(502));
}

TEST_CASE("Registration codes map to states, unknown codes stay visible") {
    auto reg = decoder::decode_registration(lines_of("\r\n+CEREG: 0,5\r\n\r\nOK\r\n"), "+CEREG:");
    REQUIRE(reg.has_value());
    CHECK(reg->state == RegState::Roaming);
    CHECK(reg->text == "registered (roaming)");

    auto urc = decoder::decode_registration({"+CGREG: 1"}, "+CGREG:");
    REQUIRE(urc.has_value());
    CHECK(urc->state == RegState::Home);

    CHECK(decoder::reg_status(42).state == RegState::Other);
    CHECK(decoder::reg_status(42).text == "stat=42");
}

TEST_CASE("QNWINFO gives access technology, band and channel") {
    auto m = decoder::decode_qnwinfo(lines_of("\r\n+QNWINFO: \"FDD LTE\",\"26201\",\"LTE BAND 3\",1300\r\n\r\nOK\r\n"));
    REQUIRE(m.has_value());
    CHECK(m->rat == std::optional<std::string>("LTE"));
    CHECK(m->duplex == std::optional<std::string>("FDD"));
    CHECK(m->band == std::optional<std::string>("LTE BAND 3"));
    CHECK(m->channel == std::optional<int>(1300));

    auto nsa = decoder::decode_qnwinfo({"+QNWINFO: \"NR5G-NSA\",\"26201\",\"NR5G BAND 78\",636672"});
    REQUIRE(nsa.has_value());
    CHECK(nsa->rat == std::optional<std::string>("NSA"));

    auto none = decoder::decode_qnwinfo({"+QNWINFO: \"No Service\""});
    REQUIRE(none.has_value());
    CHECK(none->rat == std::optional<std::string>("NONE"));
}

TEST_CASE("Signal quality buckets") {
    using bands::Rat;
    CHECK(decoder::rate_quality(-75, std::nullopt, Rat::Lte) == std::optional<Quality>(Quality::Excellent));
    CHECK(decoder::rate_quality(-85, 25, Rat::Lte) == std::optional<Quality>(Quality::Excellent));
    CHECK(decoder::rate_quality(-85, 16, Rat::Lte) == std::optional<Quality>(Quality::Good));
    CHECK(decoder::rate_quality(-85, 16, Rat::Nr) == std::optional<Quality>(Quality::Excellent));
    CHECK(decoder::rate_quality(-85, -2, Rat::Lte) == std::optional<Quality>(Quality::Fair));
    CHECK(decoder::rate_quality(-105, 25, Rat::Lte) == std::optional<Quality>(Quality::Poor));
    CHECK_FALSE(decoder::rate_quality(std::nullopt, std::nullopt, Rat::Lte).has_value());
}

TEST_CASE("Temperatures: aliases, grouping, -273 dropped, maximum") {
    auto t = decoder::decode_qtemp(lines_of(testutil::kQtemp));
    REQUIRE(t.has_value());
    CHECK(t->sensors.size() == 4);
    CHECK(t->sensors.count("modem-mmw0") == 0);
    CHECK(t->ambient == std::optional<int>(38));
    CHECK_FALSE(t->mmw.has_value());
    CHECK(t->pa.at("lte_pa1") == 35);
    CHECK(t->baseband.at("cpuss_0_usr") == 47);
    CHECK(t->baseband.at("xo_therm_usr") == 40);
    CHECK(t->max_c == std::optional<int>(47));
}

TEST_CASE("QNETDEVSTATUS counter and address-only forms") {
    auto s = decoder::decode_qnetdevstatus({"+QNETDEVSTATUS: \"rmnet_data0\",\"up\",\"10.64.1.2\",123456,654321"});
    REQUIRE(s.has_value());
    CHECK(s->source == "modem");
    CHECK(s->iface == std::optional<std::string>("rmnet_data0"));
    CHECK(s->rx_bytes == std::optional<std::uint64_t>(123456));
    CHECK(s->tx_bytes == std::optional<std::uint64_t>(654321));

    auto a = decoder::decode_qnetdevstatus({"+QNETDEVSTATUS: 10.64.1.2,255.255.255.0,10.64.1.1,10.64.1.1,10.74.210.210,10.74.210.211"});
    REQUIRE(a.has_value());
    CHECK(a->ipv4 == std::optional<std::string>("10.64.1.2"));
    CHECK_FALSE(a->rx_bytes.has_value());

    CHECK_FALSE(decoder::decode_qnetdevstatus({"OK"}).has_value());
}

TEST_CASE("Data sessions merge context definitions, state, addresses and DNS") {
    auto b = testutil::batch_of(testutil::lte_battery_replies());
    auto s = decoder::decode_sessions(&b[cmd::kCgdcont], &b[cmd::kCgact], &b[cmd::kCgcontrdp], &b[cmd::kQidnscfg]);
    REQUIRE(s.has_value());
    CHECK(s->default_cid == std::optional<int>(1));
    REQUIRE(s->contexts.size() == 2);

    const auto& c1 = s->contexts[0];
    CHECK(c1.cid == 1);
    CHECK(c1.apn == std::optional<std::string>("internet.telekom"));
    CHECK(c1.ip == std::optional<std::string>("10.64.1.2"));
    CHECK(c1.dns1 == std::optional<std::string>("10.74.210.210"));
    CHECK(c1.state == std::optional<int>(1));

    const auto& c2 = s->contexts[1];
    CHECK(c2.apn == std::optional<std::string>("ims"));
    CHECK(c2.state == std::optional<int>(0));

    CHECK_FALSE(decoder::decode_sessions(nullptr, nullptr, nullptr, nullptr).has_value());
}

TEST_CASE("Preference read-backs") {
    CHECK(decoder::decode_roam_pref({"+QNWPREFCFG: \"roam_pref\",255", "OK"}) == std::optional<int>(255));
    CHECK(decoder::decode_mode_pref({"+QNWPREFCFG: \"mode_pref\",nr5g:lte", "OK"}) ==
          std::optional<std::string>("NR5G:LTE"));

    auto bands = decoder::decode_band_pref({"+QNWPREFCFG: \"lte_band\",1:3:7:20", "OK"}, "lte_band");
    REQUIRE(bands.has_value());
    CHECK(*bands == std::vector<int>({1, 3, 7, 20}));
    CHECK_FALSE(decoder::decode_band_pref({"+QNWPREFCFG: \"lte_band\",1:x"}, "lte_band").has_value());
    CHECK_FALSE(decoder::decode_roam_pref({"OK"}).has_value());
}

TEST_CASE("Identity battery decodes plain and tagged replies") {
    auto info = decoder::decode_info(testutil::batch_of(testutil::info_replies()));
    CHECK(info.manufacturer == std::optional<std::string>("Quectel"));
    CHECK(info.model == std::optional<std::string>("RM520N-GL"));
    CHECK(info.imei == std::optional<std::string>("861234567890123"));
    CHECK(info.sim.imsi == std::optional<std::string>("262011234567890"));
    CHECK(info.sim.iccid == std::optional<std::string>("89490200001234567890"));
    CHECK(info.sim.msisdn == std::optional<std::string>("+491701234567"));
    CHECK(info.sim.enabled == std::optional<bool>(false));
    CHECK(info.sim.inserted == std::optional<bool>(true));
    CHECK(info.usb_speed == std::optional<std::string>("USB 2.0 high speed, 480 Mbps"));
}

TEST_CASE("Whole-battery decode fills every field from a complete battery") {
    auto rec = decoder::decode(testutil::batch_of(testutil::lte_battery_replies()));
    REQUIRE(rec.registration.has_value());
    CHECK(rec.registration->eps->state == RegState::Roaming);
    CHECK(rec.registration->ps->state == RegState::Home);

    REQUIRE(rec.op.has_value());
    CHECK(rec.op->name == std::optional<std::string>("Telekom.de"));
    CHECK(rec.op->plmn == std::optional<std::string>("26201"));
    CHECK(rec.op->mcc == std::optional<std::string>("262"));
    CHECK(rec.op->mnc == std::optional<std::string>("01"));

    REQUIRE(rec.signal.has_value());
    CHECK(rec.signal->rsrp == std::optional<int>(-95));
    CHECK(rec.signal->rsrq == std::optional<int>(-10));
    CHECK(rec.signal->sinr == std::optional<int>(12));
    CHECK(rec.signal->quality == std::optional<Quality>(Quality::Fair));
    CHECK(rec.signal->lte.has_value());
    CHECK_FALSE(rec.signal->nr.has_value());

    CHECK(rec.serving.has_value());
    CHECK(rec.ca.has_value());
    CHECK(rec.neighbours.has_value());
    CHECK(rec.netdev.has_value());
    CHECK(rec.session.has_value());
    CHECK(rec.temperatures.has_value());
}

TEST_CASE("A broken reply empties only its own field") {
    auto replies = testutil::lte_battery_replies();
    replies[cmd::kServing] = "\r\n+QENG: \"servingcell\",\"NOCONN\",\"LTE\",\"FDD\r\n\r\nOK\r\n";
    auto b = testutil::batch_of(replies);
    b.erase(cmd::kQtemp);

    auto rec = decoder::decode(b);
    CHECK_FALSE(rec.serving.has_value());
    CHECK_FALSE(rec.temperatures.has_value());
    REQUIRE(rec.op.has_value());
    CHECK(rec.op->mcc == std::optional<std::string>("262"));   // falls back to the PLMN
    CHECK(rec.signal.has_value());
    CHECK(rec.ca.has_value());
    CHECK(rec.registration.has_value());
}

TEST_CASE("Poll and identity batteries contain only read-only queries") {
    for (const auto* battery : {&decoder::telemetry_battery(), &decoder::info_battery()}) {
        for (const auto& c : *battery) {
            INFO(c);
            const bool query = c.back() == '?' || c.find('=') == std::string::npos ||
                               c == cmd::kServing || c == cmd::kNeighbour || c == cmd::kQidnscfg ||
                               c == cmd::kUsbspeed;
            CHECK(query);
        }
    }
    CHECK(decoder::telemetry_battery().size() == 17);
    CHECK(decoder::info_battery().size() == 9);
}
