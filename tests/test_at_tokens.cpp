#include <doctest/doctest.h>
#include "linkstation/at_tokens.hpp"
#include "linkstation/band_table.hpp"

using namespace linkstation;

TEST_CASE("split_csv honours quotes and trims fields") {
    auto t = tokens::split_csv("\"servingcell\", \"NOCONN\",\"LTE\",\"FDD\",262,01 ,\"1A2B,3C\"");
    REQUIRE(t.size() == 7);
    CHECK(t[0] == "servingcell");
    CHECK(t[1] == "NOCONN");
    CHECK(t[4] == "262");
    CHECK(t[5] == "01");
    CHECK(t[6] == "1A2B,3C");
}

TEST_CASE("payload_after matches the tag only at line start") {
    CHECK(tokens::payload_after("+CSQ: 20,99", "+CSQ:") == std::optional<std::string>("20,99"));
    CHECK(tokens::payload_after("  +CSQ:20,99  ", "+CSQ:") == std::optional<std::string>("20,99"));
    CHECK_FALSE(tokens::payload_after("AT+CSQ", "+CSQ:").has_value());

    std::vector<std::string> lines{"AT+QRSRP", "+QRSRP: -95,-97", "+QRSRP: -90", "OK"};
    auto p = tokens::payloads(lines, "+QRSRP:");
    REQUIRE(p.size() == 2);
    CHECK(p[1] == "-90");
}

TEST_CASE("parse_int rejects junk and the no-value sentinel") {
    CHECK(tokens::parse_int("-95") == std::optional<int>(-95));
    CHECK(tokens::parse_int(" 12 ") == std::optional<int>(12));
    CHECK_FALSE(tokens::parse_int("").has_value());
    CHECK_FALSE(tokens::parse_int("-").has_value());
    CHECK_FALSE(tokens::parse_int("12dB").has_value());
    CHECK_FALSE(tokens::parse_int("-32768").has_value());
    CHECK_FALSE(tokens::parse_int("300", 0, 255).has_value());
    CHECK(tokens::parse_int("255", 0, 255) == std::optional<int>(255));
}

TEST_CASE("parse_hex and parse_u64") {
    CHECK(tokens::parse_hex("1A2B3C4") == std::optional<std::uint64_t>(0x1A2B3C4));
    CHECK(tokens::parse_hex("0x3e8") == std::optional<std::uint64_t>(1000));
    CHECK_FALSE(tokens::parse_hex("XYZ").has_value());
    CHECK(tokens::parse_u64("18446744073709551615") == std::optional<std::uint64_t>(18446744073709551615ULL));
    CHECK_FALSE(tokens::parse_u64("-1").has_value());
}

TEST_CASE("band labels and channel guesses") {
    CHECK(bands::label(bands::Rat::Lte, 3) == "LTE BAND 3");
    CHECK(bands::describe(bands::Rat::Nr, 78) == "NR5G BAND 78 (3500 MHz)");
    CHECK(bands::describe(bands::Rat::Lte, 250) == "LTE BAND 250");
    CHECK(bands::pretty("b3") == "LTE BAND 3");
    CHECK(bands::pretty("n78") == "NR5G BAND 78");
    CHECK(bands::pretty("NR5G BAND 41") == "NR5G BAND 41");
    CHECK(bands::guess_lte_band(1300) == std::optional<std::string>("B3"));
    CHECK(bands::guess_lte_band(6300) == std::optional<std::string>("B20"));
    CHECK(bands::guess_nr_band(636672) == std::optional<std::string>("n78"));
    CHECK_FALSE(bands::guess_lte_band(100000).has_value());
    CHECK(bands::lte_bw_code_mhz(5) == std::optional<double>(20.0));
    CHECK(bands::nr_bw_code_mhz(10) == std::optional<double>(100.0));
    CHECK(bands::lte_rb_mhz(100) == std::optional<double>(20.0));
    CHECK(bands::scs_code_khz(1) == std::optional<int>(30));
}
