#include <doctest/doctest.h>
#include "linkstation/transport/at_framing.hpp"

using namespace linkstation::transport;

TEST_CASE("Terminal OK completes a reply only once its line is closed") {
    CHECK(detect_terminal("") == Terminal::None);
    CHECK(detect_terminal("\r\n+CSQ: 20,99\r\n\r\nOK") == Terminal::None);
    CHECK(detect_terminal("\r\n+CSQ: 20,99\r\n\r\nOK\r\n") == Terminal::Ok);
    CHECK(detect_terminal("OK\n") == Terminal::Ok);
}

TEST_CASE("ERROR and CME/CMS errors are terminal and report the failing line") {
    std::string line;
    CHECK(detect_terminal("\r\nERROR\r\n", &line) == Terminal::Error);
    CHECK(line == "ERROR");

    CHECK(detect_terminal("AT+CIMI\r\n+CME ERROR: 10\r\n", &line) == Terminal::Error);
    CHECK(line == "+CME ERROR: 10");

    CHECK(detect_terminal("\r\n+CMS ERROR: 500\r\n", &line) == Terminal::Error);
    CHECK(line == "+CMS ERROR: 500");
}

TEST_CASE("An OK inside the payload does not end the reply") {
    // "OK" followed by more data: the last complete line decides.
    CHECK(detect_terminal("\r\nOK\r\n+QIND: \"csq\"\r\n") == Terminal::None);
    CHECK(detect_terminal("\r\n+COPS: 0,0,\"OK Mobile\",7\r\n") == Terminal::None);
}

TEST_CASE("split_lines keeps payload order and inner blanks, drops framing blanks") {
    auto lines = split_lines("\r\n+QENG: \"servingcell\",\"NOCONN\"\r\n\r\nOK\r\n");
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "+QENG: \"servingcell\",\"NOCONN\"");
    CHECK(lines[1].empty());
    CHECK(lines[2] == "OK");
}

TEST_CASE("split_lines handles bare LF and a trailing partial line") {
    auto lines = split_lines("AT\n+GMI\nQuectel");
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "AT");
    CHECK(lines[2] == "Quectel");
    CHECK(split_lines("").empty());
    CHECK(split_lines("\r\n\r\n").empty());
}
