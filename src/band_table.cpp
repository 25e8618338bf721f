#include "linkstation/band_table.hpp"
#include "linkstation/at_tokens.hpp"

#include <cstddef>

namespace linkstation::bands {

namespace {

struct BandFreq { int band; const char* mhz; };
struct ChannelRange { int lo; int hi; const char* band; };
struct BwCode { int code; double mhz; };

constexpr BandFreq kLteFreq[] = {
    {1, "2100"}, {2, "1900"}, {3, "1800"}, {4, "1700/2100"}, {5, "850"}, {7, "2600"},
    {8, "900"}, {12, "700"}, {13, "700"}, {14, "700"}, {17, "700"}, {18, "800"},
    {19, "800"}, {20, "800"}, {25, "1900"}, {26, "850"}, {28, "700"}, {29, "700"},
    {30, "2300"}, {32, "1500"}, {34, "2000"}, {38, "2600"}, {39, "1900"}, {40, "2300"},
    {41, "2500"}, {42, "3500"}, {43, "3700"}, {46, "5200"}, {48, "3600"},
    {66, "1700/2100"}, {71, "600"},
};

constexpr BandFreq kNrFreq[] = {
    {1, "2100"}, {2, "1900"}, {3, "1800"}, {5, "850"}, {7, "2600"}, {8, "900"},
    {20, "800"}, {25, "1900"}, {28, "700"}, {38, "2600"}, {40, "2300"}, {41, "2500"},
    {48, "3600"}, {66, "1700/2100"}, {71, "600"}, {77, "3700"}, {78, "3500"},
    {79, "4700"}, {257, "28000"}, {258, "26000"}, {260, "39000"}, {261, "28000"},
};

// Downlink EARFCN ranges.
constexpr ChannelRange kLteRanges[] = {
    {0, 599, "B1"}, {600, 1199, "B2"}, {1200, 1949, "B3"}, {1950, 2399, "B4"},
    {2400, 2649, "B5"}, {2750, 3449, "B7"}, {3450, 3799, "B8"}, {5010, 5179, "B12"},
    {5180, 5279, "B13"}, {5280, 5379, "B14"}, {5730, 5849, "B17"}, {6150, 6449, "B20"},
    {8040, 8689, "B25"}, {8690, 9039, "B26"}, {9210, 9659, "B28"}, {9660, 9769, "B29"},
    {9770, 9869, "B30"}, {36200, 36349, "B34"}, {37750, 38249, "B38"},
    {38250, 38649, "B39"}, {38650, 39649, "B40"}, {39650, 41589, "B41"},
    {41590, 43589, "B42"}, {43590, 45589, "B43"}, {55240, 56739, "B48"},
    {66436, 67335, "B66"}, {68586, 68935, "B71"},
};

// Downlink NR-ARFCN ranges; first match wins.
constexpr ChannelRange kNrRanges[] = {
    {499200, 537999, "n41"}, {620000, 653333, "n78"}, {653334, 680000, "n77"},
    {693334, 733333, "n79"}, {151600, 160600, "n28"}, {158200, 164200, "n20"},
    {422000, 434000, "n1"}, {361000, 376000, "n3"}, {173800, 178800, "n5"},
    {185000, 192000, "n8"}, {123400, 130400, "n71"}, {514000, 524000, "n38"},
    {524000, 538000, "n7"}, {460000, 480000, "n40"},
};

constexpr BwCode kLteBwCode[] = {{0, 1.4}, {1, 3}, {2, 5}, {3, 10}, {4, 15}, {5, 20}};
constexpr BwCode kNrBwCode[] = {
    {0, 5}, {1, 10}, {2, 15}, {3, 20}, {4, 25}, {5, 30}, {6, 40}, {7, 50},
    {8, 60}, {9, 80}, {10, 100}, {11, 200}, {12, 400},
};
constexpr BwCode kLteRbs[] = {{6, 1.4}, {15, 3}, {25, 5}, {50, 10}, {75, 15}, {100, 20}};
constexpr BwCode kScs[] = {{0, 15}, {1, 30}, {2, 60}, {3, 120}, {4, 240}};

template <std::size_t N>
std::optional<double> lookup_bw(const BwCode (&table)[N], int code) {
    for (const auto& e : table) if (e.code == code) return e.mhz;
    return std::nullopt;
}

template <std::size_t N>
std::optional<std::string> lookup_range(const ChannelRange (&table)[N], int ch) {
    for (const auto& r : table) if (ch >= r.lo && ch <= r.hi) return std::string(r.band);
    return std::nullopt;
}

} // namespace

std::string label(Rat rat, int band) {
    return std::string(rat == Rat::Lte ? "LTE BAND " : "NR5G BAND ") + std::to_string(band);
}

std::optional<std::string> frequency(Rat rat, int band) {
    if (rat == Rat::Lte) {
        for (const auto& e : kLteFreq) if (e.band == band) return std::string(e.mhz) + " MHz";
    } else {
        for (const auto& e : kNrFreq) if (e.band == band) return std::string(e.mhz) + " MHz";
    }
    return std::nullopt;
}

std::string describe(Rat rat, int band) {
    auto f = frequency(rat, band);
    return f ? label(rat, band) + " (" + *f + ")" : label(rat, band);
}

std::string pretty(const std::string& raw) {
    std::string s = tokens::upper(tokens::trim(raw));
    if (s.empty()) return s;

    auto tail_number = [&](std::size_t from) -> std::optional<int> {
        return tokens::parse_int(s.substr(from));
    };
    if (s.rfind("NR5G BAND ", 0) == 0) {
        if (auto n = tail_number(10)) return label(Rat::Nr, *n);
    } else if (s.rfind("LTE BAND ", 0) == 0) {
        if (auto n = tail_number(9)) return label(Rat::Lte, *n);
    } else if (s[0] == 'N') {
        if (auto n = tail_number(1)) return label(Rat::Nr, *n);
    } else if (s[0] == 'B') {
        if (auto n = tail_number(1)) return label(Rat::Lte, *n);
    }
    return tokens::trim(raw);
}

std::optional<std::string> guess_lte_band(int earfcn) { return lookup_range(kLteRanges, earfcn); }
std::optional<std::string> guess_nr_band(int nrarfcn)  { return lookup_range(kNrRanges, nrarfcn); }

std::optional<double> lte_bw_code_mhz(int code) { return lookup_bw(kLteBwCode, code); }
std::optional<double> nr_bw_code_mhz(int code)  { return lookup_bw(kNrBwCode, code); }
std::optional<double> lte_rb_mhz(int rbs)       { return lookup_bw(kLteRbs, rbs); }

std::optional<int> scs_code_khz(int code) {
    auto v = lookup_bw(kScs, code);
    if (!v) return std::nullopt;
    return static_cast<int>(*v);
}

} // namespace linkstation::bands
