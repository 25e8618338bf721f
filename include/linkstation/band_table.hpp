#pragma once
/**
 * @file band_table.hpp
 * @brief Static lookups: band numbers, channel ranges and bandwidth codes.
 *
 * Channel-to-band guesses use the 3GPP downlink EARFCN / NR-ARFCN ranges. Where
 * ranges overlap (n41/n38/n7, n77/n78) the more common deployment wins.
 */

#include <optional>
#include <string>

namespace linkstation::bands {

enum class Rat { Lte, Nr };

/// "LTE BAND 3" / "NR5G BAND 78".
std::string label(Rat rat, int band);

/// "LTE BAND 3 (1800 MHz)" when the band is in the table, else label().
std::string describe(Rat rat, int band);

/// Nominal frequency text ("1800 MHz"), nullopt for bands not in the table.
std::optional<std::string> frequency(Rat rat, int band);

/// Normalize a vendor band string ("LTE BAND 3", "NR5G BAND 78", "B3", "n78").
std::string pretty(const std::string& raw);

std::optional<std::string> guess_lte_band(int earfcn);   ///< "B3"
std::optional<std::string> guess_nr_band(int nrarfcn);   ///< "n78"

std::optional<double> lte_bw_code_mhz(int code);   ///< +QENG LTE UL/DL bandwidth code 0..5
std::optional<double> nr_bw_code_mhz(int code);    ///< +QENG / +QCAINFO NR bandwidth code
std::optional<double> lte_rb_mhz(int rbs);         ///< +QCAINFO LTE bandwidth in RBs
std::optional<int>    scs_code_khz(int code);      ///< 0..4 -> 15..240 kHz

} // namespace linkstation::bands
