#pragma once
/**
 * @file at_tokens.hpp
 * @brief Small tokenizing helpers shared by the decoder and the action table.
 *
 * No exceptions: every parser returns std::optional or bool. Modem "no value"
 * sentinels (-32768, "-", empty) come back as nullopt.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace linkstation::tokens {

/// Split a comma list, honoring double quotes; quotes are stripped, fields trimmed.
std::vector<std::string> split_csv(const std::string& s);

/// Payload after "+TAG:" when `line` starts with `tag` (e.g. "+QENG:"), else nullopt.
std::optional<std::string> payload_after(const std::string& line, const std::string& tag);

/// All payloads of lines starting with `tag`, in reply order.
std::vector<std::string> payloads(const std::vector<std::string>& lines, const std::string& tag);

/// Decimal integer; rejects trailing junk and the -32768 sentinel.
std::optional<int> parse_int(const std::string& s);

/// Same, bounded to [lo, hi].
std::optional<int> parse_int(const std::string& s, long lo, long hi);

/// Hexadecimal (cell id, TAC); "0x" prefix optional.
std::optional<std::uint64_t> parse_hex(const std::string& s);

std::optional<std::uint64_t> parse_u64(const std::string& s);

/// Token at index i or empty string.
const std::string& at(const std::vector<std::string>& v, std::size_t i);

std::optional<std::string> non_empty(const std::string& s);

std::string lower(std::string s);
std::string upper(std::string s);
std::string trim(const std::string& s);

} // namespace linkstation::tokens
