#pragma once
/**
 * @file at_framing.hpp
 * @brief Terminal-marker detection and line splitting for AT replies.
 *
 * A reply is complete when the buffer ends in a complete line that is one of:
 *   OK | ERROR | +CME ERROR: <n> | +CMS ERROR: <n>
 * Everything before it (echo, +TAG: lines, URCs) is payload.
 */

#include <string>
#include <vector>

namespace linkstation::transport {

enum class Terminal { None, Ok, Error };

/// Inspect the accumulated buffer; `error_line` receives the failing line on Error.
Terminal detect_terminal(const std::string& buf, std::string* error_line = nullptr);

/// Split on CR/LF/CRLF, keep inner empty lines, drop trailing empties.
std::vector<std::string> split_lines(const std::string& buf);

} // namespace linkstation::transport
