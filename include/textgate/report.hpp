#pragma once

#include "textgate/types.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace textgate {

/// `<path>:<line>: [<rule-id>] <text>`
std::string format_violation(const Violation& v);

/// `textgate: PASS` or `textgate: FAIL (N violation(s) in M file(s))`
std::string format_summary(const ScanReport& report);

/// Writes every violation line followed by the summary line.
void print_report(std::ostream& os, const ScanReport& report);

/// Writes the JSON form of `report` to `path`, replacing any existing file.
/// Throws GateError if the file cannot be written.
void write_json_report(const std::filesystem::path& path, const ScanReport& report);

} // namespace textgate
