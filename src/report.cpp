#include "textgate/report.hpp"
#include "textgate/errors.hpp"
#include "textgate/json.hpp"

#include <fstream>
#include <set>

namespace textgate {

std::string format_violation(const Violation& v) {
    return v.path + ":" + std::to_string(v.line) + ": [" + v.rule_id + "] " + v.text;
}

std::string format_summary(const ScanReport& report) {
    if (report.passed()) return "textgate: PASS";

    std::set<std::string> files;
    for (const auto& v : report.violations) files.insert(v.path);
    return "textgate: FAIL (" + std::to_string(report.violations.size()) +
           " violation(s) in " + std::to_string(files.size()) + " file(s))";
}

void print_report(std::ostream& os, const ScanReport& report) {
    for (const auto& v : report.violations) os << format_violation(v) << "\n";
    os << format_summary(report) << "\n";
}

void write_json_report(const std::filesystem::path& path, const ScanReport& report) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw GateError("cannot write JSON report to " + path.string());
    out << to_json(report) << "\n";
    out.flush();
    if (!out) throw GateError("failed writing JSON report to " + path.string());
}

} // namespace textgate
