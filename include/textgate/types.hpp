#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <regex>
#include <string>
#include <vector>

namespace textgate {

enum class PatternKind { Literal, Regex };

// Only one tier exists: any match blocks the gate.
enum class Severity { Blocking };

enum class Verdict { Pass, Fail };

// LongLine: a line exceeds ScanOptions::max_line_length while regex rules
// are active.
enum class SkipReason { Binary, Undecodable, TooLarge, LongLine };

struct Rule {
    std::string id;
    std::string pattern;
    PatternKind kind        = PatternKind::Literal;
    Severity    severity    = Severity::Blocking;
    bool        ignore_case = false;
    std::string description;

    // Compiled form of `pattern`, set for Regex rules only. Shared so that
    // copies of a RuleSet stay cheap.
    std::shared_ptr<const std::regex> compiled;

    /// Returns the first matched substring of `line`, if any.
    std::optional<std::string> match(const std::string& line) const;
};

struct Violation {
    std::string path;        // relative to the scan root, '/'-separated
    std::size_t line = 0;    // 1-based
    std::string rule_id;
    std::string matched;
    std::string text;        // full line, without the line terminator
};

struct SkippedFile {
    std::string path;
    SkipReason  reason;
};

struct ScanStats {
    std::size_t              candidates = 0;
    std::size_t              scanned    = 0;
    std::vector<SkippedFile> skipped;
};

struct ScanReport {
    std::vector<Violation> violations;
    ScanStats              stats;

    Verdict verdict() const {
        return violations.empty() ? Verdict::Pass : Verdict::Fail;
    }
    bool passed() const { return violations.empty(); }
};

inline std::ostream& operator<<(std::ostream& os, Verdict v) {
    return os << (v == Verdict::Pass ? "pass" : "fail");
}

inline std::ostream& operator<<(std::ostream& os, SkipReason r) {
    switch (r) {
        case SkipReason::Binary:      return os << "binary";
        case SkipReason::Undecodable: return os << "undecodable";
        case SkipReason::TooLarge:    return os << "too-large";
        case SkipReason::LongLine:    return os << "long-line";
        default:                      return os << "unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, PatternKind k) {
    return os << (k == PatternKind::Literal ? "literal" : "regex");
}

} // namespace textgate
