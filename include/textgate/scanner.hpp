#pragma once

#include "textgate/path_filter.hpp"
#include "textgate/rule_set.hpp"
#include "textgate/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace textgate {

// std::regex matches by recursion, one or more frames per character, so a
// regex over an unbounded line can exhaust the thread's stack. Files with a
// longer line are skipped when the rule set holds regex rules.
constexpr std::size_t kDefaultMaxLineLength = 4096;
constexpr std::size_t kMaxLineLengthLimit   = 16384;

// Largest accepted timeout (one year).
constexpr long long kMaxTimeoutMs = 365LL * 24 * 60 * 60 * 1000;

struct ScanOptions {
    PathFilter     excludes { default_excludes() };
    std::uintmax_t max_file_size = 10u * 1024u * 1024u;
    std::size_t    max_line_length = kDefaultMaxLineLength;

    // Wall-clock budget for the whole scan; nullopt disables it. Budgets
    // beyond the steady clock's range never expire.
    std::optional<std::chrono::milliseconds> timeout = std::chrono::milliseconds(300000);

    // 0 picks std::thread::hardware_concurrency().
    unsigned threads = 0;
};

/**
 * Scanner
 *
 * Walks every regular file under a root directory and evaluates each rule
 * against each text line. The result depends only on the rules, the
 * options and the file contents; the thread count never changes it.
 *
 * Pipeline: Initializing -> Enumerating -> Scanning -> Reporting -> Done.
 *
 * Throws:
 *   InvalidTarget  root is missing, unreadable or not a directory.
 *   ScanAborted    I/O failure while enumerating or reading, or timeout.
 *
 * Binary (NUL in the first bytes), non-UTF-8 and oversized files are
 * skipped and listed in ScanReport::stats; they never abort the scan. So
 * is a file with a line above max_line_length when a regex rule is active.
 */
class Scanner {
public:
    Scanner() = default;
    explicit Scanner(ScanOptions options);

    ScanReport scan(const std::filesystem::path& root, const RuleSet& rules) const;

    const ScanOptions& options() const { return options_; }

private:
    ScanOptions options_;
};

/// Scans `root` with default limits and the given exclusion globs (added to
/// the version-control defaults).
ScanReport scan(const std::filesystem::path& root,
                const RuleSet& rules,
                const std::vector<std::string>& exclude_patterns);

// ── Content classification ────────────────────────────────────────────────────

/// Number of leading bytes inspected for a NUL byte.
constexpr std::size_t kBinaryProbeBytes = 8000;

/// True when a NUL byte occurs in the first kBinaryProbeBytes of `content`.
bool looks_binary(const std::string& content);

/// Strict UTF-8 check: rejects overlong forms, surrogates and code points
/// above U+10FFFF.
bool valid_utf8(const std::string& content);

} // namespace textgate
