#pragma once

#include "textgate/log.hpp"
#include "textgate/rule_set.hpp"
#include "textgate/scanner.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace textgate {

// Process exit codes. Callers tell a policy block (Fail) from a broken check.
enum ExitCode : int {
    kExitPass          = 0,
    kExitFail          = 1,
    kExitAborted       = 2,
    kExitInvalidTarget = 3,
    kExitConfigError   = 4,
};

/**
 * GateConfig
 *
 * Everything the command line says. Values left unset fall back to the
 * `options:` block of the rule files, then to ScanOptions defaults.
 */
struct GateConfig {
    std::filesystem::path                      root;
    std::vector<std::filesystem::path>         rule_files;
    std::vector<std::pair<PatternKind, std::string>> inline_rules;   // ID=PATTERN
    std::vector<std::string>                   excludes;
    bool                                       default_excludes = true;
    std::optional<std::filesystem::path>       json_output;
    std::optional<std::uintmax_t>              max_file_size;
    std::optional<std::size_t>                 max_line_length;
    std::optional<long long>                   timeout_ms;
    std::optional<unsigned>                    threads;
    log::Level                                 log_level = log::Level::Info;
    bool                                       show_help = false;
};

/// Parses arguments (without the program name). Throws UsageError.
GateConfig parse_args(const std::vector<std::string>& args);

std::string usage(const std::string& program);

// Rules and scan options after rule files have been read and merged.
struct GatePlan {
    RuleSet     rules;
    ScanOptions options;
};

/// Loads rule files, then appends inline rules in command-line order.
/// Throws RuleSetError.
GatePlan resolve(const GateConfig& config);

} // namespace textgate
