#pragma once

#include "textgate/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace textgate {

/**
 * RuleSet
 *
 * Ordered collection of forbidden-pattern rules. Identifiers are unique;
 * insertion order decides report order when several rules hit one line.
 */
class RuleSet {
public:
    /// Throws RuleSetError on an empty id or pattern, or a duplicate id.
    void add_rule(Rule rule);

    /// Appends every rule of `other`, keeping its order.
    void append(const RuleSet& other);

    const std::vector<Rule>& rules() const { return rules_; }
    std::size_t rule_count() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    /// True when any rule is evaluated with std::regex.
    bool has_regex() const;

    const Rule* find(const std::string& id) const;

    std::vector<Rule>::const_iterator begin() const { return rules_.begin(); }
    std::vector<Rule>::const_iterator end() const { return rules_.end(); }

private:
    std::vector<Rule> rules_;
};

// Scan tuning carried by a rule file's `options:` block. Unset fields leave
// the command-line or built-in default in place.
struct RuleFileOptions {
    std::optional<std::uintmax_t> max_file_size;
    std::optional<std::size_t>    max_line_length;
    std::optional<long long>      timeout_ms;
    std::optional<unsigned>       threads;
};

struct RuleFile {
    RuleSet                  rules;
    std::vector<std::string> excludes;
    RuleFileOptions          options;
};

// ── Rule construction ───────────────────────────────────────────────────────

/// Builds a literal rule. Throws RuleSetError if `id` or `pattern` is empty.
Rule make_literal_rule(std::string id, std::string pattern, bool ignore_case = false);

/// Builds a regular-expression rule (ECMAScript). Throws RuleSetError if the
/// expression does not compile.
Rule make_regex_rule(std::string id, std::string pattern, bool ignore_case = false);

/// Parses an inline `ID=PATTERN` definition.
Rule parse_inline_rule(const std::string& definition, PatternKind kind);

// ── Loading ─────────────────────────────────────────────────────────────────

/// Parses a YAML rule document. `source` names it in error messages.
RuleFile parse_rule_document(const std::string& text, const std::string& source);

/// Reads and parses a YAML rule file.
RuleFile load_rule_file(const std::filesystem::path& path);

} // namespace textgate
