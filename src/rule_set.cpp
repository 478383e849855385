#include "textgate/rule_set.hpp"
#include "textgate/errors.hpp"
#include "textgate/scanner.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <limits>
#include <sstream>

namespace textgate {

// ── Rule ──────────────────────────────────────────────────────────────────────

std::optional<std::string> Rule::match(const std::string& line) const {
    if (compiled) {
        std::smatch m;
        if (std::regex_search(line, m, *compiled)) return m.str(0);
        return std::nullopt;
    }
    if (ignore_case) {
        // ASCII folding, the same folding std::regex::icase applies in the
        // classic locale.
        auto fold = [](char c) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        };
        auto at = std::search(line.begin(), line.end(), pattern.begin(), pattern.end(),
                              [&](char a, char b) { return fold(a) == fold(b); });
        if (at == line.end()) return std::nullopt;
        return std::string(at, at + static_cast<std::ptrdiff_t>(pattern.size()));
    }
    if (line.find(pattern) != std::string::npos) return pattern;
    return std::nullopt;
}

namespace {

std::shared_ptr<const std::regex> compile(const std::string& id,
                                          const std::string& expr,
                                          bool ignore_case) {
    auto flags = std::regex::ECMAScript;
    if (ignore_case) flags |= std::regex::icase;
    try {
        return std::make_shared<const std::regex>(expr, flags);
    } catch (const std::regex_error& e) {
        throw RuleSetError("rule '" + id + "': invalid regular expression '" +
                           expr + "': " + e.what());
    }
}

void require_fields(const std::string& id, const std::string& pattern) {
    if (id.empty()) throw RuleSetError("rule with empty id");
    if (pattern.empty()) throw RuleSetError("rule '" + id + "': empty pattern");
}

} // namespace

Rule make_literal_rule(std::string id, std::string pattern, bool ignore_case) {
    require_fields(id, pattern);
    Rule rule;
    rule.id          = std::move(id);
    rule.pattern     = std::move(pattern);
    rule.kind        = PatternKind::Literal;
    rule.ignore_case = ignore_case;
    return rule;
}

Rule make_regex_rule(std::string id, std::string pattern, bool ignore_case) {
    require_fields(id, pattern);
    Rule rule;
    rule.id          = std::move(id);
    rule.pattern     = std::move(pattern);
    rule.kind        = PatternKind::Regex;
    rule.ignore_case = ignore_case;
    rule.compiled    = compile(rule.id, rule.pattern, ignore_case);
    return rule;
}

Rule parse_inline_rule(const std::string& definition, PatternKind kind) {
    auto eq = definition.find('=');
    if (eq == std::string::npos) {
        throw RuleSetError("inline rule '" + definition + "' is not of the form ID=PATTERN");
    }
    std::string id      = definition.substr(0, eq);
    std::string pattern = definition.substr(eq + 1);
    return kind == PatternKind::Regex ? make_regex_rule(id, pattern)
                                      : make_literal_rule(id, pattern);
}

// ── RuleSet ───────────────────────────────────────────────────────────────────

void RuleSet::add_rule(Rule rule) {
    require_fields(rule.id, rule.pattern);
    if (find(rule.id)) throw RuleSetError("duplicate rule id '" + rule.id + "'");
    if (rule.kind == PatternKind::Regex && !rule.compiled) {
        rule.compiled = compile(rule.id, rule.pattern, rule.ignore_case);
    }
    rules_.push_back(std::move(rule));
}

bool RuleSet::has_regex() const {
    return std::any_of(rules_.begin(), rules_.end(),
                       [](const Rule& rule) { return rule.kind == PatternKind::Regex; });
}

void RuleSet::append(const RuleSet& other) {
    for (const auto& rule : other.rules_) add_rule(rule);
}

const Rule* RuleSet::find(const std::string& id) const {
    for (const auto& rule : rules_)
        if (rule.id == id) return &rule;
    return nullptr;
}

// ── YAML loading ──────────────────────────────────────────────────────────────

namespace {

// yaml-cpp's as<T>(fallback) hides conversion errors; only default when the
// key is absent.
bool flag(const YAML::Node& node, const char* key) {
    return node[key] ? node[key].as<bool>() : false;
}

std::string text(const YAML::Node& node, const char* key, const std::string& fallback) {
    return node[key] ? node[key].as<std::string>() : fallback;
}

Rule parse_rule_node(const YAML::Node& node, std::size_t index) {
    const std::string where = "rules[" + std::to_string(index) + "]";
    if (!node.IsMap()) throw RuleSetError(where + ": expected a mapping");
    if (!node["id"])      throw RuleSetError(where + ": missing 'id'");
    if (!node["pattern"]) throw RuleSetError(where + ": missing 'pattern'");

    std::string id      = node["id"].as<std::string>();
    std::string pattern = node["pattern"].as<std::string>();
    bool is_regex       = flag(node, "regex");
    bool ignore_case    = flag(node, "ignore_case");

    std::string severity = text(node, "severity", "blocking");
    if (severity != "blocking") {
        throw RuleSetError("rule '" + id + "': unsupported severity '" + severity +
                           "' (only 'blocking' is allowed)");
    }

    Rule rule = is_regex ? make_regex_rule(id, pattern, ignore_case)
                         : make_literal_rule(id, pattern, ignore_case);
    rule.description = text(node, "description", "");
    return rule;
}

long long non_negative_option(const YAML::Node& options, const char* key) {
    long long value = options[key].as<long long>();
    if (value < 0) {
        throw RuleSetError(std::string("options.") + key + " must not be negative");
    }
    return value;
}

RuleFileOptions parse_options(const YAML::Node& node) {
    RuleFileOptions options;
    if (!node) return options;
    if (!node.IsMap()) throw RuleSetError("'options' must be a mapping");

    if (node["max_file_size"])
        options.max_file_size = static_cast<std::uintmax_t>(non_negative_option(node, "max_file_size"));
    if (node["max_line_length"]) {
        long long length = non_negative_option(node, "max_line_length");
        if (length == 0 || length > static_cast<long long>(kMaxLineLengthLimit)) {
            throw RuleSetError("options.max_line_length must be between 1 and " +
                               std::to_string(kMaxLineLengthLimit));
        }
        options.max_line_length = static_cast<std::size_t>(length);
    }
    if (node["timeout_ms"]) {
        long long ms = non_negative_option(node, "timeout_ms");
        if (ms > kMaxTimeoutMs) {
            throw RuleSetError("options.timeout_ms must not exceed " +
                               std::to_string(kMaxTimeoutMs));
        }
        options.timeout_ms = ms;
    }
    if (node["threads"]) {
        long long threads = non_negative_option(node, "threads");
        if (threads == 0) throw RuleSetError("options.threads must be at least 1");
        if (static_cast<unsigned long long>(threads) > std::numeric_limits<unsigned>::max())
            throw RuleSetError("options.threads is too large");
        options.threads = static_cast<unsigned>(threads);
    }
    return options;
}

} // namespace

RuleFile parse_rule_document(const std::string& text, const std::string& source) {
    RuleFile file;
    try {
        const YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) throw RuleSetError("top level must be a mapping");

        const YAML::Node rules = root["rules"];
        if (!rules) throw RuleSetError("missing 'rules' sequence");
        if (!rules.IsSequence() && !rules.IsNull())
            throw RuleSetError("'rules' must be a sequence");

        for (std::size_t i = 0; i < rules.size(); ++i)
            file.rules.add_rule(parse_rule_node(rules[i], i));

        if (const YAML::Node excludes = root["exclude"]) {
            if (!excludes.IsSequence()) throw RuleSetError("'exclude' must be a sequence");
            for (const auto& glob : excludes)
                file.excludes.push_back(glob.as<std::string>());
        }

        file.options = parse_options(root["options"]);
    } catch (const RuleSetError& e) {
        throw RuleSetError(source + ": " + e.detail());
    } catch (const YAML::Exception& e) {
        throw RuleSetError(source + ": " + e.what());
    }
    return file;
}

RuleFile load_rule_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw RuleSetError(path.string() + ": cannot open rule file");

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw RuleSetError(path.string() + ": read error");
    return parse_rule_document(buffer.str(), path.string());
}

} // namespace textgate
