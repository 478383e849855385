#include "textgate/config.hpp"
#include "textgate/errors.hpp"

#include <chrono>
#include <limits>
#include <sstream>

namespace textgate {

namespace {

unsigned long long parse_count(const std::string& option, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
        throw UsageError(option + " expects a non-negative integer, got '" + value + "'");
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw UsageError(option + " value '" + value + "' is out of range");
    }
}

unsigned long long parse_bounded(const std::string& option,
                                 const std::string& value,
                                 unsigned long long low,
                                 unsigned long long high) {
    auto n = parse_count(option, value);
    if (n < low || n > high) {
        throw UsageError(option + " expects a value between " + std::to_string(low) +
                         " and " + std::to_string(high) + ", got '" + value + "'");
    }
    return n;
}

} // namespace

GateConfig parse_args(const std::vector<std::string>& args) {
    GateConfig config;
    bool have_root = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw UsageError(a + " requires a value");
            return args[++i];
        };

        if (a == "-h" || a == "--help") {
            config.show_help = true;
        } else if (a == "-r" || a == "--rules") {
            config.rule_files.emplace_back(value());
        } else if (a == "--rule") {
            config.inline_rules.emplace_back(PatternKind::Literal, value());
        } else if (a == "--regex-rule") {
            config.inline_rules.emplace_back(PatternKind::Regex, value());
        } else if (a == "-x" || a == "--exclude") {
            config.excludes.push_back(value());
        } else if (a == "--no-default-excludes") {
            config.default_excludes = false;
        } else if (a == "--json") {
            config.json_output = std::filesystem::path(value());
        } else if (a == "--max-file-size") {
            config.max_file_size = parse_count(a, value());
        } else if (a == "--max-line-length") {
            config.max_line_length =
                static_cast<std::size_t>(parse_bounded(a, value(), 1, kMaxLineLengthLimit));
        } else if (a == "--timeout-ms") {
            config.timeout_ms = static_cast<long long>(parse_bounded(a, value(), 0, kMaxTimeoutMs));
        } else if (a == "-j" || a == "--threads") {
            config.threads = static_cast<unsigned>(
                parse_bounded(a, value(), 1, std::numeric_limits<unsigned>::max()));
        } else if (a == "-v" || a == "--verbose") {
            config.log_level = log::Level::Debug;
        } else if (a == "-q" || a == "--quiet") {
            config.log_level = log::Level::Error;
        } else if (a.size() > 1 && a[0] == '-') {
            throw UsageError("unknown option " + a);
        } else if (have_root) {
            throw UsageError("more than one root given ('" + config.root.string() +
                             "' and '" + a + "')");
        } else {
            config.root = a;
            have_root = true;
        }
    }

    if (!have_root && !config.show_help) throw UsageError("missing <root> directory");
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options] <root>\n"
       << "\n"
       << "Scans every text file under <root> for forbidden patterns.\n"
       << "\n"
       << "  -r, --rules FILE          YAML rule set (repeatable)\n"
       << "      --rule ID=PATTERN     inline literal rule (repeatable)\n"
       << "      --regex-rule ID=RE    inline regular-expression rule (repeatable)\n"
       << "  -x, --exclude GLOB        exclusion glob (repeatable)\n"
       << "      --no-default-excludes scan .git, .hg and .svn as well\n"
       << "      --json FILE           write the machine-readable report to FILE\n"
       << "      --max-file-size N     skip files larger than N bytes\n"
       << "      --max-line-length N   skip files with longer lines when regex rules\n"
       << "                            are active (default 4096, at most 16384)\n"
       << "      --timeout-ms N        abort the scan after N milliseconds\n"
       << "                            (at most one year)\n"
       << "  -j, --threads N           worker threads\n"
       << "  -v, --verbose             debug logging on stderr\n"
       << "  -q, --quiet               errors only on stderr\n"
       << "  -h, --help                show this help\n"
       << "\n"
       << "Exit status: 0 pass, 1 violations found, 2 scan aborted,\n"
       << "             3 invalid root, 4 rule or usage error.\n";
    return os.str();
}

GatePlan resolve(const GateConfig& config) {
    GatePlan plan;
    RuleFileOptions file_options;
    std::vector<std::string> file_excludes;

    for (const auto& path : config.rule_files) {
        RuleFile file = load_rule_file(path);
        try {
            plan.rules.append(file.rules);
        } catch (const RuleSetError& e) {
            throw RuleSetError(path.string() + ": " + e.detail());
        }
        file_excludes.insert(file_excludes.end(), file.excludes.begin(), file.excludes.end());
        // Later files override earlier ones.
        if (file.options.max_file_size) file_options.max_file_size = file.options.max_file_size;
        if (file.options.max_line_length)
            file_options.max_line_length = file.options.max_line_length;
        if (file.options.timeout_ms)    file_options.timeout_ms    = file.options.timeout_ms;
        if (file.options.threads)       file_options.threads       = file.options.threads;
    }

    for (const auto& entry : config.inline_rules)
        plan.rules.add_rule(parse_inline_rule(entry.second, entry.first));

    ScanOptions& options = plan.options;
    options.excludes = config.default_excludes ? PathFilter(default_excludes()) : PathFilter();
    for (const auto& glob : file_excludes)   options.excludes.add(glob);
    for (const auto& glob : config.excludes) options.excludes.add(glob);

    if (auto size = config.max_file_size ? config.max_file_size : file_options.max_file_size)
        options.max_file_size = *size;
    if (auto length = config.max_line_length ? config.max_line_length
                                             : file_options.max_line_length)
        options.max_line_length = *length;
    if (auto ms = config.timeout_ms ? config.timeout_ms : file_options.timeout_ms)
        options.timeout = std::chrono::milliseconds(*ms);
    if (auto n = config.threads ? config.threads : file_options.threads)
        options.threads = *n;

    return plan;
}

} // namespace textgate
