#include "textgate/config.hpp"
#include "textgate/errors.hpp"
#include "temp_tree.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace textgate;

static int passed = 0;
static int failed = 0;

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

static bool usage_error(const std::vector<std::string>& args) {
    try {
        parse_args(args);
    } catch (const UsageError&) {
        return true;
    }
    return false;
}

// ── Suites ────────────────────────────────────────────────────────────────────

void test_exit_codes() {
    std::cout << "\n[ExitCodes]\n";
    ASSERT_EQ("pass is 0",    0, static_cast<int>(kExitPass));
    ASSERT_EQ("fail is 1",    1, static_cast<int>(kExitFail));
    ASSERT_EQ("aborted is 2", 2, static_cast<int>(kExitAborted));
    ASSERT_TRUE("invalid target distinct from fail and abort",
                kExitInvalidTarget != kExitFail && kExitInvalidTarget != kExitAborted);
    ASSERT_TRUE("config error distinct",
                kExitConfigError != kExitFail && kExitConfigError != kExitAborted &&
                kExitConfigError != kExitInvalidTarget);
}

void test_parse_full_command_line() {
    std::cout << "\n[ParseFullCommandLine]\n";
    auto config = parse_args({ "--rules", "gate.yaml", "--rule", "no-fixme=FIXME",
                               "--regex-rule", "todo=TODO\\(", "-x", "vendor/",
                               "--exclude", "*.png", "--json", "out.json",
                               "--max-file-size", "4096", "--timeout-ms", "2500",
                               "-j", "3", "--verbose", "checkout" });

    ASSERT_EQ("root", std::string("checkout"), config.root.string());
    ASSERT_EQ("one rule file", static_cast<std::size_t>(1), config.rule_files.size());
    ASSERT_EQ("two inline rules", static_cast<std::size_t>(2), config.inline_rules.size());
    ASSERT_TRUE("inline order and kinds kept",
                config.inline_rules.size() == 2 &&
                config.inline_rules[0].first == PatternKind::Literal &&
                config.inline_rules[1].first == PatternKind::Regex);
    ASSERT_EQ("two excludes", static_cast<std::size_t>(2), config.excludes.size());
    ASSERT_TRUE("json path", config.json_output && config.json_output->string() == "out.json");
    ASSERT_TRUE("max file size", config.max_file_size && *config.max_file_size == 4096u);
    ASSERT_TRUE("timeout", config.timeout_ms && *config.timeout_ms == 2500);
    ASSERT_TRUE("threads", config.threads && *config.threads == 3u);
    ASSERT_TRUE("verbose -> debug", config.log_level == log::Level::Debug);
    ASSERT_TRUE("default excludes on", config.default_excludes);
}

void test_parse_minimal_and_help() {
    std::cout << "\n[ParseMinimalAndHelp]\n";
    auto config = parse_args({ "." });
    ASSERT_EQ("root only", std::string("."), config.root.string());
    ASSERT_TRUE("no rules", config.rule_files.empty() && config.inline_rules.empty());
    ASSERT_TRUE("info logging by default", config.log_level == log::Level::Info);

    auto help = parse_args({ "--help" });
    ASSERT_TRUE("help without root", help.show_help);

    auto quiet = parse_args({ "-q", "--no-default-excludes", "src" });
    ASSERT_TRUE("quiet -> error level", quiet.log_level == log::Level::Error);
    ASSERT_TRUE("default excludes off", !quiet.default_excludes);
}

void test_parse_errors() {
    std::cout << "\n[ParseErrors]\n";
    ASSERT_TRUE("missing root",            usage_error({}));
    ASSERT_TRUE("two roots",               usage_error({ "a", "b" }));
    ASSERT_TRUE("unknown option",          usage_error({ "--frobnicate", "." }));
    ASSERT_TRUE("option without value",    usage_error({ ".", "--rules" }));
    ASSERT_TRUE("non-numeric timeout",     usage_error({ "--timeout-ms", "soon", "." }));
    ASSERT_TRUE("negative size",           usage_error({ "--max-file-size", "-1", "." }));
    ASSERT_TRUE("zero threads",            usage_error({ "-j", "0", "." }));
    ASSERT_TRUE("usage text mentions exit status",
                usage("textgate").find("Exit status") != std::string::npos);
}

void test_parse_bounds() {
    std::cout << "\n[ParseBounds]\n";
    ASSERT_TRUE("timeout beyond one year rejected",
                usage_error({ "--timeout-ms", "10000000000000", "." }));
    ASSERT_TRUE("timeout beyond long long rejected",
                usage_error({ "--timeout-ms", "18446744073709551615", "." }));
    auto year = parse_args({ "--timeout-ms", std::to_string(kMaxTimeoutMs), "." });
    ASSERT_TRUE("one year accepted", year.timeout_ms && *year.timeout_ms == kMaxTimeoutMs);

    ASSERT_TRUE("thread count above unsigned range rejected",
                usage_error({ "-j", "4294967297", "." }));
    auto many = parse_args({ "-j", "64", "." });
    ASSERT_TRUE("thread count kept exactly", many.threads && *many.threads == 64u);

    ASSERT_TRUE("zero line length rejected", usage_error({ "--max-line-length", "0", "." }));
    ASSERT_TRUE("line length above limit rejected",
                usage_error({ "--max-line-length", std::to_string(kMaxLineLengthLimit + 1), "." }));
    auto wide = parse_args({ "--max-line-length", "8192", "." });
    ASSERT_TRUE("line length parsed", wide.max_line_length && *wide.max_line_length == 8192u);
}

void test_resolve_merges_rule_files() {
    std::cout << "\n[ResolveMergesRuleFiles]\n";
    TempTree tree;
    tree.write("base.yaml",
               "rules:\n"
               "  - id: no-fixme\n"
               "    pattern: FIXME\n"
               "exclude:\n"
               "  - '*.lock'\n"
               "options:\n"
               "  max_file_size: 100\n"
               "  max_line_length: 2048\n"
               "  timeout_ms: 9000\n"
               "  threads: 2\n");
    tree.write("extra.yaml",
               "rules:\n"
               "  - id: no-key\n"
               "    pattern: 'AKIA[0-9A-Z]{16}'\n"
               "    regex: true\n"
               "options:\n"
               "  threads: 6\n");

    GateConfig config = parse_args({ "-r", tree.path("base.yaml").string(),
                                     "-r", tree.path("extra.yaml").string(),
                                     "--rule", "no-hack=HACK",
                                     "--timeout-ms", "1234", "-x", "dist/", "." });
    GatePlan plan = resolve(config);

    ASSERT_EQ("three rules", static_cast<std::size_t>(3), plan.rules.rule_count());
    ASSERT_EQ("file rules first", std::string("no-fixme"), plan.rules.rules()[0].id);
    ASSERT_EQ("inline rule last", std::string("no-hack"), plan.rules.rules()[2].id);
    ASSERT_EQ("rule file size limit used", static_cast<std::uintmax_t>(100),
              plan.options.max_file_size);
    ASSERT_EQ("rule file line length used", static_cast<std::size_t>(2048),
              plan.options.max_line_length);
    ASSERT_TRUE("command line timeout wins",
                plan.options.timeout && plan.options.timeout->count() == 1234);
    ASSERT_EQ("later rule file wins", 6u, plan.options.threads);
    ASSERT_TRUE("rule file exclude applied", plan.options.excludes.excluded("Cargo.lock", false));
    ASSERT_TRUE("command line exclude applied", plan.options.excludes.excluded("dist", true));
    ASSERT_TRUE("default excludes kept", plan.options.excludes.excluded(".git", true));
}

void test_resolve_errors() {
    std::cout << "\n[ResolveErrors]\n";
    TempTree tree;
    tree.write("dup.yaml", "rules:\n  - {id: no-fixme, pattern: FIXME}\n");

    bool duplicate = false;
    try {
        resolve(parse_args({ "-r", tree.path("dup.yaml").string(),
                             "--rule", "no-fixme=XXX", "." }));
    } catch (const RuleSetError&) {
        duplicate = true;
    }
    ASSERT_TRUE("inline id clashing with file id -> RuleSetError", duplicate);

    bool missing = false;
    try {
        resolve(parse_args({ "-r", tree.path("absent.yaml").string(), "." }));
    } catch (const RuleSetError&) {
        missing = true;
    }
    ASSERT_TRUE("missing rule file -> RuleSetError", missing);

    auto plan = resolve(parse_args({ "--no-default-excludes", "." }));
    ASSERT_TRUE("no rules is allowed", plan.rules.empty());
    ASSERT_TRUE("default excludes disabled", !plan.options.excludes.excluded(".git", true));
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Configuration Tests ===\n";

    test_exit_codes();
    test_parse_full_command_line();
    test_parse_minimal_and_help();
    test_parse_errors();
    test_parse_bounds();
    test_resolve_merges_rule_files();
    test_resolve_errors();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
