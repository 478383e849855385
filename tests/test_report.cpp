#include "textgate/errors.hpp"
#include "textgate/json.hpp"
#include "textgate/report.hpp"
#include "temp_tree.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

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

static ScanReport failing_report() {
    ScanReport report;
    report.violations.push_back({ "README.md", 1, "no-fixme", "FIXME",
                                  "FIXME: this needs to be fixed." });
    report.violations.push_back({ "src/a.c", 7, "no-fixme", "FIXME", "/* FIXME \"quoted\" */" });
    report.violations.push_back({ "src/a.c", 7, "no-tab", "\t", "\tindent" });
    report.stats.candidates = 4;
    report.stats.scanned    = 3;
    report.stats.skipped.push_back({ "logo.png", SkipReason::Binary });
    return report;
}

// ── Suites ────────────────────────────────────────────────────────────────────

void test_violation_line() {
    std::cout << "\n[ViolationLine]\n";
    auto report = failing_report();
    ASSERT_EQ("path:line: [rule] text",
              std::string("README.md:1: [no-fixme] FIXME: this needs to be fixed."),
              format_violation(report.violations[0]));
}

void test_summary() {
    std::cout << "\n[Summary]\n";
    ASSERT_EQ("pass summary", std::string("textgate: PASS"), format_summary(ScanReport{}));
    ASSERT_EQ("fail summary counts distinct files",
              std::string("textgate: FAIL (3 violation(s) in 2 file(s))"),
              format_summary(failing_report()));
}

void test_print_report() {
    std::cout << "\n[PrintReport]\n";
    std::ostringstream os;
    print_report(os, failing_report());
    const std::string expected =
        "README.md:1: [no-fixme] FIXME: this needs to be fixed.\n"
        "src/a.c:7: [no-fixme] /* FIXME \"quoted\" */\n"
        "src/a.c:7: [no-tab] \tindent\n"
        "textgate: FAIL (3 violation(s) in 2 file(s))\n";
    ASSERT_EQ("full text report", expected, os.str());

    std::ostringstream empty;
    print_report(empty, ScanReport{});
    ASSERT_EQ("pass report is the summary only", std::string("textgate: PASS\n"), empty.str());
}

void test_json_report() {
    std::cout << "\n[JsonReport]\n";
    auto json = to_json(failing_report());
    ASSERT_TRUE("verdict fail",       json.find("\"verdict\": \"fail\"") != std::string::npos);
    ASSERT_TRUE("path present",       json.find("\"path\": \"README.md\"") != std::string::npos);
    ASSERT_TRUE("line number",        json.find("\"line\": 7") != std::string::npos);
    ASSERT_TRUE("rule id",            json.find("\"rule\": \"no-tab\"") != std::string::npos);
    ASSERT_TRUE("quotes escaped",     json.find("\\\"quoted\\\"") != std::string::npos);
    ASSERT_TRUE("tab escaped",        json.find("\"match\": \"\\t\"") != std::string::npos);
    ASSERT_TRUE("skip reason",        json.find("\"reason\": \"binary\"") != std::string::npos);
    ASSERT_TRUE("candidates counted", json.find("\"candidates\": 4") != std::string::npos);

    ASSERT_TRUE("long-line skip reason",
                to_json(SkippedFile{ "app.min.js", SkipReason::LongLine })
                    .find("\"reason\": \"long-line\"") != std::string::npos);

    auto pass = to_json(ScanReport{});
    ASSERT_TRUE("pass verdict",       pass.find("\"verdict\": \"pass\"") != std::string::npos);
    ASSERT_TRUE("empty violations",   pass.find("\"violations\": []") != std::string::npos);
}

void test_json_control_characters() {
    std::cout << "\n[JsonControlCharacters]\n";
    ASSERT_EQ("escape sequence for 0x01", std::string("\"a\\u0001b\""),
              json_detail::quoted(std::string("a\x01" "b")));
}

void test_write_json_report() {
    std::cout << "\n[WriteJsonReport]\n";
    TempTree tree;
    auto path = tree.path("report.json");
    write_json_report(path, failing_report());

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    ASSERT_EQ("file holds the JSON report", to_json(failing_report()) + "\n", content.str());

    bool thrown = false;
    try {
        write_json_report(tree.path("missing-dir/report.json"), failing_report());
    } catch (const GateError&) {
        thrown = true;
    }
    ASSERT_TRUE("unwritable path -> GateError", thrown);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Report Tests ===\n";

    test_violation_line();
    test_summary();
    test_print_report();
    test_json_report();
    test_json_control_characters();
    test_write_json_report();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
