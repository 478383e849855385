#include "textgate/config.hpp"
#include "textgate/errors.hpp"
#include "textgate/log.hpp"
#include "textgate/report.hpp"
#include "textgate/scanner.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace textgate;

static int run(const GateConfig& config) {
    GatePlan plan = resolve(config);
    if (plan.rules.empty()) log::warn("rule set is empty; every scan passes");
    log::debug("rules: " + std::to_string(plan.rules.rule_count()));

    Scanner scanner(std::move(plan.options));
    ScanReport report = scanner.scan(config.root, plan.rules);

    // The JSON file is written before stdout so a failed write aborts the
    // run without a half-printed report.
    if (config.json_output) write_json_report(*config.json_output, report);
    print_report(std::cout, report);
    std::cout.flush();

    log::info("scanned " + std::to_string(report.stats.scanned) + " of " +
              std::to_string(report.stats.candidates) + " file(s), skipped " +
              std::to_string(report.stats.skipped.size()));
    return report.passed() ? kExitPass : kExitFail;
}

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "textgate";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    GateConfig config;
    try {
        config = parse_args(args);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n" << usage(program);
        return kExitConfigError;
    }
    if (config.show_help) {
        std::cout << usage(program);
        return kExitPass;
    }
    log::set_level(config.log_level);

    try {
        return run(config);
    } catch (const InvalidTarget& e) {
        log::error(e.what());
        return kExitInvalidTarget;
    } catch (const RuleSetError& e) {
        log::error(e.what());
        return kExitConfigError;
    } catch (const ScanAborted& e) {
        log::error(e.what());
        return kExitAborted;
    } catch (const GateError& e) {
        // JSON report could not be written: the check is inconclusive.
        log::error(e.what());
        return kExitAborted;
    } catch (const std::exception& e) {
        log::error(std::string("internal error: ") + e.what());
        return kExitAborted;
    }
}
