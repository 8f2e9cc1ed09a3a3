#include <cstdio>
#include <string>

#include "common/logging.h"
#include "config/guard_config.h"
#include "guard/guard_engine.h"
#include "report/report_renderer.h"
#include "rules/rule_registry.h"

static void printUsage(FILE* out, const char* program) {
    const char* usage = R"(
USAGE: layer_guard [OPTIONS]

layer_guard - Architectural boundary checker for Rust crates

OPTIONS:
    --root <dir>            Directory to scan (default: .)
    --manifest <path>       Cargo manifest, relative to the root (default: Cargo.toml)
    --report <path>         JSON report path (default: architecture_report.json)
    --layer <name>          Layer to check, repeatable (default: every layer)
    --profile <name>        Detection profile: full | simplified (default: full)
    --strict-read           Report unreadable source files instead of skipping them
    --jobs <n>              Scan files on n worker threads (default: 1)
    --config <file>         KEY=VALUE config file, overridden by flags
    --log <file>            Write a log file (default: no file logging)
    --log-level <level>     debug | info | warn | error (default: info)
    --quiet, -q             Do not print the report to stdout
    --help, -h              Show this help message

CONFIG KEYS:
    ROOT, MANIFEST, REPORT, LAYERS (comma list), PROFILE,
    STRICT_READ, JOBS, LOG_FILE, LOG_LEVEL

EXAMPLES:
    # Check the crate in the current directory
    layer_guard

    # Simplified profile on four threads
    layer_guard --profile simplified --jobs 4

EXIT CODES:
    0 - Architecture is clean
    1 - Violations found, or the run could not complete

)";

    fprintf(out, "%s", usage);
    fprintf(out, "Program: %s\n", program);
}

static void printBanner() {
    printf("============================================================\n");
    printf("ARCHITECTURAL GUARDRAIL REPORT\n");
    printf("============================================================\n");
}

int main(int argc, char* argv[]) {
    LayerGuard::GuardConfig config;
    std::string error;

    const LayerGuard::CliAction action =
        LayerGuard::ConfigLoader::parseCommandLine(argc, argv, &config, &error);
    if (action == LayerGuard::CliAction::Help) {
        printUsage(stdout, argv[0]);
        return 0;
    }
    if (action == LayerGuard::CliAction::UsageError) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        printUsage(stderr, argv[0]);
        return 1;
    }

    const LayerGuard::RuleRegistry registry = LayerGuard::RuleRegistry::builtin();
    if (!LayerGuard::ConfigLoader::validate(config, registry, &error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        printUsage(stderr, argv[0]);
        return 1;
    }

    Common::LogLevel log_level = Common::LogLevel::INFO;
    (void)Common::parseLogLevel(config.log_level.c_str(), &log_level);  // validated above
    Common::initLogging(config.log_file.c_str(), log_level);
    LOG_INFO("layer_guard starting: root=%s report=%s", config.root.c_str(), config.report_path.c_str());

    LayerGuard::GuardEngine engine(registry, config);
    const LayerGuard::ValidationReport report = engine.run();

    const bool report_written = LayerGuard::writeMachineReport(report, config.report_path.c_str());

    if (!config.quiet) {
        printBanner();
        printf("%s", LayerGuard::renderHuman(report).c_str());
        printf("\nFiles scanned: %u\n", engine.lastRunStats().files_scanned);
        if (report_written) {
            printf("Detailed report written to: %s\n", config.report_path.c_str());
        }
    }

    if (!report_written) {
        fprintf(stderr, "Error: failed to write report to %s\n", config.report_path.c_str());
    }

    int exit_code = LayerGuard::exitStatus(report);
    if (!report_written) {
        exit_code = 1;
    }

    if (!config.quiet) {
        if (exit_code == 0) {
            printf("\nBuild PASSED: Architecture is clean\n");
        } else if (!report.isClean()) {
            printf("\nBuild FAILED: %zu architectural violations found\n", report.size());
        } else {
            printf("\nBuild FAILED: report could not be written\n");
        }
    }

    LOG_INFO("layer_guard finished with exit code %d", exit_code);
    Common::shutdownLogging();
    return exit_code;
}
