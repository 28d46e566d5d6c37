#include "loopguard/analysis/blocking_analyzer.h"
#include "loopguard/analysis/global_state_checker.h"
#include "loopguard/core/exceptions.h"
#include "loopguard/utils/logger.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitUnsafe = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
    out << "Usage: loopguard-scan [--json] [--policy] [--quiet] <file>...\n"
        << "\n"
        << "Scan PHP sources for code that blocks or pollutes a long-running event loop.\n"
        << "\n"
        << "  --json     print one JSON document with every report\n"
        << "  --policy   also run the global-state policy check\n"
        << "  --quiet    print only files with findings or errors\n"
        << "  --help     show this message\n"
        << "\n"
        << "Exit status: 0 clean, 1 unsafe code or unreadable file, 2 usage error\n";
}

void print_report(const loopguard::ScanReport& report, const char* title, bool quiet) {
    if (!report.ok()) {
        std::cout << report.context << ": " << title << " failed: " << *report.error << "\n";
        return;
    }
    if (report.violations.empty()) {
        if (!quiet) {
            std::cout << report.context << ": " << title << " clean\n";
        }
        return;
    }

    for (const auto& v : report.violations) {
        std::cout << v.location.to_string() << ": "
                  << loopguard::to_string(v.severity) << " [" << loopguard::to_string(v.kind) << "] "
                  << v.message << "\n";
        if (!v.suggestion.empty()) {
            std::cout << "    suggestion: " << v.suggestion << "\n";
        }
    }
    std::cout << report.context << ": " << title << " " << report.summary.blocking << " error(s), "
              << report.summary.warnings << " warning(s)\n";
}

} // namespace

int main(int argc, char** argv) {
    bool json = false;
    bool policy = false;
    bool quiet = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            json = true;
        } else if (arg == "--policy") {
            policy = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return kExitClean;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                files.emplace_back(argv[i]);
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "loopguard-scan: unknown option '" << arg << "'\n";
            print_usage(std::cerr);
            return kExitUsage;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        std::cerr << "loopguard-scan: no input files\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    // Diagnostics go to the reports, not to the log
    loopguard::LoggerFactory::set_global_level(loopguard::LogLevel::ERROR);

    loopguard::BlockingAnalyzer analyzer;
    loopguard::GlobalStateChecker checker;

    bool failed = false;
    nlohmann::json output = nlohmann::json::array();

    for (const auto& file : files) {
        const auto report = analyzer.scan_file(file);
        failed = failed || !report.safe();

        nlohmann::json entry{{"file", file}, {"analysis", report.to_json()}};
        if (!json) {
            print_report(report, "analysis", quiet);
        }

        if (policy && report.ok()) {
            loopguard::ScanReport policy_report;
            try {
                policy_report = checker.check(loopguard::read_source_file(file), file);
            } catch (const loopguard::SourceReadException& e) {
                policy_report = loopguard::ScanReport::failed(file, e.what());
                failed = true;
            }
            entry["policy"] = policy_report.to_json();
            if (!json) {
                print_report(policy_report, "policy", quiet);
            }
        }
        output.push_back(std::move(entry));
    }

    if (json) {
        std::cout << output.dump(2) << "\n";
    }

    return failed ? kExitUnsafe : kExitClean;
}
