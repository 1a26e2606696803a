#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

#include "config/scan_config.hpp"
#include "extract/errors.hpp"
#include "extract/format_adapter.hpp"
#include "history/scan_history.hpp"
#include "report/scan_report.hpp"
#include "session/scan_session.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

// Exit statuses, ordered by priority: the highest one seen wins.
constexpr int kExitSafe = 0;
constexpr int kExitIssues = 1;
constexpr int kExitUsage = 2;
constexpr int kExitParseFailure = 3;
constexpr int kExitUnsupported = 4;

struct Options {
    std::string configPath;
    std::string format;
    std::string view = "findings";
    std::string historyPath;
    bool color = true;
    bool quiet = false;
    std::vector<std::string> files;
};

void printUsage(std::ostream& os) {
    os << "usage: docshield [--config FILE] [--format pdf|docx]\n"
          "                 [--view findings|sanitized|proof|json|all]\n"
          "                 [--history DB] [--no-color] [--quiet] FILE...\n";
}

Options parseArgs(int argc, char** argv) {
    Options opts;
    opts.color = isatty(STDOUT_FILENO) != 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };
        if (arg == "--config") {
            opts.configPath = value();
        } else if (arg == "--format") {
            opts.format = value();
        } else if (arg == "--view") {
            opts.view = value();
            static const std::vector<std::string> views = {"findings", "sanitized", "proof", "json", "all"};
            if (std::find(views.begin(), views.end(), opts.view) == views.end()) {
                throw std::invalid_argument("unknown view '" + opts.view + "'");
            }
        } else if (arg == "--history") {
            opts.historyPath = value();
        } else if (arg == "--no-color") {
            opts.color = false;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(std::cout);
            std::exit(kExitSafe);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            opts.files.push_back(arg);
        }
    }
    if (opts.files.empty()) {
        throw std::invalid_argument("no input files");
    }
    return opts;
}

bool readFile(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

void printReport(const docshield::report::ScanReport& report, const std::string& view) {
    if (view == "json") {
        std::cout << report.toJson() << "\n";
        return;
    }
    if (view == "findings" || view == "all") {
        std::cout << report.findingsView();
    }
    if (view == "sanitized" || view == "all") {
        std::cout << "--- sanitized ---\n" << report.sanitizedView();
    }
    if (view == "proof" || view == "all") {
        std::cout << "--- proof ---\n" << report.proofView();
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace docshield;
    util::logger::Logger& logger = util::logger::Logger::getInstance();

    Options opts;
    config::ScanConfig scanConfig;
    try {
        opts = parseArgs(argc, argv);
        if (!opts.configPath.empty()) {
            util::ConfigParser configParser(scanConfig);
            configParser.loadFromFile(opts.configPath);
        }
    } catch (const std::exception& ex) {
        std::cerr << "docshield: " << ex.what() << "\n";
        printUsage(std::cerr);
        return kExitUsage;
    }

    logger.setLogLevel(scanConfig.logLevel);
    logger.setConsoleOutput(!opts.quiet);
    if (!scanConfig.logFile.empty() && !logger.enableFileOutput(scanConfig.logFile, true)) {
        logger.warn("[main] continuing without log file " + scanConfig.logFile);
    }
    if (!opts.historyPath.empty()) {
        scanConfig.historyDatabase = opts.historyPath;
    }

    std::unique_ptr<session::ScanSession> scanSession;
    try {
        scanSession = std::make_unique<session::ScanSession>(scanConfig);
    } catch (const std::invalid_argument& ex) {
        logger.error(std::string("[main] invalid configuration: ") + ex.what());
        std::cerr << "docshield: " << ex.what() << "\n";
        return kExitUsage;
    }
    scanSession->setCleanResultCallback([&logger](const model::ScanResult& result) {
        logger.info("[main] " + result.fileName + " is clean");
    });

    std::unique_ptr<history::ScanHistory> scanHistory;
    if (!scanConfig.historyDatabase.empty()) {
        scanHistory = std::make_unique<history::ScanHistory>(scanConfig.historyDatabase);
    }

    int exitCode = kExitSafe;
    for (const auto& path : opts.files) {
        model::DocumentFormat format;
        try {
            format = opts.format.empty() ? extract::formatFromFileName(path)
                                         : extract::parseFormatName(opts.format);
        } catch (const extract::UnsupportedFormat& ex) {
            logger.error("[main] " + std::string(ex.what()));
            std::cerr << "docshield: " << ex.what() << "\n";
            exitCode = std::max(exitCode, kExitUnsupported);
            continue;
        }

        std::vector<uint8_t> bytes;
        if (!readFile(path, bytes)) {
            logger.error("[main] cannot read " + path);
            std::cerr << "docshield: cannot read " << path << "\n";
            exitCode = std::max(exitCode, kExitUsage);
            continue;
        }

        scanSession->beginScan(std::move(bytes), path, format);
        scanSession->waitForIdle();
        scanSession->pumpCompletions();

        auto snap = scanSession->snapshot();
        if (snap->state == session::SessionState::Failed) {
            std::cerr << "docshield: " << path << ": scan failed: " << snap->error << "\n";
            exitCode = std::max(exitCode, kExitParseFailure);
            continue;
        }
        if (snap->state != session::SessionState::Done || !snap->result) {
            logger.error("[main] scan of " + path + " ended in state "
                         + session::sessionStateName(snap->state));
            exitCode = std::max(exitCode, kExitParseFailure);
            continue;
        }

        const model::ScanResult& result = *snap->result;
        report::ScanReport report(result, scanSession->scanner().scanner().phrases(), opts.color);
        printReport(report, opts.view);

        if (scanHistory && !scanHistory->Record(result)) {
            logger.warn("[main] scan of " + path + " not recorded in history");
        }
        if (!result.safe) {
            exitCode = std::max(exitCode, kExitIssues);
        }
    }

    scanSession->reset();
    return exitCode;
}
