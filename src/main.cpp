#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "config/scan_config.hpp"
#include "pipeline/file_classifier.hpp"
#include "pipeline/scanner.hpp"
#include "review/feedback_ledger.hpp"
#include "review/review_queue.hpp"
#include "review/review_session.hpp"
#include "storage/findings_store.hpp"
#include "storage/key_provider.hpp"
#include "storage/scan_json.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/time_format.hpp"

namespace {

using namespace sensiscan;

void printUsage()
{
    std::cerr << "usage: sensiscan [-c <config>] <command> [args]\n"
              << "  scan <path>                 scan a file or directory and store the results\n"
              << "  list                        list stored scans\n"
              << "  show <scan_id>              print a stored scan as JSON\n"
              << "  purge <scan_id>             delete a scan and all its findings\n"
              << "  purge --all                 delete every stored scan\n"
              << "  review <scan_id> [--all]    review matches on stdin (t/f/u, q to quit)\n"
              << "  stats                       store and feedback ledger statistics\n"
              << "  export <scan_id> <file>     write a sealed export bundle\n"
              << "  import <file>               import a sealed export bundle\n"
              << "  rotate-key                  re-seal the store under a fresh key file\n"
              << "  audit [--action A] [--scan ID] [--since ISO8601] [--limit N]\n"
              << "                              print matching audit entries\n"
              << "  audit-stats                 audit log totals\n";
}

void ensureParentDir(const std::string &path)
{
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        util::logger::warn("[main] Could not create " + parent.string() + ": " + ec.message());
    }
}

std::unique_ptr<storage::SecureFindingsStore> openStore(const config::ScanConfig &cfg)
{
    ensureParentDir(cfg.databasePath);
    ensureParentDir(cfg.effectiveAuditLogPath());
    ensureParentDir(cfg.keyFilePath);
    auto keys = storage::makeKeyProvider(cfg);
    return storage::SecureFindingsStore::open(storage::StoreSettings::fromConfig(cfg), *keys);
}

int runScan(const config::ScanConfig &cfg, const std::string &path)
{
    auto store = openStore(cfg);
    pipeline::Scanner scanner(cfg, pipeline::FileClassifier::fromConfig(cfg));
    core::ScanRecord record = store->storeScan(scanner.scan(path));

    std::cout << "scan " << record.scanId << ": " << record.fileResults.size() << " file(s), "
              << record.totalMatches() << " match(es), " << record.filesErrored() << " error(s)\n";
    for (const auto &f : record.fileResults) {
        std::cout << "  " << f.path << "  "
                  << (f.labelRecommendation ? core::toString(*f.labelRecommendation) : "-")
                  << "  matches=" << f.matches.size();
        if (f.error) {
            std::cout << "  error=" << f.error->describe();
        }
        std::cout << "\n";
    }
    return 0;
}

int runList(const config::ScanConfig &cfg)
{
    auto store = openStore(cfg);
    for (const auto &s : store->listScans()) {
        std::cout << s.scanId << "  " << util::toIso8601(s.startedAt) << "  files=" << s.fileCount
                  << "  matches=" << s.matchCount << "  " << s.sourcePath << "\n";
    }
    return 0;
}

core::Verdict verdictFromKey(char c, bool &ok)
{
    ok = true;
    switch (c) {
    case 't': return core::Verdict::TruePositive;
    case 'f': return core::Verdict::FalsePositive;
    case 'u': return core::Verdict::Unsure;
    default:
        ok = false;
        return core::Verdict::Pending;
    }
}

int runReview(const config::ScanConfig &cfg, const std::string &scanId, bool all)
{
    auto store = openStore(cfg);
    ensureParentDir(cfg.feedbackLedgerPath);
    review::FeedbackLedger ledger(cfg.feedbackLedgerPath);

    review::ReviewQueue queue(store->loadScan(scanId),
                              all ? review::ReviewQueue::Scope::All : review::ReviewQueue::Scope::PendingOnly);
    std::cout << queue.size() << " match(es) to review\n";
    review::ReviewSession session(std::move(queue), *store, ledger);

    while (auto item = session.present()) {
        const core::ResolvedMatch &m = item->match;
        std::cout << "\n" << item->filePath << ":" << m.span.line << "  " << core::toString(m.entityType)
                  << "  " << m.redactedValue << "  confidence=" << m.finalConfidence << "\n"
                  << "  " << m.contextSnippet << "\n";
        if (m.verdict != core::Verdict::Pending) {
            std::cout << "  already " << core::toString(m.verdict) << "\n";
            session.pass();
            continue;
        }
        std::cout << "[t]rue / [f]alse / [u]nsure / [q]uit > " << std::flush;

        std::string line;
        if (!std::getline(std::cin, line) || line.empty() || line[0] == 'q') {
            session.quit();
            break;
        }
        bool ok = false;
        core::Verdict verdict = verdictFromKey(line[0], ok);
        if (!ok) {
            std::cout << "unrecognized answer\n";
            continue;
        }
        std::optional<std::string> reason;
        if (line.size() > 2) {
            reason = line.substr(2);
        }
        try {
            session.submitVerdict(m.matchId, verdict, reason);
        }
        catch (const core::ReviewTransactionError &ex) {
            if (ex.code() == core::ErrorCode::InvalidState) {
                // Decided elsewhere since the queue was built.
                std::cout << "not committed (" << ex.what() << "), skipping\n";
                session.pass();
            } else {
                std::cout << "not committed (" << ex.what() << "), try again\n";
            }
        }
    }
    std::cout << session.committedCount() << " verdict(s) committed\n";
    return 0;
}

int runStats(const config::ScanConfig &cfg)
{
    auto store = openStore(cfg);
    storage::StoreStats s = store->stats();
    std::cout << "scans=" << s.scans << " files=" << s.files << " matches=" << s.matches << "\n";
    for (const auto &kv : s.byVerdict) {
        std::cout << "  " << core::toString(kv.first) << "=" << kv.second << "\n";
    }
    for (const auto &kv : s.byEntity) {
        std::cout << "  " << core::toString(kv.first) << "=" << kv.second << "\n";
    }

    review::LedgerStats ls = review::FeedbackLedger(cfg.feedbackLedgerPath).stats();
    std::cout << "feedback: total=" << ls.total << " tp=" << ls.truePositives
              << " fp=" << ls.falsePositives << " skipped=" << ls.skipped << "\n";
    return 0;
}

int runExport(const config::ScanConfig &cfg, const std::string &scanId, const std::string &outPath)
{
    auto store = openStore(cfg);
    std::vector<uint8_t> bundle = store->exportScan(scanId);
    std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bundle.data()), static_cast<std::streamsize>(bundle.size()));
    if (!out) {
        util::logger::error("[main] Could not write " + outPath);
        return 1;
    }
    std::cout << "exported " << scanId << " (" << bundle.size() << " bytes)\n";
    return 0;
}

int runImport(const config::ScanConfig &cfg, const std::string &inPath)
{
    std::ifstream in(inPath, std::ios::binary);
    if (!in.is_open()) {
        util::logger::error("[main] Could not read " + inPath);
        return 1;
    }
    std::vector<uint8_t> bundle((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto store = openStore(cfg);
    core::ScanRecord rec = store->importScan(bundle);
    std::cout << "imported " << rec.scanId << " (" << rec.totalMatches() << " matches)\n";
    return 0;
}

int runRotateKey(const config::ScanConfig &cfg)
{
    if (!cfg.keyVaultUrl.empty()) {
        util::logger::error("[main] Keys held in a vault are rotated in the vault, not here.");
        return 1;
    }
    auto store = openStore(cfg);
    storage::FileKeyProvider keys(cfg.keyFilePath, false);

    // The new key is durable before any row is re-sealed under it.
    storage::KeyMaterial next = keys.stageNewKey();
    try {
        uint64_t rows = store->rotateKey(next);
        std::cout << "re-sealed " << rows << " row(s)\n";
    }
    catch (const std::exception &) {
        keys.discardStagedKey();
        throw;
    }
    keys.promoteStagedKey();
    return 0;
}

int runAudit(const config::ScanConfig &cfg, const std::vector<std::string> &opts)
{
    storage::AuditQuery query;
    for (size_t i = 0; i < opts.size(); i += 2) {
        if (i + 1 >= opts.size()) {
            printUsage();
            return 2;
        }
        const std::string &flag = opts[i];
        const std::string &value = opts[i + 1];
        if (flag == "--action") {
            query.action = value;
        } else if (flag == "--scan") {
            query.scanId = value;
        } else if (flag == "--since") {
            query.since = util::fromIso8601(value);
        } else if (flag == "--limit") {
            query.limit = static_cast<size_t>(std::stoull(value));
        } else {
            printUsage();
            return 2;
        }
    }
    for (const auto &e : openStore(cfg)->auditEntries(query)) {
        std::cout << storage::AuditLog::toJsonLine(e) << "\n";
    }
    return 0;
}

int runAuditStats(const config::ScanConfig &cfg)
{
    storage::AuditStats s = openStore(cfg)->auditStats();
    std::cout << "entries=" << s.total << " failures=" << s.failures << "\n";
    if (s.first && s.last) {
        std::cout << "  from " << util::toIso8601(*s.first) << " to " << util::toIso8601(*s.last) << "\n";
    }
    for (const auto &kv : s.byAction) {
        std::cout << "  " << kv.first << "=" << kv.second << "\n";
    }
    for (const auto &kv : s.byActor) {
        std::cout << "  actor " << kv.first << "=" << kv.second << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configPath = "sensiscan.conf";
    if (args.size() >= 2 && args[0] == "-c") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        printUsage();
        return 2;
    }

    // 1. Configuration and logging
    config::ScanConfig cfg;
    try {
        util::ConfigParser parser(cfg);
        parser.loadFromFile(configPath);
        util::logger::setLogLevel(util::logger::parseLogLevel(cfg.logLevel));
        if (!cfg.logFile.empty() && !util::logger::enableFileOutput(cfg.logFile, true)) {
            util::logger::warn("[main] Cannot open log file " + cfg.logFile + ", logging to console only.");
        }
    }
    catch (const std::runtime_error &ex) {
        util::logger::error(std::string("[main] Invalid configuration: ") + ex.what());
        return 2;
    }

    // 2. Dispatch
    const std::string &command = args[0];
    try {
        if (command == "scan" && args.size() == 2) {
            return runScan(cfg, args[1]);
        }
        if (command == "list" && args.size() == 1) {
            return runList(cfg);
        }
        if (command == "show" && args.size() == 2) {
            std::cout << storage::scanToJson(openStore(cfg)->loadScan(args[1])) << "\n";
            return 0;
        }
        if (command == "purge" && args.size() == 2 && args[1] == "--all") {
            uint64_t removed = openStore(cfg)->purgeAll();
            std::cout << "purged all scans (" << removed << " rows)\n";
            return 0;
        }
        if (command == "purge" && args.size() == 2) {
            uint64_t removed = openStore(cfg)->purgeScan(args[1]);
            std::cout << "purged " << args[1] << " (" << removed << " rows)\n";
            return 0;
        }
        if (command == "review" && (args.size() == 2 || (args.size() == 3 && args[2] == "--all"))) {
            return runReview(cfg, args[1], args.size() == 3);
        }
        if (command == "stats" && args.size() == 1) {
            return runStats(cfg);
        }
        if (command == "export" && args.size() == 3) {
            return runExport(cfg, args[1], args[2]);
        }
        if (command == "import" && args.size() == 2) {
            return runImport(cfg, args[1]);
        }
        if (command == "rotate-key" && args.size() == 1) {
            return runRotateKey(cfg);
        }
        if (command == "audit") {
            return runAudit(cfg, std::vector<std::string>(args.begin() + 1, args.end()));
        }
        if (command == "audit-stats" && args.size() == 1) {
            return runAuditStats(cfg);
        }
    }
    catch (const core::SensiScanError &ex) {
        util::logger::error("[main] " + command + " failed: " + ex.what());
        return 1;
    }
    catch (const std::exception &ex) {
        util::logger::error("[main] " + command + " failed unexpectedly: " + ex.what());
        return 1;
    }

    printUsage();
    return 2;
}
