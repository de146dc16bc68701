#ifndef SENSISCAN_PIPELINE_SCANNER_HPP
#define SENSISCAN_PIPELINE_SCANNER_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "config/scan_config.hpp"
#include "core/match_types.hpp"
#include "pipeline/file_classifier.hpp"
#include "pipeline/text_extractor.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file scanner.hpp
 * @brief Walks a path and classifies every eligible file on a bounded pool.
 *
 * DESIGN GOALS:
 *   - Excluded directory and file names are skipped during the walk.
 *   - The size policy is applied before any bytes are read.
 *   - Each file gets `perFileTimeoutMs` for extraction and detection. The
 *     work runs on a detached thread that owns shared references to the
 *     extractor and classifier, so a timed-out file cannot outlive what it
 *     uses. The pool worker records a timeout error and moves on.
 *
 * LIMITATIONS:
 *   - A timed-out thread cannot be interrupted. It keeps running until the
 *     extractor or detector returns, so an extractor that never returns
 *     leaks one thread per file. abandonedTasks() counts them across the
 *     process and scan() warns when any are still running at its end.
 *   - A ScanCancellation stops files that have not started yet. Files in
 *     flight finish or time out. Cancelled files are left out of the record.
 *   - File results are returned sorted by path.
 *
 * USAGE:
 *   @code
 *   auto classifier = sensiscan::pipeline::FileClassifier::fromConfig(cfg);
 *   sensiscan::pipeline::Scanner scanner(cfg, classifier);
 *   sensiscan::core::ScanRecord record = scanner.scan("./docs");
 *   @endcode
 */

namespace sensiscan {
namespace pipeline {

namespace fs = std::filesystem;

class ScanCancellation
{
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

class Scanner
{
public:
    static std::vector<std::string> defaultExcludePatterns()
    {
        return {"node_modules", ".git", "__pycache__", "venv", ".venv", ".tox",
                ".pytest_cache", ".mypy_cache", "dist", "build", "*.egg-info"};
    }

    Scanner(const config::ScanConfig &cfg,
            std::shared_ptr<const FileClassifier> classifier,
            std::shared_ptr<const TextExtractor> extractor = std::make_shared<PlainTextExtractor>(),
            std::vector<std::string> excludePatterns = defaultExcludePatterns())
        : maxFileSizeBytes_(cfg.maxFileSizeBytes),
          workerCount_(cfg.workerCount),
          perFileTimeout_(std::chrono::milliseconds(cfg.perFileTimeoutMs)),
          classifier_(std::move(classifier)),
          extractor_(std::move(extractor)),
          excludes_(std::move(excludePatterns))
    {
    }

    /**
     * @brief Scan a file or directory tree.
     */
    core::ScanRecord scan(const std::string &path,
                          std::shared_ptr<const ScanCancellation> cancel = nullptr) const
    {
        core::ScanRecord record;
        record.startedAt = util::Clock::now();
        std::error_code ec;
        fs::path root = fs::absolute(fs::path(path), ec);
        record.sourcePath = ec ? path : root.lexically_normal().string();
        record.scanId = newScanId(record.sourcePath, record.startedAt);

        std::vector<std::string> files = collectFiles(record.sourcePath);
        util::logger::info("Scanner: scan " + record.scanId + " found "
                           + std::to_string(files.size()) + " file(s).");

        std::vector<std::future<std::optional<core::FileResult>>> futures;
        futures.reserve(files.size());
        {
            util::ThreadPool pool(workerCount_);
            for (const auto &file : files) {
                futures.push_back(pool.enqueue([this, file, cancel]() -> std::optional<core::FileResult> {
                    if (cancel && cancel->isCancelled()) {
                        return std::nullopt;
                    }
                    return scanFile(file);
                }));
            }

            bool discarded = false;
            for (auto &f : futures) {
                if (!discarded && cancel && cancel->isCancelled()) {
                    size_t dropped = pool.discardPending();
                    util::logger::info("Scanner: cancelled, " + std::to_string(dropped)
                                       + " queued file(s) dropped.");
                    discarded = true;
                }
                try {
                    auto result = f.get();
                    if (result) {
                        record.fileResults.push_back(std::move(*result));
                    }
                }
                catch (const std::future_error &) {
                    // Task was discarded before it started.
                }
            }
        }

        std::sort(record.fileResults.begin(), record.fileResults.end(),
                  [](const core::FileResult &a, const core::FileResult &b) { return a.path < b.path; });
        record.completedAt = util::Clock::now();
        util::logger::info("Scanner: scan " + record.scanId + " complete, "
                           + std::to_string(record.fileResults.size()) + " file(s), "
                           + std::to_string(record.totalMatches()) + " match(es), "
                           + std::to_string(record.filesErrored()) + " error(s).");
        const size_t abandoned = abandonedTasks();
        if (abandoned > 0) {
            util::logger::warn("Scanner: " + std::to_string(abandoned)
                               + " timed-out file task(s) still running in the background.");
        }
        return record;
    }

    /**
     * @brief Classify one file under the size policy and the per-file timeout.
     */
    core::FileResult scanFile(const std::string &path) const
    {
        const auto started = std::chrono::steady_clock::now();
        core::FileResult result;
        result.path = path;

        std::error_code ec;
        uintmax_t size = fs::file_size(path, ec);
        if (ec) {
            result.error = core::ScanError(core::ErrorKind::Extraction, core::ErrorCode::Unreadable, path);
            return result;
        }
        result.sizeBytes = static_cast<uint64_t>(size);

        if (result.sizeBytes > maxFileSizeBytes_) {
            result.error = core::ScanError(core::ErrorKind::Extraction, core::ErrorCode::Oversized, path);
            return result;
        }
        if (!extractor_->canHandle(path)) {
            result.error = core::ScanError(core::ErrorKind::Extraction, core::ErrorCode::Unsupported, path);
            return result;
        }

        auto promise = std::make_shared<std::promise<Classified>>();
        auto future = promise->get_future();
        auto extractor = extractor_;
        auto classifier = classifier_;

        auto finished = std::make_shared<std::atomic<bool>>(false);

        std::thread([promise, extractor, classifier, path, finished]() {
            promise->set_value(extractAndClassify(*extractor, *classifier, path));
            // Only a task that was given up on was counted.
            if (finished->exchange(true)) {
                --abandonedCounter();
            }
        }).detach();

        if (perFileTimeout_.count() > 0
            && future.wait_for(perFileTimeout_) != std::future_status::ready) {
            ++abandonedCounter();
            if (finished->exchange(true)) {
                // Finished between the wait and the increment.
                --abandonedCounter();
            }
            util::logger::warn("Scanner: timed out on " + path);
            result.error = core::ScanError(core::ErrorKind::Extraction, core::ErrorCode::Timeout, path);
            result.scanTimeMs = elapsedMs(started);
            return result;
        }

        Classified c = future.get();
        result.matches = std::move(c.classification.matches);
        result.labelRecommendation = c.classification.label;
        result.error = c.extractionError ? c.extractionError : c.classification.error;
        result.scanTimeMs = elapsedMs(started);
        return result;
    }

    /**
     * @brief Regular files under `root` (or `root` itself), minus exclusions,
     *        in lexical order.
     */
    std::vector<std::string> collectFiles(const std::string &root) const
    {
        std::vector<std::string> files;
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            files.push_back(root);
            return files;
        }
        if (!fs::is_directory(root, ec)) {
            util::logger::warn("Scanner: path is neither a file nor a directory: " + root);
            return files;
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        fs::recursive_directory_iterator end;
        while (!ec && it != end) {
            const fs::path p = it->path();
            if (isExcluded(p.filename().string())) {
                if (it->is_directory(ec)) {
                    it.disable_recursion_pending();
                }
            } else if (it->is_regular_file(ec)) {
                files.push_back(p.string());
            }
            it.increment(ec);
        }
        if (ec) {
            util::logger::warn("Scanner: directory walk stopped early: " + ec.message());
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    bool isExcluded(const std::string &name) const
    {
        for (const auto &pattern : excludes_) {
            if (globMatch(pattern, name)) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief "*"-only glob match.
     */
    static bool globMatch(const std::string &pattern, const std::string &name)
    {
        size_t p = 0, n = 0, star = std::string::npos, mark = 0;
        while (n < name.size()) {
            if (p < pattern.size() && pattern[p] == name[n]) {
                ++p;
                ++n;
            } else if (p < pattern.size() && pattern[p] == '*') {
                star = p++;
                mark = n;
            } else if (star != std::string::npos) {
                p = star + 1;
                n = ++mark;
            } else {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }

    /// Timed-out file tasks, across all scanners, whose threads have not returned yet.
    static size_t abandonedTasks() { return abandonedCounter().load(); }

    static std::string newScanId(const std::string &sourcePath, util::TimePoint startedAt)
    {
        static std::atomic<uint64_t> counter{0};
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(startedAt.time_since_epoch()).count();
        return util::hashing::shortDigest(sourcePath + "|" + std::to_string(ns) + "|"
                                          + std::to_string(counter.fetch_add(1)));
    }

private:
    static std::atomic<size_t>& abandonedCounter()
    {
        static std::atomic<size_t> counter{0};
        return counter;
    }

    struct Classified
    {
        Classification classification;
        std::optional<core::ScanError> extractionError;
    };

    uint64_t maxFileSizeBytes_;
    uint32_t workerCount_;
    std::chrono::milliseconds perFileTimeout_;
    std::shared_ptr<const FileClassifier> classifier_;
    std::shared_ptr<const TextExtractor> extractor_;
    std::vector<std::string> excludes_;

    static Classified extractAndClassify(const TextExtractor &extractor,
                                         const FileClassifier &classifier,
                                         const std::string &path)
    {
        Classified out;
        try {
            ExtractionResult extracted = extractor.extract(path);
            if (extracted.error) {
                out.extractionError = extracted.error;
                return out;
            }
            out.classification = classifier.classify(extracted.text);
        }
        catch (const std::exception &ex) {
            util::logger::error("Scanner: processing failed for " + path + ": " + ex.what());
            out.extractionError = core::ScanError(core::ErrorKind::Extraction,
                                                  core::ErrorCode::Unreadable, path);
        }
        return out;
    }

    static int64_t elapsedMs(std::chrono::steady_clock::time_point since)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - since).count();
    }
};

} // namespace pipeline
} // namespace sensiscan

#endif // SENSISCAN_PIPELINE_SCANNER_HPP
