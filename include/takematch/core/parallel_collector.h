#pragma once

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <taskflow/taskflow.hpp>
#include <tbb/concurrent_vector.h>

#include "takematch/core/cache.h"
#include "takematch/utils.h"

namespace takematch {

    struct GenerationFailure {
        std::filesystem::path file;
        std::string reason;
    };

    /// Outcome of one generation pass.
    struct CollectReport {
        size_t total = 0;
        size_t fingerprinted = 0;
        size_t excluded = 0;
        /// Not processed because the pass was cancelled. They are picked up by the next pass.
        size_t skipped = 0;
        std::vector<GenerationFailure> failures;
        bool was_cancelled = false;
    };

    /// ParallelCollector fingerprints many files at once through a `FingerprintCache`.
    ///
    /// Files are independent, so every file is a separate task. A failure is recorded for its file
    /// and the rest of the batch continues. The cache serialises writes per folder.
    class ParallelCollector {
    public:
        using ProgressCallback = std::function<void(size_t done, size_t total, const std::string &filename)>;

        explicit ParallelCollector(cache::FingerprintCache &cache, size_t workers = 0)
                : cache(cache),
                  executor(workers == 0 ? std::max<size_t>(1, std::thread::hardware_concurrency()) : workers) {}

        ~ParallelCollector() = default;

        /// Called after every processed file. May be called from worker threads.
        void on_progress(ProgressCallback callback) {
            progress = std::move(callback);
        }

        /// Ask the running (or next) `collect` to stop. Files already started are finished and kept.
        void request_stop() {
            stop = true;
        }

        auto stop_requested() const -> bool {
            return stop;
        }

        /// Fingerprint every audio file of `folder`.
        auto collect(const std::filesystem::path &folder, Algorithm algorithm) -> CollectReport {
            return collect(utils::get_audio_files(folder), algorithm);
        }

        /// Fingerprint `files`, reusing cached vectors, then write every touched folder to disk.
        auto collect(const std::vector<std::filesystem::path> &files, Algorithm algorithm) -> CollectReport {
            std::atomic<size_t> done = 0;
            std::atomic<size_t> fingerprinted = 0;
            std::atomic<size_t> excluded = 0;
            std::atomic<size_t> skipped = 0;
            tbb::concurrent_vector<GenerationFailure> failures;
            std::mutex progress_mtx;

            spdlog::info("Fingerprinting {} files ({})", files.size(), algorithm_name(algorithm));

            tf::Taskflow taskflow;
            taskflow.for_each(
                    files.cbegin(), files.cend(),
                    [&](const std::filesystem::path &file) {
                        if (stop) {
                            ++skipped;
                            return;
                        }

                        const auto filename = file.filename().string();
                        try {
                            if (cache.is_file_excluded(file.parent_path(), filename)) {
                                spdlog::debug("Skipping excluded file '{}'", file.string());
                                ++excluded;
                            } else {
                                cache.get_or_generate(file, algorithm);
                                ++fingerprinted;
                            }
                        } catch (const std::exception &e) {
                            spdlog::error("could not fingerprint '{}': {}", file.string(), e.what());
                            failures.push_back({file, e.what()});
                        }

                        const size_t n = ++done;
                        if (progress) {
                            std::scoped_lock lock(progress_mtx);
                            progress(n, files.size(), filename);
                        }
                    }
            );

            executor.run(taskflow).wait();
            stop = false;

            // Completed entries are kept even when the pass was cancelled.
            std::set<std::filesystem::path> folders;
            for (const auto &file : files) {
                folders.insert(file.parent_path());
            }
            for (const auto &folder : folders) {
                try {
                    cache.flush(folder);
                } catch (const std::exception &e) {
                    spdlog::error("Error saving fingerprints of '{}': {}", folder.string(), e.what());
                    failures.push_back({folder, e.what()});
                }
            }

            CollectReport report;
            report.total = files.size();
            report.fingerprinted = fingerprinted;
            report.excluded = excluded;
            report.skipped = skipped;
            report.failures.assign(failures.begin(), failures.end());
            report.was_cancelled = skipped > 0;

            spdlog::info("Fingerprinted {} of {} files ({} excluded, {} failed{})",
                         report.fingerprinted, report.total, report.excluded, report.failures.size(),
                         report.was_cancelled ? ", cancelled" : "");
            return report;
        }

    private:
        cache::FingerprintCache &cache;
        tf::Executor executor;
        std::atomic<bool> stop = false;
        ProgressCallback progress;

    }; // ParallelCollector

} // takematch
