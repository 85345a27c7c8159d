#pragma once

#include <algorithm>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <taskflow/taskflow.hpp>

#include "takematch/core/cache.h"
#include "takematch/match/candidates.h"

namespace takematch::match {

    /// Fingerprint sets of `folders`, read in parallel. Order follows `folders`.
    inline auto load_library(cache::FingerprintCache &cache,
                             const std::vector<std::filesystem::path> &folders,
                             size_t workers = 0) -> Library {
        Library library(folders.size());

        tf::Taskflow taskflow;
        taskflow.for_each_index(
                size_t(0), folders.size(), size_t(1),
                [&](size_t i) {
                    library[i] = cache.snapshot(folders[i]);
                }
        );

        tf::Executor executor(workers == 0 ? std::max<size_t>(1, std::thread::hardware_concurrency()) : workers);
        executor.run(taskflow).wait();

        size_t entries = 0;
        for (const auto &set : library) {
            entries += set.files.size();
        }
        spdlog::info("Loaded {} fingerprint entries from {} folders", entries, library.size());
        return library;
    }

    /// `load_library` on a background thread. `cache` must outlive the returned future.
    inline auto load_library_async(cache::FingerprintCache &cache,
                                   std::vector<std::filesystem::path> folders,
                                   size_t workers = 0) -> std::future<Library> {
        return std::async(std::launch::async, [&cache, folders = std::move(folders), workers]() {
            return load_library(cache, folders, workers);
        });
    }

} // takematch::match
