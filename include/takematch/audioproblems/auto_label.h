#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "takematch/config.h"
#include "takematch/core/cache.h"
#include "takematch/core/parallel_collector.h"
#include "takematch/match/candidates.h"
#include "takematch/match/matcher.h"

namespace takematch {

    /// Name proposed for an unlabeled recording.
    struct LabelSuggestion {
        std::filesystem::path file;
        /// Stem of the matched file.
        std::string suggested_name;
        /// Raw similarity of the match.
        double confidence = 0.0;
        std::filesystem::path source_folder;
        match::MatchResult match;
    };

    struct FolderSuggestions {
        std::vector<LabelSuggestion> suggestions;
        std::vector<std::filesystem::path> unmatched;
        std::vector<GenerationFailure> failures;
    };

    /// Suggests names for recordings by matching them against the fingerprints of known folders.
    /// Nothing is renamed and suggestions are not stored.
    class AutoLabeler {
    public:
        AutoLabeler(cache::FingerprintCache &cache, EngineConfig config)
                : cache(cache), config(std::move(config)), matcher(this->config.matcher()) {}

        /// Match `file` against `library`. The file itself is never its own candidate.
        auto query(const std::filesystem::path &file, const match::Library &library) -> match::MatchOutcome {
            const auto target = cache.get_or_generate(file, config.algorithm);
            const auto candidates = match::collect_candidates(library, config.algorithm,
                                                              config.reference_folder_paths(), file);
            return matcher.find_best_match(target, candidates, config.threshold, file.filename().string());
        }

        auto suggest(const std::filesystem::path &file, const match::Library &library)
        -> std::optional<LabelSuggestion> {
            auto outcome = query(file, library);
            if (!outcome.match) {
                spdlog::info("No match for '{}'", file.filename().string());
                return std::nullopt;
            }

            const auto &m = *outcome.match;
            LabelSuggestion suggestion;
            suggestion.file = file;
            suggestion.suggested_name = std::filesystem::path(m.matched_file).stem().string();
            suggestion.confidence = m.raw_score;
            suggestion.source_folder = m.matched_folder;
            suggestion.match = m;

            spdlog::info("'{}' -> '{}' ({:.1f}%, {})", file.filename().string(), suggestion.suggested_name,
                         suggestion.confidence * 100.0, suggestion.source_folder.string());
            return suggestion;
        }

        /// Suggestions for every audio file of `folder`. Files that fail are reported and skipped.
        auto suggest_folder(const std::filesystem::path &folder, const match::Library &library) -> FolderSuggestions {
            FolderSuggestions result;

            for (const auto &file : utils::get_audio_files(folder)) {
                try {
                    if (cache.is_file_excluded(folder, file.filename().string())) {
                        continue;
                    }
                    if (auto s = suggest(file, library)) {
                        result.suggestions.push_back(*std::move(s));
                    } else {
                        result.unmatched.push_back(file);
                    }
                } catch (const InvalidInputError &) {
                    throw;
                } catch (const std::exception &e) {
                    spdlog::error("could not fingerprint '{}': {}", file.string(), e.what());
                    result.failures.push_back({file, e.what()});
                }
            }

            cache.flush(folder);
            return result;
        }

    private:
        cache::FingerprintCache &cache;
        const EngineConfig config;
        const match::CrossFolderMatcher matcher;
    };

} // takematch
