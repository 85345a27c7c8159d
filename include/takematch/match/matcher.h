#pragma once

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "takematch/core/errors.h"
#include "takematch/core/fingerprint.h"
#include "takematch/match/candidates.h"
#include "takematch/match/diagnostics.h"
#include "takematch/match/scorer.h"

namespace takematch::match {

    /// Additive trust boosts.
    struct BoostWeights {
        /// Candidate folder is a designated reference folder.
        double reference_folder = 0.15;
        /// Candidate folder carries its own reference flag.
        double folder_reference = 0.10;
        double reference_song = 0.10;

        auto boost(const Candidate &c) const -> double {
            double b = 0.0;
            if (c.is_reference_folder) {
                b += reference_folder;
            }
            if (c.is_folder_reference) {
                b += folder_reference;
            }
            if (c.is_reference_song) {
                b += reference_song;
            }
            return b;
        }
    };

    struct MatchResult {
        std::string target_file;
        std::string matched_file;
        std::filesystem::path matched_folder;
        double raw_score = 0.0;
        double weighted_score = 0.0;
        double boost = 0.0;
        bool is_reference = false;
        /// Folders holding a fingerprint for `matched_file`. Informational only.
        size_t folder_count = 0;
    };

    struct MatchOutcome {
        std::optional<MatchResult> match;
        MatchDiagnostics diagnostics;
    };

    /// Picks the best match for a fingerprint among the fingerprints of many folders.
    class CrossFolderMatcher {
    public:
        explicit CrossFolderMatcher(BoostWeights weights = {}, size_t top_n = 10, double near_ratio = 0.5)
                : weights(weights), top_n(top_n), near_ratio(near_ratio) {}

        /// raw * (1 + boost) capped at 1.
        static auto weighted_score(double raw, double boost) -> double {
            return std::min(1.0, raw * (1.0 + boost));
        }

        /// Best candidate whose weighted score reaches `threshold`, or no match.
        ///
        /// Candidates of another algorithm are skipped with a note. Throws `InvalidInputError`
        /// for an empty or non-finite target or a threshold outside [0, 1].
        auto find_best_match(const FingerprintVector &target,
                             const std::vector<Candidate> &candidates,
                             double threshold,
                             const std::string &target_file = "") const -> MatchOutcome {
            if (!target.valid()) {
                throw InvalidInputError("target fingerprint is empty or contains non-finite values");
            }
            if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0) {
                throw InvalidInputError(fmt::format("threshold {} is outside [0, 1]", threshold));
            }

            MatchOutcome outcome;
            auto &diag = outcome.diagnostics;
            diag.target_length = target.size();
            diag.threshold = threshold;
            diag.candidate_count = candidates.size();

            const auto folder_counts = count_folders(target, candidates);

            std::vector<ScoredCandidate> scored;
            scored.reserve(candidates.size());
            size_t zero_norm = 0;

            for (const auto &c : candidates) {
                Similarity s;
                try {
                    s = SimilarityScorer::compare(target, c.vector);
                } catch (const AlgorithmMismatchError &e) {
                    ++diag.skipped_count;
                    diag.notes.push_back(fmt::format("skipped {} [{}]: {}", c.file_identity, c.folder.string(),
                                                     e.what()));
                    continue;
                }

                ScoredCandidate sc;
                sc.file_identity = c.file_identity;
                sc.folder = c.folder;
                sc.raw_score = s.value;
                sc.boost = weights.boost(c);
                sc.ranking_score = s.value * (1.0 + sc.boost);
                sc.weighted_score = weighted_score(s.value, sc.boost);
                sc.is_reference = c.is_reference();
                sc.folder_count = folder_counts.at(c.file_identity).size();
                sc.zero_norm = s.degenerate;
                if (s.degenerate) {
                    ++zero_norm;
                }
                scored.push_back(std::move(sc));
            }
            diag.scored_count = scored.size();

            if (zero_norm > 0) {
                spdlog::warn("Zero-norm fingerprint in {} of {} comparisons, similarity set to 0",
                             zero_norm, scored.size());
                diag.notes.push_back(fmt::format("{} comparisons involved a zero-norm vector", zero_norm));
            }

            std::sort(scored.begin(), scored.end(), ranks_before);

            const auto n_top = std::min(top_n, scored.size());
            diag.top.assign(scored.begin(), scored.begin() + long(n_top));
            for (const auto &sc : scored) {
                if (sc.weighted_score < threshold && sc.weighted_score >= near_ratio * threshold) {
                    diag.near_threshold.push_back(sc);
                }
            }

            if (!scored.empty()) {
                const auto &best = scored.front();
                diag.best = best;
                diag.accepted = best.weighted_score >= threshold;

                if (diag.accepted) {
                    MatchResult result;
                    result.target_file = target_file;
                    result.matched_file = best.file_identity;
                    result.matched_folder = best.folder;
                    result.raw_score = best.raw_score;
                    result.weighted_score = best.weighted_score;
                    result.boost = best.boost;
                    result.is_reference = best.is_reference;
                    result.folder_count = best.folder_count;
                    outcome.match = std::move(result);
                }
            }

            diag.log();
            return outcome;
        }

    private:
        BoostWeights weights;
        size_t top_n;
        double near_ratio;

        /// Highest score first; then reference candidates, identities present in more folders,
        /// and finally file and folder name so the order is total.
        static auto ranks_before(const ScoredCandidate &a, const ScoredCandidate &b) -> bool {
            if (a.ranking_score != b.ranking_score) {
                return a.ranking_score > b.ranking_score;
            }
            if (a.is_reference != b.is_reference) {
                return a.is_reference;
            }
            if (a.folder_count != b.folder_count) {
                return a.folder_count > b.folder_count;
            }
            if (a.file_identity != b.file_identity) {
                return a.file_identity < b.file_identity;
            }
            return a.folder < b.folder;
        }

        /// Identity -> folders holding a vector comparable with `target`.
        static auto count_folders(const FingerprintVector &target, const std::vector<Candidate> &candidates)
        -> std::map<std::string, std::set<std::filesystem::path>> {
            std::map<std::string, std::set<std::filesystem::path>> folders;
            for (const auto &c : candidates) {
                auto &s = folders[c.file_identity];
                if (c.vector.algorithm == target.algorithm && c.vector.size() == target.size()) {
                    s.insert(c.folder);
                }
            }
            return folders;
        }
    };

} // takematch::match
