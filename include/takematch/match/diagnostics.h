#pragma once

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace takematch::match {

    /// One scored candidate with its score breakdown.
    struct ScoredCandidate {
        std::string file_identity;
        std::filesystem::path folder;
        double raw_score = 0.0;
        double boost = 0.0;
        /// raw_score * (1 + boost), not clamped. Used for ordering.
        double ranking_score = 0.0;
        /// ranking_score clamped to 1.
        double weighted_score = 0.0;
        bool is_reference = false;
        size_t folder_count = 0;
        bool zero_norm = false;
    };

    /// Trace of a single `find_best_match` call.
    struct MatchDiagnostics {
        size_t target_length = 0;
        double threshold = 0.0;
        size_t candidate_count = 0;
        size_t scored_count = 0;
        size_t skipped_count = 0;
        std::vector<std::string> notes;
        /// Best candidates by weighted score, best first.
        std::vector<ScoredCandidate> top;
        /// Candidates with weighted score in [near_ratio * threshold, threshold).
        std::vector<ScoredCandidate> near_threshold;
        std::optional<ScoredCandidate> best;
        bool accepted = false;

        auto render() const -> std::string {
            std::ostringstream os;
            os << fmt::format("target length {}, threshold {:.4f}, {} candidates ({} scored, {} skipped)\n",
                              target_length, threshold, candidate_count, scored_count, skipped_count);
            for (const auto &note : notes) {
                os << "  note: " << note << '\n';
            }

            os << fmt::format("top {}:\n", top.size());
            for (const auto &c : top) {
                os << "  " << line(c) << '\n';
            }

            if (!near_threshold.empty()) {
                os << fmt::format("near threshold ({}):\n", near_threshold.size());
                for (const auto &c : near_threshold) {
                    os << "  " << line(c) << '\n';
                }
            }

            if (best) {
                os << (accepted ? "selected: " : "rejected: ") << line(*best) << '\n';
            } else {
                os << "no candidate\n";
            }
            return os.str();
        }

        void log() const {
            if (!spdlog::default_logger_raw()->should_log(spdlog::level::debug)) {
                return;
            }
            std::istringstream is(render());
            for (std::string l; std::getline(is, l);) {
                spdlog::debug("{}", l);
            }
        }

    private:
        static auto line(const ScoredCandidate &c) -> std::string {
            return fmt::format("{} [{}] raw {:.4f} boost +{:.2f} weighted {:.4f}{}{} folders {}",
                               c.file_identity, c.folder.string(), c.raw_score, c.boost, c.weighted_score,
                               c.is_reference ? " reference" : "", c.zero_norm ? " zero-norm" : "",
                               c.folder_count);
        }
    };

} // takematch::match
