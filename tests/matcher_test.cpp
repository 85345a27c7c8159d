#include <cmath>
#include <iostream>

#include <takematch/match/candidates.h>
#include <takematch/match/matcher.h>

#include "test_utils.h"

using namespace takematch;
using namespace takematch::match;
using namespace takematch::tests;

namespace {

    /// Unit vector at cosine `c` to the first axis.
    auto at_cosine(double c, size_t n = 144, Algorithm algorithm = Algorithm::Spectral) -> FingerprintVector {
        FingerprintVector v{algorithm, std::vector<float>(n, 0.0f)};
        v.values[0] = float(c);
        v.values[1] = float(std::sqrt(1.0 - c * c));
        return v;
    }

    auto target(size_t n = 144) -> FingerprintVector {
        return at_cosine(1.0, n);
    }

    auto candidate(const std::string &name, const std::string &folder, FingerprintVector v) -> Candidate {
        return {name, folder, std::move(v)};
    }

    auto entry_with(const FingerprintVector &v, bool reference_song = false) -> FingerprintCacheEntry {
        FingerprintCacheEntry e;
        e.signature = {100, 1};
        e.is_reference_song = reference_song;
        e.store(v);
        return e;
    }

    bool test_documented_scenario() {
        FolderFingerprintSet folder1;
        folder1.folder = "/practice/folder1";
        folder1.files["song_a.wav"] = entry_with(at_cosine(0.9996));
        folder1.files["song_b.wav"] = entry_with(at_cosine(0.9711));

        FolderFingerprintSet folder2;
        folder2.folder = "/practice/folder2";
        folder2.files["song_a.wav"] = entry_with(at_cosine(0.9996));

        const Library library = {folder1, folder2};
        const auto candidates = collect_candidates(library, Algorithm::Spectral, {"/practice/folder2"});

        bool ok = true;
        ok &= expect(candidates.size() == 3, "three candidates");

        const CrossFolderMatcher matcher;
        const auto outcome = matcher.find_best_match(target(), candidates, 0.80, "new_take.wav");

        ok &= expect(outcome.match.has_value(), "scenario has a match");
        if (!outcome.match) {
            return false;
        }
        const auto &m = *outcome.match;
        ok &= expect(m.matched_file == "song_a.wav", "matched song_a");
        ok &= expect(m.matched_folder == "/practice/folder2", "matched in the reference folder");
        ok &= expect(std::abs(m.weighted_score - 1.0) < 1e-4, "weighted score 1.0000");
        ok &= expect(std::abs(m.raw_score - 0.9996) < 1e-4, "raw score 0.9996");
        ok &= expect(std::abs(m.boost - 0.15) < 1e-12, "reference folder boost");
        ok &= expect(m.is_reference, "is_reference");
        ok &= expect(m.folder_count == 2, "song_a is in two folders");
        ok &= expect(m.target_file == "new_take.wav", "target file");

        const auto &diag = outcome.diagnostics;
        ok &= expect(diag.target_length == 144, "diagnostics target length");
        ok &= expect(diag.threshold == 0.80, "diagnostics threshold");
        ok &= expect(diag.candidate_count == 3 && diag.scored_count == 3, "diagnostics counts");
        ok &= expect(diag.top.size() == 3, "diagnostics top");
        if (diag.top.size() == 3) {
            ok &= expect(std::abs(diag.top[0].weighted_score - 1.0) < 1e-4, "top[0] weighted 1.0000");
            ok &= expect(std::abs(diag.top[1].weighted_score - 0.9996) < 1e-4, "top[1] weighted 0.9996");
            ok &= expect(std::abs(diag.top[2].weighted_score - 0.9711) < 1e-4, "top[2] weighted 0.9711");
        }
        ok &= expect(diag.accepted && diag.best.has_value(), "diagnostics selection");
        ok &= expect(diag.render().find("selected: song_a.wav") != std::string::npos, "rendered selection");
        return ok;
    }

    bool test_below_threshold_is_no_match() {
        std::vector<Candidate> candidates;
        for (int i = 0; i < 50; ++i) {
            candidates.push_back(candidate("song" + std::to_string(i) + ".wav", "/f", at_cosine(0.5 + 0.005 * i)));
        }

        const CrossFolderMatcher matcher;
        const auto outcome = matcher.find_best_match(target(), candidates, 0.80);

        bool ok = true;
        ok &= expect(!outcome.match, "best 0.745 < 0.80 is no match");
        ok &= expect(outcome.diagnostics.best.has_value() && !outcome.diagnostics.accepted, "best is recorded but rejected");
        ok &= expect(outcome.diagnostics.top.size() == 10, "top-N is limited to 10");
        for (const auto &c : outcome.diagnostics.near_threshold) {
            ok &= expect(c.weighted_score >= 0.40 && c.weighted_score < 0.80, "near-threshold band");
        }
        ok &= expect(outcome.diagnostics.near_threshold.size() == 50, "all candidates are near the threshold");

        const auto exact = matcher.find_best_match(target(), {candidate("x.wav", "/f", target())}, 1.0);
        ok &= expect(exact.match.has_value(), "score equal to threshold is a match");
        return ok;
    }

    bool test_reference_wins_equal_raw_score() {
        auto plain = candidate("a.wav", "/f1", at_cosine(0.9));
        auto reference = candidate("b.wav", "/f2", at_cosine(0.9));
        reference.is_reference_song = true;

        bool ok = true;
        const CrossFolderMatcher matcher;
        const auto outcome = matcher.find_best_match(target(), {plain, reference}, 0.5);
        ok &= expect(outcome.match && outcome.match->matched_file == "b.wav", "boosted reference wins");

        // Without any boost the reference flag still breaks the tie.
        const CrossFolderMatcher unweighted(BoostWeights{0.0, 0.0, 0.0});
        const auto tie = unweighted.find_best_match(target(), {plain, reference}, 0.5);
        ok &= expect(tie.match && tie.match->matched_file == "b.wav" && tie.match->is_reference,
                     "reference wins a tie");
        return ok;
    }

    bool test_tie_breaks() {
        const CrossFolderMatcher matcher;
        bool ok = true;

        // "b.wav" appears in two folders, "a.wav" in one.
        const std::vector<Candidate> spread = {
                candidate("a.wav", "/f1", at_cosine(0.9)),
                candidate("b.wav", "/f2", at_cosine(0.9)),
                candidate("b.wav", "/f3", at_cosine(0.3)),
        };
        const auto by_count = matcher.find_best_match(target(), spread, 0.5);
        ok &= expect(by_count.match && by_count.match->matched_file == "b.wav" && by_count.match->folder_count == 2,
                     "higher folder count wins a tie");

        const std::vector<Candidate> names = {
                candidate("zeta.wav", "/f1", at_cosine(0.9)),
                candidate("alpha.wav", "/f2", at_cosine(0.9)),
        };
        const auto by_name = matcher.find_best_match(target(), names, 0.5);
        ok &= expect(by_name.match && by_name.match->matched_file == "alpha.wav", "smaller filename wins a tie");

        const std::vector<Candidate> folders = {
                candidate("same.wav", "/z", at_cosine(0.9)),
                candidate("same.wav", "/a", at_cosine(0.9)),
        };
        const auto by_folder = matcher.find_best_match(target(), folders, 0.5);
        ok &= expect(by_folder.match && by_folder.match->matched_folder == "/a", "smaller folder wins a tie");
        return ok;
    }

    bool test_weighted_score_is_monotonic() {
        bool ok = true;
        for (double raw = 0.0; raw <= 1.0; raw += 0.05) {
            double previous = -1.0;
            for (double boost = 0.0; boost <= 0.35; boost += 0.05) {
                const double w = CrossFolderMatcher::weighted_score(raw, boost);
                ok &= expect(w >= previous, "non-decreasing in boost");
                ok &= expect(w <= 1.0, "capped at 1");
                previous = w;
            }
        }
        for (double boost = 0.0; boost <= 0.35; boost += 0.05) {
            double previous = -1.0;
            for (double raw = 0.0; raw <= 1.0; raw += 0.05) {
                const double w = CrossFolderMatcher::weighted_score(raw, boost);
                ok &= expect(w >= previous, "non-decreasing in raw score");
                previous = w;
            }
        }
        return ok;
    }

    bool test_boosts_stack() {
        Candidate c = candidate("a.wav", "/f", at_cosine(0.5));
        c.is_reference_folder = true;
        c.is_folder_reference = true;
        c.is_reference_song = true;

        const BoostWeights weights;
        bool ok = true;
        ok &= expect(std::abs(weights.boost(c) - 0.35) < 1e-12, "all three boosts add up");

        const CrossFolderMatcher matcher;
        const auto outcome = matcher.find_best_match(target(), {c}, 0.6);
        ok &= expect(outcome.match && std::abs(outcome.match->weighted_score - 0.675) < 1e-4, "0.5 * 1.35");
        return ok;
    }

    bool test_mismatched_candidates_are_skipped() {
        const std::vector<Candidate> candidates = {
                candidate("chroma.wav", "/f", at_cosine(1.0, 144, Algorithm::Chroma)),
                candidate("short.wav", "/f", at_cosine(1.0, 32)),
                candidate("good.wav", "/f", at_cosine(0.9)),
        };

        const CrossFolderMatcher matcher;
        const auto outcome = matcher.find_best_match(target(), candidates, 0.5);

        bool ok = true;
        ok &= expect(outcome.match && outcome.match->matched_file == "good.wav", "comparable candidate is matched");
        ok &= expect(outcome.diagnostics.skipped_count == 2 && outcome.diagnostics.scored_count == 1, "two skipped");
        ok &= expect(outcome.diagnostics.notes.size() == 2, "a note per skipped candidate");
        return ok;
    }

    bool test_silent_target_never_matches() {
        const FingerprintVector silent{Algorithm::Spectral, std::vector<float>(144, 0.0f)};
        const std::vector<Candidate> corpus = {
                candidate("a.wav", "/f1", at_cosine(0.9)),
                candidate("b.wav", "/f2", at_cosine(0.2)),
                candidate("c.wav", "/f3", at_cosine(1.0)),
        };

        const CrossFolderMatcher matcher;
        bool ok = true;
        for (const double threshold : {0.001, 0.1, 0.5, 1.0}) {
            const auto outcome = matcher.find_best_match(silent, corpus, threshold);
            ok &= expect(!outcome.match, "silent target is never matched");
            for (const auto &c : outcome.diagnostics.top) {
                ok &= expect(c.raw_score == 0.0 && c.zero_norm, "silent target scores 0");
            }
        }
        return ok;
    }

    bool test_invalid_input_throws() {
        const CrossFolderMatcher matcher;
        const std::vector<Candidate> corpus = {candidate("a.wav", "/f", at_cosine(0.9))};
        bool ok = true;

        const auto throws = [&](const FingerprintVector &t, double threshold) {
            try {
                matcher.find_best_match(t, corpus, threshold);
            } catch (const InvalidInputError &) {
                return true;
            }
            return false;
        };

        FingerprintVector nan_target = target();
        nan_target.values[3] = std::nanf("");

        ok &= expect(throws(FingerprintVector{Algorithm::Spectral, {}}, 0.5), "empty target");
        ok &= expect(throws(nan_target, 0.5), "non-finite target");
        ok &= expect(throws(target(), 1.5), "threshold above 1");
        ok &= expect(throws(target(), -0.1), "threshold below 0");
        ok &= expect(!matcher.find_best_match(target(), {}, 0.5).match, "no candidates is no match");
        return ok;
    }

    bool test_candidate_collection() {
        FolderFingerprintSet regular;
        regular.folder = "/lib/regular";
        regular.excluded_files = {"excluded.wav"};
        regular.files["keep.wav"] = entry_with(at_cosine(0.9), true);
        regular.files["excluded.wav"] = entry_with(at_cosine(0.9));
        regular.files["query.wav"] = entry_with(at_cosine(0.9));
        regular.files["chroma_only.wav"] = entry_with(at_cosine(0.9, 144, Algorithm::Chroma));

        FolderFingerprintSet flagged;
        flagged.folder = "/lib/flagged";
        flagged.is_reference_folder = true;
        flagged.files["keep.wav"] = entry_with(at_cosine(0.9));

        FolderFingerprintSet ignored;
        ignored.folder = "/lib/ignored";
        ignored.ignore_fingerprints = true;
        ignored.files["keep.wav"] = entry_with(at_cosine(0.9));

        const auto candidates = collect_candidates({regular, flagged, ignored}, Algorithm::Spectral,
                                                   {"/lib/flagged/"}, std::filesystem::path("/lib/regular/query.wav"));

        bool ok = true;
        ok &= expect(candidates.size() == 2, "ignored folder, excluded file, query and other algorithms are left out");
        if (candidates.size() == 2) {
            ok &= expect(candidates[0].folder == "/lib/regular" && candidates[0].is_reference_song &&
                         !candidates[0].is_reference_folder, "reference song flag");
            ok &= expect(candidates[1].folder == "/lib/flagged" && candidates[1].is_reference_folder &&
                         candidates[1].is_folder_reference, "designated and per-folder flags");
        }
        return ok;
    }

} // namespace

int main() {
    bool ok = true;
    ok &= test_documented_scenario();
    ok &= test_below_threshold_is_no_match();
    ok &= test_reference_wins_equal_raw_score();
    ok &= test_tie_breaks();
    ok &= test_weighted_score_is_monotonic();
    ok &= test_boosts_stack();
    ok &= test_mismatched_candidates_are_skipped();
    ok &= test_silent_target_never_matches();
    ok &= test_invalid_input_throws();
    ok &= test_candidate_collection();

    if (!ok) {
        std::cerr << "Matcher test failed.\n";
        return 1;
    }
    std::cout << "Matcher test passed.\n";
    return 0;
}
