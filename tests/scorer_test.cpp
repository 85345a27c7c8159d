#include <cmath>
#include <iostream>
#include <random>

#include <takematch/match/scorer.h>

#include "test_utils.h"

using namespace takematch;
using namespace takematch::tests;
using takematch::match::SimilarityScorer;

namespace {

    auto random_vector(Algorithm algorithm, size_t n, uint64_t seed) -> FingerprintVector {
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        FingerprintVector v{algorithm, std::vector<float>(n)};
        for (auto &x : v.values) {
            x = dist(rng);
        }
        return v;
    }

    bool test_self_similarity_is_one() {
        bool ok = true;
        for (uint64_t seed = 1; seed <= 20; ++seed) {
            const auto v = random_vector(Algorithm::Spectral, 144, seed);
            ok &= expect(std::abs(SimilarityScorer::score(v, v) - 1.0) < 1e-6, "score(v, v) == 1");
        }
        const FingerprintVector tiny{Algorithm::Chroma, std::vector<float>(144, 1e-20f)};
        ok &= expect(std::abs(SimilarityScorer::score(tiny, tiny) - 1.0) < 1e-6, "score of tiny vector with itself");
        return ok;
    }

    bool test_score_is_symmetric() {
        bool ok = true;
        for (uint64_t seed = 1; seed <= 20; ++seed) {
            const auto a = random_vector(Algorithm::Lightweight, 32, seed);
            const auto b = random_vector(Algorithm::Lightweight, 32, seed + 100);
            ok &= expect(SimilarityScorer::score(a, b) == SimilarityScorer::score(b, a), "score(a, b) == score(b, a)");
        }
        return ok;
    }

    bool test_zero_vector_scores_zero() {
        const FingerprintVector zero{Algorithm::Spectral, std::vector<float>(144, 0.0f)};
        const auto v = random_vector(Algorithm::Spectral, 144, 3);

        const auto s = SimilarityScorer::compare(zero, v);
        bool ok = true;
        ok &= expect(s.value == 0.0 && s.degenerate, "zero vector is degenerate with score 0");
        ok &= expect(SimilarityScorer::score(v, zero) == 0.0, "score(v, zero) == 0");
        ok &= expect(SimilarityScorer::score(zero, zero) == 0.0, "score(zero, zero) == 0");
        return ok;
    }

    bool test_mismatch_throws() {
        const auto spectral = random_vector(Algorithm::Spectral, 144, 1);
        const auto chroma = random_vector(Algorithm::Chroma, 144, 1);
        const auto shorter = random_vector(Algorithm::Spectral, 72, 1);

        bool ok = true;
        try {
            SimilarityScorer::score(spectral, chroma);
            ok &= expect(false, "different algorithms throw");
        } catch (const AlgorithmMismatchError &) {
        }
        try {
            SimilarityScorer::score(spectral, shorter);
            ok &= expect(false, "different lengths throw");
        } catch (const AlgorithmMismatchError &) {
        }
        return ok;
    }

    bool test_range_is_clamped() {
        const FingerprintVector a{Algorithm::Spectral, {1.0f, 0.0f}};
        const FingerprintVector opposite{Algorithm::Spectral, {-1.0f, 0.0f}};
        const FingerprintVector diagonal{Algorithm::Spectral, {1.0f, 1.0f}};

        bool ok = true;
        ok &= expect(SimilarityScorer::score(a, opposite) == 0.0, "negative correlation is clamped to 0");
        ok &= expect(std::abs(SimilarityScorer::score(a, diagonal) - std::sqrt(0.5)) < 1e-6, "45 degrees");
        return ok;
    }

} // namespace

int main() {
    bool ok = true;
    ok &= test_self_similarity_is_one();
    ok &= test_score_is_symmetric();
    ok &= test_zero_vector_scores_zero();
    ok &= test_mismatch_throws();
    ok &= test_range_is_clamped();

    if (!ok) {
        std::cerr << "Scorer test failed.\n";
        return 1;
    }
    std::cout << "Scorer test passed.\n";
    return 0;
}
