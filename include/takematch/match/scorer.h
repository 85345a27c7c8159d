#pragma once

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "takematch/core/errors.h"
#include "takematch/core/fingerprint.h"

namespace takematch::match {

    struct Similarity {
        double value = 0.0;
        /// One of the vectors had zero norm (silence), so `value` is 0 by definition.
        bool degenerate = false;
    };

    /// Cosine similarity between fingerprints of the same algorithm.
    class SimilarityScorer {
    public:
        /// Result lies in [0, 1]. Throws `AlgorithmMismatchError` for vectors of different
        /// algorithms or lengths.
        static auto compare(const FingerprintVector &a, const FingerprintVector &b) -> Similarity {
            if (a.algorithm != b.algorithm) {
                throw AlgorithmMismatchError("cannot compare " + algorithm_name(a.algorithm) + " fingerprint with " +
                                             algorithm_name(b.algorithm) + " fingerprint");
            }
            if (a.size() != b.size()) {
                throw AlgorithmMismatchError("fingerprint lengths differ: " + std::to_string(a.size()) + " vs " +
                                             std::to_string(b.size()));
            }

            using Vec = Eigen::Map<const Eigen::VectorXf>;
            const Eigen::VectorXd va = Vec(a.values.data(), Eigen::Index(a.size())).cast<double>();
            const Eigen::VectorXd vb = Vec(b.values.data(), Eigen::Index(b.size())).cast<double>();

            const double na = va.norm();
            const double nb = vb.norm();
            if (na == 0.0 || nb == 0.0) {
                return {0.0, true};
            }

            const double value = va.dot(vb) / (na * nb);
            if (!std::isfinite(value)) {
                return {0.0, true};
            }
            return {std::clamp(value, 0.0, 1.0), false};
        }

        /// `compare` that logs a warning for zero-norm input.
        static auto score(const FingerprintVector &a, const FingerprintVector &b) -> double {
            const auto s = compare(a, b);
            if (s.degenerate) {
                spdlog::warn("Zero-norm {} fingerprint, similarity set to 0", algorithm_name(a.algorithm));
            }
            return s.value;
        }
    };

} // takematch::match
