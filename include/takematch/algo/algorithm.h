#pragma once

#include <cstddef>
#include <vector>

#include "takematch/core/fingerprint.h"

namespace takematch::algo {

    /// One fingerprinting algorithm. Implementations are pure: the same mono samples and sample
    /// rate always give the same vector, and its length is a constant of the algorithm.
    class FingerprintAlgorithm {
    public:
        virtual ~FingerprintAlgorithm() = default;

        virtual auto id() const -> Algorithm = 0;

        virtual auto length() const -> size_t = 0;

        /// \param mono - downmixed samples, never empty.
        virtual auto generate(const std::vector<float> &mono, size_t sample_rate) const -> FingerprintVector = 0;
    };

} // takematch::algo
