#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "takematch/core/errors.h"

namespace takematch {

    enum class Algorithm {
        Spectral,
        Lightweight,
        Chroma,
        Constellation
    };

    inline constexpr std::array<Algorithm, 4> AllAlgorithms = {
            Algorithm::Spectral,
            Algorithm::Lightweight,
            Algorithm::Chroma,
            Algorithm::Constellation
    };

    inline auto algorithm_name(Algorithm algorithm) -> std::string {
        switch (algorithm) {
            case Algorithm::Spectral:
                return "spectral";
            case Algorithm::Lightweight:
                return "lightweight";
            case Algorithm::Chroma:
                return "chroma";
            case Algorithm::Constellation:
                return "constellation";
        }
        return "unknown";
    }

    /// Parse an algorithm name. Names written by older cache files ("chromaprint", "audfprint")
    /// are accepted as aliases.
    inline auto parse_algorithm(const std::string &name) -> std::optional<Algorithm> {
        if (name == "spectral") {
            return Algorithm::Spectral;
        }
        if (name == "lightweight") {
            return Algorithm::Lightweight;
        }
        if (name == "chroma" || name == "chromaprint") {
            return Algorithm::Chroma;
        }
        if (name == "constellation" || name == "audfprint") {
            return Algorithm::Constellation;
        }
        return std::nullopt;
    }

    /// Fixed-length feature vector. Vectors are only comparable within one algorithm.
    struct FingerprintVector {
        Algorithm algorithm = Algorithm::Spectral;
        std::vector<float> values;

        auto size() const -> size_t {
            return values.size();
        }

        auto empty() const -> bool {
            return values.empty();
        }

        /// Non-empty and every component finite.
        auto valid() const -> bool {
            if (values.empty()) {
                return false;
            }
            for (const float v : values) {
                if (!std::isfinite(v)) {
                    return false;
                }
            }
            return true;
        }

        auto operator==(const FingerprintVector &other) const -> bool {
            return algorithm == other.algorithm && values == other.values;
        }

        auto operator!=(const FingerprintVector &other) const -> bool {
            return !(*this == other);
        }
    };

    /// Interleaved PCM samples as delivered by an audio decoder.
    struct AudioBuffer {
        std::vector<float> samples;
        size_t sample_rate = 0;
        size_t channels = 1;

        auto frames() const -> size_t {
            return channels == 0 ? 0 : samples.size() / channels;
        }

        auto duration_seconds() const -> double {
            return sample_rate == 0 ? 0.0 : double(frames()) / double(sample_rate);
        }
    };

} // takematch
