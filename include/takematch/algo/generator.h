#pragma once

#include <map>
#include <memory>
#include <string>

#include "takematch/algo/algorithm.h"
#include "takematch/algo/chroma.h"
#include "takematch/algo/constellation.h"
#include "takematch/algo/lightweight.h"
#include "takematch/algo/spectral.h"
#include "takematch/core/errors.h"
#include "takematch/spectrum/convert.h"

namespace takematch::algo {

    using DefaultSpectral = Spectral<>;
    using DefaultLightweight = Lightweight<>;
    using DefaultChroma = Chroma<>;
    using DefaultConstellation = Constellation<>;

    /// Turns decoded audio into a `FingerprintVector` with the algorithm the caller selects.
    class FingerprintGenerator {
    public:
        FingerprintGenerator() {
            add(std::make_shared<DefaultSpectral>());
            add(std::make_shared<DefaultLightweight>());
            add(std::make_shared<DefaultChroma>());
            add(std::make_shared<DefaultConstellation>());
        }

        /// Register (or replace) the implementation of one algorithm.
        void add(std::shared_ptr<const FingerprintAlgorithm> algorithm) {
            const auto id = algorithm->id();
            algorithms[id] = std::move(algorithm);
        }

        auto length(Algorithm algorithm) const -> size_t {
            return get(algorithm).length();
        }

        /// Throws `DecodeError` for a malformed buffer and `EmptyAudioError` for audio
        /// shorter than a millisecond.
        auto generate(const AudioBuffer &audio, Algorithm algorithm) const -> FingerprintVector {
            if (audio.sample_rate == 0 || audio.channels == 0) {
                throw DecodeError("invalid audio format: " + std::to_string(audio.sample_rate) + " Hz, " +
                                  std::to_string(audio.channels) + " channels");
            }
            if (audio.samples.size() % audio.channels != 0) {
                throw DecodeError("truncated audio: sample count is not a multiple of the channel count");
            }
            if (audio.frames() == 0 || audio.frames() * 1000 < audio.sample_rate) {
                throw EmptyAudioError("audio is empty (" + std::to_string(audio.frames()) + " samples)");
            }

            const auto &impl = get(algorithm);
            auto fp = impl.generate(spectrum::downmix(audio), audio.sample_rate);

            if (fp.size() != impl.length() || !fp.valid()) {
                throw Error(algorithm_name(algorithm) + " produced a malformed fingerprint");
            }
            return fp;
        }

    private:
        std::map<Algorithm, std::shared_ptr<const FingerprintAlgorithm>> algorithms;

        auto get(Algorithm algorithm) const -> const FingerprintAlgorithm & {
            const auto it = algorithms.find(algorithm);
            if (it == algorithms.end()) {
                throw InvalidInputError("no implementation for algorithm " + algorithm_name(algorithm));
            }
            return *it->second;
        }
    };

} // takematch::algo
