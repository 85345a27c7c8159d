#pragma once

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "takematch/algo/algorithm.h"
#include "takematch/spectrum/convert.h"
#include "takematch/spectrum/stft.h"

namespace takematch::algo {

    /// Landmark fingerprint for spotting duplicates and exact clips.
    ///
    /// 1. Pick up to `PeaksPerFrame` spectral peaks per frame between `MinFreq` and `MaxFreq`.
    /// A peak is strictly larger than the two bins on either side and above 0.3 of the frame maximum.
    /// 2. Pair every peak (anchor) with up to `FanOut` later peaks at most `MaxDelta` frames ahead.
    /// 3. Hash each (anchor bin, peak bin, frame delta) triple into one of `Bins` histogram bins.
    /// 4. Normalise the histogram to unit length.
    ///
    /// The histogram ignores absolute time, so a clip cut out of a recording lands on the same
    /// bins as the recording itself. Most bins stay zero.
    template<size_t Bins = 256,
            size_t FrameSize = 2048,
            size_t HopLength = 512,
            size_t PeaksPerFrame = 5,
            size_t MinFreq = 300,
            size_t MaxFreq = 2000,
            size_t MaxDelta = 10,
            size_t FanOut = 8>
    class Constellation : public FingerprintAlgorithm {
    public:
        static constexpr size_t Length = Bins;

        struct Landmark {
            size_t frame;
            size_t bin;
        };

        auto id() const -> Algorithm override {
            return Algorithm::Constellation;
        }

        auto length() const -> size_t override {
            return Length;
        }

        /// Histogram bin of a landmark pair.
        static auto hash_bin(size_t f1, size_t f2, size_t dt) -> size_t {
            const auto key = static_cast<uint32_t>((f1 * 1000 + f2 + dt * 4096) % 65536);
            const uint32_t mixed = key * 2654435761u;
            return static_cast<size_t>((uint64_t(mixed) * Bins) >> 32);
        }

        auto peaks(const std::vector<float> &mono, size_t sample_rate) const -> std::vector<Landmark> {
            const size_t min_bin = MinFreq * FrameSize / sample_rate;
            const size_t max_bin = std::min(MaxFreq * FrameSize / sample_rate, FrameSize / 2);

            std::vector<Landmark> landmarks;
            if (max_bin <= min_bin + 4) {
                return landmarks;
            }

            STFT stft;
            stft.for_each_frame(mono, [&landmarks, min_bin, max_bin](size_t frame, const Eigen::ArrayXf &m) {
                const float frame_max = m.segment(Eigen::Index(min_bin), Eigen::Index(max_bin - min_bin)).maxCoeff();
                if (frame_max <= 0) {
                    return;
                }

                std::vector<std::pair<float, size_t>> candidates;
                const auto last = std::min<size_t>(max_bin, size_t(m.size()) - 2);
                for (size_t j = min_bin + 2; j < last; ++j) {
                    const float v = m(Eigen::Index(j));
                    if (v > m(Eigen::Index(j - 1)) && v > m(Eigen::Index(j + 1)) &&
                        v > m(Eigen::Index(j - 2)) && v > m(Eigen::Index(j + 2)) &&
                        v > 0.3f * frame_max) {
                        candidates.emplace_back(v, j);
                    }
                }

                std::stable_sort(candidates.begin(), candidates.end(), [](const auto &a, const auto &b) {
                    return a.first > b.first;
                });
                if (candidates.size() > PeaksPerFrame) {
                    candidates.resize(PeaksPerFrame);
                }

                for (const auto &[magnitude, bin] : candidates) {
                    landmarks.push_back({frame, bin});
                }
            });

            return landmarks;
        }

        auto generate(const std::vector<float> &mono, size_t sample_rate) const -> FingerprintVector override {
            const auto points = peaks(mono, sample_rate);

            Eigen::Matrix<float, Eigen::Dynamic, 1> histogram = Eigen::Matrix<float, Eigen::Dynamic, 1>::Zero(Bins);
            for (size_t i = 0; i < points.size(); ++i) {
                size_t paired = 0;
                for (size_t j = i + 1; j < points.size() && paired < FanOut; ++j) {
                    const size_t dt = points[j].frame - points[i].frame;
                    if (dt > MaxDelta) {
                        break;
                    }
                    if (dt == 0) {
                        continue;
                    }
                    histogram(Eigen::Index(hash_bin(points[i].bin, points[j].bin, dt))) += 1.0f;
                    ++paired;
                }
            }

            spectrum::l2_normalize(histogram);

            return {Algorithm::Constellation, std::vector<float>(histogram.data(), histogram.data() + Bins)};
        }

    private:
        using STFT = spectrum::STFT<FrameSize, HopLength>;
    };

} // takematch::algo
