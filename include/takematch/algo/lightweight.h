#pragma once

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

#include "takematch/algo/algorithm.h"
#include "takematch/spectrum/convert.h"
#include "takematch/spectrum/stft.h"

namespace takematch::algo {

    /// Fast variant of `Spectral`: decimated input, the middle `MaxSeconds` only,
    /// and one time-averaged band profile.
    template<int Bands = 32,
            size_t FrameSize = 2048,
            size_t HopLength = 512,
            size_t TargetRate = 11025,
            size_t MaxSeconds = 60,
            size_t MinFreq = 60,
            size_t MaxFreq = 6000>
    class Lightweight : public FingerprintAlgorithm {
    public:
        static constexpr size_t Length = Bands;

        auto id() const -> Algorithm override {
            return Algorithm::Lightweight;
        }

        auto length() const -> size_t override {
            return Length;
        }

        auto generate(const std::vector<float> &mono, size_t sample_rate) const -> FingerprintVector override {
            const size_t factor = std::max<size_t>(1, sample_rate / TargetRate);
            const size_t effective_rate = sample_rate / factor;

            auto samples = spectrum::decimate(mono, factor);

            // The middle of a take is steadier than count-ins and endings.
            const size_t max_samples = MaxSeconds * effective_rate;
            if (samples.size() > max_samples) {
                const size_t start = (samples.size() - max_samples) / 2;
                samples = std::vector<float>(samples.begin() + long(start), samples.begin() + long(start + max_samples));
            }

            const auto edges = spectrum::log_band_edges(MinFreq, MaxFreq, Bands, FrameSize, effective_rate);

            Eigen::Matrix<float, Bands, 1> sum = Eigen::Matrix<float, Bands, 1>::Zero();
            size_t frames = 0;

            STFT stft;
            stft.for_each_frame(samples, [&sum, &frames, &edges](size_t, const Eigen::ArrayXf &magnitude) {
                sum += spectrum::band_means<Bands>(magnitude, edges);
                ++frames;
            });

            Eigen::Matrix<float, Bands, 1> profile = (sum / float(frames)).array().log1p().matrix();
            spectrum::l2_normalize(profile);

            return {Algorithm::Lightweight, std::vector<float>(profile.data(), profile.data() + Bands)};
        }

    private:
        using STFT = spectrum::STFT<FrameSize, HopLength>;
    };

} // takematch::algo
