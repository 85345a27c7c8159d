#pragma once

#include <Eigen/Dense>

#include "takematch/algo/algorithm.h"
#include "takematch/spectrum/convert.h"
#include "takematch/spectrum/stft.h"

namespace takematch::algo {

    /// Default algorithm: energy in perceptually spaced bands, laid out over time segments.
    ///
    /// 1. Cut the signal into overlapping Hann frames and take the magnitude spectrum.
    /// 2. Average the magnitudes inside `Bands` log-spaced bands between `MinFreq` and `MaxFreq`.
    /// 3. Divide each frame's bands by their sum, which makes the result volume independent.
    /// 4. Split the frame sequence into `Segments` equal parts and average each, so long and short
    /// takes of a song land on the same `Bands * Segments` layout.
    template<int Bands = 12,
            size_t Segments = 12,
            size_t FrameSize = 4096,
            size_t HopLength = 1024,
            size_t MinFreq = 60,
            size_t MaxFreq = 8000>
    class Spectral : public FingerprintAlgorithm {
    public:
        static constexpr size_t Length = Bands * Segments;

        auto id() const -> Algorithm override {
            return Algorithm::Spectral;
        }

        auto length() const -> size_t override {
            return Length;
        }

        auto generate(const std::vector<float> &mono, size_t sample_rate) const -> FingerprintVector override {
            const auto edges = spectrum::log_band_edges(MinFreq, MaxFreq, Bands, FrameSize, sample_rate);

            using Frames = Eigen::Matrix<float, Bands, Eigen::Dynamic>;
            Frames frames(Bands, Eigen::Index(STFT::frame_count(mono.size())));

            STFT stft;
            stft.for_each_frame(mono, [&frames, &edges](size_t i, const Eigen::ArrayXf &magnitude) {
                Eigen::Matrix<float, Bands, 1> bands = spectrum::band_means<Bands>(magnitude, edges);
                const float total = bands.sum();
                if (total > 0) {
                    bands /= total;
                }
                frames.col(Eigen::Index(i)) = bands;
            });

            return {Algorithm::Spectral, spectrum::flatten<Bands>(spectrum::segment_means<Bands>(frames, Segments))};
        }

    private:
        using STFT = spectrum::STFT<FrameSize, HopLength>;
    };

} // takematch::algo
