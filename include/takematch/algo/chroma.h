#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

#include <Eigen/Dense>

#include "takematch/algo/algorithm.h"
#include "takematch/spectrum/convert.h"
#include "takematch/spectrum/stft.h"

namespace takematch::algo {

    /// Pitch-class profile over time segments. Folding the spectrum onto the 12 semitones
    /// makes different takes of a song agree even when the instruments sound different.
    template<size_t Segments = 12,
            size_t FrameSize = 4096,
            size_t HopLength = 1024,
            size_t MinFreq = 80,
            size_t MaxFreq = 5000>
    class Chroma : public FingerprintAlgorithm {
    public:
        static constexpr int PitchClasses = 12;
        static constexpr size_t Length = PitchClasses * Segments;

        auto id() const -> Algorithm override {
            return Algorithm::Chroma;
        }

        auto length() const -> size_t override {
            return Length;
        }

        /// Nearest pitch class of `freq`, with A = 9.
        static auto pitch_class(double freq) -> int {
            const long note = std::lround(12.0 * std::log2(freq / 440.0)) + 69;
            return int(((note % PitchClasses) + PitchClasses) % PitchClasses);
        }

        auto generate(const std::vector<float> &mono, size_t sample_rate) const -> FingerprintVector override {
            // -1 marks bins outside the analysed range.
            const double max_freq = std::min(double(MaxFreq), double(sample_rate) / 2);
            std::vector<int> classes(STFT::Bins, -1);
            for (size_t b = 0; b < STFT::Bins; ++b) {
                const double freq = double(b) * double(sample_rate) / double(FrameSize);
                if (freq >= double(MinFreq) && freq <= max_freq) {
                    classes[b] = pitch_class(freq);
                }
            }

            using Frames = Eigen::Matrix<float, PitchClasses, Eigen::Dynamic>;
            Frames frames(PitchClasses, Eigen::Index(STFT::frame_count(mono.size())));

            STFT stft;
            stft.for_each_frame(mono, [&frames, &classes](size_t i, const Eigen::ArrayXf &magnitude) {
                Eigen::Matrix<float, PitchClasses, 1> chroma = Eigen::Matrix<float, PitchClasses, 1>::Zero();
                for (size_t b = 0; b < classes.size(); ++b) {
                    if (classes[b] >= 0) {
                        chroma(classes[b]) += magnitude(Eigen::Index(b));
                    }
                }
                spectrum::l2_normalize(chroma);
                frames.col(Eigen::Index(i)) = chroma;
            });

            return {Algorithm::Chroma,
                    spectrum::flatten<PitchClasses>(spectrum::segment_means<PitchClasses>(frames, Segments))};
        }

    private:
        using STFT = spectrum::STFT<FrameSize, HopLength>;
    };

} // takematch::algo
