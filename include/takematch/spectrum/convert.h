#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include "takematch/core/fingerprint.h"

namespace takematch::spectrum {

    /// Average interleaved channels into one.
    inline auto downmix(const AudioBuffer &audio) -> std::vector<float> {
        if (audio.channels <= 1) {
            return audio.samples;
        }

        const size_t frames = audio.frames();
        std::vector<float> mono(frames);
        for (size_t i = 0; i < frames; ++i) {
            float sum = 0;
            for (size_t c = 0; c < audio.channels; ++c) {
                sum += audio.samples[i * audio.channels + c];
            }
            mono[i] = sum / float(audio.channels);
        }
        return mono;
    }

    /// Keep every `factor`-th sample.
    inline auto decimate(const std::vector<float> &samples, size_t factor) -> std::vector<float> {
        if (factor <= 1) {
            return samples;
        }

        std::vector<float> out;
        out.reserve(samples.size() / factor + 1);
        for (size_t i = 0; i < samples.size(); i += factor) {
            out.push_back(samples[i]);
        }
        return out;
    }

    /// FFT bin boundaries of `n_bands` log-spaced bands between `min_freq` and `max_freq`.
    /// Boundaries are strictly increasing, so every band covers at least one bin.
    inline auto log_band_edges(double min_freq,
                               double max_freq,
                               size_t n_bands,
                               size_t n_fft,
                               size_t sample_rate) -> std::vector<size_t> {
        const size_t last_bin = n_fft / 2;
        max_freq = std::min(max_freq, double(sample_rate) / 2);
        if (max_freq <= min_freq) {
            max_freq = min_freq * 2;
        }

        std::vector<size_t> edges(n_bands + 1);
        for (size_t k = 0; k <= n_bands; ++k) {
            const double freq = min_freq * std::pow(max_freq / min_freq, double(k) / double(n_bands));
            edges[k] = std::min(last_bin, static_cast<size_t>(freq * double(n_fft) / double(sample_rate)));
        }

        for (size_t k = 1; k <= n_bands; ++k) {
            if (edges[k] <= edges[k - 1]) {
                edges[k] = edges[k - 1] + 1;
            }
        }
        // Shift back under the spectrum size if the low bands were pushed past it.
        const size_t overflow = edges[n_bands] > last_bin + 1 ? edges[n_bands] - (last_bin + 1) : 0;
        if (overflow > 0) {
            for (auto &e : edges) {
                e = e >= overflow ? e - overflow : 0;
            }
        }
        return edges;
    }

    /// Mean magnitude of every band delimited by `edges`.
    template<int Bands>
    auto band_means(const Eigen::ArrayXf &magnitude, const std::vector<size_t> &edges) -> Eigen::Matrix<float, Bands, 1> {
        Eigen::Matrix<float, Bands, 1> bands;
        const auto size = static_cast<size_t>(magnitude.size());
        for (int b = 0; b < Bands; ++b) {
            const size_t begin = std::min(edges[b], size);
            const size_t end = std::min(edges[b + 1], size);
            bands(b) = end > begin
                       ? magnitude.segment(Eigen::Index(begin), Eigen::Index(end - begin)).mean()
                       : 0.0f;
        }
        return bands;
    }

    /// Reduce frame columns to `segments` columns, each the mean of an equal share of the frames.
    /// With fewer frames than segments a frame is repeated, so the shape never depends on duration.
    template<int Rows>
    auto segment_means(const Eigen::Matrix<float, Rows, Eigen::Dynamic> &frames,
                       size_t segments) -> Eigen::Matrix<float, Rows, Eigen::Dynamic> {
        const auto n = static_cast<size_t>(frames.cols());
        Eigen::Matrix<float, Rows, Eigen::Dynamic> out = Eigen::Matrix<float, Rows, Eigen::Dynamic>::Zero(frames.rows(), Eigen::Index(segments));
        if (n == 0) {
            return out;
        }

        for (size_t s = 0; s < segments; ++s) {
            const size_t begin = s * n / segments;
            const size_t end = std::max(begin + 1, (s + 1) * n / segments);
            out.col(Eigen::Index(s)) = frames.middleCols(Eigen::Index(begin), Eigen::Index(end - begin)).rowwise().mean();
        }
        return out;
    }

    /// Scale to unit length; an all-zero vector stays zero.
    template<typename Derived>
    void l2_normalize(Eigen::MatrixBase<Derived> &v) {
        const float norm = v.norm();
        if (norm > 0) {
            v /= norm;
        }
    }

    /// Flatten column by column (all rows of the first column, then the second, ...).
    template<int Rows>
    auto flatten(const Eigen::Matrix<float, Rows, Eigen::Dynamic> &m) -> std::vector<float> {
        std::vector<float> values(static_cast<size_t>(m.size()));
        Eigen::Map<Eigen::Matrix<float, Rows, Eigen::Dynamic>>(values.data(), m.rows(), m.cols()) = m;
        return values;
    }

} // takematch::spectrum
