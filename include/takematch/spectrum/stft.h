#pragma once

#include <cmath>
#include <cstddef>
#include <mutex>
#include <vector>

#include <Eigen/Dense>
#include <fftw3.h>

namespace takematch::spectrum {

    /// fftw's planner is not thread-safe; every plan is created and destroyed under this lock.
    inline auto fftw_planner_mutex() -> std::mutex & {
        static std::mutex mtx;
        return mtx;
    }

    /// Short-time Fourier transform over Hann-windowed frames.
    ///
    /// The magnitude spectrum of each frame is handed to a callback instead of being collected,
    /// since a full spectrogram of a long recording does not fit comfortably in memory.
    /// A signal shorter than one frame is zero-padded to one frame.
    ///
    /// \tparam FrameSize - samples per frame (FFT size).
    /// \tparam HopLength - samples between successive frames.
    template<size_t FrameSize, size_t HopLength>
    class STFT {
    public:
        static constexpr size_t Bins = FrameSize / 2 + 1;

        STFT() : window(FrameSize), in(fftw_alloc_real(FrameSize)), out(fftw_alloc_complex(Bins)) {
            constexpr double pi = 3.14159265358979323846;
            for (size_t i = 0; i < FrameSize; ++i) {
                window[i] = 0.5 - 0.5 * std::cos(2.0 * pi * double(i) / double(FrameSize - 1));
            }

            std::scoped_lock lock(fftw_planner_mutex());
            plan = fftw_plan_dft_r2c_1d(static_cast<int>(FrameSize), in, out, FFTW_ESTIMATE);
        }

        ~STFT() {
            {
                std::scoped_lock lock(fftw_planner_mutex());
                fftw_destroy_plan(plan);
            }
            fftw_free(in);
            fftw_free(out);
        }

        STFT(const STFT &) = delete;

        auto operator=(const STFT &) -> STFT & = delete;

        static auto frame_count(size_t num_samples) -> size_t {
            if (num_samples <= FrameSize) {
                return 1;
            }
            return 1 + (num_samples - FrameSize) / HopLength;
        }

        /// Call `f(frame_index, magnitude)` for every frame, `magnitude` holding `Bins` values.
        template<typename Func>
        void for_each_frame(const std::vector<float> &samples, Func f) {
            const size_t n = frame_count(samples.size());
            Eigen::ArrayXf magnitude(Bins);

            for (size_t i = 0; i < n; ++i) {
                const size_t offset = i * HopLength;
                for (size_t j = 0; j < FrameSize; ++j) {
                    const size_t k = offset + j;
                    in[j] = k < samples.size() ? double(samples[k]) * window[j] : 0.0;
                }

                fftw_execute(plan);
                for (size_t b = 0; b < Bins; ++b) {
                    magnitude(Eigen::Index(b)) = float(std::hypot(out[b][0], out[b][1]));
                }

                f(i, static_cast<const Eigen::ArrayXf &>(magnitude));
            }
        }

    private:
        std::vector<double> window;
        double *in;
        fftw_complex *out;
        fftw_plan plan;
    };

} // takematch::spectrum
