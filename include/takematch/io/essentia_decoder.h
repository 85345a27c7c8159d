#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <essentia/algorithmfactory.h>
#include <essentia/essentia.h>
#include <spdlog/spdlog.h>

#include "takematch/core/errors.h"
#include "takematch/io/decoder.h"

namespace takematch::io {

    /// Decodes any format essentia's `MonoLoader` understands, downmixed and resampled
    /// to `sample_rate`.
    class EssentiaDecoder : public AudioDecoder {
    public:
        explicit EssentiaDecoder(size_t sample_rate = 44100) : sample_rate(sample_rate) {
            // Process-wide registry, initialised once and never shut down.
            static std::once_flag flag;
            std::call_once(flag, [] { essentia::init(); });
        }

        auto decode(const std::filesystem::path &file) const -> AudioBuffer override {
            using essentia::standard::AlgorithmFactory;
            using uptr = std::unique_ptr<essentia::standard::Algorithm>;

            if (!std::filesystem::is_regular_file(file)) {
                throw DecodeError("no such file '" + file.string() + "'");
            }

            AudioBuffer audio;
            audio.sample_rate = sample_rate;
            audio.channels = 1;

            try {
                AlgorithmFactory &factory = AlgorithmFactory::instance();
                auto loader = uptr(factory.create("MonoLoader",
                                                  "filename", file.string(),
                                                  "sampleRate", essentia::Real(sample_rate)));

                std::vector<essentia::Real> buffer;
                loader->output("audio").set(buffer);
                loader->compute();

                audio.samples.assign(buffer.begin(), buffer.end());
            } catch (const essentia::EssentiaException &e) {
                throw DecodeError("cannot decode '" + file.string() + "': " + e.what());
            }

            spdlog::debug("Decoded '{}': {:.1f} s", file.string(), audio.duration_seconds());
            return audio;
        }

    private:
        const size_t sample_rate;
    };

} // takematch::io
