#pragma once

#include <filesystem>

#include "takematch/core/fingerprint.h"

namespace takematch::io {

    /// Source of decoded PCM. The engine does not parse audio files itself.
    class AudioDecoder {
    public:
        virtual ~AudioDecoder() = default;

        /// Throws `DecodeError` if no samples can be obtained from `file`.
        virtual auto decode(const std::filesystem::path &file) const -> AudioBuffer = 0;
    };

} // takematch::io
