#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>

#include <cereal/cereal.hpp>

#include "takematch/core/errors.h"

namespace takematch {

    /// Lightweight content marker of a source audio file. It only tells whether the file
    /// changed since it was last fingerprinted; it is not a fingerprint.
    struct FileSignature {
        uint64_t size = 0;
        int64_t mtime = 0;

        auto operator==(const FileSignature &other) const -> bool {
            return size == other.size && mtime == other.mtime;
        }

        auto operator!=(const FileSignature &other) const -> bool {
            return !(*this == other);
        }

        template<class Archive>
        void serialize(Archive &ar) {
            ar(CEREAL_NVP(size), CEREAL_NVP(mtime));
        }
    };

    /// Size and modification time of `file`. Throws `DecodeError` if the file cannot be stat'ed.
    inline auto file_signature(const std::filesystem::path &file) -> FileSignature {
        std::error_code ec;
        const auto size = std::filesystem::file_size(file, ec);
        if (ec) {
            throw DecodeError("cannot stat '" + file.string() + "': " + ec.message());
        }

        const auto time = std::filesystem::last_write_time(file, ec);
        if (ec) {
            throw DecodeError("cannot stat '" + file.string() + "': " + ec.message());
        }

        return {static_cast<uint64_t>(size), static_cast<int64_t>(time.time_since_epoch().count())};
    }

} // takematch
