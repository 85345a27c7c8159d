#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include "takematch/core/fingerprint.h"
#include "takematch/core/signature.h"
#include "takematch/utils.h"

namespace takematch {

    /// Name of the per-folder cache file.
    inline constexpr const char *FingerprintsFilename = ".audio_fingerprints.json";

    inline constexpr uint32_t CacheVersion = 2;

    /// Cached fingerprints of one file. The file identity is the key under which the entry is
    /// stored in its `FolderFingerprintSet`.
    struct FingerprintCacheEntry {
        FileSignature signature;
        bool is_reference_song = false;
        /// Algorithm name -> values. Names this build does not know are kept as they are.
        std::map<std::string, std::vector<float>> fingerprints;

        auto vector(Algorithm algorithm) const -> std::optional<FingerprintVector> {
            const auto it = fingerprints.find(algorithm_name(algorithm));
            if (it == fingerprints.end() || it->second.empty()) {
                return std::nullopt;
            }
            return FingerprintVector{algorithm, it->second};
        }

        void store(const FingerprintVector &fp) {
            fingerprints[algorithm_name(fp.algorithm)] = fp.values;
        }

        template<class Archive>
        void save(Archive &ar) const {
            const auto by_name = utils::object_map(fingerprints);
            ar(CEREAL_NVP(signature));
            ar(CEREAL_NVP(is_reference_song));
            ar(cereal::make_nvp("fingerprints", by_name));
        }

        /// Entries without a signature never match a file on disk and are regenerated on first use.
        template<class Archive>
        void load(Archive &ar) {
            utils::load_optional(ar, "signature", signature);
            utils::load_optional(ar, "is_reference_song", is_reference_song);

            auto by_name = utils::object_map(fingerprints);
            utils::load_optional(ar, "fingerprints", by_name);

            // Single-vector entries predate per-algorithm storage and hold a spectral vector.
            std::vector<float> fingerprint;
            utils::load_optional(ar, "fingerprint", fingerprint);
            if (fingerprints.empty() && !fingerprint.empty()) {
                fingerprints[algorithm_name(Algorithm::Spectral)] = std::move(fingerprint);
            }

            // Older files use other names for some algorithms.
            std::map<std::string, std::vector<float>> renamed;
            for (auto &[name, values] : fingerprints) {
                const auto algorithm = parse_algorithm(name);
                renamed[algorithm ? algorithm_name(*algorithm) : name] = std::move(values);
            }
            fingerprints = std::move(renamed);
        }
    };

    /// All cache entries of one practice folder plus its folder-level flags.
    struct FolderFingerprintSet {
        /// Owning folder, not persisted.
        std::filesystem::path folder;

        uint32_t version = CacheVersion;
        /// Narrower per-folder reference flag, stored in the folder itself.
        bool is_reference_folder = false;
        /// The folder is never used as a match source.
        bool ignore_fingerprints = false;
        std::vector<std::string> excluded_files;
        std::map<std::string, FingerprintCacheEntry> files;

        auto is_excluded(const std::string &filename) const -> bool {
            return std::find(excluded_files.cbegin(), excluded_files.cend(), filename) != excluded_files.cend();
        }

        auto find(const std::string &filename) const -> const FingerprintCacheEntry * {
            const auto it = files.find(filename);
            return it == files.end() ? nullptr : &it->second;
        }

        /// Number of entries holding a vector for each algorithm.
        auto coverage() const -> std::map<Algorithm, size_t> {
            std::map<Algorithm, size_t> counts;
            for (const auto algorithm : AllAlgorithms) {
                counts[algorithm] = static_cast<size_t>(std::count_if(
                        files.cbegin(),
                        files.cend(),
                        [algorithm](const auto &p) { return p.second.vector(algorithm).has_value(); }
                ));
            }
            return counts;
        }

        template<class Archive>
        void save(Archive &ar) const {
            ar(CEREAL_NVP(version));
            ar(CEREAL_NVP(is_reference_folder));
            ar(CEREAL_NVP(ignore_fingerprints));
            ar(CEREAL_NVP(excluded_files));
            const auto by_name = utils::object_map(files);
            ar(cereal::make_nvp("files", by_name));
        }

        template<class Archive>
        void load(Archive &ar) {
            utils::load_optional(ar, "version", version);
            utils::load_optional(ar, "is_reference_folder", is_reference_folder);
            utils::load_optional(ar, "ignore_fingerprints", ignore_fingerprints);
            utils::load_optional(ar, "excluded_files", excluded_files);
            auto by_name = utils::object_map(files);
            utils::load_optional(ar, "files", by_name);
        }
    };

} // takematch
