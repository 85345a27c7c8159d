#pragma once

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

#include <cereal/archives/json.hpp>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <spdlog/spdlog.h>

#include "takematch/core/errors.h"
#include "takematch/core/fingerprint.h"
#include "takematch/match/matcher.h"
#include "takematch/utils.h"

namespace takematch {

    /// User settings of the engine. Every field is optional in the file.
    struct EngineConfig {
        Algorithm algorithm = Algorithm::Spectral;
        double threshold = 0.7;
        match::BoostWeights boosts;
        size_t top_n = 10;
        /// Lower bound of the near-threshold band, as a fraction of the threshold.
        double near_ratio = 0.5;
        std::vector<std::string> reference_folders;
        /// 0 means one worker per core.
        size_t workers = 0;
        std::string log_level = "info";

        auto reference_folder_paths() const -> std::vector<std::filesystem::path> {
            return std::vector<std::filesystem::path>(reference_folders.cbegin(), reference_folders.cend());
        }

        auto matcher() const -> match::CrossFolderMatcher {
            return match::CrossFolderMatcher(boosts, top_n, near_ratio);
        }

        /// Throws `ConfigError` for out-of-range values.
        void validate() const {
            if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0) {
                throw ConfigError("threshold must be within [0, 1], got " + std::to_string(threshold));
            }
            if (!std::isfinite(near_ratio) || near_ratio < 0.0 || near_ratio > 1.0) {
                throw ConfigError("near_threshold_ratio must be within [0, 1], got " + std::to_string(near_ratio));
            }
            for (const double b : {boosts.reference_folder, boosts.folder_reference, boosts.reference_song}) {
                if (!std::isfinite(b) || b < 0.0) {
                    throw ConfigError("boosts must be non-negative, got " + std::to_string(b));
                }
            }
            if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
                throw ConfigError("unknown log level '" + log_level + "'");
            }
        }

        template<class Archive>
        void save(Archive &ar) const {
            const auto name = algorithm_name(algorithm);
            ar(cereal::make_nvp("algorithm", name));
            ar(CEREAL_NVP(threshold));
            ar(cereal::make_nvp("reference_folder_boost", boosts.reference_folder));
            ar(cereal::make_nvp("folder_reference_boost", boosts.folder_reference));
            ar(cereal::make_nvp("reference_song_boost", boosts.reference_song));
            ar(CEREAL_NVP(top_n));
            ar(cereal::make_nvp("near_threshold_ratio", near_ratio));
            ar(CEREAL_NVP(reference_folders));
            ar(CEREAL_NVP(workers));
            ar(CEREAL_NVP(log_level));
        }

        template<class Archive>
        void load(Archive &ar) {
            std::string name = algorithm_name(algorithm);
            utils::load_optional(ar, "algorithm", name);
            const auto parsed = parse_algorithm(name);
            if (!parsed) {
                throw ConfigError("unknown algorithm '" + name + "'");
            }
            algorithm = *parsed;

            utils::load_optional(ar, "threshold", threshold);
            utils::load_optional(ar, "reference_folder_boost", boosts.reference_folder);
            utils::load_optional(ar, "folder_reference_boost", boosts.folder_reference);
            utils::load_optional(ar, "reference_song_boost", boosts.reference_song);
            utils::load_optional(ar, "top_n", top_n);
            utils::load_optional(ar, "near_threshold_ratio", near_ratio);
            utils::load_optional(ar, "reference_folders", reference_folders);
            utils::load_optional(ar, "workers", workers);
            utils::load_optional(ar, "log_level", log_level);
        }
    };

    /// Settings stored at `path`. A missing file gives the defaults; a malformed one throws `ConfigError`.
    inline auto load_config(const std::filesystem::path &path) -> EngineConfig {
        EngineConfig config;

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            spdlog::debug("No config at '{}', using defaults", path.string());
            return config;
        }

        try {
            utils::read_json(path, config);
        } catch (const ConfigError &) {
            throw;
        } catch (const std::exception &e) {
            throw ConfigError("malformed config '" + path.string() + "': " + e.what());
        }
        config.validate();
        return config;
    }

    inline void save_config(const std::filesystem::path &path, const EngineConfig &config) {
        config.validate();
        utils::write_json_atomic(path, config);
    }

    inline void configure_logging(const EngineConfig &config) {
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    }

} // takematch
