#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "takematch/core/fingerprint.h"
#include "takematch/core/folder_set.h"
#include "takematch/utils.h"

namespace takematch::match {

    /// Fingerprint of one file of one folder, with the trust flags that apply to it.
    struct Candidate {
        std::string file_identity;
        std::filesystem::path folder;
        FingerprintVector vector;
        /// Folder is one of the designated reference folders.
        bool is_reference_folder = false;
        /// Folder carries its own reference flag.
        bool is_folder_reference = false;
        bool is_reference_song = false;

        auto is_reference() const -> bool {
            return is_reference_folder || is_folder_reference || is_reference_song;
        }
    };

    using Library = std::vector<FolderFingerprintSet>;

    /// Every `algorithm` vector of `library`. Folders flagged to be ignored, excluded files and
    /// `exclude` (normally the query file itself) are left out.
    inline auto collect_candidates(const Library &library,
                                   Algorithm algorithm,
                                   const std::vector<std::filesystem::path> &reference_folders = {},
                                   const std::optional<std::filesystem::path> &exclude = std::nullopt)
    -> std::vector<Candidate> {
        std::vector<std::filesystem::path> designated;
        designated.reserve(reference_folders.size());
        for (const auto &f : reference_folders) {
            designated.push_back(utils::normalize_folder(f));
        }

        std::optional<std::filesystem::path> exclude_folder;
        std::string exclude_name;
        if (exclude) {
            exclude_folder = utils::normalize_folder(exclude->parent_path());
            exclude_name = exclude->filename().string();
        }

        std::vector<Candidate> candidates;
        for (const auto &set : library) {
            if (set.ignore_fingerprints) {
                continue;
            }

            const auto folder = utils::normalize_folder(set.folder);
            const bool designated_folder = std::find(designated.cbegin(), designated.cend(), folder) != designated.cend();

            for (const auto &[name, entry] : set.files) {
                if (set.is_excluded(name) || (exclude_folder && *exclude_folder == folder && name == exclude_name)) {
                    continue;
                }
                auto fp = entry.vector(algorithm);
                if (!fp) {
                    continue;
                }
                candidates.push_back({name, folder, *std::move(fp), designated_folder, set.is_reference_folder,
                                      entry.is_reference_song});
            }
        }
        return candidates;
    }

} // takematch::match
