#pragma once

#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "takematch/algo/generator.h"
#include "takematch/core/folder_set.h"
#include "takematch/core/signature.h"
#include "takematch/io/decoder.h"
#include "takematch/utils.h"

namespace takematch::cache {

    inline auto cache_file(const std::filesystem::path &folder) -> std::filesystem::path {
        return folder / FingerprintsFilename;
    }

    /// Every directory under `root` (including `root`) holding a fingerprint cache file.
    inline auto discover_practice_folders(const std::filesystem::path &root) -> std::vector<std::filesystem::path> {
        namespace fs = std::filesystem;

        std::vector<fs::path> folders;
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            return folders;
        }

        if (fs::exists(cache_file(root), ec)) {
            folders.push_back(utils::normalize_folder(root));
        }

        auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::warn("Cannot scan '{}': {}", root.string(), ec.message());
            return folders;
        }
        for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                spdlog::warn("Error scanning '{}': {}", root.string(), ec.message());
                break;
            }
            if (it->path().filename() == FingerprintsFilename && it->is_regular_file(ec)) {
                folders.push_back(utils::normalize_folder(it->path().parent_path()));
            }
        }

        std::sort(folders.begin(), folders.end());
        folders.erase(std::unique(folders.begin(), folders.end()), folders.end());
        return folders;
    }

    /// Per-folder fingerprint store backed by one JSON file in every folder.
    ///
    /// Entries are reused as long as the source file's signature is unchanged; a changed file is
    /// fingerprinted again on the next request. Each folder has its own lock, so folders never
    /// block each other and a folder's file always has a single writer.
    class FingerprintCache {
    public:
        explicit FingerprintCache(std::shared_ptr<const io::AudioDecoder> decoder,
                                  algo::FingerprintGenerator generator = {})
                : decoder(std::move(decoder)), generator(std::move(generator)) {}

        /// Writes every folder with unsaved entries.
        ~FingerprintCache() {
            try {
                flush_all();
            } catch (const std::exception &e) {
                spdlog::error("Error saving fingerprints on shutdown: {}", e.what());
            }
        }

        FingerprintCache(const FingerprintCache &) = delete;

        auto operator=(const FingerprintCache &) -> FingerprintCache & = delete;

        /// Read the persisted set of `folder`. A missing or unreadable file gives an empty set.
        static auto load_all(const std::filesystem::path &folder) -> FolderFingerprintSet {
            FolderFingerprintSet set;

            const auto file = cache_file(folder);
            std::error_code ec;
            if (std::filesystem::exists(file, ec)) {
                try {
                    utils::read_json(file, set);
                } catch (const std::exception &e) {
                    spdlog::warn("Ignoring unreadable fingerprint cache '{}': {}", file.string(), e.what());
                    set = FolderFingerprintSet();
                }
            }

            set.folder = utils::normalize_folder(folder);
            return set;
        }

        /// Persist `set` as the cache file of `folder`, replacing the previous file atomically.
        static void save(const std::filesystem::path &folder, const FolderFingerprintSet &set) {
            utils::write_json_atomic(cache_file(folder), set);
        }

        /// Cached fingerprint of `file`, or a freshly generated one if the file is new or changed.
        /// The new entry is kept in memory until the folder is flushed or the cache is destroyed.
        auto get_or_generate(const std::filesystem::path &file, Algorithm algorithm) -> FingerprintVector {
            const auto folder = file.parent_path();
            const auto name = file.filename().string();
            const auto signature = file_signature(file);
            const auto expected_length = generator.length(algorithm);

            auto cached = with_state(folder, [&](FolderState &st) -> std::optional<FingerprintVector> {
                const auto *entry = st.set.find(name);
                if (entry == nullptr || entry->signature != signature) {
                    return std::nullopt;
                }
                auto fp = entry->vector(algorithm);
                if (fp && fp->size() != expected_length) {
                    return std::nullopt;
                }
                return fp;
            });
            if (cached) {
                return *std::move(cached);
            }

            spdlog::debug("Fingerprinting '{}' ({})", file.string(), algorithm_name(algorithm));
            auto fp = generator.generate(decoder->decode(file), algorithm);

            with_state(folder, [&](FolderState &st) {
                auto &entry = st.set.files[name];
                if (entry.signature != signature) {
                    entry.fingerprints.clear();
                    entry.signature = signature;
                }
                entry.store(fp);
                st.dirty = true;
            });

            return fp;
        }

        /// Copy of the in-memory set of `folder` (loaded from disk on first use).
        auto snapshot(const std::filesystem::path &folder) -> FolderFingerprintSet {
            return with_state(folder, [](FolderState &st) { return st.set; });
        }

        /// Write the folder's set to disk if it changed since the last write.
        void flush(const std::filesystem::path &folder) {
            with_state(folder, [](FolderState &st) {
                if (!st.dirty) {
                    return;
                }
                save(st.set.folder, st.set);
                st.dirty = false;
                spdlog::info("Saved {} fingerprint entries to '{}'",
                             st.set.files.size(), cache_file(st.set.folder).string());
            });
        }

        void flush_all() {
            std::vector<std::filesystem::path> folders;
            {
                std::scoped_lock lock(states_mtx);
                for (const auto &[folder, st] : states) {
                    folders.push_back(folder);
                }
            }
            for (const auto &folder : folders) {
                flush(folder);
            }
        }

        /// Explicit cleanup pass: drop entries whose file no longer exists. Returns the number removed.
        auto prune_missing(const std::filesystem::path &folder) -> size_t {
            return update(folder, [](FolderFingerprintSet &set) {
                size_t removed = 0;
                for (auto it = set.files.begin(); it != set.files.end();) {
                    std::error_code ec;
                    if (!std::filesystem::exists(set.folder / it->first, ec)) {
                        spdlog::info("Removing stale fingerprint of '{}'", it->first);
                        it = set.files.erase(it);
                        ++removed;
                    } else {
                        ++it;
                    }
                }
                return removed;
            });
        }

        auto is_file_excluded(const std::filesystem::path &folder, const std::string &filename) -> bool {
            return with_state(folder, [&filename](FolderState &st) { return st.set.is_excluded(filename); });
        }

        /// Returns the new exclusion state.
        auto toggle_file_exclusion(const std::filesystem::path &folder, const std::string &filename) -> bool {
            return update(folder, [&filename](FolderFingerprintSet &set) {
                auto &excluded = set.excluded_files;
                const auto it = std::find(excluded.begin(), excluded.end(), filename);
                if (it != excluded.end()) {
                    excluded.erase(it);
                    return false;
                }
                excluded.push_back(filename);
                return true;
            });
        }

        /// Flag a fingerprinted file as a reference song. Returns false if the file has no entry.
        auto set_reference_song(const std::filesystem::path &folder, const std::string &filename, bool value) -> bool {
            return update(folder, [&filename, value](FolderFingerprintSet &set) {
                const auto it = set.files.find(filename);
                if (it == set.files.end()) {
                    return false;
                }
                it->second.is_reference_song = value;
                return true;
            });
        }

        /// Returns the new flag.
        auto toggle_folder_reference(const std::filesystem::path &folder) -> bool {
            return update(folder, [](FolderFingerprintSet &set) {
                set.is_reference_folder = !set.is_reference_folder;
                return set.is_reference_folder;
            });
        }

        /// Returns the new flag.
        auto toggle_folder_ignore(const std::filesystem::path &folder) -> bool {
            return update(folder, [](FolderFingerprintSet &set) {
                set.ignore_fingerprints = !set.ignore_fingerprints;
                return set.ignore_fingerprints;
            });
        }

    private:
        struct FolderState {
            std::mutex mtx;
            bool loaded = false;
            bool dirty = false;
            FolderFingerprintSet set;
        };

        std::shared_ptr<const io::AudioDecoder> decoder;
        const algo::FingerprintGenerator generator;

        std::mutex states_mtx;
        std::map<std::filesystem::path, std::unique_ptr<FolderState>> states;

        /// Run `f` on the folder's state under the folder's lock. The set is read from disk
        /// on first use, under that same lock, so other folders are not held up.
        template<typename Func>
        auto with_state(const std::filesystem::path &folder, Func f) {
            const auto key = utils::normalize_folder(folder);

            FolderState *st = nullptr;
            {
                std::scoped_lock lock(states_mtx);
                auto &slot = states[key];
                if (!slot) {
                    slot = std::make_unique<FolderState>();
                    slot->set.folder = key;
                }
                st = slot.get();
            }

            std::scoped_lock lock(st->mtx);
            if (!st->loaded) {
                st->set = load_all(key);
                st->loaded = true;
            }
            return f(*st);
        }

        /// Apply `f` to a copy of the folder's set and persist it right away. The in-memory set is
        /// replaced only once the file is written, so a failed save changes nothing.
        template<typename Func>
        auto update(const std::filesystem::path &folder, Func f) {
            return with_state(folder, [&f](FolderState &st) {
                auto next = st.set;
                auto result = f(next);
                save(next.folder, next);
                st.set = std::move(next);
                st.dirty = false;
                return result;
            });
        }
    };

} // takematch::cache
