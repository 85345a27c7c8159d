#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <boost/range/adaptor/filtered.hpp>
#include <boost/range/algorithm/copy.hpp>
#include <cereal/archives/json.hpp>
#include <cereal/cereal.hpp>

#include "takematch/core/errors.h"

namespace takematch::utils {

    /// Absolute, normalised form of a folder path, used as the folder's identity.
    /// An empty path (the parent of a bare filename) is the current directory.
    inline auto normalize_folder(const std::filesystem::path &folder) -> std::filesystem::path {
        auto p = std::filesystem::absolute(folder.empty() ? std::filesystem::path(".") : folder).lexically_normal();
        if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
            p = p.parent_path();
        }
        return p;
    }

    /// Regular files of `dir`, sorted by name.
    inline auto get_dir_files(const std::filesystem::path &dir) -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> files;
        for (const auto &f : std::filesystem::directory_iterator(dir)) {
            if (f.is_regular_file()) {
                files.emplace_back(f.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    inline auto is_audio_file(const std::filesystem::path &file) -> bool {
        static const std::vector<std::string> extensions = {
                ".wav", ".mp3", ".flac", ".ogg", ".m4a", ".aac", ".aif", ".aiff", ".wma"
        };

        auto ext = file.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
        return std::find(extensions.cbegin(), extensions.cend(), ext) != extensions.cend();
    }

    /// Audio files of `dir`, sorted by name.
    inline auto get_audio_files(const std::filesystem::path &dir) -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> audio;
        const auto files = get_dir_files(dir);
        boost::copy(files | boost::adaptors::filtered([](const std::filesystem::path &f) { return is_audio_file(f); }),
                    std::back_inserter(audio));
        return audio;
    }

    /// Load a field that may be absent from older files. A missing field leaves `value` untouched.
    template<typename Archive, typename T>
    void load_optional(Archive &ar, const char *name, T &value) {
        try {
            ar(cereal::make_nvp(name, value));
        } catch (const cereal::Exception &) {
            // absent: keep default
        }
    }

    /// A string-keyed map written as a JSON object (`{"name": value, ...}`) instead of cereal's
    /// list of key/value pairs. JSON archives only.
    template<typename Map>
    struct ObjectMap {
        Map &map;

        template<class Archive>
        void save(Archive &ar) const {
            for (const auto &[key, value] : map) {
                ar(cereal::make_nvp(key, value));
            }
        }

        template<class Archive>
        void load(Archive &ar) {
            map.clear();
            for (const char *name = ar.getNodeName(); name != nullptr; name = ar.getNodeName()) {
                const std::string key = name;
                typename Map::mapped_type value;
                ar(value);
                map.emplace(key, std::move(value));
            }
        }
    };

    template<typename Map>
    auto object_map(Map &map) -> ObjectMap<Map> {
        return {map};
    }

    /// Serialize `obj` as the root object of a JSON document. The document is written to a
    /// temporary file next to `path` which then replaces `path`, so readers never see a partial file.
    template<typename T>
    void write_json_atomic(const std::filesystem::path &path, const T &obj) {
        auto tmp = path;
        tmp += ".tmp";

        {
            std::ofstream os(tmp, std::ios::trunc);
            if (!os) {
                throw Error("cannot open '" + tmp.string() + "' for writing");
            }
            {
                cereal::JSONOutputArchive archive(os);
                obj.save(archive);
            }
            os.flush();
            if (!os) {
                throw Error("error writing '" + tmp.string() + "'");
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            const auto reason = ec.message();
            std::filesystem::remove(tmp, ec);
            throw Error("cannot replace '" + path.string() + "': " + reason);
        }
    }

    /// Read a JSON document written by `write_json_atomic`.
    template<typename T>
    void read_json(const std::filesystem::path &path, T &obj) {
        std::ifstream is(path);
        if (!is) {
            throw Error("cannot open '" + path.string() + "'");
        }
        cereal::JSONInputArchive archive(is);
        obj.load(archive);
    }

} // takematch::utils
