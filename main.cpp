#include <getopt.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <takematch/audioproblems/auto_label.h>
#include <takematch/config.h>
#include <takematch/core/cache.h>
#include <takematch/core/parallel_collector.h>
#include <takematch/io/essentia_decoder.h>
#include <takematch/match/library.h>

namespace fs = std::filesystem;
using namespace std;

namespace {

    void usage() {
        cerr << "Usage: takematch <command> [options] <path>...\n"
                "Commands:\n"
                "  index <folder>...           Fingerprint every audio file of the folders\n"
                "  match <file>...             Best match of each file among the library\n"
                "  suggest <folder>            Suggest names for every file of a folder\n"
                "  info <folder>...            Show the fingerprint cache of the folders\n"
                "  discover <root>             List folders holding a fingerprint cache\n"
                "  exclude <file>...           Toggle exclusion of files from matching\n"
                "  reference-song <file>...    Flag files as reference songs (--off to clear)\n"
                "  reference-folder <folder>   Toggle the folder's reference flag\n"
                "  ignore-folder <folder>      Toggle whether the folder is used for matching\n"
                "  prune <folder>...           Drop entries of files that no longer exist\n"
                "Options:\n"
                "  --config <file>      Settings file (default: takematch.json)\n"
                "  --library <root>     Root searched for known folders (default: parent of the target folder)\n"
                "  --algorithm <name>   spectral, lightweight, chroma or constellation\n"
                "  --threshold <value>  Minimum weighted score, 0..1\n"
                "  --reference <folder> Designated reference folder (can be given multiple times)\n"
                "  --workers <n>        Worker threads (0: one per core)\n"
                "  --off                Clear instead of set (reference-song)\n"
                "  --verbose            Log match diagnostics\n";
    }

    auto parse_number(const char *s) -> optional<double> {
        try {
            size_t pos = 0;
            const double v = stod(s, &pos);
            if (pos != string(s).size()) {
                return nullopt;
            }
            return v;
        } catch (const exception &) {
            return nullopt;
        }
    }

    auto library_folders(const optional<fs::path> &root, const fs::path &target_folder) -> vector<fs::path> {
        const auto base = root.value_or(takematch::utils::normalize_folder(target_folder).parent_path());
        auto folders = takematch::cache::discover_practice_folders(base);
        spdlog::info("Found {} practice folders under '{}'", folders.size(), base.string());
        return folders;
    }

    void print_match(const fs::path &file, const takematch::match::MatchOutcome &outcome) {
        if (!outcome.match) {
            cout << file.filename().string() << ": no match";
            if (outcome.diagnostics.best) {
                cout << " (best " << outcome.diagnostics.best->file_identity << ", weighted "
                     << outcome.diagnostics.best->weighted_score << ")";
            }
            cout << endl;
            return;
        }

        const auto &m = *outcome.match;
        cout << file.filename().string() << " -> " << m.matched_file << " [" << m.matched_folder.string() << "]"
             << " raw " << m.raw_score << " weighted " << m.weighted_score
             << (m.is_reference ? " reference" : "") << " folders " << m.folder_count << endl;
    }

    void print_info(takematch::cache::FingerprintCache &cache, const fs::path &folder) {
        const auto set = cache.snapshot(folder);
        cout << set.folder.string() << ": " << set.files.size() << " entries"
             << (set.is_reference_folder ? ", reference" : "")
             << (set.ignore_fingerprints ? ", ignored" : "") << endl;
        for (const auto &[algorithm, count] : set.coverage()) {
            cout << "  " << takematch::algorithm_name(algorithm) << ": " << count << endl;
        }
        for (const auto &name : set.excluded_files) {
            cout << "  excluded: " << name << endl;
        }
        for (const auto &[name, entry] : set.files) {
            if (entry.is_reference_song) {
                cout << "  reference song: " << name << endl;
            }
        }
    }

} // namespace

int main(int argc, char **argv) {
    std::ios_base::sync_with_stdio(false);

    if (argc < 2) {
        usage();
        return EXIT_FAILURE;
    }
    const string command = argv[1];

    fs::path config_path = "takematch.json";
    optional<fs::path> library_root;
    optional<string> opt_algorithm;
    optional<double> opt_threshold;
    vector<string> opt_references;
    optional<size_t> opt_workers;
    bool off = false;
    bool verbose = false;

    int opt;
    int option_index = 0;
    static struct option long_options[] = {
            {"config",    required_argument, nullptr, 'c'},
            {"library",   required_argument, nullptr, 'l'},
            {"algorithm", required_argument, nullptr, 'a'},
            {"threshold", required_argument, nullptr, 't'},
            {"reference", required_argument, nullptr, 'r'},
            {"workers",   required_argument, nullptr, 'w'},
            {"off",       no_argument,       nullptr, 'o'},
            {"verbose",   no_argument,       nullptr, 'v'},
            {nullptr,     0,                 nullptr, 0}
    };

    optind = 2;
    while ((opt = getopt_long(argc, argv, "", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'l':
                library_root = fs::path(optarg);
                break;
            case 'a':
                opt_algorithm = optarg;
                break;
            case 't': {
                const auto v = parse_number(optarg);
                if (!v) {
                    cerr << "Invalid --threshold value: " << optarg << endl;
                    return EXIT_FAILURE;
                }
                opt_threshold = *v;
                break;
            }
            case 'r':
                opt_references.emplace_back(optarg);
                break;
            case 'w': {
                const auto v = parse_number(optarg);
                if (!v || *v < 0) {
                    cerr << "Invalid --workers value: " << optarg << endl;
                    return EXIT_FAILURE;
                }
                opt_workers = size_t(*v);
                break;
            }
            case 'o':
                off = true;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                usage();
                return EXIT_FAILURE;
        }
    }

    vector<fs::path> paths(argv + optind, argv + argc);
    if (paths.empty()) {
        usage();
        return EXIT_FAILURE;
    }

    try {
        auto config = takematch::load_config(config_path);
        if (opt_algorithm) {
            const auto algorithm = takematch::parse_algorithm(*opt_algorithm);
            if (!algorithm) {
                cerr << "Unknown algorithm: " << *opt_algorithm << endl;
                return EXIT_FAILURE;
            }
            config.algorithm = *algorithm;
        }
        if (opt_threshold) {
            config.threshold = *opt_threshold;
        }
        if (opt_workers) {
            config.workers = *opt_workers;
        }
        config.reference_folders.insert(config.reference_folders.end(), opt_references.cbegin(),
                                        opt_references.cend());
        if (verbose) {
            config.log_level = "debug";
        }
        config.validate();
        takematch::configure_logging(config);

        takematch::cache::FingerprintCache cache(make_shared<takematch::io::EssentiaDecoder>());

        if (command == "index") {
            takematch::ParallelCollector collector(cache, config.workers);
            bool failed = false;
            for (const auto &folder : paths) {
                const auto report = collector.collect(folder, config.algorithm);
                failed = failed || !report.failures.empty();
                for (const auto &f : report.failures) {
                    cout << "could not fingerprint " << f.file.string() << ": " << f.reason << endl;
                }
            }
            return failed ? EXIT_FAILURE : EXIT_SUCCESS;
        }

        if (command == "match") {
            auto future = takematch::match::load_library_async(
                    cache, library_folders(library_root, paths.front().parent_path()), config.workers);
            const auto library = future.get();

            takematch::AutoLabeler labeler(cache, config);
            for (const auto &file : paths) {
                print_match(file, labeler.query(file, library));
            }
            cache.flush_all();
            return EXIT_SUCCESS;
        }

        if (command == "suggest") {
            const auto &folder = paths.front();
            auto future = takematch::match::load_library_async(cache, library_folders(library_root, folder),
                                                               config.workers);
            const auto library = future.get();

            takematch::AutoLabeler labeler(cache, config);
            const auto result = labeler.suggest_folder(folder, library);
            for (const auto &s : result.suggestions) {
                cout << s.file.filename().string() << " -> " << s.suggested_name << " ("
                     << s.confidence * 100.0 << "%, " << s.source_folder.string() << ")" << endl;
            }
            for (const auto &f : result.unmatched) {
                cout << f.filename().string() << ": no match" << endl;
            }
            for (const auto &f : result.failures) {
                cout << "could not fingerprint " << f.file.string() << ": " << f.reason << endl;
            }
            return EXIT_SUCCESS;
        }

        if (command == "info") {
            for (const auto &folder : paths) {
                print_info(cache, folder);
            }
            return EXIT_SUCCESS;
        }

        if (command == "discover") {
            for (const auto &folder : takematch::cache::discover_practice_folders(paths.front())) {
                cout << folder.string() << endl;
            }
            return EXIT_SUCCESS;
        }

        if (command == "exclude") {
            for (const auto &file : paths) {
                const bool excluded = cache.toggle_file_exclusion(file.parent_path(), file.filename().string());
                cout << file.filename().string() << (excluded ? ": excluded" : ": included") << endl;
            }
            return EXIT_SUCCESS;
        }

        if (command == "reference-song") {
            bool failed = false;
            for (const auto &file : paths) {
                if (!cache.set_reference_song(file.parent_path(), file.filename().string(), !off)) {
                    cerr << file.string() << " has no fingerprint, index its folder first" << endl;
                    failed = true;
                }
            }
            return failed ? EXIT_FAILURE : EXIT_SUCCESS;
        }

        if (command == "reference-folder") {
            for (const auto &folder : paths) {
                const bool on = cache.toggle_folder_reference(folder);
                cout << folder.string() << (on ? ": reference folder" : ": regular folder") << endl;
            }
            return EXIT_SUCCESS;
        }

        if (command == "ignore-folder") {
            for (const auto &folder : paths) {
                const bool ignored = cache.toggle_folder_ignore(folder);
                cout << folder.string() << (ignored ? ": ignored" : ": used for matching") << endl;
            }
            return EXIT_SUCCESS;
        }

        if (command == "prune") {
            for (const auto &folder : paths) {
                cout << folder.string() << ": removed " << cache.prune_missing(folder) << " entries" << endl;
            }
            return EXIT_SUCCESS;
        }

        cerr << "Unknown command: " << command << endl;
        usage();
        return EXIT_FAILURE;
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
}
