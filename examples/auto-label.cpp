#include <filesystem>
#include <iostream>
#include <memory>

#include <takematch/audioproblems/auto_label.h>
#include <takematch/match/library.h>
#include <takematch/io/essentia_decoder.h>

namespace fs = std::filesystem;
using namespace std;

int main(int argc, char **argv) {
    std::ios_base::sync_with_stdio(false);

    if (argc < 3) {
        cerr << "Usage: auto-label <library root> <unlabeled folder>" << endl;
        return 1;
    }
    const fs::path library_root = argv[1];
    const fs::path unlabeled = argv[2];

    takematch::cache::FingerprintCache cache(make_shared<takematch::io::EssentiaDecoder>());

    auto folders = takematch::cache::discover_practice_folders(library_root);
    takematch::ParallelCollector collector(cache);
    for (const auto &folder : folders) {
        collector.collect(folder, takematch::Algorithm::Spectral);
    }

    const auto library = takematch::match::load_library_async(cache, folders).get();

    takematch::EngineConfig config;
    config.log_level = "debug";
    takematch::configure_logging(config);

    takematch::AutoLabeler labeler(cache, config);
    const auto result = labeler.suggest_folder(unlabeled, library);
    for (const auto &s : result.suggestions) {
        cout << s.file.filename().string() << " -> " << s.suggested_name << " " << s.confidence << endl;
    }

    return 0;
}
