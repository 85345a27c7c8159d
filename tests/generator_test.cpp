#include <algorithm>
#include <cmath>
#include <iostream>

#include <takematch/algo/generator.h>
#include <takematch/match/scorer.h>

#include "test_utils.h"

using namespace takematch;
using namespace takematch::tests;

namespace {

    auto cosine(const FingerprintVector &a, const FingerprintVector &b) -> double {
        return match::SimilarityScorer::compare(a, b).value;
    }

    bool test_lengths_are_fixed_per_algorithm() {
        const algo::FingerprintGenerator gen;
        const auto short_clip = mono(make_sine(440, 0.1));
        const auto long_clip = mono(make_sine(440, 4.0));

        const std::pair<Algorithm, size_t> expected[] = {
                {Algorithm::Spectral,      144},
                {Algorithm::Lightweight,   32},
                {Algorithm::Chroma,        144},
                {Algorithm::Constellation, 256},
        };

        bool ok = true;
        for (const auto &[algorithm, length] : expected) {
            const auto a = gen.generate(short_clip, algorithm);
            const auto b = gen.generate(long_clip, algorithm);
            ok &= expect(gen.length(algorithm) == length, algorithm_name(algorithm) + " length");
            ok &= expect(a.size() == length && b.size() == length,
                         algorithm_name(algorithm) + " output length independent of duration");
            ok &= expect(a.algorithm == algorithm, algorithm_name(algorithm) + " tag");
        }
        return ok;
    }

    bool test_generation_is_deterministic() {
        const algo::FingerprintGenerator gen;
        const auto audio = mono(make_noise(2.0, 7));

        bool ok = true;
        for (const auto algorithm : AllAlgorithms) {
            ok &= expect(gen.generate(audio, algorithm) == gen.generate(audio, algorithm),
                         algorithm_name(algorithm) + " deterministic");
        }
        return ok;
    }

    bool test_long_and_short_takes_are_comparable() {
        const algo::FingerprintGenerator gen;
        const auto a = gen.generate(mono(make_sine(440, 2.0)), Algorithm::Spectral);
        const auto b = gen.generate(mono(make_sine(440, 5.0)), Algorithm::Spectral);
        const auto other = gen.generate(mono(make_sine(3000, 2.0)), Algorithm::Spectral);

        bool ok = true;
        ok &= expect(cosine(a, b) > 0.99, "same tone at different durations is similar");
        ok &= expect(cosine(a, other) < 0.9, "different tones are dissimilar");
        return ok;
    }

    bool test_spectral_is_volume_independent() {
        const algo::FingerprintGenerator gen;
        const auto quiet = gen.generate(mono(make_sine(440, 2.0, TestSampleRate, 0.1f)), Algorithm::Spectral);
        const auto loud = gen.generate(mono(make_sine(440, 2.0, TestSampleRate, 0.9f)), Algorithm::Spectral);
        return expect(cosine(quiet, loud) > 0.9999, "spectral ignores volume");
    }

    bool test_chroma_folds_octaves() {
        const algo::FingerprintGenerator gen;
        const auto a4 = gen.generate(mono(make_sine(440, 2.0)), Algorithm::Chroma);
        const auto a5 = gen.generate(mono(make_sine(880, 2.0)), Algorithm::Chroma);
        const auto cs5 = gen.generate(mono(make_sine(554.37, 2.0)), Algorithm::Chroma);

        bool ok = true;
        ok &= expect(cosine(a4, a5) > 0.95, "octaves share a pitch class");
        ok &= expect(cosine(a4, cs5) < 0.3, "different pitch classes are dissimilar");
        ok &= expect(algo::DefaultChroma::pitch_class(440.0) == 9, "A is pitch class 9");
        ok &= expect(algo::DefaultChroma::pitch_class(261.63) == 0, "C is pitch class 0");
        return ok;
    }

    bool test_constellation_matches_clips() {
        const algo::FingerprintGenerator gen;
        const auto full = gen.generate(mono(make_sine(440, 2.0)), Algorithm::Constellation);
        const auto clip = gen.generate(mono(make_sine(440, 1.0)), Algorithm::Constellation);
        const auto other = gen.generate(mono(make_sine(1500, 2.0)), Algorithm::Constellation);

        bool ok = true;
        ok &= expect(cosine(full, clip) > 0.95, "clip lands on the same landmarks");
        ok &= expect(cosine(full, other) < 0.5, "different tones give different landmarks");

        const auto nonzero = std::count_if(full.values.cbegin(), full.values.cend(), [](float v) { return v > 0; });
        ok &= expect(nonzero > 0 && nonzero <= 10, "landmark histogram is sparse");
        return ok;
    }

    bool test_silence_gives_zero_vector() {
        const algo::FingerprintGenerator gen;
        const auto silence = mono(std::vector<float>(TestSampleRate * 2, 0.0f));

        bool ok = true;
        for (const auto algorithm : AllAlgorithms) {
            const auto fp = gen.generate(silence, algorithm);
            ok &= expect(fp.valid(), algorithm_name(algorithm) + " silence is a valid vector");
            ok &= expect(std::all_of(fp.values.cbegin(), fp.values.cend(), [](float v) { return v == 0.0f; }),
                         algorithm_name(algorithm) + " silence is all zero");
        }
        return ok;
    }

    bool test_stereo_is_downmixed() {
        const algo::FingerprintGenerator gen;
        const auto samples = make_sine(440, 1.0);

        AudioBuffer stereo;
        stereo.sample_rate = TestSampleRate;
        stereo.channels = 2;
        for (const float s : samples) {
            stereo.samples.push_back(s);
            stereo.samples.push_back(s);
        }

        return expect(gen.generate(stereo, Algorithm::Spectral) == gen.generate(mono(samples), Algorithm::Spectral),
                      "identical channels downmix to the mono signal");
    }

    bool test_rejects_unusable_audio() {
        const algo::FingerprintGenerator gen;
        bool ok = true;

        const auto throws_empty = [&gen](const AudioBuffer &audio) {
            try {
                gen.generate(audio, Algorithm::Spectral);
            } catch (const EmptyAudioError &) {
                return true;
            }
            return false;
        };
        const auto throws_decode = [&gen](const AudioBuffer &audio) {
            try {
                gen.generate(audio, Algorithm::Spectral);
            } catch (const DecodeError &) {
                return true;
            }
            return false;
        };

        ok &= expect(throws_empty(mono({})), "no samples is empty audio");
        ok &= expect(throws_empty(mono(std::vector<float>(10, 0.1f))), "10 samples is empty audio");
        ok &= expect(throws_decode(mono(make_sine(440, 1.0), 0)), "zero sample rate is a decode error");
        ok &= expect(throws_decode({{0.1f, 0.2f, 0.3f}, TestSampleRate, 2}), "truncated stereo is a decode error");
        ok &= expect(throws_decode({{0.1f, 0.2f}, TestSampleRate, 0}), "zero channels is a decode error");
        return ok;
    }

    bool test_algorithm_names() {
        bool ok = true;
        for (const auto algorithm : AllAlgorithms) {
            ok &= expect(parse_algorithm(algorithm_name(algorithm)) == algorithm, algorithm_name(algorithm) + " parses");
        }
        ok &= expect(parse_algorithm("chromaprint") == Algorithm::Chroma, "chromaprint alias");
        ok &= expect(parse_algorithm("audfprint") == Algorithm::Constellation, "audfprint alias");
        ok &= expect(!parse_algorithm("mfcc"), "unknown name");
        return ok;
    }

} // namespace

int main() {
    bool ok = true;
    ok &= test_lengths_are_fixed_per_algorithm();
    ok &= test_generation_is_deterministic();
    ok &= test_long_and_short_takes_are_comparable();
    ok &= test_spectral_is_volume_independent();
    ok &= test_chroma_folds_octaves();
    ok &= test_constellation_matches_clips();
    ok &= test_silence_gives_zero_vector();
    ok &= test_stereo_is_downmixed();
    ok &= test_rejects_unusable_audio();
    ok &= test_algorithm_names();

    if (!ok) {
        std::cerr << "Generator test failed.\n";
        return 1;
    }
    std::cout << "Generator test passed.\n";
    return 0;
}
