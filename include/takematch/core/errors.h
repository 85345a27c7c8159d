#pragma once

#include <stdexcept>
#include <string>

namespace takematch {

    /// Base of every error the engine reports.
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Audio samples could not be obtained from the source (corrupt, unsupported, missing).
    class DecodeError : public Error {
    public:
        using Error::Error;
    };

    /// Decoded audio has effectively zero duration.
    class EmptyAudioError : public Error {
    public:
        using Error::Error;
    };

    /// Two fingerprints were produced by different algorithms (or differ in length).
    class AlgorithmMismatchError : public Error {
    public:
        using Error::Error;
    };

    /// Caller passed an unusable argument, e.g. an empty target fingerprint.
    class InvalidInputError : public Error {
    public:
        using Error::Error;
    };

    class ConfigError : public Error {
    public:
        using Error::Error;
    };

} // takematch
