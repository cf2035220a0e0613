#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "load_config/load_config.hpp"
#include "Slicer/Slicer.hpp"

namespace jigsaw::cli
{
    enum ExitCode
    {
        kExitOk = 0,
        kExitUsage = 1,
        kExitFailure = 2,
        kExitChecksumMismatch = 3
    };

    struct CommandLine
    {
        std::string command;
        std::map<std::string, std::string> options;

        bool has(const std::string &key) const { return options.count(key) > 0; }
        std::string get(const std::string &key, const std::string &fallback = "") const;
    };

    // Defaults are the ones the tool has always shipped with.
    struct Settings
    {
        SlicerKind slicer = SlicerKind::Even;
        std::size_t blocksize = 32768;
        std::size_t filenamelength = 30;
        std::size_t hashlength = 16;
        int version = 1;
        int verbose = 2;
        std::size_t threads = 1;
        std::string log_file;
        std::optional<std::uint64_t> seed;
    };

    // Accepts `--key=value` and `--key value`; the first bare word is the command.
    // Throws InvalidParameter on anything else.
    CommandLine parseArguments(int argc, const char *const argv[]);

    // Command line beats config file beats built-in default.
    Settings resolveSettings(const CommandLine &cmd, const json &config);

    std::string usage(const std::string &program);

    int runEncrypt(const CommandLine &cmd, const Settings &settings);
    int runDecrypt(const CommandLine &cmd, const Settings &settings);
    int runObs(const CommandLine &cmd);

    int run(int argc, const char *const argv[]);
}
