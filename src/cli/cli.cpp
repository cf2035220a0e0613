#include "cli.hpp"

#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>

#include "Advisor/Advisor.hpp"
#include "Jigsaw/Jigsaw.hpp"
#include "Manifest/Manifest.hpp"
#include "errors/errors.hpp"
#include "fsUtils/fsUtils.hpp"
#include "logger/Mylogger.hpp"

namespace fs = std::filesystem;

namespace jigsaw::cli
{
    namespace
    {
        const char *kKeyFileExtension = ".jgk";
        const char *kReportExtension = ".jkd";

        std::uint64_t parseUnsigned(const std::string &key, const std::string &value)
        {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
            {
                throw InvalidParameter(key, "must be a non-negative integer, got '" + value + "'");
            }
            try
            {
                return std::stoull(value);
            }
            catch (const std::out_of_range &)
            {
                throw InvalidParameter(key, "is out of range: " + value);
            }
        }

        std::uint64_t configUnsigned(const std::string &key, const json &config, std::uint64_t fallback)
        {
            std::int64_t value = ConfigReader::get_config_value(key, config, static_cast<std::int64_t>(fallback));
            if (value < 0)
            {
                throw InvalidParameter(key, "must not be negative in the config file");
            }
            return static_cast<std::uint64_t>(value);
        }

        std::uint64_t setting(const CommandLine &cmd, const json &config, const std::string &key, std::uint64_t fallback)
        {
            if (cmd.has(key))
                return parseUnsigned(key, cmd.get(key));
            return configUnsigned(key, config, fallback);
        }

        int toInt(const std::string &key, std::uint64_t value)
        {
            if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            {
                throw InvalidParameter(key, "is out of range: " + std::to_string(value));
            }
            return static_cast<int>(value);
        }

        std::string reportText(const DecodeReport &report)
        {
            std::ostringstream out;
            out << report.fragments << " Jigsaw files processed\n";
            out << "Expected number of bytes: " << report.expected_bytes << "\n";
            out << "Actual number of bytes  : " << report.actual_bytes << "\n";
            if (!report.checksums.empty())
            {
                out << "File Hashes (Decrypted File vs Original Unencrypted File)\n";
                for (const auto &c : report.checksums)
                {
                    out << c.algorithm << ": " << c.actual << "\n";
                    out << std::string(c.algorithm.size(), ' ') << "  vs " << c.expected
                        << (c.matches() ? "" : "  MISMATCH") << "\n";
                }
            }
            return out.str();
        }
    }

    std::string CommandLine::get(const std::string &key, const std::string &fallback) const
    {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }

    CommandLine parseArguments(int argc, const char *const argv[])
    {
        CommandLine cmd;
        int i = 1;
        while (i < argc)
        {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) == 0)
            {
                std::string body = arg.substr(2);
                auto eq = body.find('=');
                if (body.empty() || eq == 0)
                {
                    throw InvalidParameter(arg, "is not a valid option");
                }
                if (eq != std::string::npos)
                {
                    cmd.options[body.substr(0, eq)] = body.substr(eq + 1);
                    ++i;
                }
                else if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0)
                {
                    cmd.options[body] = argv[i + 1];
                    i += 2;
                }
                else
                {
                    // Bare flag, e.g. --help
                    cmd.options[body] = "";
                    ++i;
                }
            }
            else if (cmd.command.empty())
            {
                cmd.command = arg;
                ++i;
            }
            else
            {
                throw InvalidParameter(arg, "is an unexpected argument");
            }
        }
        return cmd;
    }

    Settings resolveSettings(const CommandLine &cmd, const json &config)
    {
        Settings s;

        // Anything but "uneven" means even.
        std::string slicer = cmd.has("slicer") ? cmd.get("slicer")
                                               : ConfigReader::get_config_string("slicer", config, toString(s.slicer));
        s.slicer = parseSlicerKind(slicer).value_or(SlicerKind::Even);

        s.blocksize = setting(cmd, config, "blocksize", s.blocksize);
        s.filenamelength = setting(cmd, config, "filenamelength", s.filenamelength);
        s.hashlength = setting(cmd, config, "hashlength", s.hashlength);
        s.version = toInt("version", setting(cmd, config, "version", s.version));
        s.verbose = toInt("verbose", setting(cmd, config, "verbose", s.verbose));
        s.threads = setting(cmd, config, "threads", s.threads);
        s.log_file = cmd.has("log_file") ? cmd.get("log_file")
                                         : ConfigReader::get_config_string("log_file", config, s.log_file);
        if (cmd.has("seed"))
        {
            s.seed = parseUnsigned("seed", cmd.get("seed"));
        }
        return s;
    }

    std::string usage(const std::string &program)
    {
        std::ostringstream out;
        out << "Usage:\n"
            << "  " << program << " encrypt --filename=<file> [--slicer=even|uneven] [--blocksize=32768]\n"
            << "        [--filenamelength=30] [--hashlength=16] [--version=1] [--verbose=2]\n"
            << "        [--output_dir=<dir>] [--threads=1] [--seed=<n>] [--config=<json>]\n"
            << "  " << program << " decrypt --keyfilename=<file.jgk> [--outputfile=<file>]\n"
            << "        [--encrypt_dir=<dir>] [--threads=1] [--verbose=2] [--config=<json>]\n"
            << "  " << program << " obs --filename=<file>\n";
        return out.str();
    }

    int runEncrypt(const CommandLine &cmd, const Settings &settings)
    {
        if (!cmd.has("filename"))
        {
            std::cerr << "encrypt: missing --filename\n";
            return kExitUsage;
        }

        fs::path filename = fs::absolute(cmd.get("filename"));
        fs::path output_dir = cmd.has("output_dir") ? fs::absolute(cmd.get("output_dir")) : filename.parent_path();

        MyLogger::info("Encrypting file: " + filename.string());
        MyLogger::info("... onto output directory: " + output_dir.string());
        fsUtils::ensureDirectoryExists(output_dir);

        EncodeOptions options;
        options.slicer = settings.slicer;
        options.blocksize = settings.blocksize;
        options.filenamelength = settings.filenamelength;
        options.hashlength = settings.hashlength;
        options.version = settings.version;
        options.threads = settings.threads;
        options.original_filename = filename.filename().string();
        options.reserved_names = fsUtils::listFileNames(output_dir);
        validate(options);

        Bytes source = fsUtils::readBinaryFile(filename);
        Rng rng = settings.seed ? Rng(*settings.seed) : Rng::fromEntropy();
        MyLogger::debug("Random seed: " + std::to_string(rng.seed()));

        EncodeResult result = encode(source, options, rng);
        std::string key_text = ManifestCodec::encode(result.manifest);

        for (const auto &fragment : result.fragments)
        {
            fsUtils::writeBinaryFile(output_dir / fragment.name, fragment.bytes);
        }

        fs::path key_file = output_dir / (options.original_filename + kKeyFileExtension);
        MyLogger::info("Writing key file: " + key_file.string());
        fsUtils::writeTextFile(key_file, key_text);

        MyLogger::info(std::to_string(result.fragments.size()) + " blocks processed");
        MyLogger::info("Encrypting file, " + filename.string() + ", completed");
        return kExitOk;
    }

    int runDecrypt(const CommandLine &cmd, const Settings &settings)
    {
        if (!cmd.has("keyfilename"))
        {
            std::cerr << "decrypt: missing --keyfilename\n";
            return kExitUsage;
        }

        fs::path key_file = fs::absolute(cmd.get("keyfilename"));
        MyLogger::info("Decrypting file using keyfile: " + key_file.string());

        Manifest manifest = ManifestCodec::decode(fsUtils::readTextFile(key_file));

        fs::path encrypt_dir = cmd.has("encrypt_dir") ? fs::absolute(cmd.get("encrypt_dir")) : key_file.parent_path();
        fs::path output_file;
        if (!cmd.has("outputfile"))
        {
            output_file = encrypt_dir / fs::path(manifest.original_filename).filename();
        }
        else
        {
            fs::path given = cmd.get("outputfile");
            output_file = given.has_parent_path() ? fs::absolute(given) : encrypt_dir / given;
        }
        MyLogger::info("... Directory of encrypted files (input): " + encrypt_dir.string());
        MyLogger::info("... Decrypted file name (output): " + output_file.string());

        Bytes output = decode(manifest, fsUtils::directoryLookup(encrypt_dir), settings.threads);

        if (output_file.has_parent_path())
        {
            fsUtils::ensureDirectoryExists(output_file.parent_path());
        }
        fsUtils::writeBinaryFile(output_file, output);

        DecodeReport report = compareChecksums(manifest, output);
        fs::path report_file = output_file;
        report_file += kReportExtension;
        fsUtils::writeTextFile(report_file, reportText(report));

        for (const auto &c : report.checksums)
        {
            MyLogger::debug(c.algorithm + ": " + c.actual + " vs " + c.expected);
        }
        if (!report.ok())
        {
            MyLogger::error("Whole-file checksums do not match the key file; see " + report_file.string());
            return kExitChecksumMismatch;
        }

        MyLogger::info(std::to_string(report.fragments) + " Jigsaw files processed, " +
                       std::to_string(report.actual_bytes) + " bytes written");
        MyLogger::info("Decryption completed");
        return kExitOk;
    }

    int runObs(const CommandLine &cmd)
    {
        if (!cmd.has("filename"))
        {
            std::cerr << "obs: missing --filename\n";
            return kExitUsage;
        }

        fs::path filename = fs::absolute(cmd.get("filename"));
        std::uintmax_t size = fs::file_size(filename);
        advisor::Advice advice = advisor::sufficientBlockSize(size);

        std::cout << "Size of " << filename.string() << " is " << size << " bytes\n";
        std::cout << "Minimum block size to reach AES-256 is " << advice.blocksize
                  << " (" << advice.fragments << " fragments)\n";
        if (advice.blocksize == 0)
        {
            MyLogger::warning("File is smaller than " + std::to_string(advice.fragments) +
                              " bytes; no block size reaches the AES-256 key space");
        }
        return kExitOk;
    }

    int run(int argc, const char *const argv[])
    {
        const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "jigsaw";

        try
        {
            CommandLine cmd = parseArguments(argc, argv);
            if (cmd.command.empty() || cmd.command == "help" || cmd.has("help"))
            {
                std::cout << usage(program);
                return cmd.command.empty() && !cmd.has("help") ? kExitUsage : kExitOk;
            }

            json config = json::object();
            if (cmd.has("config"))
            {
                config = ConfigReader::load(cmd.get("config"));
            }
            Settings settings = resolveSettings(cmd, config);
            MyLogger::init(MyLogger::levelFromVerbosity(settings.verbose), settings.log_file);

            if (cmd.command == "encrypt")
                return runEncrypt(cmd, settings);
            if (cmd.command == "decrypt")
                return runDecrypt(cmd, settings);
            if (cmd.command == "obs")
                return runObs(cmd);

            std::cerr << "Unknown command: " << cmd.command << "\n"
                      << usage(program);
            return kExitUsage;
        }
        catch (const JigsawError &e)
        {
            MyLogger::error(e.what());
            return kExitFailure;
        }
        catch (const std::exception &e)
        {
            MyLogger::error(std::string("Error: ") + e.what());
            return kExitFailure;
        }
    }
}
