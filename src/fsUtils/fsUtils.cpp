#include "fsUtils.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "logger/Mylogger.hpp"

namespace fs = std::filesystem;

namespace jigsaw::fsUtils
{
    Bytes readBinaryFile(const fs::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            MyLogger::error("Failed to open file: " + path.string());
            throw std::runtime_error("Could not open file: " + path.string());
        }

        Bytes content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad())
        {
            throw std::runtime_error("Error reading file: " + path.string());
        }
        return content;
    }

    std::optional<Bytes> tryReadBinaryFile(const fs::path &path)
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            return std::nullopt;
        }
        return readBinaryFile(path);
    }

    void writeBinaryFile(const fs::path &path, const Bytes &content)
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            MyLogger::error("Failed to create file: " + path.string());
            throw std::runtime_error("Could not create file: " + path.string());
        }
        file.write(reinterpret_cast<const char *>(content.data()), static_cast<std::streamsize>(content.size()));
        file.close();
        if (!file)
        {
            throw std::runtime_error("Error writing file: " + path.string());
        }
    }

    std::string readTextFile(const fs::path &path)
    {
        Bytes content = readBinaryFile(path);
        return std::string(content.begin(), content.end());
    }

    void writeTextFile(const fs::path &path, const std::string &content)
    {
        writeBinaryFile(path, Bytes(content.begin(), content.end()));
    }

    bool ensureDirectoryExists(const fs::path &dir)
    {
        std::error_code ec;
        if (fs::is_directory(dir, ec))
        {
            return false;
        }
        if (!fs::create_directories(dir, ec) || ec)
        {
            throw std::runtime_error("Could not create directory " + dir.string() + ": " + ec.message());
        }
        MyLogger::info("Created directory: " + dir.string());
        return true;
    }

    std::set<std::string> listFileNames(const fs::path &dir)
    {
        std::set<std::string> names;
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
        {
            return names;
        }
        for (const auto &entry : fs::directory_iterator(dir))
        {
            if (entry.is_regular_file())
            {
                names.insert(entry.path().filename().string());
            }
        }
        return names;
    }

    FragmentLookup directoryLookup(const fs::path &dir)
    {
        return [dir](const std::string &name) -> std::optional<Bytes>
        {
            // Fragment names never contain separators; anything else is not ours to open.
            if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..")
            {
                return std::nullopt;
            }
            return tryReadBinaryFile(dir / name);
        };
    }
}
