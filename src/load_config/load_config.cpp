#include "load_config.hpp"

#include <fstream>
#include <stdexcept>

#include "logger/Mylogger.hpp"

namespace jigsaw::ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            if (!j.is_object())
            {
                throw std::runtime_error("Config file is not a JSON object: " + filepath);
            }
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            MyLogger::debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
            throw std::runtime_error("Could not parse config file: " + filepath);
        }
    }

    std::int64_t get_config_value(const std::string &key, const json &j, std::int64_t fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            return fallback;
        }
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            return fallback;
        }
        return j[key].get<std::int64_t>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            return fallback;
        }
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            return fallback;
        }
        return j[key].get<std::string>();
    }
}
