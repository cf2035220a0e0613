#ifndef JIGSAW_LOAD_CONFIG_HPP
#define JIGSAW_LOAD_CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace jigsaw
{
    using json = nlohmann::json;

    namespace ConfigReader
    {
        json load(const std::string &filepath);

        // Typed lookups. A missing key yields `fallback`; a key of the wrong
        // type is logged and also yields `fallback`.
        std::int64_t get_config_value(const std::string &key, const json &j, std::int64_t fallback);
        std::string get_config_string(const std::string &key, const json &j, const std::string &fallback);
    }
}

#endif // JIGSAW_LOAD_CONFIG_HPP
