#ifndef MKWL_UTIL_HPP
#define MKWL_UTIL_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace util
{
    // Lowercase hex, two characters per byte
    std::string to_hex(const std::vector<unsigned char> &vec);
    std::vector<unsigned char> from_hex(const std::string &hex);

    std::vector<unsigned char> to_bytes(const std::string &str);
    std::vector<unsigned char> concat(const std::vector<unsigned char> &left, const std::vector<unsigned char> &right);

    json json_from_file(const std::string &fname);

    // config[key] or fallback when absent, std::invalid_argument on a type mismatch
    template <typename T>
    T config_entry(const json &config, const std::string &key, const T &fallback)
    {
        if (!config.contains(key))
        {
            return fallback;
        }
        try
        {
            return config.at(key).get<T>();
        }
        catch (const json::exception &e)
        {
            throw std::invalid_argument("Invalid config value " + key + ": " + e.what());
        }
    }

    // config[section][key] or fallback when absent, std::invalid_argument on a type mismatch
    template <typename T>
    T config_value(const json &config, const std::string &section, const std::string &key, const T &fallback)
    {
        if (!config.contains(section))
        {
            return fallback;
        }
        if (!config.at(section).is_object())
        {
            throw std::invalid_argument("Invalid config section " + section);
        }
        return config_entry<T>(config.at(section), key, fallback);
    }
};

#endif
