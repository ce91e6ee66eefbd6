#include "util/util.hpp"
#include <iomanip>
#include <vector>
#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    int hex_value(char c)
    {
        if (c >= '0' && c <= '9')
        {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f')
        {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F')
        {
            return c - 'A' + 10;
        }
        return -1;
    }
}

std::string util::to_hex(const std::vector<unsigned char> &vec)
{
    std::stringstream ss;
    for (const unsigned char &byte : vec)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

std::vector<unsigned char> util::from_hex(const std::string &hex)
{
    std::size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    {
        start = 2;
    }

    if ((hex.size() - start) & 1)
    {
        throw std::invalid_argument("Hex string has odd length.");
    }

    std::vector<unsigned char> res;
    res.reserve((hex.size() - start) / 2);
    for (std::size_t i = start; i < hex.size(); i += 2)
    {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            throw std::invalid_argument("Invalid character in hex string.");
        }
        res.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return res;
}

std::vector<unsigned char> util::to_bytes(const std::string &str)
{
    return std::vector<unsigned char>(str.begin(), str.end());
}

std::vector<unsigned char> util::concat(const std::vector<unsigned char> &left, const std::vector<unsigned char> &right)
{
    std::vector<unsigned char> res(left);
    res.insert(res.end(), right.begin(), right.end());
    return res;
}

json util::json_from_file(const std::string &fname)
{
    std::ifstream f(fname);
    if (!f.is_open())
    {
        throw std::invalid_argument("Could not open json file: " + fname);
    }

    json res;
    try
    {
        f >> res;
    }
    catch (const json::parse_error &e)
    {
        throw std::invalid_argument(std::string("Could not parse json file: ") + e.what());
    }

    f.close();
    return res;
}
