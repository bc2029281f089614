#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

#include "worldgen/block_registry.h"

namespace worldgen::detail
{

inline std::string requireString(const toml::table& table, std::string_view key, const std::filesystem::path& filePath)
{
    if (auto value = table[key].value<std::string>())
    {
        if (!value->empty())
        {
            return *value;
        }
    }

    std::ostringstream oss;
    oss << "Missing or empty string field '" << key << "' in " << filePath;
    throw std::runtime_error(oss.str());
}

inline float requireFloat(const toml::table& table, std::string_view key, const std::filesystem::path& filePath)
{
    if (auto value = table[key].value<double>())
    {
        return static_cast<float>(*value);
    }

    std::ostringstream oss;
    oss << "Missing floating-point field '" << key << "' in " << filePath;
    throw std::runtime_error(oss.str());
}

inline int requireInt(const toml::table& table, std::string_view key, const std::filesystem::path& filePath)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        return static_cast<int>(*value);
    }

    std::ostringstream oss;
    oss << "Missing integer field '" << key << "' in " << filePath;
    throw std::runtime_error(oss.str());
}

inline std::optional<float> optionalFloat(const toml::table& table, std::string_view key)
{
    if (auto value = table[key].value<double>())
    {
        return static_cast<float>(*value);
    }
    return std::nullopt;
}

inline std::optional<int> optionalInt(const toml::table& table, std::string_view key)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        return static_cast<int>(*value);
    }
    return std::nullopt;
}

inline std::vector<std::string> readStringArray(const toml::table& table,
                                                std::string_view key,
                                                const std::filesystem::path& filePath)
{
    std::vector<std::string> values;
    const toml::array* array = table[key].as_array();
    if (!array)
    {
        return values;
    }

    for (const toml::node& node : *array)
    {
        auto value = node.value<std::string>();
        if (!value)
        {
            std::ostringstream oss;
            oss << "Field '" << key << "' in " << filePath << " must only contain strings";
            throw std::runtime_error(oss.str());
        }
        values.push_back(*value);
    }
    return values;
}

// Reads a two-element [min, max] float range.
inline void readRange(const toml::table& table,
                      std::string_view key,
                      float& minValue,
                      float& maxValue,
                      const std::filesystem::path& filePath)
{
    const toml::array* array = table[key].as_array();
    if (!array)
    {
        return;
    }

    auto low = array->size() == 2 ? (*array)[0].value<double>() : std::nullopt;
    auto high = array->size() == 2 ? (*array)[1].value<double>() : std::nullopt;
    if (!low || !high || *low > *high)
    {
        std::ostringstream oss;
        oss << "Field '" << key << "' in " << filePath << " must be an ascending [min, max] pair";
        throw std::runtime_error(oss.str());
    }
    minValue = static_cast<float>(*low);
    maxValue = static_cast<float>(*high);
}

inline BlockId resolveBlock(const BlockRegistry& blocks, const std::string& name, const std::filesystem::path& filePath)
{
    try
    {
        return blocks.idOf(name);
    }
    catch (const std::runtime_error& ex)
    {
        std::ostringstream oss;
        oss << ex.what() << " (referenced from " << filePath << ")";
        throw std::runtime_error(oss.str());
    }
}

// Sorted *.toml files in a directory; throws when the directory is missing.
inline std::vector<std::filesystem::path> listTomlFiles(const std::filesystem::path& directory, std::string_view what)
{
    namespace fs = std::filesystem;
    if (!fs::exists(directory))
    {
        std::ostringstream oss;
        oss << what << " directory '" << directory.string() << "' does not exist";
        throw std::runtime_error(oss.str());
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory))
    {
        if (!entry.is_regular_file())
        {
            continue;
        }
        const fs::path& path = entry.path();
        if (path.extension() == ".toml")
        {
            files.push_back(path);
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace worldgen::detail
