#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace JsonDemux
{
    void setupHome();
    std::string loadHomeFile(std::filesystem::path const& subpath);
    std::optional<std::string> tryLoadHomeFile(std::filesystem::path const& subpath);
    void saveHomeFile(std::filesystem::path const& subpath, std::string const& data);
    std::filesystem::path getHomePath();
    std::string loadTextFile(std::filesystem::path const& path);
} // namespace JsonDemux
