#include <sharedpp/load_home_file.hpp>

#include <roar/filesystem/special_paths.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace JsonDemux
{
    std::string loadTextFile(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            throw std::runtime_error("Cannot load file "s + path.string());
        std::stringstream sstr;
        sstr << reader.rdbuf();
        return sstr.str();
    }
    std::string loadHomeFile(std::filesystem::path const& subpath)
    {
        const auto path = getHomePath() / subpath;
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            throw std::runtime_error("Cannot load home file "s + path.string());
        std::stringstream sstr;
        sstr << reader.rdbuf();
        return sstr.str();
    }
    std::optional<std::string> tryLoadHomeFile(std::filesystem::path const& subpath)
    {
        if (!std::filesystem::exists(getHomePath() / subpath))
            return std::nullopt;
        return loadHomeFile(subpath);
    }
    void saveHomeFile(std::filesystem::path const& subpath, std::string const& data)
    {
        const auto path = getHomePath() / subpath;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream writer{path, std::ios_base::binary};
        if (!writer.good())
            throw std::runtime_error("Cannot open home file for writing "s + path.string());
        writer.write(data.c_str(), static_cast<std::streamsize>(data.size()));
    }
    std::filesystem::path getHomePath()
    {
        return Roar::resolvePath("~/.jsondemux");
    }
    void setupHome()
    {
        const auto homePath = getHomePath();
        if (!std::filesystem::exists(homePath / "logs"))
            std::filesystem::create_directories(homePath / "logs");
    }
} // namespace JsonDemux
