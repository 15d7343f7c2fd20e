#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace JsonDemux::StreamCat
{
    struct ProgramOptions
    {
        std::optional<std::string> url;
        std::optional<std::string> data;
        std::optional<std::string> dataFile;
        std::optional<std::string> token;
        std::optional<std::string> tokenFile;
        std::optional<std::string> project;
        std::vector<std::string> headers;
        std::string method = "POST";
        std::optional<std::string> policy;
        std::optional<std::size_t> maxPending;
        std::optional<int> timeout;
        std::optional<std::string> logLevel;
        std::optional<std::string> replay;
        std::size_t chunkSize = 4096;
        bool insecure = false;
        bool pretty = false;
        bool saveConfig = false;

        /// Set when --help was given, holds the usage text.
        std::optional<std::string> help;
    };

    /**
     * Throws std::invalid_argument for unknown options, malformed values and contradicting options.
     */
    ProgramOptions parseProgramOptions(int argc, char** argv);
}
