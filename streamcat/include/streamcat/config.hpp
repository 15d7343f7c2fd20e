#pragma once

#include <demuxpp/demux_options.hpp>
#include <sharedpp/json.hpp>

#include <cstddef>
#include <string>

namespace JsonDemux::StreamCat
{
    struct Config
    {
        bool verifyPeer = true;
        int timeoutSeconds = 60;
        ParseFailurePolicy parseFailurePolicy = ParseFailurePolicy::DropAndResume;
        std::size_t maxPendingBytes = 0;
        std::string userAgent = "streamcat";
        std::string logLevel = "info";
    };

    void to_json(json& j, Config const& config);

    /// Absent members keep their defaults. Unknown policy names and wrongly typed members throw.
    void from_json(json const& j, Config& config);

    /**
     * Loads config.json (configDev.json in debug builds) from the home directory.
     * Returns the defaults if there is no such file, throws if it can not be parsed.
     */
    Config loadConfig();
    void saveConfig(Config const& config);
}
