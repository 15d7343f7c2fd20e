#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace JsonDemux
{
    struct Url
    {
        std::string scheme;
        std::string host;
        std::string port;
        std::string target;

        bool secure() const;

        /// Value for the Host header, the port is omitted when it is the scheme default.
        std::string hostHeader() const;
        std::string toString() const;
    };

    /**
     * Splits http(s)://host[:port][/path][?query]. Throws std::invalid_argument for anything else.
     */
    Url parseUrl(std::string const& url);

    struct StreamRequest
    {
        std::string url;
        std::string method = "POST";
        std::vector<std::pair<std::string, std::string>> headers = {};
        std::string body = {};

        /// Sent as "Authorization: Bearer <token>" when set.
        std::optional<std::string> bearerToken = std::nullopt;

        /// Project billed for the call, sent as X-Goog-User-Project.
        std::optional<std::string> quotaProject = std::nullopt;

        /// Inactivity limit for every network operation.
        std::chrono::seconds timeout = std::chrono::seconds{60};
        bool verifyPeer = true;
        std::string userAgent = "jsondemux";
    };

    /**
     * Parses "Name: value" into its parts. Throws std::invalid_argument if there is no colon or no name.
     */
    std::pair<std::string, std::string> parseHeaderLine(std::string const& line);
}
