#include <fetchpp/stream_request.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace std::string_literals;

namespace JsonDemux
{
    namespace
    {
        std::string trim(std::string const& text)
        {
            const auto isSpace = [](unsigned char c) {
                return std::isspace(c) != 0;
            };
            const auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
            const auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
            if (begin >= end)
                return {};
            return std::string{begin, end};
        }

        std::string toLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return text;
        }
    }
    //#####################################################################################################################
    bool Url::secure() const
    {
        return scheme == "https";
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string Url::hostHeader() const
    {
        const auto bracketed = host.find(':') == std::string::npos ? host : "[" + host + "]";
        const bool defaultPort = (secure() && port == "443") || (!secure() && port == "80");
        if (defaultPort)
            return bracketed;
        return bracketed + ":" + port;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string Url::toString() const
    {
        return scheme + "://" + hostHeader() + target;
    }
    //---------------------------------------------------------------------------------------------------------------------
    Url parseUrl(std::string const& url)
    {
        const auto schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos)
            throw std::invalid_argument("Url lacks a scheme: '"s + url + "'");

        Url result;
        result.scheme = toLower(url.substr(0, schemeEnd));
        if (result.scheme != "http" && result.scheme != "https")
            throw std::invalid_argument("Unsupported url scheme '"s + result.scheme + "', expected http or https.");

        const auto authorityBegin = schemeEnd + 3;
        const auto targetBegin = url.find_first_of("/?", authorityBegin);
        const auto authority = url.substr(
            authorityBegin, targetBegin == std::string::npos ? std::string::npos : targetBegin - authorityBegin);

        if (targetBegin == std::string::npos)
            result.target = "/";
        else if (url[targetBegin] == '?')
            result.target = "/" + url.substr(targetBegin);
        else
            result.target = url.substr(targetBegin);

        if (authority.find('@') != std::string::npos)
            throw std::invalid_argument("Credentials in urls are not supported, use a token instead.");

        // [v6::addr]:port or host:port
        std::string::size_type portSeparator = std::string::npos;
        if (!authority.empty() && authority.front() == '[')
        {
            const auto closing = authority.find(']');
            if (closing == std::string::npos)
                throw std::invalid_argument("Unterminated IPv6 address in url: '"s + url + "'");
            result.host = authority.substr(1, closing - 1);
            if (closing + 1 < authority.size())
            {
                if (authority[closing + 1] != ':')
                    throw std::invalid_argument("Malformed authority in url: '"s + url + "'");
                portSeparator = closing + 1;
            }
        }
        else
        {
            portSeparator = authority.rfind(':');
            result.host = authority.substr(0, portSeparator);
        }

        if (portSeparator != std::string::npos)
            result.port = authority.substr(portSeparator + 1);
        if (result.port.empty())
            result.port = result.secure() ? "443" : "80";

        if (result.host.empty())
            throw std::invalid_argument("Url lacks a host: '"s + url + "'");
        if (!std::all_of(result.port.begin(), result.port.end(), [](unsigned char c) {
                return std::isdigit(c);
            }))
            throw std::invalid_argument("Invalid port in url: '"s + url + "'");

        return result;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::pair<std::string, std::string> parseHeaderLine(std::string const& line)
    {
        const auto colon = line.find(':');
        if (colon == std::string::npos)
            throw std::invalid_argument("Header must look like 'Name: value', got '"s + line + "'");

        auto name = trim(line.substr(0, colon));
        if (name.empty())
            throw std::invalid_argument("Header name missing in '"s + line + "'");
        return {std::move(name), trim(line.substr(colon + 1))};
    }
    //#####################################################################################################################
}
