#include <streamcat/config.hpp>
#include <sharedpp/load_home_file.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace JsonDemux::StreamCat
{
    namespace detail
    {
#ifdef NDEBUG
        constexpr static auto inDev = false;
#else
        constexpr static auto inDev = true;
#endif
        constexpr static auto configFile = inDev ? "configDev.json" : "config.json";
    }

    void to_json(json& j, Config const& config)
    {
        j = json{
            {"verifyPeer", config.verifyPeer},
            {"timeoutSeconds", config.timeoutSeconds},
            {"parseFailurePolicy", config.parseFailurePolicy},
            {"maxPendingBytes", config.maxPendingBytes},
            {"userAgent", config.userAgent},
            {"logLevel", config.logLevel},
        };
    }
    void from_json(json const& j, Config& config)
    {
        const Config defaults{};
        config.verifyPeer = valueOr(j, "verifyPeer", defaults.verifyPeer);
        config.timeoutSeconds = valueOr(j, "timeoutSeconds", defaults.timeoutSeconds);
        config.maxPendingBytes = valueOr(j, "maxPendingBytes", defaults.maxPendingBytes);
        config.userAgent = valueOr(j, "userAgent", defaults.userAgent);
        config.logLevel = valueOr(j, "logLevel", defaults.logLevel);

        const auto policyName = valueOr(j, "parseFailurePolicy", std::string{toString(defaults.parseFailurePolicy)});
        const auto policy = parseFailurePolicyFromString(policyName);
        if (!policy)
            throw std::invalid_argument("Unknown parseFailurePolicy '" + policyName + "', expected 'drop' or 'keep'.");
        config.parseFailurePolicy = *policy;

        if (config.timeoutSeconds <= 0)
            throw std::invalid_argument("timeoutSeconds must be positive.");
    }

    Config loadConfig()
    {
        const auto configString = tryLoadHomeFile(detail::configFile);
        if (!configString)
        {
            spdlog::info("No {} in '{}', using defaults.", detail::configFile, getHomePath().string());
            return Config{};
        }

        try
        {
            return json::parse(*configString).get<Config>();
        }
        catch (json::exception const& exc)
        {
            throw std::runtime_error(std::string{"Cannot read "} + detail::configFile + ": " + exc.what());
        }
    }
    void saveConfig(Config const& config)
    {
        saveHomeFile(detail::configFile, json(config).dump(4));
    }
}
