#include <streamcat/program_options.hpp>

#include <cxxopts.hpp>

#include <stdexcept>

namespace JsonDemux::StreamCat
{
    namespace
    {
        template <typename T>
        std::optional<T> optionalValue(cxxopts::ParseResult const& result, std::string const& name)
        {
            if (result.count(name) == 0)
                return std::nullopt;
            return result[name].as<T>();
        }
    }

    ProgramOptions parseProgramOptions(int argc, char** argv)
    {
        cxxopts::Options options(
            "streamcat", "Prints every json object of a streaming HTTP response as soon as it is complete.");

        // clang-format off
        options.add_options()
            ("u,url", "Endpoint to request.", cxxopts::value<std::string>())
            ("d,data", "Request body.", cxxopts::value<std::string>())
            ("data-file", "Read the request body from a file.", cxxopts::value<std::string>())
            ("t,token", "Bearer token.", cxxopts::value<std::string>())
            ("token-file", "Read the bearer token from a file.", cxxopts::value<std::string>())
            ("p,project", "Quota project sent as X-Goog-User-Project.", cxxopts::value<std::string>())
            ("H,header", "Additional header \"Name: value\", may be repeated.", cxxopts::value<std::vector<std::string>>())
            ("X,method", "HTTP method.", cxxopts::value<std::string>()->default_value("POST"))
            ("policy", "What to do with text that is not valid json: drop or keep.", cxxopts::value<std::string>())
            ("max-pending", "Discard buffered text beyond this many bytes, 0 for no limit.", cxxopts::value<std::size_t>())
            ("timeout", "Inactivity timeout in seconds.", cxxopts::value<int>())
            ("log-level", "trace, debug, info, warn, error or off.", cxxopts::value<std::string>())
            ("replay", "Read the body from a file instead of the network.", cxxopts::value<std::string>())
            ("chunk-size", "Chunk size used with --replay.", cxxopts::value<std::size_t>()->default_value("4096"))
            ("k,insecure", "Do not verify the server certificate.")
            ("pretty", "Indent printed values.")
            ("save-config", "Write the effective configuration to the home directory.")
            ("h,help", "Print usage.");
        // clang-format on

        const auto result = [&options, &argc, &argv]() {
            try
            {
                return options.parse(argc, argv);
            }
            catch (std::exception const& exc)
            {
                throw std::invalid_argument(exc.what());
            }
        }();

        ProgramOptions programOptions{
            .url = optionalValue<std::string>(result, "url"),
            .data = optionalValue<std::string>(result, "data"),
            .dataFile = optionalValue<std::string>(result, "data-file"),
            .token = optionalValue<std::string>(result, "token"),
            .tokenFile = optionalValue<std::string>(result, "token-file"),
            .project = optionalValue<std::string>(result, "project"),
            .headers = optionalValue<std::vector<std::string>>(result, "header").value_or(std::vector<std::string>{}),
            .method = result["method"].as<std::string>(),
            .policy = optionalValue<std::string>(result, "policy"),
            .maxPending = optionalValue<std::size_t>(result, "max-pending"),
            .timeout = optionalValue<int>(result, "timeout"),
            .logLevel = optionalValue<std::string>(result, "log-level"),
            .replay = optionalValue<std::string>(result, "replay"),
            .chunkSize = result["chunk-size"].as<std::size_t>(),
            .insecure = result.count("insecure") > 0,
            .pretty = result.count("pretty") > 0,
            .saveConfig = result.count("save-config") > 0,
            .help = std::nullopt,
        };

        if (result.count("help") > 0)
        {
            programOptions.help = options.help();
            return programOptions;
        }

        if (!programOptions.url && !programOptions.replay)
            throw std::invalid_argument("Either --url or --replay is required.");
        if (programOptions.url && programOptions.replay)
            throw std::invalid_argument("--url and --replay can not be combined.");
        if (programOptions.data && programOptions.dataFile)
            throw std::invalid_argument("--data and --data-file can not be combined.");
        if (programOptions.token && programOptions.tokenFile)
            throw std::invalid_argument("--token and --token-file can not be combined.");
        if (programOptions.chunkSize == 0)
            throw std::invalid_argument("--chunk-size must be positive.");
        if (programOptions.timeout && *programOptions.timeout <= 0)
            throw std::invalid_argument("--timeout must be positive.");

        return programOptions;
    }
}
