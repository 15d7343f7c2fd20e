#include <streamcat/config.hpp>
#include <streamcat/program_options.hpp>

#include <fetchpp/http_chunk_source.hpp>
#include <fetchpp/replay_chunk_source.hpp>
#include <fetchpp/stream_reader.hpp>
#include <sharedpp/load_home_file.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cctype>
#include <csignal>
#include <iostream>
#include <optional>

namespace
{
    constexpr static auto ExitSuccess = 0;
    constexpr static auto ExitStreamFailed = 1;
    constexpr static auto ExitUsage = 2;

    void setupLogging()
    {
        using namespace JsonDemux;

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        sinks.push_back(
            std::make_shared<spdlog::sinks::daily_file_sink_mt>((getHomePath() / "logs/log").string(), 23, 59));
        auto combined_logger = std::make_shared<spdlog::logger>("streamcat", begin(sinks), end(sinks));
        spdlog::set_default_logger(combined_logger);
        spdlog::flush_on(spdlog::level::warn);
    }

    std::string trimTrailingWhitespace(std::string text)
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.pop_back();
        return text;
    }

    JsonDemux::StreamCat::Config
    mergeConfig(JsonDemux::StreamCat::Config config, JsonDemux::StreamCat::ProgramOptions const& programOptions)
    {
        using namespace JsonDemux;

        if (programOptions.insecure)
            config.verifyPeer = false;
        if (programOptions.timeout)
            config.timeoutSeconds = *programOptions.timeout;
        if (programOptions.maxPending)
            config.maxPendingBytes = *programOptions.maxPending;
        if (programOptions.logLevel)
            config.logLevel = *programOptions.logLevel;
        if (programOptions.policy)
        {
            const auto policy = parseFailurePolicyFromString(*programOptions.policy);
            if (!policy)
                throw std::invalid_argument("--policy must be 'drop' or 'keep'.");
            config.parseFailurePolicy = *policy;
        }
        return config;
    }

    JsonDemux::StreamRequest
    makeRequest(JsonDemux::StreamCat::Config const& config, JsonDemux::StreamCat::ProgramOptions const& programOptions)
    {
        using namespace JsonDemux;

        StreamRequest request{
            .url = programOptions.url.value_or(""),
            .method = programOptions.method,
            .timeout = std::chrono::seconds{config.timeoutSeconds},
            .verifyPeer = config.verifyPeer,
            .userAgent = config.userAgent,
        };

        if (programOptions.data)
            request.body = *programOptions.data;
        else if (programOptions.dataFile)
            request.body = loadTextFile(*programOptions.dataFile);

        if (programOptions.token)
            request.bearerToken = *programOptions.token;
        else if (programOptions.tokenFile)
            request.bearerToken = trimTrailingWhitespace(loadTextFile(*programOptions.tokenFile));

        request.quotaProject = programOptions.project;

        for (auto const& header : programOptions.headers)
            request.headers.push_back(parseHeaderLine(header));

        return request;
    }
}

int main(int argc, char** argv)
{
    using namespace JsonDemux;
    using namespace JsonDemux::StreamCat;

    ProgramOptions programOptions;
    try
    {
        programOptions = parseProgramOptions(argc, argv);
    }
    catch (std::invalid_argument const& exc)
    {
        std::cerr << "streamcat: " << exc.what() << "\nTry 'streamcat --help'.\n";
        return ExitUsage;
    }

    if (programOptions.help)
    {
        std::cout << *programOptions.help << "\n";
        return ExitSuccess;
    }

    setupHome();
    setupLogging();

    std::shared_ptr<ChunkSource> source;
    std::shared_ptr<StreamReader> reader;
    boost::asio::io_context context;
    std::optional<StreamError> failure;
    {
        Config config;
        StreamRequest request;
        try
        {
            config = mergeConfig(loadConfig(), programOptions);
            spdlog::set_level(spdlog::level::from_str(config.logLevel));

            request = makeRequest(config, programOptions);
            if (programOptions.saveConfig)
            {
                saveConfig(config);
                spdlog::info("Configuration saved to '{}'.", getHomePath().string());
            }

            if (programOptions.replay)
                source = std::make_shared<ReplayChunkSource>(
                    context.get_executor(), loadTextFile(*programOptions.replay), programOptions.chunkSize);
            else
                source = std::make_shared<HttpChunkSource>(context.get_executor(), request);
        }
        catch (std::exception const& exc)
        {
            spdlog::error("{}", exc.what());
            std::cerr << "streamcat: " << exc.what() << "\n";
            return ExitUsage;
        }

        if (!config.verifyPeer)
            spdlog::warn("Certificate verification is disabled! This is only for testing purposes!");

        reader = std::make_shared<StreamReader>(
            source,
            DemuxOptions{
                .parseFailurePolicy = config.parseFailurePolicy,
                .maxPendingBytes = config.maxPendingBytes,
                .streamName = "streamcat",
            },
            [indent = programOptions.pretty ? 2 : -1](json const& value) {
                std::cout << value.dump(indent) << std::endl;
            });
    }

    boost::asio::signal_set signals{context, SIGINT, SIGTERM};
    signals.async_wait([weak = std::weak_ptr<StreamReader>{reader}](boost::system::error_code const& ec, int signal) {
        if (ec)
            return;

        spdlog::info("Received signal {}, stopping.", signal);
        if (auto reader = weak.lock(); reader)
            reader->cancel();
    });

    reader->start([&failure, &signals](std::optional<StreamError> const& error, StreamStatistics const&) {
        failure = error;
        signals.cancel();
    });

    context.run();

    reader.reset();
    source.reset();
    spdlog::shutdown();

    if (failure)
    {
        std::cerr << "streamcat: " << failure->toString() << "\n";
        return ExitStreamFailed;
    }
    return ExitSuccess;
}
