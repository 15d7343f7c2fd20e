#pragma once

#include <sharedpp/json.hpp>
#include <sharedpp/memory_unit.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace JsonDemux
{
    /**
     * What to do when the text between two depth zero boundaries is not valid json.
     */
    enum class ParseFailurePolicy
    {
        /// Log, throw the buffered text away and continue with the next object.
        DropAndResume,
        /// Keep the buffered text and retry at the next depth zero boundary.
        KeepBuffering
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(
        ParseFailurePolicy,
        {
            {ParseFailurePolicy::DropAndResume, "drop"},
            {ParseFailurePolicy::KeepBuffering, "keep"},
        })

    std::string_view toString(ParseFailurePolicy policy);
    std::optional<ParseFailurePolicy> parseFailurePolicyFromString(std::string_view name);

    struct DemuxOptions
    {
        ParseFailurePolicy parseFailurePolicy = ParseFailurePolicy::DropAndResume;

        /// Upper bound for text buffered without a complete object. 0 means unbounded.
        std::size_t maxPendingBytes = 0;

        /// Prefix for log lines of this stream.
        std::string streamName = "stream";
    };

    struct StreamStatistics
    {
        MemoryUnit bytesReceived{};
        MemoryUnit textDecoded{};
        std::size_t valuesDispatched = 0;
        std::size_t decodeAnomalies = 0;
        std::size_t parseAnomalies = 0;
        MemoryUnit bytesDiscarded{};
    };
}
