#include <demuxpp/demux_options.hpp>

namespace JsonDemux
{
    std::string_view toString(ParseFailurePolicy policy)
    {
        switch (policy)
        {
            case ParseFailurePolicy::DropAndResume:
                return "drop";
            case ParseFailurePolicy::KeepBuffering:
                return "keep";
        }
        return "unknown";
    }

    std::optional<ParseFailurePolicy> parseFailurePolicyFromString(std::string_view name)
    {
        if (name == "drop")
            return ParseFailurePolicy::DropAndResume;
        if (name == "keep")
            return ParseFailurePolicy::KeepBuffering;
        return std::nullopt;
    }
}
