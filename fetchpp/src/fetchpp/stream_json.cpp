#include <fetchpp/stream_json.hpp>
#include <fetchpp/http_chunk_source.hpp>
#include <fetchpp/stream_reader.hpp>

#include <boost/asio/io_context.hpp>

#include <optional>

namespace JsonDemux
{
    StreamStatistics
    streamJson(StreamRequest const& request, DemuxOptions const& options, std::function<void(json const&)> const& onValue)
    {
        boost::asio::io_context context;

        auto source = std::make_shared<HttpChunkSource>(context.get_executor(), request);
        auto reader = std::make_shared<StreamReader>(source, options, onValue);

        std::optional<StreamError> failure;
        StreamStatistics result;
        reader->start([&failure, &result](std::optional<StreamError> const& error, StreamStatistics const& statistics) {
            failure = error;
            result = statistics;
        });

        context.run();

        if (failure)
            throw StreamFailure{*failure};
        return result;
    }
}
