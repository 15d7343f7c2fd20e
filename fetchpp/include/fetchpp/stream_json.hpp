#pragma once

#include <fetchpp/stream_error.hpp>
#include <fetchpp/stream_request.hpp>

#include <demuxpp/demux_options.hpp>
#include <sharedpp/json.hpp>

#include <functional>

namespace JsonDemux
{
    /**
     * Performs the request and calls onValue for every json object of the response body, in order.
     * Blocks until the body ended. Runs its own io_context on the calling thread.
     *
     * Throws StreamFailure when the transport fails, and std::invalid_argument for a malformed request.
     * Exceptions thrown by onValue end the stream and are reported as StreamFailure of kind Consumer.
     */
    StreamStatistics
    streamJson(StreamRequest const& request, DemuxOptions const& options, std::function<void(json const&)> const& onValue);
}
