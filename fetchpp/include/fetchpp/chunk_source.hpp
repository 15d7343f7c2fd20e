#pragma once

#include <fetchpp/stream_error.hpp>

#include <functional>
#include <optional>
#include <string_view>

namespace JsonDemux
{
    /**
     * Asynchronous producer of the byte chunks of one response body.
     *
     * Every started operation calls its handler exactly once, also after cancel(), then with an error.
     * Only one operation may be outstanding at a time. Bytes passed to a read handler are only valid during
     * the call.
     */
    class ChunkSource
    {
      public:
        using OpenHandler = std::function<void(std::optional<StreamError> const& error)>;
        using ReadHandler =
            std::function<void(std::optional<StreamError> const& error, std::string_view bytes, bool done)>;

        virtual ~ChunkSource() = default;

        /**
         * Establishes the stream. Fails before any body byte is read if the request did not succeed.
         */
        virtual void open(OpenHandler handler) = 0;

        /**
         * Reads the next chunk. done is set together with the last bytes or on an empty read at the end.
         */
        virtual void readSome(ReadHandler handler) = 0;

        /**
         * Releases the underlying resource as soon as possible.
         */
        virtual void cancel() = 0;

        /**
         * Short description for log lines, e.g. the url.
         */
        virtual std::string describe() const = 0;
    };
}
