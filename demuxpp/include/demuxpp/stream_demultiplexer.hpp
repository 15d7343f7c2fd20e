#pragma once

#include <demuxpp/demux_options.hpp>
#include <demuxpp/dispatcher.hpp>
#include <demuxpp/object_scanner.hpp>
#include <demuxpp/utf8_decoder.hpp>

#include <sharedpp/json.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace JsonDemux
{
    /**
     * Turns the raw bytes of one response body into a sequence of json values.
     *
     * Bytes go through the UTF-8 decoder, then the object scanner. Every complete top level object is parsed
     * and dispatched synchronously from within feed(), in stream order. Framing does not matter: newline
     * delimited, concatenated, pretty printed or wrapped in an array, split at any byte.
     * One instance per stream, it is not thread safe.
     */
    class StreamDemultiplexer
    {
      public:
        using ValueCallback = std::function<void(json const&)>;

        explicit StreamDemultiplexer(DemuxOptions options = {});
        StreamDemultiplexer(DemuxOptions options, ValueCallback onValue);
        ~StreamDemultiplexer();
        StreamDemultiplexer(StreamDemultiplexer const&) = delete;
        StreamDemultiplexer(StreamDemultiplexer&&) = delete;
        StreamDemultiplexer& operator=(StreamDemultiplexer const&) = delete;
        StreamDemultiplexer& operator=(StreamDemultiplexer&&) = delete;

        [[nodiscard]] std::shared_ptr<Subscription> subscribe(Subscription::FunctionType const& callback);
        [[nodiscard]] std::shared_ptr<Subscription> listen(ValueCallback const& callback);

        /**
         * Decodes and scans a chunk of bytes. Throws std::logic_error after finish().
         * Exceptions of subscribers propagate.
         */
        void feed(std::string_view bytes);

        /**
         * End of stream. Flushes the decoder and drops an unterminated trailing object.
         * Calling it again has no effect.
         */
        void finish();

        bool finished() const;
        StreamStatistics const& statistics() const;
        ScanState const& scanState() const;
        std::string_view pendingText() const;
        DemuxOptions const& options() const;

      private:
        void scanText(std::string_view text);
        bool onCandidate(std::string_view candidate);

      private:
        DemuxOptions options_;
        Utf8Decoder decoder_;
        ObjectScanner scanner_;
        Dispatcher dispatcher_;
        std::shared_ptr<Subscription> ownSubscription_;
        StreamStatistics statistics_;
        bool finished_;
    };
}
