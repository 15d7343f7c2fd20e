#pragma once

#include <fetchpp/chunk_source.hpp>
#include <fetchpp/stream_error.hpp>

#include <demuxpp/stream_demultiplexer.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace JsonDemux
{
    /**
     * Read loop of one stream: opens the chunk source, then reads chunk after chunk and feeds each into its
     * own StreamDemultiplexer. A chunk is completely scanned and dispatched before the next read is issued.
     *
     * All callbacks run on the chunk source's executor. Handlers hold the reader weakly, destroying it ends
     * the stream without calling the completion handler.
     *
     * A consumer exception derived from std::exception completes the stream with a Consumer error. Anything
     * else thrown by the consumer leaves the executor's run() as is, no further read is issued and the stream
     * is not completed.
     */
    class StreamReader : public std::enable_shared_from_this<StreamReader>
    {
      public:
        using ValueCallback = StreamDemultiplexer::ValueCallback;
        using CompletionHandler =
            std::function<void(std::optional<StreamError> const& error, StreamStatistics const& statistics)>;

        StreamReader(std::shared_ptr<ChunkSource> source, DemuxOptions options, ValueCallback onValue);
        ~StreamReader();
        StreamReader(StreamReader const&) = delete;
        StreamReader(StreamReader&&) = delete;
        StreamReader& operator=(StreamReader const&) = delete;
        StreamReader& operator=(StreamReader&&) = delete;

        /**
         * Starts the stream. onComplete is called exactly once: without error at the end of the stream, with
         * the error otherwise. Values dispatched before an error stay valid.
         */
        void start(CompletionHandler onComplete);

        /**
         * Stops the stream and closes the transport. No value is delivered after this call returns, not
         * even the rest of a chunk that is being dispatched right now. Completes with a Cancelled error.
         */
        void cancel();

        bool active() const;
        std::string const& name() const;
        StreamStatistics const& statistics() const;

      private:
        void doRead();
        void onOpened(std::optional<StreamError> const& error);
        void onRead(std::optional<StreamError> const& error, std::string_view bytes, bool done);
        void complete(std::optional<StreamError> const& error);

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
