#pragma once

#include <fetchpp/chunk_source.hpp>
#include <fetchpp/stream_request.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <optional>
#include <string>

namespace JsonDemux
{
    /**
     * Chunk source for the body of an HTTP/1.1 response, over plain TCP or TLS.
     *
     * open() resolves, connects, performs the TLS handshake for https, sends the request and reads the
     * response header. Statuses outside of 2xx fail the open with the status, reason and the start of the
     * body. Chunked transfer encoding is removed, readSome() delivers body bytes only.
     */
    class HttpChunkSource
        : public ChunkSource
        , public std::enable_shared_from_this<HttpChunkSource>
    {
      public:
        /**
         * Throws std::invalid_argument for a malformed url or an unknown method.
         */
        HttpChunkSource(boost::asio::any_io_executor executor, StreamRequest request);
        ~HttpChunkSource() override;
        HttpChunkSource(HttpChunkSource const&) = delete;
        HttpChunkSource(HttpChunkSource&&) = delete;
        HttpChunkSource& operator=(HttpChunkSource const&) = delete;
        HttpChunkSource& operator=(HttpChunkSource&&) = delete;

        void open(OpenHandler handler) override;
        void readSome(ReadHandler handler) override;
        void cancel() override;
        std::string describe() const override;

        /// Status of the response, available once the header was read.
        std::optional<int> status() const;

      private:
        void onResolved();
        void connect();
        void handshake();
        void writeRequest();
        void readHeader();
        void onHeader();
        void collectErrorBody();
        void completeOpen(std::optional<StreamError> const& error);
        void close();

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
