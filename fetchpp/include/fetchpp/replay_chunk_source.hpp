#pragma once

#include <fetchpp/chunk_source.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace JsonDemux
{
    /**
     * Replays recorded chunks, e.g. a captured response body. Every operation completes through the executor,
     * never inside the initiating call, like a network read would.
     */
    class ReplayChunkSource
        : public ChunkSource
        , public std::enable_shared_from_this<ReplayChunkSource>
    {
      public:
        ReplayChunkSource(boost::asio::any_io_executor executor, std::vector<std::string> chunks);

        /**
         * Cuts data into chunks of chunkSize bytes, the last one may be shorter.
         */
        ReplayChunkSource(boost::asio::any_io_executor executor, std::string const& data, std::size_t chunkSize);

        void open(OpenHandler handler) override;
        void readSome(ReadHandler handler) override;
        void cancel() override;
        std::string describe() const override;

        std::size_t chunksDelivered() const;

      private:
        boost::asio::any_io_executor executor_;
        std::vector<std::string> chunks_;
        std::size_t next_;
        bool cancelled_;
    };

    std::vector<std::string> splitIntoChunks(std::string const& data, std::size_t chunkSize);
}
