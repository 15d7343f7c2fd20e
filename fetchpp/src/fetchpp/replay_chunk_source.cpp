#include <fetchpp/replay_chunk_source.hpp>

#include <boost/asio/post.hpp>

#include <stdexcept>

namespace JsonDemux
{
    //#####################################################################################################################
    std::vector<std::string> splitIntoChunks(std::string const& data, std::size_t chunkSize)
    {
        if (chunkSize == 0)
            throw std::invalid_argument("Chunk size must not be 0.");

        std::vector<std::string> chunks;
        chunks.reserve(data.size() / chunkSize + 1);
        for (std::size_t offset = 0; offset < data.size(); offset += chunkSize)
            chunks.push_back(data.substr(offset, chunkSize));
        return chunks;
    }
    //#####################################################################################################################
    ReplayChunkSource::ReplayChunkSource(boost::asio::any_io_executor executor, std::vector<std::string> chunks)
        : executor_{std::move(executor)}
        , chunks_{std::move(chunks)}
        , next_{0}
        , cancelled_{false}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    ReplayChunkSource::ReplayChunkSource(
        boost::asio::any_io_executor executor,
        std::string const& data,
        std::size_t chunkSize)
        : ReplayChunkSource{std::move(executor), splitIntoChunks(data, chunkSize)}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    void ReplayChunkSource::open(OpenHandler handler)
    {
        boost::asio::post(executor_, [weak = weak_from_this(), handler = std::move(handler)]() {
            auto self = weak.lock();
            if (!self || self->cancelled_)
                return handler(StreamError::cancelled());
            handler(std::nullopt);
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void ReplayChunkSource::readSome(ReadHandler handler)
    {
        boost::asio::post(executor_, [weak = weak_from_this(), handler = std::move(handler)]() {
            auto self = weak.lock();
            if (!self || self->cancelled_)
                return handler(StreamError::cancelled(), {}, true);

            if (self->next_ >= self->chunks_.size())
                return handler(std::nullopt, {}, true);

            auto const& chunk = self->chunks_[self->next_++];
            handler(std::nullopt, chunk, self->next_ == self->chunks_.size());
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void ReplayChunkSource::cancel()
    {
        cancelled_ = true;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string ReplayChunkSource::describe() const
    {
        return "replay of " + std::to_string(chunks_.size()) + " chunks";
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t ReplayChunkSource::chunksDelivered() const
    {
        return next_;
    }
    //#####################################################################################################################
}
