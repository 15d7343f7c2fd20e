#include <fetchpp/stream_reader.hpp>

#include <sharedpp/uuid_generator.hpp>

#include <roar/utility/scope_exit.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace JsonDemux
{
    //#####################################################################################################################
    namespace
    {
        DemuxOptions withStreamName(DemuxOptions options)
        {
            options.streamName = options.streamName + "-" + UuidGenerator{}.generateShortId();
            return options;
        }
    }
    //#####################################################################################################################
    struct StreamReader::Implementation
    {
        Implementation(std::shared_ptr<ChunkSource> source, DemuxOptions options, ValueCallback onValue);

        std::shared_ptr<ChunkSource> source;
        ValueCallback onValue;
        StreamDemultiplexer demultiplexer;
        std::shared_ptr<Subscription> subscription;
        CompletionHandler onComplete;
        bool started;
        bool cancelled;
        bool completed;
    };
    //---------------------------------------------------------------------------------------------------------------------
    StreamReader::Implementation::Implementation(
        std::shared_ptr<ChunkSource> source,
        DemuxOptions options,
        ValueCallback onValue)
        : source{std::move(source)}
        , onValue{std::move(onValue)}
        , demultiplexer{withStreamName(std::move(options))}
        , subscription{}
        , onComplete{}
        , started{false}
        , cancelled{false}
        , completed{false}
    {
        subscription = demultiplexer.subscribe([this](json const& value) {
            if (cancelled || completed)
                return false;
            this->onValue(value);
            return true;
        });
    }
    //#####################################################################################################################
    StreamReader::StreamReader(std::shared_ptr<ChunkSource> source, DemuxOptions options, ValueCallback onValue)
        : impl_{std::make_unique<Implementation>(std::move(source), std::move(options), std::move(onValue))}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    StreamReader::~StreamReader()
    {
        if (impl_->started && !impl_->completed)
        {
            spdlog::info("'{}': reader destroyed while streaming, closing transport.", name());
            impl_->cancelled = true;
            impl_->source->cancel();
        }
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamReader::start(CompletionHandler onComplete)
    {
        if (impl_->started)
            throw std::logic_error("StreamReader::start called twice.");

        impl_->started = true;
        impl_->onComplete = std::move(onComplete);
        if (impl_->cancelled)
            return complete(StreamError::cancelled());

        spdlog::info("'{}': starting on {}", name(), impl_->source->describe());
        impl_->source->open([weak = weak_from_this()](std::optional<StreamError> const& error) {
            auto self = weak.lock();
            if (!self)
                return;

            self->onOpened(error);
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamReader::onOpened(std::optional<StreamError> const& error)
    {
        if (impl_->cancelled)
            return complete(StreamError::cancelled());
        if (error)
            return complete(error);

        doRead();
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamReader::doRead()
    {
        impl_->source->readSome(
            [weak = weak_from_this()](std::optional<StreamError> const& error, std::string_view bytes, bool done) {
                auto self = weak.lock();
                if (!self)
                    return;

                self->onRead(error, bytes, done);
            });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamReader::onRead(std::optional<StreamError> const& error, std::string_view bytes, bool done)
    {
        if (impl_->completed)
            return;
        if (impl_->cancelled)
            return complete(StreamError::cancelled());
        if (error)
        {
            spdlog::error("'{}': read failed: {}", name(), error->toString());
            return complete(error);
        }

        // Only set once the chunk went through, an exception leaving this function issues no read.
        bool readMore = false;
        auto readAgain = Roar::ScopeExit{[weak = weak_from_this(), &readMore]() {
            if (!readMore)
                return;

            auto self = weak.lock();
            if (!self)
                return;

            self->doRead();
        }};

        try
        {
            if (!bytes.empty())
                impl_->demultiplexer.feed(bytes);
            if (done)
                impl_->demultiplexer.finish();
        }
        catch (std::exception const& exc)
        {
            spdlog::error("'{}': error in json consumer: {}", name(), exc.what());
            impl_->source->cancel();
            return complete(StreamError{.kind = StreamErrorKind::Consumer, .message = exc.what()});
        }

        if (impl_->cancelled)
            return complete(StreamError::cancelled());

        if (done)
            return complete(std::nullopt);

        readMore = true;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamReader::cancel()
    {
        if (impl_->cancelled || impl_->completed)
            return;

        spdlog::info("'{}': cancelled.", name());
        impl_->cancelled = true;
        impl_->source->cancel();
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamReader::complete(std::optional<StreamError> const& error)
    {
        if (impl_->completed)
            return;
        impl_->completed = true;

        auto const& statistics = impl_->demultiplexer.statistics();
        spdlog::info(
            "'{}': {} after {} received, {} values, {} decode anomalies, {} parse anomalies, {} discarded.",
            name(),
            error ? error->toString() : "finished",
            statistics.bytesReceived.toString(),
            statistics.valuesDispatched,
            statistics.decodeAnomalies,
            statistics.parseAnomalies,
            statistics.bytesDiscarded.toString());

        auto handler = std::exchange(impl_->onComplete, {});
        if (handler)
            handler(error, statistics);
    }
    //---------------------------------------------------------------------------------------------------------------------
    bool StreamReader::active() const
    {
        return impl_->started && !impl_->completed;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string const& StreamReader::name() const
    {
        return impl_->demultiplexer.options().streamName;
    }
    //---------------------------------------------------------------------------------------------------------------------
    StreamStatistics const& StreamReader::statistics() const
    {
        return impl_->demultiplexer.statistics();
    }
    //#####################################################################################################################
}
