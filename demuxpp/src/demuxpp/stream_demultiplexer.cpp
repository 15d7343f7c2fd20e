#include <demuxpp/stream_demultiplexer.hpp>

#include <sharedpp/printable_string.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace JsonDemux
{
    //#####################################################################################################################
    StreamDemultiplexer::StreamDemultiplexer(DemuxOptions options)
        : options_{std::move(options)}
        , decoder_{}
        , scanner_{options_.maxPendingBytes}
        , dispatcher_{}
        , ownSubscription_{}
        , statistics_{}
        , finished_{false}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    StreamDemultiplexer::StreamDemultiplexer(DemuxOptions options, ValueCallback onValue)
        : StreamDemultiplexer{std::move(options)}
    {
        ownSubscription_ = dispatcher_.listen(std::move(onValue));
    }
    //---------------------------------------------------------------------------------------------------------------------
    StreamDemultiplexer::~StreamDemultiplexer() = default;
    //---------------------------------------------------------------------------------------------------------------------
    std::shared_ptr<Subscription> StreamDemultiplexer::subscribe(Subscription::FunctionType const& callback)
    {
        return dispatcher_.subscribe(callback);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::shared_ptr<Subscription> StreamDemultiplexer::listen(ValueCallback const& callback)
    {
        return dispatcher_.listen(callback);
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamDemultiplexer::feed(std::string_view bytes)
    {
        if (finished_)
            throw std::logic_error("StreamDemultiplexer::feed called after finish.");

        statistics_.bytesReceived += bytes.size();
        spdlog::debug("'{}': feeding {} bytes.", options_.streamName, bytes.size());

        scanText(decoder_.decode(bytes));
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamDemultiplexer::finish()
    {
        if (finished_)
            return;
        finished_ = true;

        scanText(decoder_.decode({}, true));

        const auto leftover = scanner_.pendingText();
        if (!leftover.empty())
        {
            spdlog::debug(
                "'{}': stream ended with {} bytes outside of a complete object: '{}'",
                options_.streamName,
                leftover.size(),
                makePrintableString(leftover));
        }
        statistics_.bytesDiscarded += scanner_.discardPending();
    }
    //---------------------------------------------------------------------------------------------------------------------
    void StreamDemultiplexer::scanText(std::string_view text)
    {
        statistics_.textDecoded += text.size();
        statistics_.decodeAnomalies = decoder_.anomalies();

        const auto overflowBefore = scanner_.overflowDiscarded();
        scanner_.scan(text, [this](std::string_view candidate) {
            return onCandidate(candidate);
        });
        statistics_.bytesDiscarded += scanner_.overflowDiscarded() - overflowBefore;
    }
    //---------------------------------------------------------------------------------------------------------------------
    bool StreamDemultiplexer::onCandidate(std::string_view candidate)
    {
        auto value = tryParseJson(candidate);
        if (value)
        {
            ++statistics_.valuesDispatched;
            dispatcher_.dispatch(*value);
            return true;
        }

        ++statistics_.parseAnomalies;
        switch (options_.parseFailurePolicy)
        {
            case ParseFailurePolicy::KeepBuffering:
                spdlog::warn(
                    "'{}': could not parse object candidate of {} bytes, buffering on: '{}'",
                    options_.streamName,
                    candidate.size(),
                    makePrintableString(candidate));
                return false;
            case ParseFailurePolicy::DropAndResume:
                break;
        }

        spdlog::warn(
            "'{}': could not parse object candidate of {} bytes, dropping it: '{}'",
            options_.streamName,
            candidate.size(),
            makePrintableString(candidate));
        statistics_.bytesDiscarded += candidate.size();
        return true;
    }
    //---------------------------------------------------------------------------------------------------------------------
    bool StreamDemultiplexer::finished() const
    {
        return finished_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    StreamStatistics const& StreamDemultiplexer::statistics() const
    {
        return statistics_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    ScanState const& StreamDemultiplexer::scanState() const
    {
        return scanner_.state();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string_view StreamDemultiplexer::pendingText() const
    {
        return scanner_.pendingText();
    }
    //---------------------------------------------------------------------------------------------------------------------
    DemuxOptions const& StreamDemultiplexer::options() const
    {
        return options_;
    }
    //#####################################################################################################################
}
