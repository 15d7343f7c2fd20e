#include <demuxpp/object_scanner.hpp>

#include <spdlog/spdlog.h>

namespace JsonDemux
{
    //#####################################################################################################################
    ObjectScanner::ObjectScanner(std::size_t maxPendingBytes)
        : state_{}
        , offset_{0}
        , start_{0}
        , maxPendingBytes_{maxPendingBytes}
        , overflowDiscarded_{0}
        , skipping_{false}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    void ObjectScanner::scan(std::string_view text, CandidateHandler const& onCandidate)
    {
        compact();
        state_.buffer.append(text.data(), text.size());

        while (offset_ < state_.buffer.size())
        {
            const auto position = offset_++;
            const auto c = state_.buffer[position];

            if (state_.pendingEscape)
            {
                state_.pendingEscape = false;
                continue;
            }

            if (state_.inString)
            {
                if (c == '\\')
                    state_.pendingEscape = true;
                else if (c == '"')
                    state_.inString = false;
                continue;
            }

            if (c == '"')
                state_.inString = true;
            else if (c == '{')
                ++state_.braceDepth;
            else if (c == '}')
            {
                if (state_.braceDepth == 0)
                {
                    spdlog::debug("ObjectScanner: ignoring '}}' outside of any object at offset {}.", position);
                    continue;
                }

                if (--state_.braceDepth != 0)
                    continue;

                if (skipping_)
                {
                    // Rest of an object whose start was discarded.
                    overflowDiscarded_ += position + 1 - start_;
                    start_ = position + 1;
                    skipping_ = false;
                    continue;
                }

                const auto pending = std::string_view{state_.buffer}.substr(start_, position + 1 - start_);
                const auto firstBrace = pending.find('{');
                if (firstBrace == std::string_view::npos)
                    continue;

                const auto previousStart = start_;
                start_ = position + 1;
                if (!onCandidate(pending.substr(firstBrace)))
                    start_ = previousStart;
            }
        }

        compact();

        if (maxPendingBytes_ != 0 && state_.buffer.size() > maxPendingBytes_)
        {
            spdlog::warn(
                "ObjectScanner: {} bytes pending without a complete object, limit is {}. Discarding them.",
                state_.buffer.size(),
                maxPendingBytes_);
            discardOverflow();
        }
    }
    //---------------------------------------------------------------------------------------------------------------------
    void ObjectScanner::compact()
    {
        if (start_ == 0)
            return;
        state_.buffer.erase(0, start_);
        offset_ -= start_;
        start_ = 0;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void ObjectScanner::discardOverflow()
    {
        // Only the text goes, string and depth tracking must stay in step with the stream.
        overflowDiscarded_ += state_.buffer.size();
        state_.buffer.clear();
        offset_ = 0;
        start_ = 0;
        skipping_ = state_.braceDepth > 0;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t ObjectScanner::discardPending()
    {
        const auto discarded = pendingText().size();
        state_ = {};
        offset_ = 0;
        start_ = 0;
        skipping_ = false;
        return discarded;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void ObjectScanner::reset()
    {
        discardPending();
        overflowDiscarded_ = 0;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string_view ObjectScanner::pendingText() const
    {
        return std::string_view{state_.buffer}.substr(start_);
    }
    //---------------------------------------------------------------------------------------------------------------------
    ScanState const& ObjectScanner::state() const
    {
        return state_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t ObjectScanner::overflowDiscarded() const
    {
        return overflowDiscarded_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    bool ObjectScanner::skipping() const
    {
        return skipping_;
    }
    //#####################################################################################################################
}
