#include <demuxpp/utf8_decoder.hpp>

#include <sharedpp/printable_string.hpp>

#include <spdlog/spdlog.h>

namespace JsonDemux
{
    namespace
    {
        constexpr std::string_view replacementCharacter = "\xEF\xBF\xBD";
        constexpr std::string_view byteOrderMark = "\xEF\xBB\xBF";
    }
    //#####################################################################################################################
    Utf8Decoder::Utf8Decoder()
        : sequence_{}
        , bytesNeeded_{0}
        , lowerBoundary_{0x80}
        , upperBoundary_{0xBF}
        , bomChecked_{false}
        , anomalies_{0}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    std::string Utf8Decoder::decode(std::string_view bytes, bool finalChunk)
    {
        std::string text;
        text.reserve(bytes.size() + sequence_.size());

        for (std::size_t i = 0; i < bytes.size();)
        {
            const auto byte = static_cast<unsigned char>(bytes[i]);

            if (bytesNeeded_ == 0)
            {
                ++i;
                if (byte <= 0x7F)
                    text.push_back(static_cast<char>(byte));
                else if (byte >= 0xC2 && byte <= 0xDF)
                {
                    bytesNeeded_ = 1;
                    sequence_.push_back(static_cast<char>(byte));
                }
                else if (byte >= 0xE0 && byte <= 0xEF)
                {
                    if (byte == 0xE0)
                        lowerBoundary_ = 0xA0;
                    else if (byte == 0xED)
                        upperBoundary_ = 0x9F;
                    bytesNeeded_ = 2;
                    sequence_.push_back(static_cast<char>(byte));
                }
                else if (byte >= 0xF0 && byte <= 0xF4)
                {
                    if (byte == 0xF0)
                        lowerBoundary_ = 0x90;
                    else if (byte == 0xF4)
                        upperBoundary_ = 0x8F;
                    bytesNeeded_ = 3;
                    sequence_.push_back(static_cast<char>(byte));
                }
                else
                {
                    ++anomalies_;
                    text.append(replacementCharacter);
                }
                continue;
            }

            if (byte < lowerBoundary_ || byte > upperBoundary_)
            {
                // The byte is not consumed, it may start the next sequence.
                spdlog::debug("Utf8Decoder: ill-formed sequence '{}'", makePrintableString(sequence_));
                restartSequence();
                ++anomalies_;
                text.append(replacementCharacter);
                continue;
            }

            ++i;
            lowerBoundary_ = 0x80;
            upperBoundary_ = 0xBF;
            sequence_.push_back(static_cast<char>(byte));
            if (static_cast<int>(sequence_.size()) == bytesNeeded_ + 1)
            {
                text.append(sequence_);
                restartSequence();
            }
        }

        if (finalChunk && bytesNeeded_ != 0)
        {
            spdlog::warn(
                "Utf8Decoder: stream ended inside a multi-byte sequence '{}', replacing it.",
                makePrintableString(sequence_));
            restartSequence();
            ++anomalies_;
            text.append(replacementCharacter);
        }

        if (!bomChecked_ && !text.empty())
        {
            bomChecked_ = true;
            if (text.starts_with(byteOrderMark))
                text.erase(0, byteOrderMark.size());
        }

        return text;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void Utf8Decoder::restartSequence()
    {
        sequence_.clear();
        bytesNeeded_ = 0;
        lowerBoundary_ = 0x80;
        upperBoundary_ = 0xBF;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void Utf8Decoder::reset()
    {
        restartSequence();
        bomChecked_ = false;
        anomalies_ = 0;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t Utf8Decoder::anomalies() const
    {
        return anomalies_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t Utf8Decoder::pendingBytes() const
    {
        return sequence_.size();
    }
    //#####################################################################################################################
}
