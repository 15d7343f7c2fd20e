#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace JsonDemux
{
    /**
     * Incremental UTF-8 decoder for byte chunks of arbitrary size.
     *
     * Complete code points are passed through, an incomplete sequence at the end of a chunk is held back until
     * the next call. Ill-formed input never throws: each maximal ill-formed subpart becomes one U+FFFD.
     * A byte order mark at the very start of the stream is removed.
     */
    class Utf8Decoder
    {
      public:
        Utf8Decoder();

        /**
         * @param bytes The next chunk of raw bytes, may be empty.
         * @param finalChunk Set on the last call. Flushes an unfinished sequence as U+FFFD.
         * @return Well-formed UTF-8 text decoded from this and all previously held back bytes.
         */
        std::string decode(std::string_view bytes, bool finalChunk = false);

        void reset();

        /// Number of replacement characters produced so far.
        std::size_t anomalies() const;

        /// Bytes of an unfinished sequence currently held back.
        std::size_t pendingBytes() const;

      private:
        void restartSequence();

      private:
        std::string sequence_;
        int bytesNeeded_;
        unsigned char lowerBoundary_;
        unsigned char upperBoundary_;
        bool bomChecked_;
        std::size_t anomalies_;
    };
}
