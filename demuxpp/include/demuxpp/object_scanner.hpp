#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace JsonDemux
{
    /**
     * Scan state that survives between chunks of one stream.
     * pendingEscape is only ever set while inString is set, braceDepth only changes outside of strings.
     */
    struct ScanState
    {
        std::string buffer{};
        int braceDepth = 0;
        bool inString = false;
        bool pendingEscape = false;
    };

    /**
     * Finds the ends of top level json objects in text that arrives in pieces.
     *
     * The scanner is aware of string literals and escapes, so braces, quotes and newlines inside of strings
     * are never structural. Whenever the brace depth returns to zero, the text from the first '{' since the
     * last consumed candidate up to and including the closing '}' is handed to the candidate handler.
     */
    class ObjectScanner
    {
      public:
        /**
         * Receives a candidate object text. Returns true if the candidate is consumed (dispatched or dropped),
         * false to keep the text buffered and continue scanning past this boundary.
         */
        using CandidateHandler = std::function<bool(std::string_view candidate)>;

        /**
         * @param maxPendingBytes Discard unconsumed text once it grows beyond this. 0 means unbounded.
         * String and depth tracking survive the discard, the rest of a cut object is skipped up to its
         * closing brace and never becomes a candidate.
         */
        explicit ObjectScanner(std::size_t maxPendingBytes = 0);

        /**
         * Appends text and scans it. The handler is called synchronously for every depth zero closure, in
         * order. Exceptions thrown by the handler leave the scanner consistent: the candidate that caused it
         * counts as consumed.
         */
        void scan(std::string_view text, CandidateHandler const& onCandidate);

        /**
         * Drops whatever is left, e.g. an unterminated object at the end of a stream.
         * @return The number of dropped bytes.
         */
        std::size_t discardPending();

        void reset();

        std::string_view pendingText() const;
        ScanState const& state() const;

        /// Total bytes dropped because maxPendingBytes was exceeded, including the skipped rest of a cut object.
        std::size_t overflowDiscarded() const;

        /// Set while the rest of an object cut by maxPendingBytes is being skipped.
        bool skipping() const;

      private:
        void compact();
        void discardOverflow();

      private:
        ScanState state_;
        std::size_t offset_;
        std::size_t start_;
        std::size_t maxPendingBytes_;
        std::size_t overflowDiscarded_;
        bool skipping_;
    };
}
