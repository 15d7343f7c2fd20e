#pragma once

#include <boost/system/error_code.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace JsonDemux
{
    enum class StreamErrorKind
    {
        /// Resolve, connect, handshake, write or read failed, including timeouts.
        Transport,
        /// The server answered with a status outside of 2xx.
        HttpStatus,
        /// The response can not carry a body (204, 205, 304).
        MissingBody,
        /// A value consumer threw.
        Consumer,
        /// The stream was cancelled by its owner.
        Cancelled
    };

    char const* toString(StreamErrorKind kind);

    struct StreamError
    {
        StreamErrorKind kind;
        std::string message;
        std::optional<int> status = std::nullopt;
        boost::system::error_code errorCode = {};

        static StreamError fromErrorCode(boost::system::error_code const& ec, std::string const& what);
        static StreamError cancelled();

        std::string toString() const;
    };

    /**
     * Thrown by the blocking stream interface.
     */
    class StreamFailure : public std::runtime_error
    {
      public:
        explicit StreamFailure(StreamError error);

        StreamError const& error() const noexcept;

      private:
        StreamError error_;
    };
}
