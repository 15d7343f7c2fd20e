#include <fetchpp/stream_error.hpp>

#include <boost/asio/error.hpp>

namespace JsonDemux
{
    //#####################################################################################################################
    char const* toString(StreamErrorKind kind)
    {
        switch (kind)
        {
            case StreamErrorKind::Transport:
                return "Transport";
            case StreamErrorKind::HttpStatus:
                return "HttpStatus";
            case StreamErrorKind::MissingBody:
                return "MissingBody";
            case StreamErrorKind::Consumer:
                return "Consumer";
            case StreamErrorKind::Cancelled:
                return "Cancelled";
        }
        return "Unknown";
    }
    //---------------------------------------------------------------------------------------------------------------------
    StreamError StreamError::fromErrorCode(boost::system::error_code const& ec, std::string const& what)
    {
        if (ec == boost::asio::error::operation_aborted)
            return StreamError{.kind = StreamErrorKind::Cancelled, .message = what + ": cancelled", .errorCode = ec};
        return StreamError{.kind = StreamErrorKind::Transport, .message = what + ": " + ec.message(), .errorCode = ec};
    }
    //---------------------------------------------------------------------------------------------------------------------
    StreamError StreamError::cancelled()
    {
        return StreamError{.kind = StreamErrorKind::Cancelled, .message = "Stream cancelled"};
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string StreamError::toString() const
    {
        return std::string{JsonDemux::toString(kind)} + ": " + message;
    }
    //#####################################################################################################################
    StreamFailure::StreamFailure(StreamError error)
        : std::runtime_error{error.toString()}
        , error_{std::move(error)}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    StreamError const& StreamFailure::error() const noexcept
    {
        return error_;
    }
    //#####################################################################################################################
}
