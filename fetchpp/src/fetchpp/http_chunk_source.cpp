#include <fetchpp/http_chunk_source.hpp>

#include <sharedpp/printable_string.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

using namespace std::string_literals;

namespace JsonDemux
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http = boost::beast::http;
        namespace ssl = boost::asio::ssl;
        using tcp = boost::asio::ip::tcp;

        constexpr std::size_t readBufferSize = 16 * 1024;
        constexpr std::size_t maxErrorTextSize = 500;

        http::verb verbFromString(std::string const& method)
        {
            const auto verb = http::string_to_verb(method);
            if (verb == http::verb::unknown)
                throw std::invalid_argument("Unknown http method '"s + method + "'");
            return verb;
        }

        std::optional<ssl::context> makeSslContext(Url const& url, bool verifyPeer)
        {
            if (!url.secure())
                return std::nullopt;

            ssl::context sslContext{ssl::context::tls_client};
            sslContext.set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::single_dh_use);
            if (verifyPeer)
            {
                sslContext.set_default_verify_paths();
                sslContext.set_verify_mode(ssl::verify_peer);
            }
            else
                sslContext.set_verify_mode(ssl::verify_none);
            return sslContext;
        }
    }
    //#####################################################################################################################
    struct HttpChunkSource::Implementation
    {
        using PlainStream = beast::tcp_stream;
        using SecureStream = beast::ssl_stream<beast::tcp_stream>;

        Implementation(boost::asio::any_io_executor executor, StreamRequest request);

        template <typename Function>
        void withStream(Function&& function)
        {
            std::visit(
                [&function](auto& stream) {
                    if constexpr (!std::is_same_v<std::decay_t<decltype(stream)>, std::monostate>)
                        function(stream);
                },
                stream);
        }

        void armTimer()
        {
            withStream([this](auto& stream) {
                beast::get_lowest_layer(stream).expires_after(request.timeout);
            });
        }

        boost::asio::any_io_executor executor;
        StreamRequest request;
        Url url;
        std::optional<ssl::context> sslContext;
        tcp::resolver resolver;
        tcp::resolver::results_type endpoints;
        std::variant<std::monostate, PlainStream, SecureStream> stream;
        http::request<http::string_body> httpRequest;
        beast::flat_buffer buffer;
        std::optional<http::response_parser<http::buffer_body>> parser;
        std::string readBuffer;
        std::string errorText;
        OpenHandler openHandler;
        bool cancelled;
    };
    //---------------------------------------------------------------------------------------------------------------------
    HttpChunkSource::Implementation::Implementation(boost::asio::any_io_executor executor, StreamRequest request)
        : executor{executor}
        , request{std::move(request)}
        , url{parseUrl(this->request.url)}
        , sslContext{makeSslContext(url, this->request.verifyPeer)}
        , resolver{executor}
        , endpoints{}
        , stream{}
        , httpRequest{verbFromString(this->request.method), url.target, 11}
        , buffer{}
        , parser{}
        , readBuffer(readBufferSize, '\0')
        , errorText{}
        , openHandler{}
        , cancelled{false}
    {
        httpRequest.set(http::field::host, url.hostHeader());
        httpRequest.set(http::field::user_agent, this->request.userAgent);
        httpRequest.set(http::field::accept, "application/json");
        if (!this->request.body.empty())
            httpRequest.set(http::field::content_type, "application/json");
        if (this->request.bearerToken)
            httpRequest.set(http::field::authorization, "Bearer "s + *this->request.bearerToken);
        if (this->request.quotaProject)
            httpRequest.set("X-Goog-User-Project", *this->request.quotaProject);
        for (auto const& [name, value] : this->request.headers)
            httpRequest.set(name, value);
        httpRequest.body() = this->request.body;
        httpRequest.prepare_payload();
    }
    //#####################################################################################################################
    HttpChunkSource::HttpChunkSource(boost::asio::any_io_executor executor, StreamRequest request)
        : impl_{std::make_unique<Implementation>(std::move(executor), std::move(request))}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    HttpChunkSource::~HttpChunkSource()
    {
        close();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string HttpChunkSource::describe() const
    {
        return impl_->request.method + " " + impl_->url.toString();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::optional<int> HttpChunkSource::status() const
    {
        if (!impl_->parser || !impl_->parser->is_header_done())
            return std::nullopt;
        return static_cast<int>(impl_->parser->get().result_int());
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::open(OpenHandler handler)
    {
        impl_->openHandler = std::move(handler);
        if (impl_->cancelled)
            return completeOpen(StreamError::cancelled());

        spdlog::info("Opening stream '{}'", describe());
        impl_->resolver.async_resolve(
            impl_->url.host,
            impl_->url.port,
            [weak = weak_from_this()](boost::system::error_code ec, tcp::resolver::results_type results) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (self->impl_->cancelled)
                    return self->completeOpen(StreamError::cancelled());
                if (ec)
                    return self->completeOpen(StreamError::fromErrorCode(ec, "Resolving '" + self->impl_->url.host + "'"));

                self->impl_->endpoints = std::move(results);
                self->onResolved();
            });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::onResolved()
    {
        if (impl_->url.secure())
        {
            auto& secure = impl_->stream.emplace<Implementation::SecureStream>(impl_->executor, *impl_->sslContext);
            if (!SSL_set_tlsext_host_name(secure.native_handle(), impl_->url.host.c_str()))
            {
                const boost::system::error_code ec{
                    static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
                return completeOpen(StreamError::fromErrorCode(ec, "Setting TLS server name"));
            }
            if (impl_->request.verifyPeer)
                secure.set_verify_callback(ssl::host_name_verification(impl_->url.host));
        }
        else
            impl_->stream.emplace<Implementation::PlainStream>(impl_->executor);

        connect();
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::connect()
    {
        impl_->armTimer();
        impl_->withStream([this](auto& stream) {
            beast::get_lowest_layer(stream).async_connect(
                impl_->endpoints,
                [weak = weak_from_this()](boost::system::error_code ec, tcp::endpoint const& endpoint) {
                    auto self = weak.lock();
                    if (!self)
                        return;

                    if (self->impl_->cancelled)
                        return self->completeOpen(StreamError::cancelled());
                    if (ec)
                        return self->completeOpen(StreamError::fromErrorCode(ec, "Connecting to '" + self->describe() + "'"));

                    spdlog::debug("Connected to {}:{}", endpoint.address().to_string(), endpoint.port());
                    if (self->impl_->url.secure())
                        self->handshake();
                    else
                        self->writeRequest();
                });
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::handshake()
    {
        impl_->armTimer();
        auto& secure = std::get<Implementation::SecureStream>(impl_->stream);
        secure.async_handshake(ssl::stream_base::client, [weak = weak_from_this()](boost::system::error_code ec) {
            auto self = weak.lock();
            if (!self)
                return;

            if (self->impl_->cancelled)
                return self->completeOpen(StreamError::cancelled());
            if (ec)
                return self->completeOpen(StreamError::fromErrorCode(ec, "TLS handshake with '" + self->impl_->url.host + "'"));

            self->writeRequest();
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::writeRequest()
    {
        impl_->armTimer();
        impl_->withStream([this](auto& stream) {
            http::async_write(
                stream, impl_->httpRequest, [weak = weak_from_this()](boost::system::error_code ec, std::size_t) {
                    auto self = weak.lock();
                    if (!self)
                        return;

                    if (self->impl_->cancelled)
                        return self->completeOpen(StreamError::cancelled());
                    if (ec)
                        return self->completeOpen(StreamError::fromErrorCode(ec, "Sending request"));

                    self->readHeader();
                });
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::readHeader()
    {
        impl_->parser.emplace();
        impl_->parser->body_limit(boost::none);

        impl_->armTimer();
        impl_->withStream([this](auto& stream) {
            http::async_read_header(
                stream,
                impl_->buffer,
                *impl_->parser,
                [weak = weak_from_this()](boost::system::error_code ec, std::size_t) {
                    auto self = weak.lock();
                    if (!self)
                        return;

                    if (self->impl_->cancelled)
                        return self->completeOpen(StreamError::cancelled());
                    if (ec)
                        return self->completeOpen(StreamError::fromErrorCode(ec, "Reading response header"));

                    self->onHeader();
                });
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::onHeader()
    {
        auto const& response = impl_->parser->get();
        const auto status = static_cast<int>(response.result_int());
        spdlog::info("'{}' answered {} {}", describe(), status, std::string{response.reason()});

        if (status == 204 || status == 205 || status == 304)
        {
            return completeOpen(StreamError{
                .kind = StreamErrorKind::MissingBody,
                .message = "Response has no body: " + std::to_string(status) + " " + std::string{response.reason()},
                .status = status,
            });
        }

        if (status < 200 || status > 299)
            return collectErrorBody();

        completeOpen(std::nullopt);
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::collectErrorBody()
    {
        readSome([weak = weak_from_this()](std::optional<StreamError> const& error, std::string_view bytes, bool done) {
            auto self = weak.lock();
            if (!self)
                return;

            auto& impl = *self->impl_;
            if (impl.cancelled)
                return self->completeOpen(StreamError::cancelled());

            if (!error)
                impl.errorText.append(bytes.substr(0, maxErrorTextSize - impl.errorText.size()));

            if (!error && !done && impl.errorText.size() < maxErrorTextSize)
                return self->collectErrorBody();

            auto const& response = impl.parser->get();
            const auto status = static_cast<int>(response.result_int());
            spdlog::error(
                "'{}' failed with {} {}: '{}'",
                self->describe(),
                status,
                std::string{response.reason()},
                makePrintableString(impl.errorText));

            self->completeOpen(StreamError{
                .kind = StreamErrorKind::HttpStatus,
                .message = "HTTP " + std::to_string(status) + " " + std::string{response.reason()} + " - " +
                    impl.errorText,
                .status = status,
            });
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::completeOpen(std::optional<StreamError> const& error)
    {
        if (error)
            close();

        auto handler = std::exchange(impl_->openHandler, {});
        if (handler)
            handler(error);
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::readSome(ReadHandler handler)
    {
        if (impl_->cancelled)
            return handler(StreamError::cancelled(), {}, true);
        if (!impl_->parser || !impl_->parser->is_header_done())
            return handler(StreamError{.kind = StreamErrorKind::Transport, .message = "Stream is not open."}, {}, true);
        if (impl_->parser->is_done())
            return handler(std::nullopt, {}, true);

        auto& body = impl_->parser->get().body();
        body.data = impl_->readBuffer.data();
        body.size = impl_->readBuffer.size();

        impl_->armTimer();
        impl_->withStream([this, &handler](auto& stream) {
            http::async_read_some(
                stream,
                impl_->buffer,
                *impl_->parser,
                [weak = weak_from_this(), handler = std::move(handler)](boost::system::error_code ec, std::size_t) {
                    auto self = weak.lock();
                    if (!self)
                        return;

                    auto& impl = *self->impl_;
                    if (impl.cancelled)
                        return handler(StreamError::cancelled(), {}, true);

                    if (ec == http::error::need_buffer)
                        ec = {};

                    // Servers that close TLS without close_notify end bodies that are delimited by the connection.
                    if (ec == ssl::error::stream_truncated && !impl.parser->is_done())
                    {
                        boost::system::error_code eofError;
                        impl.parser->put_eof(eofError);
                        if (!eofError)
                            ec = {};
                    }

                    if (ec)
                        return handler(StreamError::fromErrorCode(ec, "Reading response body"), {}, true);

                    const auto received = impl.readBuffer.size() - impl.parser->get().body().size;
                    const auto done = impl.parser->is_done();
                    if (done)
                        spdlog::debug("'{}': response body complete.", self->describe());

                    handler(std::nullopt, std::string_view{impl.readBuffer.data(), received}, done);
                });
        });
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::cancel()
    {
        if (impl_->cancelled)
            return;

        spdlog::info("Cancelling stream '{}'", describe());
        impl_->cancelled = true;
        impl_->resolver.cancel();
        close();
    }
    //---------------------------------------------------------------------------------------------------------------------
    void HttpChunkSource::close()
    {
        impl_->withStream([](auto& stream) {
            auto& lowest = beast::get_lowest_layer(stream);
            if (!lowest.socket().is_open())
                return;

            boost::system::error_code ec;
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::asio::error::not_connected)
                spdlog::warn("HttpChunkSource::close: socket.shutdown() failed: {}", ec.message());
            lowest.close();
        });
    }
    //#####################################################################################################################
}
