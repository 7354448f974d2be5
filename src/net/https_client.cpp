#include "geni/net/https_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include <utility>

#include "geni/common/log.hpp"
#include "geni/net/identity_provider.hpp"

namespace geni::net
{
    namespace beast = boost::beast;
    namespace http  = beast::http;
    namespace asio  = boost::asio;
    namespace ssl   = asio::ssl;
    using tcp       = asio::ip::tcp;

    namespace
    {
        constexpr const char* HTTPS_PORT = "443";
    }

    HttpsClient::HttpsClient(const std::chrono::seconds timeout)
        : timeout_(timeout)
          , ssl_ctx_(ssl::context::tls_client)
    {
        boost::system::error_code ec;
        ssl_ctx_.set_default_verify_paths(ec);
        if (ec)
            throw NetworkError("Failed to load system CA certificates: " + ec.message());
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    HttpResponse HttpsClient::post(
        const std::string& host,
        const std::string& target,
        const HeaderMap& headers,
        const std::string& body)
    {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);

        // SNI and certificate host name check
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
            throw NetworkError("Failed to set TLS server name for " + host);
        stream.set_verify_callback(ssl::host_name_verification(host));

        http::request<http::string_body> req{http::verb::post, target, 11};
        req.set(http::field::host, host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        for (const auto& [name, value] : headers)
            req.set(name, value);
        req.body() = body;
        req.prepare_payload();

        beast::flat_buffer buffer;
        http::response<http::string_body> res;

        bool done = false;
        beast::error_code failure;
        std::string stage;

        auto fail = [&](const beast::error_code& ec, const char* what)
        {
            failure = ec;
            stage   = what;
        };

        GENI_LOG_DEBUG("POST https://" << host << target);

        beast::get_lowest_layer(stream).expires_after(timeout_);

        // step 1: resolve, connect, handshake, then a single request/response
        resolver.async_resolve(host, HTTPS_PORT, [&](const beast::error_code& ec, const tcp::resolver::results_type& results)
        {
            if (ec) return fail(ec, "resolve");

            beast::get_lowest_layer(stream).async_connect(results, [&](const beast::error_code& ec, const tcp::endpoint&)
            {
                if (ec) return fail(ec, "connect");

                stream.async_handshake(ssl::stream_base::client, [&](const beast::error_code& ec)
                {
                    if (ec) return fail(ec, "TLS handshake");

                    http::async_write(stream, req, [&](const beast::error_code& ec, std::size_t)
                    {
                        if (ec) return fail(ec, "write");

                        http::async_read(stream, buffer, res, [&](const beast::error_code& ec, std::size_t)
                        {
                            if (ec) return fail(ec, "read");
                            done = true;
                        });
                    });
                });
            });
        });

        // step 2: the resolver is not covered by the stream timer, so bound the whole run
        ioc.run_for(timeout_);

        if (failure)
        {
            if (failure == beast::error::timeout)
                throw NetworkError("Request to " + host + " timed out during " + stage);
            throw NetworkError("Request to " + host + " failed during " + stage + ": " + failure.message());
        }
        if (!done)
            throw NetworkError("Request to " + host + " timed out");

        // best effort close, the exchange is already complete
        beast::error_code ignored;
        beast::get_lowest_layer(stream).socket().close(ignored);

        GENI_LOG_DEBUG("HTTP " << res.result_int() << " from " << host);

        return HttpResponse{
            .status = res.result_int(),
            .body = std::move(res.body())
        };
    }
} // namespace geni::net
