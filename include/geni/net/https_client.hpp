#pragma once

#include <chrono>
#include <map>
#include <string>

#include <boost/asio/ssl/context.hpp>

namespace geni::net
{
    using HeaderMap = std::map<std::string, std::string>;

    struct HttpResponse
    {
        unsigned status{0};
        std::string body;
    };

    // blocking request/response transport; throws NetworkError
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse post(
            const std::string& host,
            const std::string& target,
            const HeaderMap& headers,
            const std::string& body) = 0;
    };

    /**
     * HTTPS/1.1 client over Boost.Beast
     * One connection per request, peer certificate and host name verified
     * against the system trust store, whole exchange bounded by timeout
     */
    class HttpsClient : public HttpTransport
    {
    public:
        explicit HttpsClient(std::chrono::seconds timeout);

        HttpsClient(const HttpsClient&)            = delete;
        HttpsClient& operator=(const HttpsClient&) = delete;

        HttpResponse post(
            const std::string& host,
            const std::string& target,
            const HeaderMap& headers,
            const std::string& body) override;

    private:
        std::chrono::seconds timeout_;
        boost::asio::ssl::context ssl_ctx_;
    };
} // namespace geni::net
