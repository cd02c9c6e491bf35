#ifndef INFRASTRUCTURE_HTTP_BEAST_HTTP_TRANSPORT_HPP
#define INFRASTRUCTURE_HTTP_BEAST_HTTP_TRANSPORT_HPP

#include <chrono>
#include <memory>

#include "http_transport.hpp"

namespace infrastructure {

    // one resolve / connect / write / read / shutdown cycle; owns itself through the handlers
    class BeastHttpSession: public std::enable_shared_from_this<BeastHttpSession> {
    public:
        BeastHttpSession(
            net::io_context &context, std::chrono::seconds timeout,
            HttpRequest &&request, HttpResponseCallback &&callback
        );
        BeastHttpSession() = delete;
        BeastHttpSession (const BeastHttpSession&) = delete;
        BeastHttpSession& operator= (const BeastHttpSession&) = delete;
        void Start();
    private:
        void onResolve(beast::error_code ec, const tcp::resolver::results_type &results);
        void onConnect(beast::error_code ec, const tcp::resolver::results_type::endpoint_type &endpoint);
        void onWrite(beast::error_code ec, std::size_t bytes_transferred);
        void onRead(beast::error_code ec, std::size_t bytes_transferred);
        void finish(beast::error_code ec);

        const std::chrono::seconds _timeout;
        const std::string _host;
        const std::string _port;
        tcp::resolver _resolver;
        beast::tcp_stream _stream;
        beast::flat_buffer _buffer;
        http::request<http::string_body> _request;
        http::response<http::string_body> _response;
        HttpResponseCallback _callback;
    };

    class BeastHttpTransport: public HttpTransport {
    public:
        BeastHttpTransport(const HttpTransportConfig &config, net::io_context &context);
        BeastHttpTransport() = delete;
        BeastHttpTransport (const BeastHttpTransport&) = delete;
        BeastHttpTransport& operator= (const BeastHttpTransport&) = delete;
        void AsyncSend(HttpRequest &&request, HttpResponseCallback &&callback) override;
    private:
        net::io_context &_context;
        const std::chrono::seconds _timeout;
    };

}

#endif //INFRASTRUCTURE_HTTP_BEAST_HTTP_TRANSPORT_HPP
