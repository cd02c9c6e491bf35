#include "beast_http_transport.hpp"

#include <boost/beast/version.hpp>

namespace infrastructure {

    BeastHttpTransport::BeastHttpTransport(const HttpTransportConfig &config, net::io_context &context):
        _context(context),
        _timeout(config.get_http_request_timeout())
    {}

    void BeastHttpTransport::AsyncSend(HttpRequest &&request, HttpResponseCallback &&callback) {
        std::make_shared<BeastHttpSession>(_context, _timeout, std::move(request), std::move(callback))->Start();
    }

    BeastHttpSession::BeastHttpSession(
        net::io_context &context, const std::chrono::seconds timeout,
        HttpRequest &&request, HttpResponseCallback &&callback
    ):
        _timeout(timeout),
        _host(request.host),
        _port(request.port),
        _resolver(net::make_strand(context)),
        _stream(_resolver.get_executor()),
        _callback(std::move(callback))
    {
        _request.version(11);
        _request.method(request.method);
        _request.target(request.target);
        _request.set(http::field::host, request.HostHeader());
        _request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        for (const auto &[name, value] : request.headers) {
            _request.set(name, value);
        }
        if (!request.body.empty()) {
            _request.body() = std::move(request.body);
        }
        _request.prepare_payload();
    }

    void BeastHttpSession::Start() {
        _resolver.async_resolve(
            _host, _port,
            beast::bind_front_handler(&BeastHttpSession::onResolve, shared_from_this())
        );
    }

    void BeastHttpSession::onResolve(beast::error_code ec, const tcp::resolver::results_type &results) {
        if (ec) {
            finish(ec);
            return;
        }
        _stream.expires_after(_timeout);
        _stream.async_connect(
            results,
            beast::bind_front_handler(&BeastHttpSession::onConnect, shared_from_this())
        );
    }

    void BeastHttpSession::onConnect(
        beast::error_code ec, const tcp::resolver::results_type::endpoint_type &endpoint
    ) {
        if (ec) {
            finish(ec);
            return;
        }
        // covers both the write and the read
        _stream.expires_after(_timeout);
        http::async_write(
            _stream, _request,
            beast::bind_front_handler(&BeastHttpSession::onWrite, shared_from_this())
        );
    }

    void BeastHttpSession::onWrite(beast::error_code ec, std::size_t bytes_transferred) {
        if (ec) {
            finish(ec);
            return;
        }
        http::async_read(
            _stream, _buffer, _response,
            beast::bind_front_handler(&BeastHttpSession::onRead, shared_from_this())
        );
    }

    void BeastHttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
        if (ec) {
            finish(ec);
            return;
        }
        beast::error_code shutdown_ec;
        _stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
        // the peer closing first is not a failure once the response is in hand
        if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
            std::cout << "BeastHttpSession::onRead shutdown reported " << shutdown_ec.message() << std::endl;
        }
        finish({});
    }

    void BeastHttpSession::finish(beast::error_code ec) {
        HttpResponse response;
        if (!ec) {
            response.status = static_cast<int>(_response.result_int());
            const auto content_type = _response[http::field::content_type];
            response.content_type.assign(content_type.data(), content_type.size());
            response.body = std::move(_response.body());
        }
        auto callback = std::move(_callback);
        callback(ec, std::move(response));
    }

}
