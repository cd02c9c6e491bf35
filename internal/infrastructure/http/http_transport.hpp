#ifndef INFRASTRUCTURE_HTTP_TRANSPORT_HPP
#define INFRASTRUCTURE_HTTP_TRANSPORT_HPP

#include <memory>

#include "http_common.hpp"

namespace infrastructure {

    enum class HttpTransportType {
        BEAST,
    };

    struct HttpTransportConfig {
        [[nodiscard]] virtual HttpTransportType get_http_transport_type() const = 0;
        // seconds; applies to connect and to the write + read of one exchange
        [[nodiscard]] virtual int get_http_request_timeout() const = 0;
    };

    /*
     * Sends one request and reports either a transport error or the response, whatever its status.
     * The callback runs exactly once, on the io_context the transport was created with.
     */
    class HttpTransport {
    public:
        [[nodiscard]] static std::shared_ptr<HttpTransport> Create(
            const HttpTransportConfig &config, net::io_context &context
        );
        virtual void AsyncSend(HttpRequest &&request, HttpResponseCallback &&callback) = 0;
        virtual ~HttpTransport() = default;
    };

}

#endif //INFRASTRUCTURE_HTTP_TRANSPORT_HPP
