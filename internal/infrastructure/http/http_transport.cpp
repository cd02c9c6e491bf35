#include "http_transport.hpp"

#include "beast_http_transport.hpp"

namespace infrastructure {

    std::shared_ptr<HttpTransport> HttpTransport::Create(
        const HttpTransportConfig &config, net::io_context &context
    ) {
        switch (config.get_http_transport_type()) {
            case HttpTransportType::BEAST:
                return std::make_shared<BeastHttpTransport>(config, context);
            default:
                throw std::runtime_error("Selected http transport unavailable... ");
        }
    }

}
