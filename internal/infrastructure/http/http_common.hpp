#ifndef INFRASTRUCTURE_HTTP_COMMON_HPP
#define INFRASTRUCTURE_HTTP_COMMON_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "utils/asio_context.hpp"

namespace infrastructure {

    enum class MimeType {
        JSON,
        JPEG,
    };

    inline const char *MimeTypeString(const MimeType mime_type) {
        switch (mime_type) {
            case MimeType::JPEG:
                return "application/jpeg";
            case MimeType::JSON:
            default:
                return "application/json";
        }
    }

    typedef std::map<std::string, std::string> HttpHeaders;

    struct HttpRequest {
        http::verb method = http::verb::get;
        std::string host;
        std::string port = "80";
        // path and query
        std::string target = "/";
        HttpHeaders headers;
        std::string body;
        // Host header value; the port is left out when it is the default
        [[nodiscard]] std::string HostHeader() const {
            return port == "80" ? host : host + ":" + port;
        }
    };

    struct HttpResponse {
        int status = 0;
        std::string content_type;
        std::string body;
    };

    // ec is set for transport failures only; any status code arrives as a response
    typedef std::function<void(error_code, HttpResponse &&)> HttpResponseCallback;

    struct HttpUrl {
        std::string host;
        std::string port = "80";
        std::string target = "/";
    };

    // plain http only: http://host[:port][/path][?query]
    [[nodiscard]] std::optional<HttpUrl> ParseHttpUrl(const std::string &url);

}

#endif //INFRASTRUCTURE_HTTP_COMMON_HPP
