#ifndef DOMAIN_PROTECT_ERROR_HPP
#define DOMAIN_PROTECT_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include <boost/system/error_code.hpp>

namespace domain {

    class ProtectError: public std::runtime_error {
    public:
        explicit ProtectError(const std::string &message): std::runtime_error(message) {}
    };

    // connection, dns, timeout or a malformed response envelope
    class TransportError: public ProtectError {
    public:
        explicit TransportError(const std::string &message):
            ProtectError("transport error: " + message)
        {}
        TransportError(const std::string &what, boost::system::error_code ec):
            ProtectError("transport error: " + what + ": " + ec.message()),
            _ec(ec)
        {}
        [[nodiscard]] boost::system::error_code Code() const noexcept {
            return _ec;
        }
    private:
        boost::system::error_code _ec;
    };

    class HttpStatusError: public ProtectError {
    public:
        HttpStatusError(const int code, std::string reason):
            ProtectError("http status " + std::to_string(code) + ": " + reason),
            _code(code),
            _reason(std::move(reason))
        {}
        [[nodiscard]] int Code() const noexcept {
            return _code;
        }
        [[nodiscard]] const std::string &Reason() const noexcept {
            return _reason;
        }
    private:
        int _code;
        std::string _reason;
    };

    // carries the element index / field name and the json library's own position info
    class DecodingError: public ProtectError {
    public:
        explicit DecodingError(const std::string &message): ProtectError(message) {}
    };

    class NotFoundError: public ProtectError {
    public:
        NotFoundError(const std::string &kind, std::string name):
            ProtectError(kind + " '" + name + "' not found"),
            _name(std::move(name))
        {}
        [[nodiscard]] const std::string &Name() const noexcept {
            return _name;
        }
    private:
        std::string _name;
    };

}

#endif //DOMAIN_PROTECT_ERROR_HPP
