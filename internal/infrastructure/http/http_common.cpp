#include "http_common.hpp"

#include <algorithm>
#include <cctype>

namespace infrastructure {

    std::optional<HttpUrl> ParseHttpUrl(const std::string &url) {
        static const std::string scheme = "http://";
        if (url.size() <= scheme.size()) {
            return std::nullopt;
        }
        const auto lowered_scheme = [&url]() {
            std::string out = url.substr(0, scheme.size());
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return out;
        }();
        if (lowered_scheme != scheme) {
            return std::nullopt;
        }

        const auto authority_end = url.find_first_of("/?#", scheme.size());
        const auto authority = url.substr(scheme.size(), authority_end - scheme.size());
        if (authority.empty() || authority.find('@') != std::string::npos) {
            return std::nullopt;
        }

        HttpUrl parsed;
        const auto colon = authority.rfind(':');
        if (colon == std::string::npos) {
            parsed.host = authority;
        } else {
            parsed.host = authority.substr(0, colon);
            parsed.port = authority.substr(colon + 1);
            if (
                parsed.port.empty() || parsed.port.size() > 5 ||
                !std::all_of(parsed.port.begin(), parsed.port.end(), [](unsigned char c) { return std::isdigit(c); }) ||
                std::stoi(parsed.port) > 65535
            ) {
                return std::nullopt;
            }
        }
        if (parsed.host.empty()) {
            return std::nullopt;
        }

        if (authority_end != std::string::npos) {
            auto target = url.substr(authority_end);
            // fragments never go on the wire
            if (const auto fragment = target.find('#'); fragment != std::string::npos) {
                target.erase(fragment);
            }
            if (target.empty() || target.front() != '/') {
                target.insert(target.begin(), '/');
            }
            parsed.target = std::move(target);
        }
        return parsed;
    }

}
