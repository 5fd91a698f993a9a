#include "WebSocketUrl.hpp"
#include "relayErrors.hpp"

#include <algorithm>
#include <cctype>

namespace transport { namespace ws {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool valid_port(std::string_view p) {
    if (p.empty() || p.size() > 5) return false;
    if (!std::all_of(p.begin(), p.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;
    int value = std::stoi(std::string(p));
    return value > 0 && value <= 65535;
}

} // namespace

std::optional<WebSocketUrl> WebSocketUrl::parse(std::string_view text, std::error_code& error) {
    error.clear();
    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        error = relay::errc::invalid_url;
        return std::nullopt;
    }
    WebSocketUrl url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "ws") {
        error = relay::errc::unsupported_scheme;
        return std::nullopt;
    }

    std::string_view rest = text.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        std::string_view target = rest.substr(path_start);
        url.target = target.front() == '/' ? std::string(target) : "/" + std::string(target);
    }
    if (authority.find('@') != std::string_view::npos) {
        // Credentials in the authority are not supported.
        error = relay::errc::invalid_url;
        return std::nullopt;
    }

    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            error = relay::errc::invalid_url;
            return std::nullopt;
        }
        url.host = std::string(authority.substr(1, close - 1));
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                error = relay::errc::invalid_url;
                return std::nullopt;
            }
            port = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host = std::string(authority.substr(0, colon));
            port = authority.substr(colon + 1);
        } else {
            url.host = std::string(authority);
        }
    }

    if (url.host.empty()) {
        error = relay::errc::invalid_url;
        return std::nullopt;
    }
    if (!port.empty() || (authority.size() > 0 && authority.back() == ':')) {
        if (!valid_port(port)) {
            error = relay::errc::invalid_url;
            return std::nullopt;
        }
        url.port = std::string(port);
    }
    return url;
}

std::string WebSocketUrl::host_header() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == "80") return host_part;
    return host_part + ":" + port;
}

std::string WebSocketUrl::to_string() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + host_part + ":" + port + target;
}

} } // namespace transport::ws
