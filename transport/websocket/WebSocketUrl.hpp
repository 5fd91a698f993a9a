/**
 * \file WebSocketUrl.hpp
 * \brief Parsed `ws://` endpoint address.
 * \ingroup websocket_backend
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace transport { namespace ws {

/** \brief Components of `ws://host[:port][/path][?query]`.
 *  \ingroup websocket_backend
 */
struct WebSocketUrl {
    std::string scheme{"ws"};
    std::string host;          ///< Host name or address; IPv6 literals without brackets
    std::string port{"80"};
    std::string target{"/"};   ///< Path plus query, always starting with '/'

    /** \brief Parse `text`; sets `error` to a relay::errc value on failure. */
    static std::optional<WebSocketUrl> parse(std::string_view text, std::error_code& error);

    /** \brief Value for the HTTP Host header of the upgrade request. */
    std::string host_header() const;
    /** \brief Canonical printable form. */
    std::string to_string() const;
};

} } // namespace transport::ws
