/**
 * \file relayErrors.hpp
 * \brief Error codes raised by the relay itself (as opposed to system or Beast/Asio codes).
 * \details All failures travel as `std::error_code`; awaitables wrap them in
 * `std::system_error` when they throw. Compare with `relay::errc` values directly.
 */
#pragma once

#include <string>
#include <system_error>

namespace relay {

/** \brief Relay-specific error conditions. */
enum class errc {
    missing_url = 1,     ///< No endpoint given on the command line or in config
    invalid_url,         ///< Endpoint could not be parsed
    unsupported_scheme,  ///< Endpoint scheme other than ws://
    connection_closed,   ///< Remote peer closed the connection (terminal for the source)
    queue_closed,        ///< Push attempted on a queue whose producer already closed it
    not_connected        ///< Operation on a connection that was never established
};

/** \brief Category singleton for `relay::errc`. */
const std::error_category& error_category() noexcept;

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace relay

namespace std {
template<>
struct is_error_code_enum<relay::errc> : true_type {};
}
