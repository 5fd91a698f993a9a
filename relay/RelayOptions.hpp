/**
 * \file relay/RelayOptions.hpp
 * \brief Relay-specific option provider and the collected runtime settings.
 */
#pragma once

#include "logger.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

/** \brief Settings for one relay run, after CLI and config have been merged. */
struct RelayOptions {
    std::string url;                                   ///< Remote endpoint, ws://host[:port][/path]
    std::size_t queue_capacity{32};                    ///< Capacity of each direction's queue.
    LogLevel log_level{LogLevel::Info};                ///< Minimum level written to stderr.
    std::chrono::milliseconds poll_interval{10};       ///< Scheduler idle re-check interval.
};

namespace relay_opts {

/**
 * \brief Register the relay options (url, queue capacity, log level, poll interval).
 *
 * Safe to call multiple times; registration is protected by an internal flag.
 */
void register_options();

std::optional<std::string> get_url();
std::size_t get_queue_capacity();
std::optional<LogLevel> get_log_level();
std::chrono::milliseconds get_poll_interval();

/** \brief Snapshot of the parsed values; an absent url is left empty. */
RelayOptions collect();

} // namespace relay_opts
