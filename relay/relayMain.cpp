/**
 * \file relay/relayMain.cpp
 * \brief Entrypoint for stream-relay: stdin lines out over a WebSocket, inbound text to stdout.
 */

#include "RelayOptions.hpp"
#include "RelaySession.hpp"
#include "logger.hpp"
#include <options/Options.hpp>

#include <csignal>
#include <iostream>
#include <unistd.h>

/** \brief Entrypoint for the relay binary. */
int main(int argc, char* argv[]) {
    // stdout carries relayed data; diagnostics go to stderr only.
    auto logger = std::make_shared<Logger>("stream-relay");
    auto stderr_sink = std::make_shared<StderrSink>();
    stderr_sink->set_level(LogLevel::Info);
    logger->add_sink(stderr_sink);

    try {
        // A closed output pipe must surface as EPIPE on the writer, not kill the process.
        std::signal(SIGPIPE, SIG_IGN);

        relay_opts::register_options();
        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error("Option parse error: " + opt_err);
            return 2;
        }

        RelayOptions opts = relay_opts::collect();
        logger->set_level(opts.log_level);
        if (auto cfg = shared_opts::Options::get_config_file()) {
            logger->debug("Loaded config " + cfg->string());
        }

        relay::RelaySession session(opts, logger, STDIN_FILENO, STDOUT_FILENO);
        return session.run().exit_code();
    } catch (const std::exception& e) {
        logger->critical(std::string{"stream-relay error: "} + e.what());
        return 1;
    }
}
