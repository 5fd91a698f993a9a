// RelayOptions.cpp - Relay options provider with auto-registration
#include "RelayOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace {
    std::mutex g_relay_opts_mtx;
    std::optional<std::string> g_url;
    std::size_t g_queue_capacity = 32;
    std::string g_log_level = "info";
    int g_poll_interval_ms = 10;
    std::atomic<bool> g_relay_registered{false};

    const std::vector<std::string> k_level_names{"debug", "info", "warning", "error", "critical"};
}

namespace relay_opts {

void register_options() {
    bool expected = false;
    if (!g_relay_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::optional<std::string> url_default;
        std::size_t capacity_default = 32;
        int poll_default = 10;
        std::string level_default = "info";

        if (j.contains("relay") && j["relay"].is_object()) {
            const auto& rj = j["relay"];
            if (rj.contains("url") && rj["url"].is_string()) url_default = rj["url"].get<std::string>();
            if (rj.contains("queue_capacity") && rj["queue_capacity"].is_number_unsigned()) {
                auto v = rj["queue_capacity"].get<std::size_t>();
                if (v >= 1 && v <= 65536) capacity_default = v;
            }
            if (rj.contains("poll_interval_ms") && rj["poll_interval_ms"].is_number_integer()) {
                auto v = rj["poll_interval_ms"].get<int>();
                if (v >= 1 && v <= 1000) poll_default = v;
            }
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& lj = j["logging"];
            if (lj.contains("level") && lj["level"].is_string()) level_default = lj["level"].get<std::string>();
        }

        {
            std::lock_guard<std::mutex> lk(g_relay_opts_mtx);
            g_url = url_default;
            g_queue_capacity = capacity_default;
            g_poll_interval_ms = poll_default;
            g_log_level = level_default;
        }

        app.add_option("url", g_url, "WebSocket endpoint, ws://host[:port][/path]")
            ->group("Relay");
        app.add_option("--queue-capacity", g_queue_capacity, "Capacity of each direction's message queue")
            ->check(CLI::Range(1, 65536))
            ->group("Relay");
        app.add_option("--poll-interval-ms", g_poll_interval_ms, "Scheduler idle re-check interval in milliseconds")
            ->check(CLI::Range(1, 1000))
            ->group("Relay");
        app.add_option("--log-level", g_log_level, "Diagnostic level: debug|info|warning|error|critical")
            ->check(CLI::IsMember(k_level_names))
            ->group("Logging");
    });
}

std::optional<std::string> get_url() {
    std::lock_guard<std::mutex> lk(g_relay_opts_mtx);
    if (g_url && g_url->empty()) return std::nullopt;
    return g_url;
}

std::size_t get_queue_capacity() {
    std::lock_guard<std::mutex> lk(g_relay_opts_mtx);
    return g_queue_capacity;
}

std::optional<LogLevel> get_log_level() {
    std::lock_guard<std::mutex> lk(g_relay_opts_mtx);
    return parse_log_level(g_log_level);
}

std::chrono::milliseconds get_poll_interval() {
    std::lock_guard<std::mutex> lk(g_relay_opts_mtx);
    return std::chrono::milliseconds(g_poll_interval_ms);
}

RelayOptions collect() {
    RelayOptions opts;
    opts.url = get_url().value_or("");
    opts.queue_capacity = get_queue_capacity();
    opts.log_level = get_log_level().value_or(LogLevel::Info);
    opts.poll_interval = get_poll_interval();
    return opts;
}

} // namespace relay_opts

// Static auto-registration object
namespace {
    struct RelayOptsAutoReg {
        RelayOptsAutoReg() { relay_opts::register_options(); }
    };
    [[maybe_unused]] static RelayOptsAutoReg s_relay_auto_reg;
}
