#include "relayErrors.hpp"

namespace relay {

namespace {

class RelayErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "relay"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::missing_url:        return "no endpoint URL given";
            case errc::invalid_url:        return "malformed endpoint URL";
            case errc::unsupported_scheme: return "unsupported URL scheme (expected ws://)";
            case errc::connection_closed:  return "connection closed by peer";
            case errc::queue_closed:       return "queue closed";
            case errc::not_connected:      return "not connected";
            default:                       return "unknown relay error";
        }
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static RelayErrorCategory category;
    return category;
}

} // namespace relay
