/**
 * \file relay/io/LineTrim.hpp
 * \brief Line-terminator trimming for the `outgoing:` / `incoming:` diagnostics.
 */
#pragma once

#include <string>
#include <string_view>

namespace relay {

/// Line text without its trailing "\n" / "\r\n", for diagnostic output only.
inline std::string trim_line_end(std::string_view text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

} // namespace relay
