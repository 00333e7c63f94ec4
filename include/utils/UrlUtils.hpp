#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tcsim {
    struct EndPoint {
        std::string host;
        std::string port;
        std::string target; ///< path + query, always starts with '/'
    };

    /**
     * Splits "wss://host[:port][/path][?query]" into host, port and target.
     *
     * - scheme is case-insensitive; only wss is accepted (the client is TLS-only)
     * - port defaults to 443, target to "/"
     * - returns nullopt on any other scheme, an empty host or a non-numeric port
     */
    std::optional<EndPoint> parse_ws_url(std::string_view url);
} // namespace tcsim
