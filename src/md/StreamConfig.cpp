#include "abstract/FeedHandler.hpp"
#include "utils/UrlUtils.hpp"

#include <cmath>

namespace tcsim {
    std::vector<std::string> StreamConfig::validate() const {
        std::vector<std::string> problems;

        if (!parse_ws_url(ws_url)) {
            problems.push_back("ws_url must look like wss://host[:port]/path (got '" + ws_url + "')");
        }
        if (max_retries <= 0) {
            problems.push_back("max_retries must be a positive integer (got " + std::to_string(max_retries) + ")");
        }
        if (!std::isfinite(retry_delay) || retry_delay < 0.0) {
            problems.push_back("retry_delay must be >= 0 seconds");
        }
        if (!std::isfinite(connect_timeout) || connect_timeout <= 0.0) {
            problems.push_back("connect_timeout must be > 0 seconds");
        }
        if (!std::isfinite(read_timeout) || read_timeout < 0.0) {
            problems.push_back("read_timeout must be >= 0 seconds (0 disables the watchdog)");
        }
        return problems;
    }
} // namespace tcsim
