#include "utils/UrlUtils.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>

namespace tcsim {
    std::optional<EndPoint> parse_ws_url(std::string_view url) {
        const std::string trimmed = boost::algorithm::trim_copy(std::string(url));

        constexpr std::string_view scheme = "wss://";
        if (trimmed.size() <= scheme.size()
            || !boost::algorithm::iequals(std::string_view(trimmed).substr(0, scheme.size()), scheme)) {
            return std::nullopt;
        }

        const std::string rest = trimmed.substr(scheme.size());
        const auto path_pos = rest.find_first_of("/?");
        const std::string authority = rest.substr(0, path_pos);

        EndPoint e;
        e.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
        if (e.target.front() == '?') e.target.insert(e.target.begin(), '/');

        const auto colon = authority.rfind(':');
        if (colon == std::string::npos) {
            e.host = authority;
            e.port = "443";
        } else {
            e.host = authority.substr(0, colon);
            e.port = authority.substr(colon + 1);
            if (e.port.empty()
                || !std::ranges::all_of(e.port, [](unsigned char c) { return std::isdigit(c) != 0; })) {
                return std::nullopt;
            }
        }

        if (e.host.empty()) return std::nullopt;
        return e;
    }
} // namespace tcsim
