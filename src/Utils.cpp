#include "Utils.hpp"

#include <string>
#include <string_view>

namespace rangeget::utils {

std::string_view trim(std::string_view str) {
    constexpr std::string_view whitespace{" \t\r\n\v\f"};

    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(whitespace);

    return str.substr(first, last - first + 1);
}

bool is_http_url(std::string_view url) {
    std::string_view rest;
    if (url.starts_with("http://")) {
        rest = url.substr(7);
    } else if (url.starts_with("https://")) {
        rest = url.substr(8);
    } else {
        return false;
    }

    // there must be a host before the path
    const auto host_end = rest.find_first_of("/?#");
    return !rest.substr(0, host_end).empty() &&
           rest.find_first_of(" \t\r\n") == std::string_view::npos;
}

std::string file_name_from_url(std::string_view url) {
    // drop the fragment and the query string
    url = url.substr(0, url.find('#'));
    url = url.substr(0, url.find('?'));

    // skip the scheme and the host
    if (const auto scheme_end = url.find("://"); scheme_end != std::string_view::npos) {
        url.remove_prefix(scheme_end + 3);
        const auto path_start = url.find('/');
        if (path_start == std::string_view::npos) {
            return {};
        }
        url.remove_prefix(path_start);
    }

    return std::string{url.substr(url.find_last_of('/') + 1)};
}

}  // namespace rangeget::utils
