#include "HttpProbe.hpp"

#include "Error.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <charconv>
#include <cpr/cpr.h>
#include <string_view>

namespace rangeget {

auto probe_file_size(const std::string& url, const ProbeTimeouts& timeouts)
    -> std::expected<uint64_t, std::error_code> {
    cpr::Response response = cpr::Head(
        cpr::Url{url}, cpr::ConnectTimeout{timeouts.connect}, cpr::Timeout{timeouts.total}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        LOG_ERROR("HEAD {} failed: {}", url, response.error.message);
        return std::unexpected(DownloadErrc::probe_failed);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        LOG_ERROR("HEAD {} failed with status code: {}", url, response.status_code);
        return std::unexpected(DownloadErrc::probe_failed);
    }

    // cpr headers are case-insensitive
    auto length_it = response.header.find("content-length");
    if (length_it == response.header.end()) {
        LOG_ERROR("HEAD {} returned no Content-Length", url);
        return std::unexpected(DownloadErrc::unknown_file_size);
    }

    const std::string_view length_str{utils::trim(length_it->second)};
    int64_t                length{-1};
    auto [ptr, ec] =
        std::from_chars(length_str.data(), length_str.data() + length_str.size(), length);

    if (ec != std::errc{} || ptr != length_str.data() + length_str.size() || length < 0) {
        LOG_ERROR("HEAD {} returned an invalid Content-Length: '{}'", url, length_it->second);
        return std::unexpected(DownloadErrc::unknown_file_size);
    }

    auto ranges_it = response.header.find("accept-ranges");
    if (ranges_it == response.header.end() || utils::trim(ranges_it->second) != "bytes") {
        LOG_WARN("{} does not advertise byte range support, trying anyway", url);
    }

    LOG_INFO("Size of {}: {} bytes", url, length);
    return static_cast<uint64_t>(length);
}

}  // namespace rangeget
