#pragma once

#include "Duration.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <system_error>

namespace rangeget {

struct ProbeTimeouts {
        std::chrono::milliseconds connect{duration::PROBE_CONNECT_TIMEOUT};
        std::chrono::milliseconds total{duration::PROBE_TIMEOUT};
};

/**
 * @brief Ask the server for the size of a resource with a HEAD request
 *
 * @param url The resource
 * @param timeouts Connect and overall timeouts of the request
 * @return The Content-Length of the resource, probe_failed if the request failed, or
 * unknown_file_size if the server did not send a usable length
 * @note A server that does not advertise byte ranges only gets a warning in the log
 */
[[nodiscard]] auto probe_file_size(const std::string& url, const ProbeTimeouts& timeouts = {})
    -> std::expected<uint64_t, std::error_code>;

}  // namespace rangeget
