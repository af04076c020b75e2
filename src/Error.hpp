#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace err {

/**
 * @brief Get the error message with trace
 *
 * @param msg The error message
 * @return std::string The error message with trace
 */
[[nodiscard]] std::string err_msg_with_trace(const std::string& msg);

/**
 * @brief Throw an exception with trace
 *
 * @tparam Error The type of the exception
 * @param msg The error message
 */
template <typename Error = std::runtime_error>
[[noreturn]] void throw_with_trace(const std::string& msg) {
    throw Error(err_msg_with_trace(msg));
}
}  // namespace err

namespace rangeget {

/**
 * Every failure a download can end with. Each value maps to one of the four fatal classes: probe,
 * connection, persistence and filesystem errors, plus launcher and coordination errors.
 */
enum class DownloadErrc {
    success = 0,

    // probe
    probe_failed,
    unknown_file_size,

    // connection
    connection_failed,
    timeout,
    tls_error,
    http_error,
    range_not_supported,
    truncated_response,
    unexpected_body_length,

    // persistence
    metadata_write_failed,
    metadata_read_failed,
    metadata_corrupt,
    metadata_size_mismatch,
    metadata_remove_failed,

    // filesystem
    output_file_failed,
    output_write_failed,

    // launcher
    mirror_list_unreadable,
    invalid_url,
    invalid_argument,

    // coordination
    cancelled,
    invalid_chunk,
};

/**
 * @brief Get the error category of the download errors
 *
 * @return The singleton category
 */
const std::error_category& download_category() noexcept;

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_category()};
}

}  // namespace rangeget

template <>
struct std::is_error_code_enum<rangeget::DownloadErrc> : std::true_type {};
