#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <random>
#include <string>
#include <string_view>

namespace rangeget::utils {

/**
 * Convert the given value to big endian
 *
 * @param value  the value to convert
 * @return the value in big endian
 */
constexpr auto host_to_network_order(auto value) {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

/**
 * Convert the given value to host endian
 *
 * @param value  the value to convert
 * @return the value in host endian
 */
constexpr auto network_to_host_order(auto value) {
    return host_to_network_order(value);
}

/**
 * Calculate the ceiling of the division of the given integers
 *
 * @param divident the divident
 * @param divisor  the divisor
 * @return the ceiling of the division
 */
constexpr auto ceil_div(std::integral auto divident, std::integral auto divisor) {
    return (divident / divisor) + (divident % divisor != 0);
}

template <typename T>
    requires std::integral<T>
auto generate_random(T min = std::numeric_limits<T>::min(), T max = std::numeric_limits<T>::max()) {
    thread_local std::random_device  rd;
    thread_local std::mt19937        gen(rd());
    std::uniform_int_distribution<T> dist(min, max);

    return dist(gen);
}

/**
 * Remove leading and trailing whitespace
 *
 * @param str the string to trim
 * @return a view into str without the surrounding whitespace
 */
[[nodiscard]] std::string_view trim(std::string_view str);

/**
 * Check that the given string is an absolute http or https URL with a host
 *
 * @param url the string to check
 * @return true if the URL can be requested
 */
[[nodiscard]] bool is_http_url(std::string_view url);

/**
 * Get the name of the resource a URL points to: the last path segment, without the query string
 * and the fragment
 *
 * @param url the URL
 * @return the file name, empty if the URL has no path segment
 */
[[nodiscard]] std::string file_name_from_url(std::string_view url);

}  // namespace rangeget::utils
