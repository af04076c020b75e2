#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rangeget {

struct Stats {
        /**
         * @brief Get the elapsed seconds since the start of the download
         *
         * @return The elapsed seconds
         */
        [[nodiscard]] auto get_elapsed_seconds() const -> std::chrono::seconds {
            return std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - start_time
            );
        }

        /*
         * @brief Get the download rate of this run in bytes per second
         *
         * @return The download rate, 0 during the first second
         */
        [[nodiscard]] double get_download_rate() const {
            const auto elapsed = get_elapsed_seconds().count();
            if (elapsed <= 0 || downloaded_bytes < resumed_bytes) {
                return 0.0;
            }
            return static_cast<double>(downloaded_bytes - resumed_bytes) / elapsed;
        }

        /**
         * @brief Get the download rate in a formatted string
         *
         * @return The download rate as a string
         * @note The rate is formatted as B/s, KiB/s or MiB/s
         * depending on the magnitude of the rate
         */
        [[nodiscard]] std::string get_formatted_download_rate() const;

        /**
         * @brief Get the download percentage
         *
         * @return The download percentage, in [0, 1]
         */
        [[nodiscard]] double get_download_percentage() const {
            if (total_bytes == 0) {
                return 1.0;
            }
            return static_cast<double>(downloaded_bytes) / total_bytes;
        }

        /**
         * @brief Get the estimated time of arrival in seconds
         *
         * @return The estimated time of arrival, seconds::max() while the rate is unknown
         */
        [[nodiscard]] auto get_eta() const -> std::chrono::seconds {
            const double rate{get_download_rate()};
            if (rate <= 0.0) {
                return std::chrono::seconds::max();
            }
            return std::chrono::seconds{
                static_cast<long>((total_bytes - downloaded_bytes) / rate)
            };
        }

        /**
         * @brief Get the estimated time of arrival in a formatted string
         *
         * @return The estimated time of arrival as a string
         * @note The time is formatted as DD:HH:MM:SS
         */
        [[nodiscard]] std::string get_formatted_eta() const;

        uint64_t                                           total_bytes{};
        uint64_t                                           downloaded_bytes{};
        // Bytes already on disk when the run started
        uint64_t                                           resumed_bytes{};
        std::chrono::time_point<std::chrono::steady_clock> start_time;
        uint32_t                                           active_connections{};
};

}  // namespace rangeget
