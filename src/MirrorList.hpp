#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rangeget {

/**
 * The URLs the file can be downloaded from. Every entry serves the same resource; each range
 * getter is handed one of them at random to spread the load over the mirrors.
 */
class MirrorList {
    public:
        /**
         * @param urls the mirrors, at least one
         * @throws std::invalid_argument if the list is empty or an entry is not a http(s) URL
         */
        explicit MirrorList(std::vector<std::string> urls);

        /**
         * @brief Build the list from the command line source argument
         *
         * @param source Either a URL (anything containing "http") or the path of a file holding one
         * URL per line
         * @return The list, mirror_list_unreadable if the file cannot be read or holds no URL, or
         * invalid_url if an entry is malformed
         */
        [[nodiscard]] static auto from_source(std::string_view source)
            -> std::expected<MirrorList, std::error_code>;

        /**
         * @brief Choose a mirror uniformly at random
         */
        [[nodiscard]] const std::string& pick() const;

        /**
         * @brief Get the first mirror, the one used for the size probe and the output name
         */
        [[nodiscard]] const std::string& front() const { return urls_.front(); }

        [[nodiscard]] const std::vector<std::string>& get_urls() const { return urls_; }

        [[nodiscard]] size_t size() const { return urls_.size(); }

    private:
        std::vector<std::string> urls_;
};

}  // namespace rangeget
