#include "MirrorList.hpp"

#include "Error.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>

namespace rangeget {

MirrorList::MirrorList(std::vector<std::string> urls) : urls_{std::move(urls)} {
    if (urls_.empty()) {
        err::throw_with_trace<std::invalid_argument>("Mirror list must not be empty");
    }
    if (!std::ranges::all_of(urls_, [](const std::string& url) { return utils::is_http_url(url); }
        )) {
        err::throw_with_trace<std::invalid_argument>("Mirror list contains an invalid URL");
    }
}

auto MirrorList::from_source(std::string_view source)
    -> std::expected<MirrorList, std::error_code> {
    source = utils::trim(source);

    if (source.find("http") != std::string_view::npos) {
        if (!utils::is_http_url(source)) {
            LOG_ERROR("'{}' is not a valid URL", source);
            return std::unexpected(DownloadErrc::invalid_url);
        }
        return MirrorList{std::vector<std::string>{std::string{source}}};
    }

    std::ifstream list_file{std::string{source}};
    if (!list_file.is_open()) {
        LOG_ERROR("Failed to open mirror list {}", source);
        return std::unexpected(DownloadErrc::mirror_list_unreadable);
    }

    std::vector<std::string> urls;
    std::string              line;

    while (std::getline(list_file, line)) {
        auto url = utils::trim(line);
        if (url.empty()) {
            continue;
        }
        if (!utils::is_http_url(url)) {
            LOG_ERROR("Mirror list {} contains an invalid URL: '{}'", source, url);
            return std::unexpected(DownloadErrc::invalid_url);
        }
        urls.emplace_back(url);
    }

    if (list_file.bad() || urls.empty()) {
        LOG_ERROR("Mirror list {} could not be read or holds no URL", source);
        return std::unexpected(DownloadErrc::mirror_list_unreadable);
    }

    LOG_INFO("Loaded {} mirrors from {}", urls.size(), source);
    return MirrorList{std::move(urls)};
}

const std::string& MirrorList::pick() const {
    return urls_[utils::generate_random<size_t>(0, urls_.size() - 1)];
}

}  // namespace rangeget
