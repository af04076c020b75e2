#include "Stats.hpp"

#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>

namespace rangeget {

std::string Stats::get_formatted_download_rate() const {
    double download_rate{get_download_rate()};

    if (double megabyte_rate{download_rate / 1'048'576.0}; megabyte_rate >= 1.0) {
        return fmt::format("{:.2f} MiB/s", megabyte_rate);
    } else if (double kilobyte_rate{download_rate / 1'024.0}; kilobyte_rate >= 1.0) {
        return fmt::format("{:.2f} KiB/s", kilobyte_rate);
    } else {
        return fmt::format("{:.2f} B/s", download_rate);
    }

    std::unreachable();
}

std::string Stats::get_formatted_eta() const {
    auto eta{get_eta()};

    if (eta == std::chrono::seconds::max()) {
        return "Inf";
    }

    uint64_t eta_quant{static_cast<uint64_t>(eta.count())};
    uint64_t days_left{eta_quant / 86'400};
    uint64_t hours_left{(eta_quant % 86'400) / 3'600};
    uint64_t minutes_left{(eta_quant % 3'600) / 60};
    uint64_t seconds_left{eta_quant % 60};

    std::string formatted_eta{};

    if (days_left > 0) {
        formatted_eta += fmt::format("{}d:", days_left);
    }
    if (hours_left > 0) {
        formatted_eta += fmt::format("{}h:", hours_left);
    }
    if (minutes_left > 0) {
        formatted_eta += fmt::format("{}m:", minutes_left);
    }
    formatted_eta += fmt::format("{}s", seconds_left);

    return formatted_eta;
}

}  // namespace rangeget
