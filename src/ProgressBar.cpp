#include "ProgressBar.hpp"

#include "DownloadManager.hpp"
#include "Stats.hpp"

#include <indicators/block_progress_bar.hpp>
#include <indicators/cursor_control.hpp>
#include <spdlog/fmt/fmt.h>
#include <thread>

namespace rangeget::ui {

void ProgressBar::start_draw() {
    indicators::show_console_cursor(false);

    // The size probe runs before the download starts
    while (download_manager_.get_download_status() != DownloadStatus::DOWNLOADING &&
           !stop_flag_.test(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(duration::PROGRESS_BAR_START_POLL);
    }

    while (download_manager_.get_download_status() == DownloadStatus::DOWNLOADING &&
           !stop_flag_.test(std::memory_order_relaxed)) {
        const Stats cur_stats = download_manager_.get_stats();

        std::string bar_postfix{fmt::format(
            " {} | ETA: {} | Connections: {}",
            cur_stats.get_formatted_download_rate(),
            cur_stats.get_formatted_eta(),
            cur_stats.active_connections
        )};
        bar_.set_option(indicators::option::PostfixText{bar_postfix});
        bar_.set_progress(100.0 * cur_stats.get_download_percentage());

        std::this_thread::sleep_for(refresh_rate_);
    }

    if (download_manager_.get_download_status() == DownloadStatus::FINISHED) {
        bar_.set_option(indicators::option::PostfixText{" Done"});
        bar_.set_progress(100.0);
    }
    indicators::show_console_cursor(true);
}

}  // namespace rangeget::ui
