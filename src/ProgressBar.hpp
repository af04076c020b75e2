#pragma once

#include "Constant.hpp"
#include "DownloadManager.hpp"
#include "Duration.hpp"

#include <atomic>
#include <indicators/block_progress_bar.hpp>

namespace rangeget::ui {

class ProgressBar {
    public:
        explicit ProgressBar(const DownloadManager& download_manager)
            : bar_(
                  indicators::option::BarWidth{PROGRESS_BAR_WIDTH},
                  indicators::option::PostfixText{PROGRESS_BAR_INIT_TEXT}
              ),
              download_manager_{download_manager} {}

        /**
         * Starts drawing the progress bar.
         *
         * @Note: This function blocks until the download stops or stop_draw() is called. Should be
         * called from a separate thread.
         */
        void start_draw();

        /**
         * Set the stop flag to true.
         * This will stop the progress bar from drawing.
         */
        void stop_draw() { stop_flag_.test_and_set(std::memory_order_relaxed); }

    private:
        indicators::BlockProgressBar bar_;
        const DownloadManager&       download_manager_;
        std::atomic_flag             stop_flag_{ATOMIC_FLAG_INIT};
        std::chrono::milliseconds    refresh_rate_{duration::PROGRESS_BAR_REFRESH_RATE};
};
}  // namespace rangeget::ui
