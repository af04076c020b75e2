#pragma once

#include "ChunkQueue.hpp"
#include "Constant.hpp"
#include "HttpProbe.hpp"
#include "MetadataStore.hpp"
#include "MirrorList.hpp"
#include "RangeGetter.hpp"
#include "Stats.hpp"
#include "Writer.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

namespace rangeget {

enum class DownloadStatus { STOPPED, DOWNLOADING, FINISHED };

struct DownloadConfig {
        // Mirrors of the resource; the first one is probed for the size
        std::vector<std::string> urls;
        std::filesystem::path    output_path;
        uint32_t                 connections{DEFAULT_CONNECTIONS};
        size_t                   chunk_size{CHUNK_SIZE};
        size_t                   queue_capacity{CHUNK_QUEUE_CAPACITY};
        ProbeTimeouts            probe_timeouts{};
        RangeTimeouts            range_timeouts{};
        ProgressCallback         on_progress;
        CompletionCallback       on_completion;
};

/**
 * Runs one download: probes the size, decides between a fresh start and a resume, splits the
 * file between the range getters and runs them together with the writer, each on its own thread.
 *
 * The first thread to fail stops every other one and its error is the result of the download.
 * The persisted bitmap is only removed by the writer once the whole file is on disk, so any
 * failed run can be resumed.
 */
class DownloadManager {
    public:
        /**
         * @throws std::invalid_argument if the mirrors, the output path or the sizes are invalid
         */
        explicit DownloadManager(DownloadConfig config);

        DownloadManager(const DownloadManager&)            = delete;
        DownloadManager& operator=(const DownloadManager&) = delete;
        DownloadManager(DownloadManager&&)                 = delete;
        DownloadManager& operator=(DownloadManager&&)      = delete;
        ~DownloadManager()                                 = default;

        /**
         * @brief Probe the first mirror for the size of the file and download it
         *
         * @return The first error of the download
         */
        [[nodiscard]] auto run() -> std::expected<void, std::error_code>;

        /**
         * @brief Download a file whose size is already known
         *
         * @param file_size Size of the file in bytes
         * @return The first error reported by the writer or a range getter
         */
        [[nodiscard]] auto download(uint64_t file_size) -> std::expected<void, std::error_code>;

        /**
         * @brief Stop the download; it ends with the cancelled error and stays resumable
         * A stop requested before or during run() also cancels it. The manager can not be
         * restarted afterwards; a new one resumes the download.
         * @note This function is thread-safe
         */
        void stop();

        /**
         * @brief Get a snapshot of the progress of the download
         * @note This function is thread-safe
         */
        [[nodiscard]] Stats get_stats() const;

        /**
         * @note This function is thread-safe
         */
        [[nodiscard]] DownloadStatus get_download_status() const {
            return download_status_.load(std::memory_order_acquire);
        }

    private:
        /**
         * @brief Find the resume state left by a previous run, cleaning up the unusable ones
         *
         * @param store The record of the output file
         * @param chunk_count Number of chunks of the file
         * @return The bitmap to resume from, nullptr to start fresh, or a persistence error
         */
        [[nodiscard]] auto prepare_resume(const MetadataStore& store, size_t chunk_count)
            -> std::expected<std::shared_ptr<const Metadata>, std::error_code>;

        DownloadConfig              config_;
        MirrorList                  mirrors_;
        std::atomic<DownloadStatus> download_status_{DownloadStatus::STOPPED};
        std::stop_source            stop_source_;

        // Guards the members below, which are replaced at the start of every download.
        // The queue and the store are declared first, so they outlive the writer and getters.
        mutable std::mutex                        state_mutex_;
        std::unique_ptr<ChunkQueue>               queue_;
        std::unique_ptr<MetadataStore>            store_;
        std::unique_ptr<Writer>                   writer_;
        std::vector<std::unique_ptr<RangeGetter>> getters_;
        Stats                                     stats_;
};

}  // namespace rangeget
