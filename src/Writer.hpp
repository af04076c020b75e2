#pragma once

#include "ChunkQueue.hpp"
#include "Constant.hpp"
#include "File.hpp"
#include "Metadata.hpp"
#include "MetadataStore.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <system_error>

namespace rangeget {

// Called with the integer percentage every time it changes
using ProgressCallback = std::function<void(uint32_t percent)>;

// Called once the whole file is on disk and the resume record is gone
using CompletionCallback = std::function<void()>;

/**
 * The single consumer of the chunk queue. It places every chunk at its offset in the output file,
 * marks the chunk in the bitmap and persists the bitmap before taking the next chunk, so that a
 * set bit always describes bytes that reached the file.
 */
class Writer {
    public:
        /**
         * @param queue       the queue filled by the range getters
         * @param output_path the file to assemble
         * @param file_size   the size of the file, from the HEAD probe
         * @param store       the persistence of the bitmap
         * @param metadata    a fresh bitmap, or the one loaded from the store when resuming
         * @param resume      true to keep the bytes already in the output file
         * @param chunk_size  size of a bitmap slot
         */
        Writer(
            ChunkQueue&           queue,
            std::filesystem::path output_path,
            uint64_t              file_size,
            const MetadataStore&  store,
            Metadata              metadata,
            bool                  resume,
            size_t                chunk_size = CHUNK_SIZE
        );

        Writer(const Writer&)            = delete;
        Writer& operator=(const Writer&) = delete;
        Writer(Writer&&)                 = delete;
        Writer& operator=(Writer&&)      = delete;
        ~Writer()                        = default;

        void set_progress_callback(ProgressCallback callback) {
            on_progress_ = std::move(callback);
        }

        void set_completion_callback(CompletionCallback callback) {
            on_completion_ = std::move(callback);
        }

        /**
         * @brief Drain the queue until every byte of the file is accounted for, then delete the
         * resume record
         *
         * @param stoken Stops the wait for the next chunk; the record is left in place
         * @return cancelled if stopped, otherwise the first filesystem or persistence error
         */
        [[nodiscard]] auto run(std::stop_token stoken = {}) -> std::expected<void, std::error_code>;

        /**
         * @brief Get the number of bytes of the file on disk, including those of a previous run
         * @note This function is thread-safe
         */
        [[nodiscard]] uint64_t get_downloaded_bytes() const {
            return downloaded_.load(std::memory_order_acquire);
        }

        [[nodiscard]] const Metadata& get_metadata() const { return metadata_; }

    private:
        /**
         * @brief Write one chunk, mark it and persist the bitmap
         */
        [[nodiscard]] auto commit(fs::File& file, const Chunk& chunk)
            -> std::expected<void, std::error_code>;

        void report_progress();

        ChunkQueue&           queue_;
        std::filesystem::path output_path_;
        uint64_t              file_size_;
        size_t                chunk_size_;
        const MetadataStore&  store_;
        Metadata              metadata_;
        bool                  resume_;
        std::atomic<uint64_t> downloaded_{0};
        // -1 so the starting percentage is always reported
        int64_t               last_percent_{-1};
        ProgressCallback      on_progress_;
        CompletionCallback    on_completion_;
};

}  // namespace rangeget
