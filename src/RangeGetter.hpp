#pragma once

#include "ChunkQueue.hpp"
#include "Constant.hpp"
#include "Duration.hpp"
#include "Metadata.hpp"
#include "Partitioner.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rangeget {

struct RangeTimeouts {
        std::chrono::milliseconds connect{duration::RANGE_CONNECT_TIMEOUT};
        // Longest time the body may stall without a single byte arriving
        std::chrono::milliseconds read{duration::RANGE_READ_TIMEOUT};
};

/**
 * Streams one assigned byte range over a single ranged GET and feeds the writer with
 * chunk-aligned pieces of it.
 *
 * On resume, the getter first scans the bitmap for the first chunk of its range that is not on
 * disk yet and starts the request there; a range with no missing chunk is not requested at all.
 * Chunks already on disk that show up later in the stream are dropped instead of queued.
 */
class RangeGetter {
    public:
        enum class State { IDLE, SCANNING, STREAMING, DONE, FAILED };

        /**
         * @param queue        the queue shared with the writer
         * @param url          the resource to request
         * @param range        the byte range owned by this getter, starting on a chunk boundary
         * @param resume_state the bitmap loaded at startup, nullptr for a fresh download
         * @param chunk_size   size of a bitmap slot
         * @param timeouts     connect and stall timeouts of the request
         */
        RangeGetter(
            ChunkQueue&                     queue,
            std::string                     url,
            ByteRange                       range,
            std::shared_ptr<const Metadata> resume_state,
            size_t                          chunk_size = CHUNK_SIZE,
            RangeTimeouts                   timeouts   = {}
        );

        RangeGetter(const RangeGetter&)            = delete;
        RangeGetter& operator=(const RangeGetter&) = delete;
        RangeGetter(RangeGetter&&)                 = delete;
        RangeGetter& operator=(RangeGetter&&)      = delete;
        ~RangeGetter()                             = default;

        /**
         * @brief Download the whole range, or the part of it that is still missing
         *
         * @param stoken Aborts the transfer and any wait on a full queue
         * @return cancelled if stopped, otherwise the first connection error
         */
        [[nodiscard]] auto run(std::stop_token stoken = {}) -> std::expected<void, std::error_code>;

        /**
         * @brief Find where the request has to start
         *
         * @return The offset of the first missing chunk of the range, or an empty optional if
         * every chunk of the range is already on disk
         */
        [[nodiscard]] std::optional<uint64_t> effective_start() const;

        /**
         * @note This function is thread-safe
         */
        [[nodiscard]] State get_state() const { return state_.load(std::memory_order_acquire); }

        [[nodiscard]] const ByteRange& get_range() const { return range_; }

        /**
         * @brief Get the number of chunks dropped because they were already on disk
         */
        [[nodiscard]] size_t get_skipped_chunks() const { return skipped_chunks_; }

    private:
        /**
         * @brief Issue the ranged GET from the given offset to the end of the range
         */
        [[nodiscard]] auto stream(uint64_t start, std::stop_token stoken)
            -> std::expected<void, std::error_code>;

        /**
         * @brief Consume a piece of the response body
         *
         * @return false to abort the transfer
         */
        bool on_body(std::string_view data, std::stop_token& stoken);

        /**
         * @brief Hand the buffered chunk to the writer, or drop it if it is already on disk
         *
         * @return false if the stop token fired while waiting for room in the queue
         */
        bool emit_chunk(std::stop_token& stoken);

        /**
         * @brief Check the status of the latest response against the requested range
         */
        [[nodiscard]] auto check_status() const -> std::expected<void, std::error_code>;

        void fail(std::error_code ec) {
            if (!failure_) {
                failure_ = ec;
            }
        }

        ChunkQueue&                     queue_;
        std::string                     url_;
        ByteRange                       range_;
        std::shared_ptr<const Metadata> resume_state_;
        size_t                          chunk_size_;
        RangeTimeouts                   timeouts_;
        std::atomic<State>              state_{State::IDLE};

        // Streaming state, only touched by the thread running run()
        uint64_t                              request_start_{};
        uint64_t                              next_offset_{};
        std::vector<std::byte>                buffer_;
        long                                  status_code_{};
        std::optional<std::error_code>        failure_;
        size_t                                skipped_chunks_{};
        uint64_t                              last_received_{};
        std::chrono::steady_clock::time_point last_activity_;
};

}  // namespace rangeget
