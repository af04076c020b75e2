#pragma once

#include "Chunk.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace rangeget {

/**
 * Multi-producer / single-consumer FIFO hand-off.
 * Both ends block: pop() while the queue is empty, push() while it holds `capacity` items. Every
 * blocking call also returns as soon as its stop token is triggered, which is how a failing
 * worker wakes up the rest of the download.
 * Items from different producers interleave in arrival order only.
 */
template <typename T>
class BlockingQueue {
    public:
        explicit BlockingQueue(size_t capacity) : capacity_{capacity == 0 ? 1 : capacity} {}

        BlockingQueue(const BlockingQueue&)            = delete;
        BlockingQueue& operator=(const BlockingQueue&) = delete;
        BlockingQueue(BlockingQueue&&)                 = delete;
        BlockingQueue& operator=(BlockingQueue&&)      = delete;
        ~BlockingQueue()                               = default;

        /**
         * @brief Append an item, waiting for free space if the queue is full
         *
         * @param item The item to append
         * @param stoken Token that aborts the wait
         * @return true if the item was queued, false if the wait was stopped
         */
        bool push(T item, std::stop_token stoken = {}) {
            {
                std::unique_lock lock(mutex_);
                if (!not_full_.wait(lock, stoken, [this] { return items_.size() < capacity_; })) {
                    return false;
                }
                items_.push_back(std::move(item));
            }
            not_empty_.notify_one();
            return true;
        }

        /**
         * @brief Remove the oldest item, waiting until one is available
         *
         * @param stoken Token that aborts the wait
         * @return The item, or an empty optional if the wait was stopped
         */
        std::optional<T> pop(std::stop_token stoken = {}) {
            std::optional<T> item;
            {
                std::unique_lock lock(mutex_);
                if (!not_empty_.wait(lock, stoken, [this] { return !items_.empty(); })) {
                    return std::nullopt;
                }
                item.emplace(std::move(items_.front()));
                items_.pop_front();
            }
            not_full_.notify_one();
            return item;
        }

        [[nodiscard]] size_t size() const {
            std::scoped_lock lock(mutex_);
            return items_.size();
        }

        [[nodiscard]] size_t capacity() const { return capacity_; }

    private:
        const size_t                capacity_;
        mutable std::mutex          mutex_;
        std::condition_variable_any not_empty_;
        std::condition_variable_any not_full_;
        std::deque<T>               items_;
};

using ChunkQueue = BlockingQueue<Chunk>;

}  // namespace rangeget
