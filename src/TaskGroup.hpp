#pragma once

#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace rangeget {

/**
 * A set of threads that share one stop source.
 * If the group is destroyed while some of its threads are still running (e.g. an exception
 * escaped while the group was being filled), it stops all of them before joining, so no
 * thread is left waiting for work that will never come.
 */
class TaskGroup {
    public:
        TaskGroup() = default;

        /**
         * @param stoken An outer token; stopping it stops the whole group
         */
        explicit TaskGroup(std::stop_token stoken)
            : forward_stop_{std::in_place, std::move(stoken), StopForwarder{stop_source_}} {}

        TaskGroup(const TaskGroup&)            = delete;
        TaskGroup& operator=(const TaskGroup&) = delete;
        TaskGroup(TaskGroup&&)                 = delete;
        TaskGroup& operator=(TaskGroup&&)      = delete;

        ~TaskGroup() {
            for (const auto& thread : threads_) {
                if (thread.joinable()) {
                    stop_source_.request_stop();
                    break;
                }
            }
            join();
        }

        /**
         * @brief Start a thread running `task(stop_token)` with the token of the group
         */
        template <typename Task>
        void spawn(Task&& task) {
            threads_.emplace_back(std::forward<Task>(task), stop_source_.get_token());
        }

        /**
         * @brief Wait for every thread, in the order they were spawned
         */
        void join() {
            for (auto& thread : threads_) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        }

        /**
         * @note This function is thread-safe
         */
        void request_stop() { stop_source_.request_stop(); }

        [[nodiscard]] std::stop_token get_token() const { return stop_source_.get_token(); }

    private:
        struct StopForwarder {
                std::stop_source source;
                void             operator()() { source.request_stop(); }
        };

        std::stop_source stop_source_;
        // Declared after the source it triggers and before the threads, which are joined first
        std::optional<std::stop_callback<StopForwarder>> forward_stop_;
        std::vector<std::thread>                         threads_;
};

}  // namespace rangeget
