#include "DownloadManager.hpp"

#include "ChunkQueue.hpp"
#include "Error.hpp"
#include "Logger.hpp"
#include "MetadataStore.hpp"
#include "Partitioner.hpp"
#include "TaskGroup.hpp"

#include <chrono>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace rangeget {

DownloadManager::DownloadManager(DownloadConfig config)
    : config_{std::move(config)}, mirrors_{config_.urls} {
    if (config_.output_path.empty()) {
        err::throw_with_trace<std::invalid_argument>("Output path must not be empty");
    }
    if (config_.chunk_size == 0 || config_.queue_capacity == 0) {
        err::throw_with_trace<std::invalid_argument>("Chunk size and queue capacity must be positive");
    }
    config_.output_path = std::filesystem::absolute(config_.output_path);
}

auto DownloadManager::run() -> std::expected<void, std::error_code> {
    if (stop_source_.stop_requested()) {
        return std::unexpected(DownloadErrc::cancelled);
    }

    auto file_size = probe_file_size(mirrors_.front(), config_.probe_timeouts);
    if (!file_size.has_value()) {
        return std::unexpected(file_size.error());
    }
    return download(*file_size);
}

auto DownloadManager::prepare_resume(const MetadataStore& store, size_t chunk_count)
    -> std::expected<std::shared_ptr<const Metadata>, std::error_code> {
    auto exists = store.exists();
    if (!exists.has_value()) {
        return std::unexpected(exists.error());
    }
    if (!*exists) {
        return nullptr;
    }

    auto is_empty = store.is_empty();
    if (!is_empty.has_value()) {
        return std::unexpected(is_empty.error());
    }

    // A previous run stopped before the first save completed
    if (*is_empty) {
        LOG_WARN("Removing empty metadata file {}", store.get_path().string());
        if (auto removed = store.remove(); !removed) {
            return std::unexpected(removed.error());
        }
        return nullptr;
    }

    std::error_code ec;
    const bool      output_exists{std::filesystem::exists(config_.output_path, ec)};
    if (ec) {
        LOG_ERROR("Failed to check output file {}: {}", config_.output_path.string(), ec.message());
        return std::unexpected(DownloadErrc::output_file_failed);
    }

    // The bits describe bytes that are not there anymore
    if (!output_exists) {
        LOG_WARN(
            "Metadata file {} found without {}, starting over",
            store.get_path().string(),
            config_.output_path.string()
        );
        if (auto removed = store.remove(); !removed) {
            return std::unexpected(removed.error());
        }
        return nullptr;
    }

    auto loaded = store.load(chunk_count);
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    return std::make_shared<const Metadata>(std::move(*loaded));
}

auto DownloadManager::download(uint64_t file_size) -> std::expected<void, std::error_code> {
    if (stop_source_.stop_requested()) {
        LOG_INFO("Download of {} cancelled before it started", config_.output_path.string());
        return std::unexpected(DownloadErrc::cancelled);
    }

    const size_t chunk_size{config_.chunk_size};
    const size_t chunk_count{Metadata::chunk_count(file_size, chunk_size)};

    auto store = std::make_unique<MetadataStore>(config_.output_path);

    auto resume_state = prepare_resume(*store, chunk_count);
    if (!resume_state.has_value()) {
        return std::unexpected(resume_state.error());
    }

    const bool resume{*resume_state != nullptr};
    Metadata   metadata{resume ? **resume_state : Metadata{chunk_count}};

    const uint32_t connections{effective_connections(file_size, config_.connections, chunk_size)};
    if (connections != config_.connections) {
        LOG_INFO("Using {} connections instead of {}", connections, config_.connections);
    }
    const auto ranges = partition(file_size, chunk_size, connections);

    {
        std::scoped_lock lock(state_mutex_);

        // The previous writer and getters reference the previous queue and store
        getters_.clear();
        writer_.reset();
        queue_ = std::make_unique<ChunkQueue>(config_.queue_capacity);
        store_ = std::move(store);

        writer_ = std::make_unique<Writer>(
            *queue_, config_.output_path, file_size, *store_, std::move(metadata), resume, chunk_size
        );
        writer_->set_progress_callback(config_.on_progress);
        writer_->set_completion_callback(config_.on_completion);

        for (const auto& range : ranges) {
            getters_.push_back(std::make_unique<RangeGetter>(
                *queue_, mirrors_.pick(), range, *resume_state, chunk_size, config_.range_timeouts
            ));
        }

        stats_                    = Stats{};
        stats_.total_bytes        = file_size;
        stats_.resumed_bytes      = writer_->get_downloaded_bytes();
        stats_.downloaded_bytes   = stats_.resumed_bytes;
        stats_.start_time         = std::chrono::steady_clock::now();
        stats_.active_connections = 0;
    }

    LOG_INFO(
        "{} {} ({} bytes, {} chunks) with {} connections",
        resume ? "Resuming" : "Starting",
        config_.output_path.string(),
        file_size,
        chunk_count,
        ranges.size()
    );

    std::mutex                     error_mutex;
    std::optional<std::error_code> first_error;

    download_status_.store(DownloadStatus::DOWNLOADING, std::memory_order_release);

    {
        // stop() reaches the threads through the group, which also stops them if a spawn throws
        TaskGroup tasks{stop_source_.get_token()};

        auto report = [&](std::error_code ec, const std::string& who) {
            {
                std::scoped_lock lock(error_mutex);
                if (!first_error.has_value()) {
                    LOG_ERROR("{} failed: {}", who, ec.message());
                    first_error = ec;
                }
            }
            tasks.request_stop();
        };

        tasks.spawn([&, writer = writer_.get()](std::stop_token stoken) {
            if (auto result = writer->run(stoken); !result) {
                report(result.error(), "Writer");
            }
        });
        for (auto& getter : getters_) {
            tasks.spawn([&, getter = getter.get()](std::stop_token stoken) {
                if (auto result = getter->run(stoken); !result) {
                    report(result.error(), fmt::format("Worker {}", getter->get_range().worker_index));
                }
            });
        }

        tasks.join();
    }

    if (first_error.has_value()) {
        download_status_.store(DownloadStatus::STOPPED, std::memory_order_release);
        return std::unexpected(*first_error);
    }

    LOG_INFO("Download of {} completed", config_.output_path.string());
    download_status_.store(DownloadStatus::FINISHED, std::memory_order_release);
    return {};
}

void DownloadManager::stop() {
    LOG_INFO("Stop requested");
    stop_source_.request_stop();
}

Stats DownloadManager::get_stats() const {
    std::scoped_lock lock(state_mutex_);

    Stats stats{stats_};
    if (writer_ != nullptr) {
        stats.downloaded_bytes = writer_->get_downloaded_bytes();
    }
    for (const auto& getter : getters_) {
        if (getter->get_state() == RangeGetter::State::STREAMING) {
            ++stats.active_connections;
        }
    }
    return stats;
}

}  // namespace rangeget
