#include "Writer.hpp"

#include "Error.hpp"
#include "File.hpp"
#include "Logger.hpp"

#include <optional>
#include <utility>

namespace rangeget {

Writer::Writer(
    ChunkQueue&           queue,
    std::filesystem::path output_path,
    uint64_t              file_size,
    const MetadataStore&  store,
    Metadata              metadata,
    bool                  resume,
    size_t                chunk_size
)
    : queue_{queue},
      output_path_{std::move(output_path)},
      file_size_{file_size},
      chunk_size_{chunk_size},
      store_{store},
      metadata_{std::move(metadata)},
      resume_{resume} {
    if (metadata_.size() != Metadata::chunk_count(file_size_, chunk_size_)) {
        err::throw_with_trace<std::invalid_argument>("Bitmap size does not match the file size");
    }
    // Seed the counter so the percentage is right from the first report on resume
    downloaded_.store(metadata_.downloaded_bytes(file_size_, chunk_size_), std::memory_order_release);
}

auto Writer::run(std::stop_token stoken) -> std::expected<void, std::error_code> {
    std::optional<fs::File> file;
    try {
        file.emplace(output_path_, resume_ ? fs::OpenMode::RESUME : fs::OpenMode::CREATE);
    } catch (const std::exception& e) {
        LOG_ERROR("Writer could not open the output file:\n{}", e.what());
        return std::unexpected(DownloadErrc::output_file_failed);
    }

    if (resume_) {
        LOG_INFO(
            "Writer resuming {}: {} of {} chunks ({} bytes) already on disk",
            output_path_.string(),
            metadata_.downloaded_count(),
            metadata_.size(),
            get_downloaded_bytes()
        );
    } else {
        LOG_INFO("Writer starting {} ({} bytes)", output_path_.string(), file_size_);
        // The record exists from now on: the download is in progress
        if (auto saved = store_.save(metadata_); !saved) {
            return saved;
        }
    }

    report_progress();

    while (get_downloaded_bytes() < file_size_) {
        // Queued chunks are left behind once stopped; the record still describes the file
        auto chunk = stoken.stop_requested() ? std::nullopt : queue_.pop(stoken);
        if (!chunk.has_value()) {
            LOG_INFO("Writer stopped with {} of {} bytes on disk", get_downloaded_bytes(), file_size_);
            return std::unexpected(DownloadErrc::cancelled);
        }

        if (auto committed = commit(*file, *chunk); !committed) {
            return committed;
        }
        report_progress();
    }

    file.reset();

    // Deleting the record is what marks the file as complete
    if (auto removed = store_.remove(); !removed) {
        return removed;
    }

    LOG_INFO("Writer finished {}", output_path_.string());
    if (on_completion_) {
        on_completion_();
    }

    return {};
}

auto Writer::commit(fs::File& file, const Chunk& chunk) -> std::expected<void, std::error_code> {
    const size_t index{chunk.get_index(chunk_size_)};

    if (index >= metadata_.size() || chunk.get_offset() != index * chunk_size_ ||
        chunk.get_size() != Metadata::chunk_length(index, file_size_, chunk_size_)) {
        LOG_ERROR(
            "Rejecting chunk at offset {} with {} bytes: it does not match a chunk slot",
            chunk.get_offset(),
            chunk.get_size()
        );
        return std::unexpected(DownloadErrc::invalid_chunk);
    }

    if (metadata_.is_downloaded(index)) {
        LOG_WARN("Chunk {} was already written, ignoring the duplicate", index);
        return {};
    }

    if (auto written = file.write(chunk.get_data(), chunk.get_offset()); !written) {
        LOG_ERROR("Failed to write chunk {} at offset {}", index, chunk.get_offset());
        return written;
    }

    metadata_.mark_downloaded(index);

    if (auto saved = store_.save(metadata_); !saved) {
        return saved;
    }

    downloaded_.fetch_add(chunk.get_size(), std::memory_order_acq_rel);
    LOG_TRACE("Committed chunk {} ({} bytes)", index, chunk.get_size());

    return {};
}

void Writer::report_progress() {
    const uint64_t downloaded{get_downloaded_bytes()};
    const int64_t  percent{
        file_size_ == 0 ? 100 : static_cast<int64_t>(downloaded * 100 / file_size_)
    };

    if (percent == last_percent_) {
        return;
    }
    last_percent_ = percent;

    LOG_DEBUG("Downloaded {}%", percent);
    if (on_progress_) {
        on_progress_(static_cast<uint32_t>(percent));
    }
}

}  // namespace rangeget
