#include "RangeGetter.hpp"

#include "Error.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <charconv>
#include <cpr/cpr.h>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace {

// Parse the code of a status line such as "HTTP/1.1 206 Partial Content"
std::optional<long> parse_status_line(std::string_view line) {
    if (!line.starts_with("HTTP/")) {
        return std::nullopt;
    }

    auto code_begin = line.find(' ');
    if (code_begin == std::string_view::npos) {
        return std::nullopt;
    }
    line.remove_prefix(code_begin + 1);

    long code{};
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), code);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return code;
}

std::error_code from_transport_error(const cpr::Error& error) {
    using rangeget::DownloadErrc;

    switch (error.code) {
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return DownloadErrc::timeout;
        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return DownloadErrc::tls_error;
        default:
            return DownloadErrc::connection_failed;
    }
}

}  // namespace

namespace rangeget {

RangeGetter::RangeGetter(
    ChunkQueue&                     queue,
    std::string                     url,
    ByteRange                       range,
    std::shared_ptr<const Metadata> resume_state,
    size_t                          chunk_size,
    RangeTimeouts                   timeouts
)
    : queue_{queue},
      url_{std::move(url)},
      range_{range},
      resume_state_{std::move(resume_state)},
      chunk_size_{chunk_size},
      timeouts_{timeouts} {
    if (chunk_size_ == 0) {
        err::throw_with_trace<std::invalid_argument>("Chunk size must be positive");
    }
    if (range_.end_byte < range_.start_byte || range_.start_byte % chunk_size_ != 0) {
        err::throw_with_trace<std::invalid_argument>(
            fmt::format(
                "Invalid range {}-{} for worker {}",
                range_.start_byte,
                range_.end_byte,
                range_.worker_index
            )
        );
    }
    if (resume_state_ && resume_state_->size() * chunk_size_ <= range_.end_byte) {
        err::throw_with_trace<std::invalid_argument>("Resume bitmap does not cover the range");
    }
}

std::optional<uint64_t> RangeGetter::effective_start() const {
    if (!resume_state_) {
        return range_.start_byte;
    }

    const size_t first_index{range_.start_byte / chunk_size_};
    const size_t last_index{range_.end_byte / chunk_size_};

    for (size_t index = first_index; index <= last_index; ++index) {
        if (!resume_state_->is_downloaded(index)) {
            return static_cast<uint64_t>(index) * chunk_size_;
        }
    }
    return std::nullopt;
}

auto RangeGetter::run(std::stop_token stoken) -> std::expected<void, std::error_code> {
    state_.store(State::SCANNING, std::memory_order_release);

    const auto start = effective_start();
    if (!start.has_value()) {
        LOG_INFO(
            "Worker {}: range {}-{} is already on disk",
            range_.worker_index,
            range_.start_byte,
            range_.end_byte
        );
        state_.store(State::DONE, std::memory_order_release);
        return {};
    }

    if (*start != range_.start_byte) {
        LOG_INFO(
            "Worker {}: skipping {} leading chunks already on disk",
            range_.worker_index,
            (*start - range_.start_byte) / chunk_size_
        );
    }

    LOG_INFO(
        "Worker {}: downloading bytes {}-{} from {}",
        range_.worker_index,
        *start,
        range_.end_byte,
        url_
    );

    state_.store(State::STREAMING, std::memory_order_release);
    auto result = stream(*start, stoken);

    if (!result) {
        state_.store(State::FAILED, std::memory_order_release);
        if (result.error() == DownloadErrc::cancelled) {
            LOG_INFO("Worker {}: stopped", range_.worker_index);
        } else {
            LOG_ERROR("Worker {}: {}", range_.worker_index, result.error().message());
        }
        return result;
    }

    state_.store(State::DONE, std::memory_order_release);
    LOG_INFO(
        "Worker {}: finished, {} chunks were already on disk",
        range_.worker_index,
        skipped_chunks_
    );
    return {};
}

auto RangeGetter::stream(uint64_t start, std::stop_token stoken)
    -> std::expected<void, std::error_code> {
    request_start_ = start;
    next_offset_   = start;
    buffer_.clear();
    buffer_.reserve(chunk_size_);
    status_code_   = 0;
    failure_       = std::nullopt;
    last_received_ = 0;
    last_activity_ = std::chrono::steady_clock::now();

    cpr::Session session;
    session.SetUrl(cpr::Url{url_});
    session.SetHeader(cpr::Header{{"Range", fmt::format("bytes={}-{}", start, range_.end_byte)}});
    session.SetConnectTimeout(cpr::ConnectTimeout{timeouts_.connect});

    // Keep the status of the last response only, redirects send several
    session.SetHeaderCallback(cpr::HeaderCallback{[this](std::string_view header, intptr_t) {
        if (auto code = parse_status_line(header); code.has_value()) {
            status_code_ = *code;
        }
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[this, &stoken](std::string_view data, intptr_t) {
        return on_body(data, stoken);
    }});

    // Called periodically even when no data flows: enforces the stall timeout and the stop token
    session.SetProgressCallback(cpr::ProgressCallback{
        [this, &stoken](
            cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t downloaded, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t,
            intptr_t
        ) {
            if (stoken.stop_requested()) {
                return false;
            }

            const auto now = std::chrono::steady_clock::now();
            if (static_cast<uint64_t>(downloaded) != last_received_) {
                last_received_ = static_cast<uint64_t>(downloaded);
                last_activity_ = now;
            } else if (now - last_activity_ > timeouts_.read) {
                fail(DownloadErrc::timeout);
                return false;
            }
            return true;
        }
    });

    cpr::Response response = session.Get();

    if (failure_.has_value()) {
        return std::unexpected(*failure_);
    }
    if (stoken.stop_requested()) {
        return std::unexpected(DownloadErrc::cancelled);
    }
    if (response.error.code != cpr::ErrorCode::OK) {
        LOG_ERROR(
            "Worker {}: transfer error: {}", range_.worker_index, response.error.message
        );
        return std::unexpected(from_transport_error(response.error));
    }

    status_code_ = response.status_code;
    if (auto status = check_status(); !status) {
        return status;
    }

    if (next_offset_ != range_.end_byte + 1) {
        LOG_ERROR(
            "Worker {}: response ended at byte {} instead of {}",
            range_.worker_index,
            next_offset_,
            range_.end_byte + 1
        );
        return std::unexpected(DownloadErrc::truncated_response);
    }

    return {};
}

auto RangeGetter::check_status() const -> std::expected<void, std::error_code> {
    if (status_code_ == 206) {
        return {};
    }

    // A full response is only usable when it is exactly the requested range
    if (status_code_ == 200) {
        if (request_start_ == 0) {
            return {};
        }
        LOG_ERROR("Worker {}: the server ignored the Range header", range_.worker_index);
        return std::unexpected(DownloadErrc::range_not_supported);
    }

    LOG_ERROR("Worker {}: unexpected HTTP status {}", range_.worker_index, status_code_);
    return std::unexpected(DownloadErrc::http_error);
}

bool RangeGetter::on_body(std::string_view data, std::stop_token& stoken) {
    if (stoken.stop_requested()) {
        return false;
    }

    if (auto status = check_status(); !status) {
        fail(status.error());
        return false;
    }

    while (!data.empty()) {
        if (next_offset_ > range_.end_byte) {
            LOG_ERROR("Worker {}: server sent more bytes than requested", range_.worker_index);
            fail(DownloadErrc::unexpected_body_length);
            return false;
        }

        const uint64_t chunk_start{next_offset_ - buffer_.size()};
        const uint64_t chunk_end{std::min(chunk_start + chunk_size_ - 1, range_.end_byte)};
        const size_t   missing{static_cast<size_t>(chunk_end + 1 - next_offset_)};
        const size_t   take{std::min(missing, data.size())};

        const auto* bytes = reinterpret_cast<const std::byte*>(data.data());
        buffer_.insert(buffer_.end(), bytes, bytes + take);
        data.remove_prefix(take);
        next_offset_ += take;

        if (next_offset_ == chunk_end + 1 && !emit_chunk(stoken)) {
            return false;
        }
    }

    return true;
}

bool RangeGetter::emit_chunk(std::stop_token& stoken) {
    const uint64_t offset{next_offset_ - buffer_.size()};
    const size_t   index{offset / chunk_size_};

    // Interior chunks written by a previous run
    if (resume_state_ && resume_state_->is_downloaded(index)) {
        LOG_TRACE("Worker {}: chunk {} already on disk", range_.worker_index, index);
        ++skipped_chunks_;
        buffer_.clear();
        return true;
    }

    std::vector<std::byte> data;
    data.reserve(chunk_size_);
    data.swap(buffer_);

    return queue_.push(Chunk{offset, std::move(data)}, stoken);
}

}  // namespace rangeget
