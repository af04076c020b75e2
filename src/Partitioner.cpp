#include "Partitioner.hpp"

#include "Error.hpp"
#include "Logger.hpp"
#include "Metadata.hpp"

#include <algorithm>
#include <ranges>
#include <spdlog/fmt/fmt.h>

namespace rangeget {

uint32_t effective_connections(uint64_t file_size, uint32_t requested, size_t chunk_size) {
    if (requested == 0 || file_size < MINIMAL_FILE_SIZE) {
        return 1;
    }

    const uint64_t total_chunks{Metadata::chunk_count(file_size, chunk_size)};
    return static_cast<uint32_t>(std::min<uint64_t>(requested, total_chunks));
}

std::vector<ByteRange> partition(uint64_t file_size, size_t chunk_size, uint32_t num_connections) {
    if (chunk_size == 0 || num_connections == 0) {
        err::throw_with_trace<std::invalid_argument>(fmt::format(
            "Cannot partition with chunk size {} and {} connections", chunk_size, num_connections
        ));
    }

    std::vector<ByteRange> ranges;
    if (file_size == 0) {
        return ranges;
    }

    const uint64_t total_chunks{Metadata::chunk_count(file_size, chunk_size)};
    if (num_connections > total_chunks) {
        err::throw_with_trace<std::invalid_argument>(fmt::format(
            "Cannot split {} chunks between {} connections", total_chunks, num_connections
        ));
    }

    const uint64_t chunks_per_worker{total_chunks / num_connections};
    const uint64_t bytes_per_worker{chunks_per_worker * chunk_size};

    ranges.reserve(num_connections);
    for (auto worker : std::views::iota(uint32_t{0}, num_connections)) {
        uint64_t start{worker * bytes_per_worker};
        uint64_t end{(worker + 1) * bytes_per_worker - 1};

        // the last worker absorbs the remainder of the integer division
        if (worker == num_connections - 1) {
            end = file_size - 1;
        }

        ranges.push_back(ByteRange{worker, start, end});
        LOG_DEBUG("Worker {} owns bytes [{}, {}]", worker, start, end);
    }

    return ranges;
}

}  // namespace rangeget
