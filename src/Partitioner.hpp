#pragma once

#include "Constant.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rangeget {

/**
 * Contiguous, inclusive byte span of the target file owned by one range getter
 */
struct ByteRange {
        uint32_t worker_index;
        uint64_t start_byte;
        uint64_t end_byte;

        [[nodiscard]] uint64_t length() const { return end_byte - start_byte + 1; }

        bool operator==(const ByteRange&) const = default;
};

/**
 * @brief Decide how many connections a file is worth
 *
 * @param file_size Size of the file in bytes
 * @param requested Number of connections asked for (0 is treated as 1)
 * @param chunk_size Size of a chunk in bytes
 * @return 1 below MINIMAL_FILE_SIZE, otherwise the request capped at the number of chunks so that
 * no worker is left with an empty range
 */
[[nodiscard]] uint32_t effective_connections(
    uint64_t file_size, uint32_t requested, size_t chunk_size = CHUNK_SIZE
);

/**
 * @brief Split the chunk index space of a file into one contiguous range per worker
 *
 * Each worker gets total_chunks / num_connections whole chunks; the last worker's range is
 * extended to the end of the file to absorb the remainder of the division.
 *
 * @param file_size Size of the file in bytes
 * @param chunk_size Size of a chunk in bytes
 * @param num_connections Number of workers, at least 1 and at most the number of chunks
 * @return The ranges, ordered by worker index; empty for an empty file
 */
[[nodiscard]] std::vector<ByteRange> partition(
    uint64_t file_size, size_t chunk_size, uint32_t num_connections
);

}  // namespace rangeget
