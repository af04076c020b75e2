#pragma once

#include "Constant.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <system_error>
#include <vector>

namespace rangeget {

/**
 * Resume bitmap: one bit per chunk-sized slot of the target file. Bit i is set if and only if the
 * bytes [i * chunk_size, min((i + 1) * chunk_size, file_size)) have been written to the target.
 * Bits are only ever set, never cleared.
 */
class Metadata {
    public:
        explicit Metadata(size_t size) : bits_(size, false) {}

        /**
         * @brief Get the number of chunk slots of a file
         *
         * @param file_size Size of the file in bytes
         * @param chunk_size Size of a slot in bytes
         * @return ceil(file_size / chunk_size)
         */
        [[nodiscard]] static size_t chunk_count(uint64_t file_size, size_t chunk_size);

        /**
         * @brief Get the length of the byte range a slot covers
         *
         * @param index Index of the slot
         * @param file_size Size of the file in bytes
         * @param chunk_size Size of a slot in bytes
         * @return chunk_size for every slot but the last, which gets the remainder
         */
        [[nodiscard]] static size_t chunk_length(
            size_t index, uint64_t file_size, size_t chunk_size
        );

        [[nodiscard]] size_t size() const { return bits_.size(); }

        [[nodiscard]] bool is_downloaded(size_t index) const {
            assert(index < bits_.size() && "Chunk index out of bounds");
            return bits_[index];
        }

        void mark_downloaded(size_t index) {
            assert(index < bits_.size() && "Chunk index out of bounds");
            bits_[index] = true;
        }

        /**
         * @brief Count the slots that have been written
         */
        [[nodiscard]] size_t downloaded_count() const;

        [[nodiscard]] bool all_downloaded() const { return downloaded_count() == bits_.size(); }

        /**
         * @brief Sum the byte lengths of every written slot
         *
         * @param file_size Size of the file in bytes
         * @param chunk_size Size of a slot in bytes
         * @return Number of bytes already on disk
         */
        [[nodiscard]] uint64_t downloaded_bytes(
            uint64_t file_size, size_t chunk_size = CHUNK_SIZE
        ) const;

        /**
         * @brief Encode the bitmap: magic, version, big endian bit count, packed bits (MSB first)
         *
         * @return The encoded bytes
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Decode a bitmap produced by serialize()
         *
         * @param data The encoded bytes
         * @param expected_size Number of slots the file needs, recomputed from its size
         * @return The bitmap, or metadata_corrupt / metadata_size_mismatch
         */
        [[nodiscard]] static auto deserialize(std::span<const std::byte> data, size_t expected_size)
            -> std::expected<Metadata, std::error_code>;

        bool operator==(const Metadata&) const = default;

    private:
        std::vector<bool> bits_;
};

}  // namespace rangeget
