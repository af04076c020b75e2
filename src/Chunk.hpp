#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace rangeget {

/**
 * A piece of the target file together with its absolute offset in the file.
 * A chunk is move-only: the range getter that reads it hands it over to the writer through the
 * chunk queue and never touches it again.
 */
class Chunk {
    public:
        Chunk(uint64_t offset, std::vector<std::byte> data)
            : offset_{offset}, data_{std::move(data)} {}

        Chunk(const Chunk&)                = delete;
        Chunk& operator=(const Chunk&)     = delete;
        Chunk(Chunk&&) noexcept            = default;
        Chunk& operator=(Chunk&&) noexcept = default;
        ~Chunk()                           = default;

        [[nodiscard]] uint64_t get_offset() const { return offset_; }

        [[nodiscard]] size_t get_size() const { return data_.size(); }

        [[nodiscard]] std::span<const std::byte> get_data() const { return data_; }

        /**
         * @brief Get the index of the bitmap slot this chunk fills
         *
         * @param chunk_size Size of a bitmap slot
         * @return The slot index
         */
        [[nodiscard]] size_t get_index(size_t chunk_size) const { return offset_ / chunk_size; }

    private:
        uint64_t               offset_;
        std::vector<std::byte> data_;
};

}  // namespace rangeget
