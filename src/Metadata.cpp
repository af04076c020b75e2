#include "Metadata.hpp"

#include "Error.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <ranges>

namespace {

constexpr std::array<std::byte, 4> MAGIC{
    {std::byte{'R'}, std::byte{'G'}, std::byte{'M'}, std::byte{'D'}}
};
constexpr std::byte FORMAT_VERSION{1};
constexpr size_t    HEADER_SIZE{MAGIC.size() + 1 + sizeof(uint64_t)};

}  // namespace

namespace rangeget {

size_t Metadata::chunk_count(uint64_t file_size, size_t chunk_size) {
    return static_cast<size_t>(utils::ceil_div(file_size, static_cast<uint64_t>(chunk_size)));
}

size_t Metadata::chunk_length(size_t index, uint64_t file_size, size_t chunk_size) {
    if (index + 1 == chunk_count(file_size, chunk_size)) {
        return static_cast<size_t>(1 + (file_size - 1) % chunk_size);
    }
    return chunk_size;
}

size_t Metadata::downloaded_count() const {
    return static_cast<size_t>(std::ranges::count(bits_, true));
}

uint64_t Metadata::downloaded_bytes(uint64_t file_size, size_t chunk_size) const {
    uint64_t downloaded{0};
    for (auto index : std::views::iota(size_t{0}, bits_.size())) {
        if (bits_[index]) {
            downloaded += chunk_length(index, file_size, chunk_size);
        }
    }
    return downloaded;
}

std::vector<std::byte> Metadata::serialize() const {
    std::vector<std::byte> out(HEADER_SIZE + utils::ceil_div(bits_.size(), size_t{8}));

    std::ranges::copy(MAGIC, out.begin());
    out[MAGIC.size()] = FORMAT_VERSION;

    const uint64_t bit_count{utils::host_to_network_order(static_cast<uint64_t>(bits_.size()))};
    std::memcpy(out.data() + MAGIC.size() + 1, &bit_count, sizeof(bit_count));

    for (auto index : std::views::iota(size_t{0}, bits_.size())) {
        if (bits_[index]) {
            out[HEADER_SIZE + index / 8] |= std::byte{0x80} >> (index % 8);
        }
    }

    return out;
}

auto Metadata::deserialize(std::span<const std::byte> data, size_t expected_size)
    -> std::expected<Metadata, std::error_code> {
    if (data.size() < HEADER_SIZE || !std::ranges::equal(data.first(MAGIC.size()), MAGIC) ||
        data[MAGIC.size()] != FORMAT_VERSION) {
        return std::unexpected(DownloadErrc::metadata_corrupt);
    }

    uint64_t bit_count{};
    std::memcpy(&bit_count, data.data() + MAGIC.size() + 1, sizeof(bit_count));
    bit_count = utils::network_to_host_order(bit_count);

    auto payload = data.subspan(HEADER_SIZE);
    if (payload.size() != utils::ceil_div(bit_count, uint64_t{8})) {
        return std::unexpected(DownloadErrc::metadata_corrupt);
    }

    if (bit_count != expected_size) {
        return std::unexpected(DownloadErrc::metadata_size_mismatch);
    }

    Metadata metadata(expected_size);
    for (auto index : std::views::iota(size_t{0}, payload.size() * 8)) {
        bool bit{(payload[index / 8] & (std::byte{0x80} >> (index % 8))) != std::byte{0}};

        if (index >= expected_size) {
            // padding bits of the last byte must be clear
            if (bit) {
                return std::unexpected(DownloadErrc::metadata_corrupt);
            }
            continue;
        }
        metadata.bits_[index] = bit;
    }

    return metadata;
}

}  // namespace rangeget
