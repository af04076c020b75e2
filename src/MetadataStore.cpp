#include "MetadataStore.hpp"

#include "Constant.hpp"
#include "Error.hpp"
#include "Logger.hpp"

#include <fstream>
#include <iterator>
#include <vector>

namespace rangeget {

MetadataStore::MetadataStore(const std::filesystem::path& output_path)
    : path_{output_path.string() + std::string{METADATA_SUFFIX}},
      staging_path_{output_path.string() + std::string{METADATA_STAGING_SUFFIX}} {}

auto MetadataStore::exists() const -> std::expected<bool, std::error_code> {
    std::error_code ec;
    const bool      found{std::filesystem::exists(path_, ec)};

    // a missing file is not an error, anything else that hides the record is
    if (ec) {
        LOG_ERROR("Failed to check metadata file {}: {}", path_.string(), ec.message());
        return std::unexpected(DownloadErrc::metadata_read_failed);
    }
    return found;
}

auto MetadataStore::is_empty() const -> std::expected<bool, std::error_code> {
    std::error_code ec;
    const auto      size = std::filesystem::file_size(path_, ec);

    if (ec) {
        LOG_ERROR("Failed to get the size of metadata file {}: {}", path_.string(), ec.message());
        return std::unexpected(DownloadErrc::metadata_read_failed);
    }
    return size == 0;
}

auto MetadataStore::save(const Metadata& metadata) const -> std::expected<void, std::error_code> {
    const auto encoded = metadata.serialize();

    {
        std::ofstream staging(staging_path_, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!staging.is_open()) {
            LOG_ERROR("Failed to open metadata staging file {}", staging_path_.string());
            return std::unexpected(DownloadErrc::metadata_write_failed);
        }

        staging.write(
            reinterpret_cast<const char*>(encoded.data()),
            static_cast<std::streamsize>(encoded.size())
        );
        staging.close();

        if (!staging) {
            LOG_ERROR("Failed to write metadata staging file {}", staging_path_.string());
            return std::unexpected(DownloadErrc::metadata_write_failed);
        }
    }

    // rename(2) replaces the destination atomically
    std::error_code ec;
    std::filesystem::rename(staging_path_, path_, ec);
    if (ec) {
        LOG_ERROR("Failed to move {} over {}: {}", staging_path_.string(), path_.string(), ec.message());
        return std::unexpected(DownloadErrc::metadata_write_failed);
    }

    return {};
}

auto MetadataStore::load(size_t expected_size) const -> std::expected<Metadata, std::error_code> {
    std::ifstream record(path_, std::ios::binary | std::ios::in);
    if (!record.is_open()) {
        LOG_ERROR("Failed to open metadata file {}", path_.string());
        return std::unexpected(DownloadErrc::metadata_read_failed);
    }

    std::vector<char> raw{std::istreambuf_iterator<char>(record), std::istreambuf_iterator<char>()};
    if (record.bad()) {
        LOG_ERROR("Failed to read metadata file {}", path_.string());
        return std::unexpected(DownloadErrc::metadata_read_failed);
    }

    auto metadata = Metadata::deserialize(
        std::span(reinterpret_cast<const std::byte*>(raw.data()), raw.size()), expected_size
    );
    if (!metadata) {
        LOG_ERROR("Failed to decode metadata file {}: {}", path_.string(), metadata.error().message());
    }
    return metadata;
}

auto MetadataStore::remove() const -> std::expected<void, std::error_code> {
    std::error_code ec;

    // a staging file left by an interrupted save is garbage once the record goes away
    std::filesystem::remove(staging_path_, ec);
    if (ec) {
        LOG_WARN("Failed to remove metadata staging file {}: {}", staging_path_.string(), ec.message());
    }

    ec.clear();
    if (!std::filesystem::remove(path_, ec) || ec) {
        LOG_ERROR("Failed to remove metadata file {}: {}", path_.string(), ec.message());
        return std::unexpected(DownloadErrc::metadata_remove_failed);
    }

    return {};
}

}  // namespace rangeget
