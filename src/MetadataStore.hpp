#pragma once

#include "Metadata.hpp"

#include <expected>
#include <filesystem>
#include <system_error>

namespace rangeget {

/**
 * Crash-safe persistence of the resume bitmap next to the output file.
 *
 * <output>.tmp    canonical record; present = download in progress, absent = not started or done
 * <output>.1.tmp  staging file, written in full and then renamed over the canonical record
 *
 * At any point the canonical record is either the previous or the new complete bitmap.
 */
class MetadataStore {
    public:
        explicit MetadataStore(const std::filesystem::path& output_path);

        /**
         * @brief Check if a canonical record exists (i.e. the download can be resumed)
         *
         * @return metadata_read_failed if the record cannot be examined
         */
        [[nodiscard]] auto exists() const -> std::expected<bool, std::error_code>;

        /**
         * @brief Check if the canonical record exists but holds no bytes
         * This happens when a previous run stopped right after creating it
         *
         * @return metadata_read_failed if the size of the record cannot be read
         */
        [[nodiscard]] auto is_empty() const -> std::expected<bool, std::error_code>;

        /**
         * @brief Atomically replace the canonical record with the given bitmap
         *
         * @param metadata The bitmap to persist
         * @return metadata_write_failed on any I/O error
         */
        [[nodiscard]] auto save(const Metadata& metadata) const
            -> std::expected<void, std::error_code>;

        /**
         * @brief Read the canonical record
         *
         * @param expected_size Number of chunk slots of the file being downloaded
         * @return The bitmap, metadata_read_failed on I/O errors, or a decoding error
         */
        [[nodiscard]] auto load(size_t expected_size) const
            -> std::expected<Metadata, std::error_code>;

        /**
         * @brief Delete the canonical record (and any leftover staging file)
         *
         * @return metadata_remove_failed if the record could not be deleted
         */
        [[nodiscard]] auto remove() const -> std::expected<void, std::error_code>;

        [[nodiscard]] const std::filesystem::path& get_path() const { return path_; }

        [[nodiscard]] const std::filesystem::path& get_staging_path() const {
            return staging_path_;
        }

    private:
        std::filesystem::path path_;
        std::filesystem::path staging_path_;
};

}  // namespace rangeget
