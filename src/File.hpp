#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <span>
#include <system_error>

namespace rangeget::fs {

enum class OpenMode {
    // Create the file, discarding any previous content
    CREATE,
    // Open an existing file and keep its content
    RESUME
};

/**
 * Output file written at arbitrary offsets. Owned by the writer thread only.
 */
class File {
    public:
        /**
         * @brief Open the target file
         *
         * @param path  the path of the file
         * @param mode  whether to start from an empty file or keep the existing bytes
         * @throws std::runtime_error if the file cannot be opened
         */
        File(const std::filesystem::path& path, OpenMode mode);
        ~File();

        File(const File&)                = delete;
        File& operator=(const File&)     = delete;
        File(File&&) noexcept            = default;
        File& operator=(File&&) noexcept = default;

        /**
         * @brief Write data to the file at a given offset and hand it to the operating system
         *
         * @param data    the data to write
         * @param offset  the offset to write the data at
         * @return output_write_failed if the write or the flush failed
         * @note Writing past the end extends the file; the gap reads as zeros
         */
        [[nodiscard]] auto write(std::span<const std::byte> data, uint64_t offset)
            -> std::expected<void, std::error_code>;

        [[nodiscard]] const std::filesystem::path& get_path() const { return path_; }

    private:
        std::filesystem::path path_;
        std::fstream          file_;
};

}  // namespace rangeget::fs
