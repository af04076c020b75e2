#include "File.hpp"

#include "Error.hpp"

#include <filesystem>
#include <spdlog/fmt/fmt.h>

namespace rangeget::fs {

File::File(const std::filesystem::path& path, OpenMode mode) : path_{path} {
    // create directories if they don't exist
    if (path.has_parent_path()) {
        try {
            std::filesystem::create_directories(path.parent_path());
        } catch (const std::exception& e) {
            err::throw_with_trace(fmt::format(
                "Failed to create directories for file: {} ({})", path.string(), e.what()
            ));
        }
    }

    auto open_mode = std::ios::binary | std::ios::in | std::ios::out;
    if (mode == OpenMode::CREATE) {
        open_mode |= std::ios::trunc;
    }

    file_.open(path, open_mode);

    if (!file_.is_open()) {
        err::throw_with_trace(fmt::format("Failed to open file: {}", path.string()));
    }
}

File::~File() {
    if (file_.is_open()) {
        file_.close();
    }
}

auto File::write(std::span<const std::byte> data, uint64_t offset)
    -> std::expected<void, std::error_code> {
    file_.seekp(static_cast<std::streamoff>(offset), std::ios::beg);

    if (!file_.write(reinterpret_cast<const char*>(data.data()),
                     static_cast<std::streamsize>(data.size())) ||
        !file_.flush()) {
        file_.clear();
        return std::unexpected(DownloadErrc::output_write_failed);
    }

    return {};
}

}  // namespace rangeget::fs
