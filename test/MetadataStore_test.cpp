#include "Error.hpp"
#include "Metadata.hpp"
#include "MetadataStore.hpp"
#include "Utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace rangeget;

namespace {

std::filesystem::path make_temp_dir() {
    auto dir = std::filesystem::temp_directory_path() /
               ("rangeget-store-" + std::to_string(utils::generate_random<uint32_t>()));
    std::filesystem::create_directories(dir);
    return dir;
}

void write_raw(const std::filesystem::path& path, const std::string& data) {
    std::ofstream file{path, std::ios::binary | std::ios::out | std::ios::trunc};
    file << data;
}

}  // namespace

TEST_CASE("MetadataStore: paths", "[MetadataStore]") {
    MetadataStore store{"/downloads/file.iso"};

    REQUIRE(store.get_path() == "/downloads/file.iso.tmp");
    REQUIRE(store.get_staging_path() == "/downloads/file.iso.1.tmp");
}

TEST_CASE("MetadataStore: save and load", "[MetadataStore]") {
    const auto    dir = make_temp_dir();
    MetadataStore store{dir / "file.bin"};

    REQUIRE_FALSE(store.exists().value());

    Metadata metadata{20};
    metadata.mark_downloaded(3);
    metadata.mark_downloaded(19);

    REQUIRE(store.save(metadata).has_value());
    REQUIRE(store.exists().value());
    REQUIRE_FALSE(store.is_empty().value());
    REQUIRE_FALSE(std::filesystem::exists(store.get_staging_path()));

    auto loaded = store.load(20);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == metadata);

    SECTION("Saving again replaces the record") {
        metadata.mark_downloaded(4);
        REQUIRE(store.save(metadata).has_value());
        REQUIRE(store.load(20).value().is_downloaded(4));
    }

    SECTION("Loading with another file size") {
        REQUIRE(store.load(21).error() == DownloadErrc::metadata_size_mismatch);
    }

    SECTION("Remove") {
        REQUIRE(store.remove().has_value());
        REQUIRE_FALSE(store.exists().value());

        // nothing left to remove
        REQUIRE(store.remove().error() == DownloadErrc::metadata_remove_failed);
        REQUIRE(store.load(20).error() == DownloadErrc::metadata_read_failed);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("MetadataStore: crash between staging write and rename", "[MetadataStore]") {
    const auto    dir = make_temp_dir();
    MetadataStore store{dir / "file.bin"};

    Metadata previous{8};
    previous.mark_downloaded(0);
    REQUIRE(store.save(previous).has_value());

    // A save that died after writing half of the staging file
    Metadata next{previous};
    next.mark_downloaded(1);
    const auto encoded = next.serialize();
    write_raw(
        store.get_staging_path(),
        std::string(reinterpret_cast<const char*>(encoded.data()), encoded.size() / 2)
    );

    auto loaded = store.load(8);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == previous);

    SECTION("The next save overwrites the leftover") {
        REQUIRE(store.save(next).has_value());
        REQUIRE(store.load(8).value() == next);
    }

    SECTION("Remove also cleans up the leftover") {
        REQUIRE(store.remove().has_value());
        REQUIRE_FALSE(std::filesystem::exists(store.get_staging_path()));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("MetadataStore: unusable records", "[MetadataStore]") {
    const auto    dir = make_temp_dir();
    MetadataStore store{dir / "file.bin"};

    SECTION("Empty record") {
        write_raw(store.get_path(), "");
        REQUIRE(store.exists().value());
        REQUIRE(store.is_empty().value());
        REQUIRE(store.load(4).error() == DownloadErrc::metadata_corrupt);
    }

    SECTION("Garbage record") {
        write_raw(store.get_path(), "definitely not a bitmap");
        REQUIRE_FALSE(store.is_empty().value());
        REQUIRE(store.load(4).error() == DownloadErrc::metadata_corrupt);
    }

    SECTION("Record that can not be examined") {
        // A link to itself fails every stat with ELOOP
        std::filesystem::create_symlink(store.get_path(), store.get_path());
        REQUIRE(store.exists().error() == DownloadErrc::metadata_read_failed);
        REQUIRE(store.is_empty().error() == DownloadErrc::metadata_read_failed);
    }

    SECTION("Missing directory") {
        MetadataStore orphan{dir / "missing" / "file.bin"};
        REQUIRE(orphan.save(Metadata{4}).error() == DownloadErrc::metadata_write_failed);
    }

    std::filesystem::remove_all(dir);
}
