#include "DownloadManager.hpp"
#include "Error.hpp"
#include "Metadata.hpp"
#include "MetadataStore.hpp"
#include "MockRangeServer.hpp"
#include "Partitioner.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rangeget;

namespace {

// Large enough for several connections, with a short last chunk
constexpr uint64_t TEST_FILE_SIZE{2 * MINIMAL_FILE_SIZE + 1'234};
constexpr uint32_t TEST_CONNECTIONS{4};

std::filesystem::path make_temp_dir() {
    auto dir = std::filesystem::temp_directory_path() /
               ("rangeget-manager-" + std::to_string(utils::generate_random<uint32_t>()));
    std::filesystem::create_directories(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary | std::ios::in};
    return std::string{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

std::string range_header(const ByteRange& range) {
    return "bytes=" + std::to_string(range.start_byte) + "-" + std::to_string(range.end_byte);
}

bool requested_from(const std::vector<std::string>& headers, uint64_t start) {
    const std::string prefix{"bytes=" + std::to_string(start) + "-"};
    return std::ranges::any_of(headers, [&prefix](const std::string& header) {
        return header.starts_with(prefix);
    });
}

/**
 * Leave the output file and the bitmap the way an interrupted run would: the given chunks are on
 * disk and recorded, everything else is missing.
 */
void simulate_interrupted_run(
    const std::filesystem::path& output_path,
    const std::string&           content,
    const std::vector<size_t>&   done_chunks
) {
    Metadata metadata{Metadata::chunk_count(content.size(), CHUNK_SIZE)};

    std::ofstream partial{output_path, std::ios::binary | std::ios::out | std::ios::trunc};
    for (size_t index : done_chunks) {
        const size_t offset{index * CHUNK_SIZE};
        const size_t length{Metadata::chunk_length(index, content.size(), CHUNK_SIZE)};
        partial.seekp(static_cast<std::streamoff>(offset));
        partial.write(content.data() + offset, static_cast<std::streamsize>(length));
        metadata.mark_downloaded(index);
    }
    partial.close();

    REQUIRE(MetadataStore{output_path}.save(metadata).has_value());
}

}  // namespace

TEST_CASE("DownloadManager: fresh download", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "file.bin";
    const auto      content     = MockRangeServer::generate_content(TEST_FILE_SIZE);
    MockRangeServer server{content};

    std::vector<uint32_t> percents;
    size_t                completions{0};

    DownloadManager manager{DownloadConfig{
        .urls          = {server.url()},
        .output_path   = output_path,
        .connections   = TEST_CONNECTIONS,
        .on_progress   = [&percents](uint32_t percent) { percents.push_back(percent); },
        .on_completion = [&completions] { ++completions; },
    }};

    REQUIRE(manager.get_download_status() == DownloadStatus::STOPPED);

    auto result = manager.run();

    REQUIRE(result.has_value());
    REQUIRE(manager.get_download_status() == DownloadStatus::FINISHED);
    REQUIRE(read_file(output_path) == content);
    REQUIRE_FALSE(MetadataStore{output_path}.exists().value());
    REQUIRE(completions == 1);
    REQUIRE(percents.back() == 100);

    const auto ranges  = partition(TEST_FILE_SIZE, CHUNK_SIZE, TEST_CONNECTIONS);
    auto       headers = server.get_range_headers();
    std::vector<std::string> expected;
    std::ranges::transform(ranges, std::back_inserter(expected), range_header);
    std::ranges::sort(headers);
    std::ranges::sort(expected);
    REQUIRE(headers == expected);

    const auto stats = manager.get_stats();
    REQUIRE(stats.total_bytes == TEST_FILE_SIZE);
    REQUIRE(stats.downloaded_bytes == TEST_FILE_SIZE);
    REQUIRE(stats.get_download_percentage() == 1.0);

    SECTION("The same manager downloads again") {
        REQUIRE(manager.download(TEST_FILE_SIZE).has_value());
        REQUIRE(read_file(output_path) == content);
        REQUIRE(completions == 2);

        const auto again = manager.get_stats();
        REQUIRE(again.resumed_bytes == 0);
        REQUIRE(again.downloaded_bytes == TEST_FILE_SIZE);
        REQUIRE(again.active_connections == 0);
    }

    SECTION("Running again starts a fresh download") {
        DownloadManager again{DownloadConfig{
            .urls        = {server.url()},
            .output_path = output_path,
            .connections = TEST_CONNECTIONS,
        }};

        REQUIRE(again.run().has_value());
        REQUIRE(read_file(output_path) == content);
        REQUIRE(server.get_range_headers().size() == 2 * TEST_CONNECTIONS);
        REQUIRE(
            std::ranges::count(server.get_range_headers(), range_header(ranges.front())) == 2
        );
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: resume", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "file.bin";
    const auto      content     = MockRangeServer::generate_content(TEST_FILE_SIZE);
    MockRangeServer server{content};

    const auto ranges = partition(TEST_FILE_SIZE, CHUNK_SIZE, TEST_CONNECTIONS);
    const auto chunk_index = [](uint64_t offset) { return static_cast<size_t>(offset / CHUNK_SIZE); };

    // Worker 0 finished, worker 2 wrote its first chunk and one in the middle
    std::vector<size_t> done_chunks;
    for (size_t index = chunk_index(ranges[0].start_byte); index <= chunk_index(ranges[0].end_byte);
         ++index) {
        done_chunks.push_back(index);
    }
    done_chunks.push_back(chunk_index(ranges[2].start_byte));
    done_chunks.push_back(chunk_index(ranges[2].start_byte) + 10);

    simulate_interrupted_run(output_path, content, done_chunks);

    std::vector<uint32_t> percents;
    DownloadManager       manager{DownloadConfig{
        .urls        = {server.url()},
        .output_path = output_path,
        .connections = TEST_CONNECTIONS,
        .on_progress = [&percents](uint32_t percent) { percents.push_back(percent); },
    }};

    REQUIRE(manager.run().has_value());
    REQUIRE(read_file(output_path) == content);
    REQUIRE_FALSE(MetadataStore{output_path}.exists().value());

    // Progress starts from the bytes already on disk
    REQUIRE(percents.front() >= 24);
    REQUIRE(percents.back() == 100);

    const auto headers = server.get_range_headers();
    REQUIRE(headers.size() == TEST_CONNECTIONS - 1);
    REQUIRE_FALSE(requested_from(headers, ranges[0].start_byte));
    REQUIRE_FALSE(requested_from(headers, ranges[2].start_byte));
    REQUIRE(requested_from(headers, ranges[2].start_byte + CHUNK_SIZE));
    REQUIRE(requested_from(headers, ranges[1].start_byte));
    REQUIRE(requested_from(headers, ranges[3].start_byte));

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: leftover resume state", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "file.bin";
    const auto      content     = MockRangeServer::generate_content(TEST_FILE_SIZE);
    MockRangeServer server{content};
    MetadataStore   store{output_path};

    DownloadManager manager{DownloadConfig{
        .urls        = {server.url()},
        .output_path = output_path,
        .connections = TEST_CONNECTIONS,
    }};

    SECTION("Empty metadata file") {
        std::ofstream{store.get_path()};
        REQUIRE(store.is_empty().value());

        REQUIRE(manager.run().has_value());
        REQUIRE(read_file(output_path) == content);
        REQUIRE(requested_from(server.get_range_headers(), 0));
    }

    SECTION("Metadata without the output file") {
        simulate_interrupted_run(output_path, content, {0, 1, 2});
        std::filesystem::remove(output_path);

        REQUIRE(manager.run().has_value());
        REQUIRE(read_file(output_path) == content);
        REQUIRE(requested_from(server.get_range_headers(), 0));
    }

    SECTION("Corrupt metadata") {
        simulate_interrupted_run(output_path, content, {0});
        std::ofstream{store.get_path(), std::ios::binary | std::ios::trunc} << "garbage";

        REQUIRE(manager.run().error() == DownloadErrc::metadata_corrupt);
        REQUIRE(server.get_request_count() == 0);
        // never deleted by a failed run
        REQUIRE(store.exists().value());
    }

    SECTION("Metadata of another file") {
        MetadataStore{output_path}.save(Metadata{3}).value();
        std::ofstream{output_path} << "x";

        REQUIRE(manager.run().error() == DownloadErrc::metadata_size_mismatch);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: unreadable resume state", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "file.bin";
    const auto      content     = MockRangeServer::generate_content(TEST_FILE_SIZE);
    MockRangeServer server{content};
    MetadataStore   store{output_path};

    // A partial file whose record can not be examined
    const std::string partial{content.substr(0, 3 * CHUNK_SIZE)};
    std::ofstream{output_path, std::ios::binary | std::ios::trunc} << partial;
    std::filesystem::create_symlink(store.get_path(), store.get_path());

    DownloadManager manager{DownloadConfig{
        .urls        = {server.url()},
        .output_path = output_path,
        .connections = TEST_CONNECTIONS,
    }};

    REQUIRE(manager.download(content.size()).error() == DownloadErrc::metadata_read_failed);
    REQUIRE(server.get_request_count() == 0);
    // not truncated by a fresh start
    REQUIRE(read_file(output_path) == partial);

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: failures", "[DownloadManager]") {
    const auto dir         = make_temp_dir();
    const auto output_path = dir / "file.bin";
    const auto content     = MockRangeServer::generate_content(TEST_FILE_SIZE);

    SECTION("A failing worker stops the download") {
        MockRangeServer server{content, MockRangeServer::Mode::FAIL};
        size_t          completions{0};

        DownloadManager manager{DownloadConfig{
            .urls          = {server.url()},
            .output_path   = output_path,
            .connections   = TEST_CONNECTIONS,
            .on_completion = [&completions] { ++completions; },
        }};

        REQUIRE(manager.run().error() == DownloadErrc::http_error);
        REQUIRE(manager.get_download_status() == DownloadStatus::STOPPED);
        REQUIRE(completions == 0);

        // resumable
        REQUIRE(MetadataStore{output_path}.exists().value());
    }

    SECTION("Unreachable server") {
        std::string url;
        {
            MockRangeServer server{content};
            url = server.url();
        }

        DownloadManager manager{DownloadConfig{.urls = {url}, .output_path = output_path}};

        REQUIRE(manager.run().error() == DownloadErrc::probe_failed);
        REQUIRE_FALSE(std::filesystem::exists(output_path));
        REQUIRE_FALSE(MetadataStore{output_path}.exists().value());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: stalled connection", "[DownloadManager]") {
    const auto dir         = make_temp_dir();
    const auto output_path = dir / "small.bin";
    const auto content     = MockRangeServer::generate_content(10'000);

    {
        MockRangeServer server{content, MockRangeServer::Mode::STALL};
        DownloadManager manager{DownloadConfig{
            .urls           = {server.url()},
            .output_path    = output_path,
            .connections    = TEST_CONNECTIONS,
            .range_timeouts = {.connect = std::chrono::milliseconds(2'000),
                               .read    = std::chrono::milliseconds(300)},
        }};

        REQUIRE(manager.download(content.size()).error() == DownloadErrc::timeout);
        REQUIRE(manager.get_download_status() == DownloadStatus::STOPPED);
    }

    // The first chunk arrived before the stall and is kept for the next run
    auto persisted = MetadataStore{output_path}.load(Metadata::chunk_count(content.size(), CHUNK_SIZE));
    REQUIRE(persisted.has_value());
    REQUIRE(persisted->is_downloaded(0));

    MockRangeServer server{content};
    DownloadManager manager{DownloadConfig{.urls = {server.url()}, .output_path = output_path}};

    REQUIRE(manager.run().has_value());
    REQUIRE(read_file(output_path) == content);
    REQUIRE(server.get_range_headers() == std::vector<std::string>{"bytes=4096-9999"});

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: stop", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "file.bin";
    const auto      content     = MockRangeServer::generate_content(TEST_FILE_SIZE);
    MockRangeServer server{content};

    SECTION("Stopped before it starts") {
        DownloadManager manager{DownloadConfig{
            .urls        = {server.url()},
            .output_path = output_path,
            .connections = TEST_CONNECTIONS,
        }};

        manager.stop();

        REQUIRE(manager.run().error() == DownloadErrc::cancelled);
        REQUIRE(server.get_request_count() == 0);
        REQUIRE_FALSE(std::filesystem::exists(output_path));
        REQUIRE_FALSE(MetadataStore{output_path}.exists().value());
    }

    SECTION("Stopped midway and resumed") {
        DownloadManager* running{nullptr};
        DownloadManager  manager{DownloadConfig{
            .urls        = {server.url()},
            .output_path = output_path,
            .connections = TEST_CONNECTIONS,
            .on_progress =
                [&running](uint32_t percent) {
                    if (percent >= 30 && running != nullptr) {
                        running->stop();
                    }
                },
        }};
        running = &manager;

        REQUIRE(manager.run().error() == DownloadErrc::cancelled);
        REQUIRE(manager.get_download_status() == DownloadStatus::STOPPED);
        REQUIRE(MetadataStore{output_path}.exists().value());

        std::vector<uint32_t> percents;
        DownloadManager       resumed{DownloadConfig{
            .urls        = {server.url()},
            .output_path = output_path,
            .connections = TEST_CONNECTIONS,
            .on_progress = [&percents](uint32_t percent) { percents.push_back(percent); },
        }};

        REQUIRE(resumed.run().has_value());
        REQUIRE(read_file(output_path) == content);
        REQUIRE(percents.front() >= 30);
        REQUIRE_FALSE(MetadataStore{output_path}.exists().value());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: empty file", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "empty.bin";
    MockRangeServer server{""};
    size_t          completions{0};

    DownloadManager manager{DownloadConfig{
        .urls          = {server.url()},
        .output_path   = output_path,
        .connections   = TEST_CONNECTIONS,
        .on_completion = [&completions] { ++completions; },
    }};

    REQUIRE(manager.download(0).has_value());
    REQUIRE(std::filesystem::file_size(output_path) == 0);
    REQUIRE(completions == 1);
    REQUIRE(server.get_request_count() == 0);
    REQUIRE_FALSE(MetadataStore{output_path}.exists().value());

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: small files use one connection", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "small.bin";
    const auto      content     = MockRangeServer::generate_content(10'000);
    MockRangeServer server{content};

    DownloadManager manager{DownloadConfig{
        .urls        = {server.url()},
        .output_path = output_path,
        .connections = TEST_CONNECTIONS,
    }};

    REQUIRE(manager.run().has_value());
    REQUIRE(read_file(output_path) == content);
    REQUIRE(server.get_range_headers() == std::vector<std::string>{"bytes=0-9999"});

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: mirrors", "[DownloadManager]") {
    const auto      dir         = make_temp_dir();
    const auto      output_path = dir / "file.bin";
    const auto      content     = MockRangeServer::generate_content(TEST_FILE_SIZE);
    MockRangeServer first{content};
    MockRangeServer second{content};

    DownloadManager manager{DownloadConfig{
        .urls        = {first.url(), second.url()},
        .output_path = output_path,
        .connections = 8,
    }};

    REQUIRE(manager.run().has_value());
    REQUIRE(read_file(output_path) == content);
    REQUIRE(first.get_range_headers().size() + second.get_range_headers().size() == 8);

    std::filesystem::remove_all(dir);
}

TEST_CASE("DownloadManager: invalid configuration", "[DownloadManager]") {
    REQUIRE_THROWS_AS(
        DownloadManager(DownloadConfig{.urls = {}, .output_path = "file.bin"}),
        std::invalid_argument
    );
    REQUIRE_THROWS_AS(
        DownloadManager(DownloadConfig{.urls = {"ftp://host/file.bin"}, .output_path = "file.bin"}),
        std::invalid_argument
    );
    REQUIRE_THROWS_AS(
        DownloadManager(DownloadConfig{.urls = {"http://host/file.bin"}, .output_path = ""}),
        std::invalid_argument
    );
}
