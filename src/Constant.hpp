#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rangeget {

// Unit of transfer and the granularity of the resume bitmap
inline constexpr size_t CHUNK_SIZE{4'096};

// Below this size a single connection is used
inline constexpr size_t MINIMAL_FILE_SIZE{256 * CHUNK_SIZE};

// Maximum number of chunks buffered between the range getters and the writer (16 MiB)
inline constexpr size_t CHUNK_QUEUE_CAPACITY{4'096};

inline constexpr uint32_t DEFAULT_CONNECTIONS{1};

// Suffixes appended to the output file name for the persisted bitmap
inline constexpr std::string_view METADATA_SUFFIX{".tmp"};
inline constexpr std::string_view METADATA_STAGING_SUFFIX{".1.tmp"};

inline constexpr uint8_t  PROGRESS_BAR_WIDTH{50};
inline constexpr auto     PROGRESS_BAR_INIT_TEXT{"Connecting..."};

}  // namespace rangeget
