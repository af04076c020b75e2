#pragma once

#include <chrono>

namespace rangeget::duration {

inline constexpr std::chrono::seconds      PROBE_CONNECT_TIMEOUT{2};
inline constexpr std::chrono::seconds      PROBE_TIMEOUT{30};
inline constexpr std::chrono::seconds      RANGE_CONNECT_TIMEOUT{10};
inline constexpr std::chrono::seconds      RANGE_READ_TIMEOUT{10};
inline constexpr std::chrono::milliseconds PROGRESS_BAR_REFRESH_RATE{1'000};
inline constexpr std::chrono::milliseconds PROGRESS_BAR_START_POLL{200};

}  // namespace rangeget::duration
