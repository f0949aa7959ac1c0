#ifndef LINEARDS_COMMON_HPP
#define LINEARDS_COMMON_HPP

#include <cstddef>
#include <cstdint>

namespace lineards {

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info,
    Warning,
    Error,
};

// Messages below this level are dropped by log_message.
constexpr LogLevel LOG_LEVEL = LogLevel::Info;

// Slots reserved up front by every LinkedSequence (two of them are the sentinels).
constexpr std::size_t DEFAULT_ARENA_RESERVE = 16;

} // namespace lineards

#endif // LINEARDS_COMMON_HPP
