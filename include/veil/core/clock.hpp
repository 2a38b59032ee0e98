#pragma once
#include <chrono>
#include <cstdint>
namespace veil::transfer {

using Timestamp = std::chrono::system_clock::time_point;

[[nodiscard]] inline Timestamp Now() noexcept {
    return std::chrono::system_clock::now();
}

[[nodiscard]] inline int64_t ToUnixMillis(const Timestamp t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp FromUnixMillis(const int64_t millis) noexcept {
    return Timestamp(std::chrono::milliseconds(millis));
}
}
