#pragma once

#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace toolhub {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

enum class BindMode {
    Loopback,
    All,
};

NLOHMANN_JSON_SERIALIZE_ENUM(BindMode, {
    {BindMode::Loopback, "loopback"},
    {BindMode::All, "all"},
})

/// Milliseconds since the Unix epoch, the on-disk and on-wire time format.
inline auto to_epoch_ms(Timestamp ts) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

inline auto from_epoch_ms(int64_t ms) -> Timestamp {
    return Timestamp{std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds{ms})};
}

} // namespace toolhub
