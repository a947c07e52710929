#pragma once
#include "aiblame/config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aiblame::timeutil {

// Committer line for notes commits: "Name <email> <epoch> <+HHMM>", local zone.
auto signature_now(const Identity& identity) -> std::string;

// Epoch seconds carried by a signature, or nullopt when the line is malformed.
[[nodiscard]] auto signature_epoch(std::string_view signature) -> std::optional<std::int64_t>;

// Event timestamps are milliseconds since the Unix epoch.
auto now_millis() -> std::int64_t;

} // namespace aiblame::timeutil
