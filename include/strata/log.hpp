#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace strata::log {

enum class Level : std::uint8_t { Debug, Info, Warn };

// Diagnostics callback injected by the caller. The library never prints.
using Sink = std::function<void(Level, std::string_view)>;

// Sink that drops every message.
auto null_sink() -> Sink;

// Parse "debug" | "info" | "warn" | "quiet". nullopt for quiet; throws on unknown text.
auto parse_threshold(std::string_view text) -> std::optional<Level>;

auto level_name(Level level) -> std::string_view;

} // namespace strata::log
