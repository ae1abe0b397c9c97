#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class ContentKind : std::uint8_t { Text, Binary };

// Decoded text: one element per Unicode code point.
using Text = std::u32string;

namespace text {

// Strict UTF-8 decode (rejects overlongs, surrogates, > U+10FFFF).
auto decode_utf8(std::span<const std::uint8_t> bytes) -> std::optional<Text>;
auto encode_utf8(std::u32string_view text) -> std::string;

// Text if the bytes decode as UTF-8, Binary otherwise.
auto classify(std::span<const std::uint8_t> bytes) -> ContentKind;

// 't' / 'b', as used in commit log entries.
auto kind_letter(ContentKind kind) -> char;

} // namespace text
} // namespace strata
