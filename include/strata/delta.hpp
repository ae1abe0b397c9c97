#pragma once
#include "strata/text.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strata::delta {

enum class Op : std::uint8_t { Copy, Skip, Insert };

struct Instruction {
  Op op;
  std::size_t count;  // code points consumed from the source (Copy/Skip) or literal length
  Text literal;       // Insert only
};

using Delta = std::vector<Instruction>;

// Edit script turning `from` into `to`. Lines are matched with a Myers
// diff; consecutive instructions of the same kind are merged. When the
// changed middle needs too many line edits it is skipped and re-inserted
// whole, keeping memory bounded for rewritten files.
Delta compute_delta(const Text& from, const Text& to);

// Run `delta` against `from`. Throws Error{CorruptDelta} on overrun.
Text apply_delta(const Text& from, const Delta& delta);

// "<op> <count>\n" per instruction; 'i' is followed by the literal and "\n".
std::string serialize(const Delta& delta);
// Throws Error{CorruptDelta} on malformed input.
Delta parse(std::string_view utf8);

// Split keeping terminators, so that concatenating the lines gives `text` back.
std::vector<Text> split_lines(const Text& text);

} // namespace strata::delta
