#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strata::fs {

using Bytes = std::vector<std::uint8_t>;

bool exists(const std::filesystem::path& p);
bool is_directory(const std::filesystem::path& p);
void ensure_dir(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

Bytes read_file(const std::filesystem::path& p);
// nullopt when the file is missing or is not a regular file
std::optional<Bytes> try_read_file(const std::filesystem::path& p);

void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void append_file(const std::filesystem::path& p, std::string_view text);

// Copy `from` over `to` (overwrites), then give `to` the mtime of `from`.
void copy_file(const std::filesystem::path& from, const std::filesystem::path& to);
void rename(const std::filesystem::path& from, const std::filesystem::path& to);
// No error if `p` is already gone.
void remove_file(const std::filesystem::path& p);

// Cosmetic only: keeps stored copies' timestamps in line with their source.
void sync_mtime(const std::filesystem::path& from, const std::filesystem::path& to);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

inline std::string to_string(std::span<const std::uint8_t> bytes) {
  return {bytes.begin(), bytes.end()};
}

} // namespace strata::fs
