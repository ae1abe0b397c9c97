#pragma once
#include "strata/text.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace strata {

enum class ChangeKind : std::uint8_t { DirAdded, DirDeleted, FileAdded, FileModified, FileDeleted };

struct Change {
  ChangeKind kind;
  std::string path;                          // repo-relative, '/' separated
  ContentKind content = ContentKind::Binary; // meaningful for FileAdded / FileModified
};

// One commit-log line without indentation, e.g. "+ft docs/a.txt".
auto describe(const Change& change) -> std::string;

// "<R>. <comment>\n" + "  <change>\n"... + "\n"
auto format_log_entry(std::uint64_t revision, std::string_view comment,
                      const std::vector<Change>& changes) -> std::string;

} // namespace strata
