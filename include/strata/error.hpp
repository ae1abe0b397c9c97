#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace strata {

enum class ErrorKind : std::uint8_t {
  MalformedMetadata,
  PathNotFound,
  DuplicateEntry,
  InvalidEventOrder,
  AlreadyHasHistory,
  CorruptDelta,
  NotYetPresent,
  DeletedAtRevision,
  UncommittedChanges,
  UntrackedPath,
  InvalidFilter,
  RevisionOutOfRange,
  PathConflict,
  DirectoryNotEmpty,
  Io,
};

// Short stable name for an error kind, e.g. "uncommitted changes".
auto to_string(ErrorKind kind) -> std::string_view;

// Every failure surfaced by the library. what() carries the detail text.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace strata
