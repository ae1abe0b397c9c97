#include "strata/error.hpp"

namespace strata {

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::MalformedMetadata:  return "malformed metadata";
  case ErrorKind::PathNotFound:       return "path not found";
  case ErrorKind::DuplicateEntry:     return "duplicate entry";
  case ErrorKind::InvalidEventOrder:  return "invalid event order";
  case ErrorKind::AlreadyHasHistory:  return "already has history";
  case ErrorKind::CorruptDelta:       return "corrupt delta";
  case ErrorKind::NotYetPresent:      return "not yet present";
  case ErrorKind::DeletedAtRevision:  return "deleted at revision";
  case ErrorKind::UncommittedChanges: return "uncommitted changes";
  case ErrorKind::UntrackedPath:      return "untracked path";
  case ErrorKind::InvalidFilter:      return "invalid filter";
  case ErrorKind::RevisionOutOfRange: return "revision out of range";
  case ErrorKind::PathConflict:       return "path conflict";
  case ErrorKind::DirectoryNotEmpty:  return "directory not empty";
  case ErrorKind::Io:                 return "i/o error";
  }
  return "unknown error";
}

} // namespace strata
