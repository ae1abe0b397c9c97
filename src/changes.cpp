#include "strata/changes.hpp"

#include "strata/consts.hpp"

namespace strata {

auto describe(const Change& change) -> std::string {
  std::string out;
  switch (change.kind) {
  case ChangeKind::DirAdded:
    out = consts::kLogDirAdded;
    break;
  case ChangeKind::DirDeleted:
    out = consts::kLogDirDeleted;
    break;
  case ChangeKind::FileAdded:
    out = consts::kLogFileAdded;
    out.push_back(text::kind_letter(change.content));
    break;
  case ChangeKind::FileModified:
    out = consts::kLogFileChanged;
    out.push_back(text::kind_letter(change.content));
    break;
  case ChangeKind::FileDeleted:
    out = consts::kLogFileDeleted;
    break;
  }
  out.push_back(consts::kSpace);
  out += change.path;
  return out;
}

auto format_log_entry(std::uint64_t revision, std::string_view comment,
                      const std::vector<Change>& changes) -> std::string {
  std::string out = std::to_string(revision) + ". ";
  // Keep the log line-structured.
  for (const char c : comment) {
    out.push_back(c == '\n' || c == '\r' ? consts::kSpace : c);
  }
  out.push_back(consts::kLF);
  for (const auto& c : changes) {
    out += consts::kLogIndent;
    out += describe(c);
    out.push_back(consts::kLF);
  }
  out.push_back(consts::kLF);
  return out;
}

} // namespace strata
