#pragma once
#include "strata/log.hpp"
#include "strata/revision.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// Crash marker + pre-mutation backups for one in-flight commit.
//
// begin() writes REPO/LOCK naming the pending revision. Before any stored
// file is overwritten, renamed or removed, backup() copies it to
// "BAK<R>- <name>" in the same directory. finish() removes LOCK and then
// the backups. If the process dies in between, recover() on the next open
// puts every backup back and drops what revision R created.
class Journal {
public:
  Journal(std::filesystem::path repo_dir, log::Sink sink);

  void begin(Revision revision);
  void backup(const std::filesystem::path& file);
  void finish();

  [[nodiscard]] Revision revision() const { return revision_; }
  [[nodiscard]] bool active() const { return revision_ != 0; }

  // Revision named by REPO/LOCK, if present.
  static auto pending(const std::filesystem::path& repo_dir) -> std::optional<Revision>;

  // Undo an interrupted commit. Returns the revision that was rolled back.
  static auto recover(const std::filesystem::path& repo_dir, const log::Sink& sink)
      -> std::optional<Revision>;

  static auto backup_name(Revision revision, std::string_view name) -> std::string;

private:
  std::filesystem::path repo_dir_;
  log::Sink sink_;
  Revision revision_ = 0;
  std::vector<std::filesystem::path> backups_;
};

} // namespace strata
