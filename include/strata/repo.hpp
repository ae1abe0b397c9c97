#pragma once
#include "strata/changes.hpp"
#include "strata/consts.hpp"
#include "strata/directory_tree.hpp"
#include "strata/log.hpp"
#include "strata/revision.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

class Repository {
public:
  // Use the nearest REPO at or above `directory`, or create one in
  // `directory`. An interrupted commit is rolled back before returning.
  static auto open(const std::filesystem::path& directory, log::Sink sink = log::null_sink())
      -> Repository;

  // Core paths
  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] auto repo_dir() const -> std::filesystem::path { return root_ / consts::kRepoDir; }
  [[nodiscard]] auto data_dir() const -> std::filesystem::path {
    return repo_dir() / consts::kDataDir;
  }
  [[nodiscard]] auto metadata_file() const -> std::filesystem::path {
    return repo_dir() / consts::kMetadataFile;
  }
  [[nodiscard]] auto commits_file() const -> std::filesystem::path {
    return repo_dir() / consts::kCommitsFile;
  }
  [[nodiscard]] auto lock_file() const -> std::filesystem::path {
    return repo_dir() / consts::kLockFile;
  }

  // Snapshot the working tree. nullopt when nothing changed (no revision used).
  auto commit(std::string_view comment) -> std::optional<Revision>;

  // Verbose: the raw commit log. Otherwise only the "<R>. <comment>" lines.
  [[nodiscard]] auto list(bool verbose) -> std::string;

  // Make the working tree look like `revision` (default: the newest one)
  // for files whose relative path matches `filter`.
  void restore_to(std::optional<Revision> revision, std::string_view filter = ".*");

  // What commit() would record right now, without writing anything.
  [[nodiscard]] auto status() -> std::vector<Change>;

  [[nodiscard]] auto last_revision() -> Revision;

  [[nodiscard]] const DirectoryTree& tree() const { return tree_; }

private:
  Repository(std::filesystem::path root, log::Sink sink);

  static void create_store(const std::filesystem::path& root);
  void recover_and_load();
  void ensure_consistent();
  [[nodiscard]] auto scan_changes() -> std::vector<Change>;
  void apply_changes(Revision revision, std::vector<Change>& changes, Journal& journal);

  std::filesystem::path root_;
  log::Sink sink_;
  DirectoryTree tree_;
  Revision last_revision_ = 0;
};

} // namespace strata
