#include "strata/repo.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/journal.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;

namespace strata {

namespace {

std::string join(const std::string &dir, const std::string &name) {
  return dir.empty() ? name : dir + "/" + name;
}

std::pair<std::string, std::string> split_last(const std::string &path) {
  const std::size_t pos = path.rfind('/');
  if (pos == std::string::npos) {
    return {std::string{}, path};
  }
  return {path.substr(0, pos), path.substr(pos + 1)};
}

// Mirror one working directory against `node` (nullopt when the store has
// never seen it). Touches what still exists and reports additions and edits.
void walk(DirectoryTree &tree, std::optional<NodeId> node, const stdfs::path &dir,
          const std::string &rel, std::vector<Change> &out, const log::Sink &sink) {
  std::vector<stdfs::directory_entry> entries;
  std::error_code ec;
  for (auto it = stdfs::directory_iterator(dir, ec); !ec && it != stdfs::directory_iterator();
       it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) {
    throw Error(ErrorKind::Io, "cannot list " + dir.string() + ": " + ec.message());
  }
  std::ranges::sort(entries, [](const auto &a, const auto &b) {
    return a.path().filename() < b.path().filename();
  });

  for (const auto &e : entries) {
    const std::string name = e.path().filename().string();
    if (rel.empty() && name == consts::kRepoDir) {
      continue;
    }
    const std::string path = join(rel, name);
    const auto st = e.symlink_status(ec);
    if (ec) {
      throw Error(ErrorKind::Io, "cannot stat " + e.path().string() + ": " + ec.message());
    }

    if (stdfs::is_symlink(st)) {
      sink(log::Level::Warn, "skipping symlink " + path);
    } else if (stdfs::is_directory(st)) {
      const auto child = node ? tree.child(*node, name) : std::nullopt;
      if (!child || !tree.node(*child).is_active()) {
        out.push_back(Change{
            .kind = ChangeKind::DirAdded, .path = path, .content = ContentKind::Binary});
      }
      if (child) {
        tree.node(*child).touched = true;
      }
      walk(tree, child, e.path(), path, out, sink);
    } else if (stdfs::is_regular_file(st)) {
      VersionedFile *f = node ? tree.find_file(*node, name) : nullptr;
      if (f == nullptr || !f->exists_now()) {
        out.push_back(Change{.kind = ChangeKind::FileAdded,
                             .path = path,
                             .content = text::classify(fs::read_file(e.path()))});
      } else {
        f->touched = true;
        if (f->is_modified()) {
          out.push_back(Change{.kind = ChangeKind::FileModified,
                               .path = path,
                               .content = text::classify(fs::read_file(e.path()))});
        }
      }
    } else {
      sink(log::Level::Warn, "skipping special file " + path);
    }
  }
}

} // namespace

auto Repository::scan_changes() -> std::vector<Change> {
  tree_.reset_touched();
  std::vector<Change> out;
  walk(tree_, tree_.root(), root_, std::string{}, out, sink_);
  auto gone = tree_.untouched();
  out.insert(out.end(), std::make_move_iterator(gone.begin()),
             std::make_move_iterator(gone.end()));
  return out;
}

auto Repository::status() -> std::vector<Change> {
  ensure_consistent();
  return scan_changes();
}

void Repository::apply_changes(Revision revision, std::vector<Change> &changes,
                               Journal &journal) {
  std::size_t expected_deletions = 0;
  for (auto &c : changes) {
    switch (c.kind) {
    case ChangeKind::DirAdded: {
      const NodeId id = tree_.add(c.path, revision);
      tree_.node(id).touched = true;
      fs::ensure_dir(tree_.data_dir(id));
      sink_(log::Level::Debug, "+d " + c.path);
      break;
    }
    case ChangeKind::FileAdded: {
      const auto [parent, name] = split_last(c.path);
      const NodeId dir = tree_.at_path(parent);
      auto &f = tree_.file(dir, name);
      c.content = f.recreate_at_revision(revision, journal);
      f.touched = true;
      tree_.note_revision(dir, revision);
      sink_(log::Level::Debug, "+f " + c.path);
      break;
    }
    case ChangeKind::FileModified: {
      const auto [parent, name] = split_last(c.path);
      const NodeId dir = tree_.at_path(parent);
      VersionedFile *f = tree_.find_file(dir, name);
      if (f == nullptr) {
        throw Error(ErrorKind::PathNotFound, "no file entry for: " + c.path);
      }
      c.content = f->change_at_revision(revision, journal);
      tree_.note_revision(dir, revision);
      sink_(log::Level::Debug, "*f " + c.path);
      break;
    }
    case ChangeKind::DirDeleted:
    case ChangeKind::FileDeleted:
      ++expected_deletions;
      break;
    }
  }

  const std::size_t deleted = tree_.mark_untouched_deleted(revision, journal);
  if (deleted != expected_deletions) {
    throw Error(ErrorKind::Io, "working tree changed during commit (" + std::to_string(deleted) +
                                   " deletions, expected " +
                                   std::to_string(expected_deletions) + ")");
  }
}

// Crash-safe write sequence: LOCK, metadata backups, store mutations (each
// backing up what it replaces), new metadata, log entry, drop LOCK, drop
// backups. Any exception in between leaves LOCK for recovery.
auto Repository::commit(std::string_view comment) -> std::optional<Revision> {
  ensure_consistent();
  auto changes = scan_changes();
  if (changes.empty()) {
    sink_(log::Level::Info, "nothing to commit");
    return std::nullopt;
  }

  const Revision revision = last_revision_ + 1;
  Journal journal{repo_dir(), sink_};
  journal.begin(revision);
  journal.backup(metadata_file());
  journal.backup(commits_file());

  apply_changes(revision, changes, journal);

  fs::write_file_atomic(metadata_file(), fs::as_bytes(tree_.serialize()));
  fs::append_file(commits_file(), format_log_entry(revision, comment, changes));
  journal.finish();

  last_revision_ = revision;
  sink_(log::Level::Info, "committed revision " + std::to_string(revision) + " (" +
                              std::to_string(changes.size()) + " changes)");
  return revision;
}

} // namespace strata
