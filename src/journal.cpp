#include "strata/journal.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/versioned_file.hpp"

#include <algorithm>
#include <charconv>
#include <string>

namespace stdfs = std::filesystem;

namespace strata {

namespace {

stdfs::path lock_path(const stdfs::path &repo_dir) { return repo_dir / consts::kLockFile; }

// Every regular file under `dir` whose name starts with `prefix`.
std::vector<stdfs::path> files_with_prefix(const stdfs::path &dir, std::string_view prefix) {
  std::vector<stdfs::path> out;
  std::error_code ec;
  for (auto it = stdfs::recursive_directory_iterator(dir, ec);
       !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file() && it->path().filename().string().starts_with(prefix)) {
      out.push_back(it->path());
    }
  }
  if (ec) {
    throw Error(ErrorKind::Io, "scan failed: " + dir.string() + ": " + ec.message());
  }
  return out;
}

} // namespace

Journal::Journal(stdfs::path repo_dir, log::Sink sink)
    : repo_dir_(std::move(repo_dir)), sink_(std::move(sink)) {}

auto Journal::backup_name(Revision revision, std::string_view name) -> std::string {
  return std::string(consts::kBackupPrefix) + std::to_string(revision) +
         std::string(consts::kRevSeparator) + std::string(name);
}

void Journal::begin(Revision revision) {
  revision_ = revision;
  backups_.clear();
  const std::string s = std::to_string(revision);
  fs::write_file_atomic(lock_path(repo_dir_), fs::as_bytes(s));
}

void Journal::backup(const stdfs::path &file) {
  if (!active()) {
    throw Error(ErrorKind::Io, "backup outside of a commit: " + file.string());
  }
  if (!fs::exists(file)) {
    return;
  }
  const auto bak = file.parent_path() / backup_name(revision_, file.filename().string());
  if (std::ranges::find(backups_, bak) != backups_.end()) {
    return; // the pre-commit copy is already safe
  }
  // A backup left by an earlier, abandoned attempt at this revision is stale:
  // overwrite it and own it so finish() removes it.
  fs::copy_file(file, bak);
  backups_.push_back(bak);
  sink_(log::Level::Debug, "backup " + file.filename().string());
}

void Journal::finish() {
  fs::remove_file(lock_path(repo_dir_));
  for (const auto &bak : backups_) {
    fs::remove_file(bak);
  }
  backups_.clear();
  revision_ = 0;
}

auto Journal::pending(const stdfs::path &repo_dir) -> std::optional<Revision> {
  const auto p = lock_path(repo_dir);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  std::string s = fs::to_string(fs::read_file(p));
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
    s.pop_back();
  }
  Revision rev = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), rev);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size() || rev == 0) {
    throw Error(ErrorKind::MalformedMetadata, "unreadable LOCK content: " + s);
  }
  return rev;
}

// Copy (not move) every backup home so a crash during recovery can simply
// run it again. A backed-up live artifact was renamed to its historical
// name by the interrupted commit; that twin is removed.
auto Journal::recover(const stdfs::path &repo_dir, const log::Sink &sink)
    -> std::optional<Revision> {
  const auto pending_rev = pending(repo_dir);
  if (!pending_rev) {
    return std::nullopt;
  }
  const Revision rev = *pending_rev;
  sink(log::Level::Warn, "recovering from interrupted commit " + std::to_string(rev));

  const std::string bak_prefix = backup_name(rev, "");
  const auto backups = files_with_prefix(repo_dir, bak_prefix);
  for (const auto &bak : backups) {
    const std::string live_name = bak.filename().string().substr(bak_prefix.size());
    const auto live = bak.parent_path() / live_name;
    fs::copy_file(bak, live);
    sink(log::Level::Debug, "restored " + live_name);

    if (auto a = parse_artifact_name(live_name); a && a->state == EventState::Live) {
      const auto twin =
          bak.parent_path() / artifact_name(EventState::Historical, a->content, a->revision,
                                            a->filename);
      fs::remove_file(twin);
    }
  }

  const auto data_dir = repo_dir / consts::kDataDir;
  if (fs::is_directory(data_dir)) {
    std::error_code ec;
    std::vector<stdfs::path> stale;
    for (auto it = stdfs::recursive_directory_iterator(data_dir, ec);
         !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
      if (!it->is_regular_file()) {
        continue;
      }
      const auto a = parse_artifact_name(it->path().filename().string());
      if (a && a->revision == rev && a->state != EventState::Historical) {
        stale.push_back(it->path());
      }
    }
    if (ec) {
      throw Error(ErrorKind::Io, "scan failed: " + data_dir.string() + ": " + ec.message());
    }
    for (const auto &p : stale) {
      fs::remove_file(p);
      sink(log::Level::Debug, "dropped " + p.filename().string());
    }
  }

  fs::remove_file(lock_path(repo_dir));
  for (const auto &bak : backups) {
    fs::remove_file(bak);
  }
  return rev;
}

} // namespace strata
