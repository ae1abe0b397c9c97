#include "strata/repo.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/journal.hpp"
#include "strata/restore.hpp"

#include <algorithm>
#include <charconv>
#include <regex>
#include <string>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

// Highest "<R>. " header in the commit log; 0 for an empty log.
strata::Revision highest_logged_revision(std::string_view log) {
  strata::Revision best = 0;
  while (!log.empty()) {
    const std::size_t nl = log.find('\n');
    const auto line = log.substr(0, nl);
    log.remove_prefix(nl == std::string_view::npos ? log.size() : nl + 1);

    strata::Revision r = 0;
    const auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), r);
    if (ec == std::errc{} && ptr != line.data() && ptr + 1 < line.data() + line.size() &&
        ptr[0] == '.' && ptr[1] == ' ') {
      best = std::max(best, r);
    }
  }
  return best;
}

std::string read_text_or_empty(const stdfs::path &p) {
  if (!strata::fs::exists(p)) {
    return {};
  }
  return strata::fs::to_string(strata::fs::read_file(p));
}

} // namespace

namespace strata {

Repository::Repository(stdfs::path root, log::Sink sink)
    : root_(std::move(root)), sink_(sink ? std::move(sink) : log::null_sink()),
      tree_(root_, root_ / consts::kRepoDir / consts::kDataDir) {}

void Repository::create_store(const stdfs::path &root) {
  const auto repo = root / consts::kRepoDir;
  fs::ensure_dir(repo / consts::kDataDir);
  fs::write_file_atomic(repo / consts::kMetadataFile, {});
  fs::write_file_atomic(repo / consts::kCommitsFile, {});
}

auto Repository::open(const stdfs::path &directory, log::Sink sink) -> Repository {
  std::error_code ec;
  const auto start = stdfs::absolute(directory, ec).lexically_normal();
  if (ec) {
    throw Error(ErrorKind::Io, "cannot resolve " + directory.string() + ": " + ec.message());
  }

  std::optional<stdfs::path> found;
  for (auto p = start; !p.empty(); p = p.parent_path()) {
    if (fs::is_directory(p / consts::kRepoDir)) {
      found = p;
      break;
    }
    if (p == p.parent_path()) {
      break;
    }
  }

  Repository repo{found.value_or(start), std::move(sink)};
  if (!found) {
    create_store(start);
    repo.sink_(log::Level::Info, "created repository in " + repo.repo_dir().string());
  }
  repo.recover_and_load();
  return repo;
}

void Repository::recover_and_load() {
  if (const auto rolled_back = Journal::recover(repo_dir(), sink_)) {
    sink_(log::Level::Warn,
          "rolled back interrupted commit " + std::to_string(*rolled_back));
  }
  tree_ = DirectoryTree::deserialize(read_text_or_empty(metadata_file()), root_, data_dir());
  tree_.load_artifacts();
  last_revision_ =
      std::max(tree_.max_revision(), highest_logged_revision(read_text_or_empty(commits_file())));
}

// A commit that failed in this process leaves LOCK behind; treat it exactly
// like a crash.
void Repository::ensure_consistent() {
  if (fs::exists(lock_file())) {
    recover_and_load();
  }
}

auto Repository::last_revision() -> Revision {
  ensure_consistent();
  return last_revision_;
}

auto Repository::list(bool verbose) -> std::string {
  ensure_consistent();
  const std::string log = read_text_or_empty(commits_file());
  if (verbose) {
    return log;
  }
  std::string out;
  std::string_view rest{log};
  while (!rest.empty()) {
    const std::size_t nl = rest.find('\n');
    const auto line = rest.substr(0, nl);
    rest.remove_prefix(nl == std::string_view::npos ? rest.size() : nl + 1);
    if (line.empty() || line.starts_with(consts::kLogIndent)) {
      continue;
    }
    out.append(line);
    out.push_back(consts::kLF);
  }
  return out;
}

void Repository::restore_to(std::optional<Revision> revision, std::string_view filter) {
  ensure_consistent();
  const Revision current = last_revision_;
  const Revision target = revision.value_or(current);
  if (target < 1 || target > current) {
    throw Error(ErrorKind::RevisionOutOfRange,
                "revision " + std::to_string(target) + " not in 1.." + std::to_string(current));
  }

  std::regex re;
  try {
    re = std::regex(std::string(filter));
  } catch (const std::regex_error &e) {
    throw Error(ErrorKind::InvalidFilter,
                "bad filter expression '" + std::string(filter) + "': " + e.what());
  }

  const auto plan = restore::plan(tree_, target, re);
  restore::validate(tree_, plan, current);
  restore::apply(tree_, plan, sink_);
  sink_(log::Level::Info, "restored revision " + std::to_string(target) + " (" +
                              std::to_string(plan.restore_files.size()) + " files)");
}

} // namespace strata
