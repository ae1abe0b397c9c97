#include "strata/restore.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"

#include <string>
#include <system_error>

namespace stdfs = std::filesystem;

namespace strata::restore {

namespace {

std::string rel_path(const DirectoryTree &tree, const VersionedFile &f) {
  return f.work_path().lexically_relative(tree.work_root()).generic_string();
}

std::string rel_path(const DirectoryTree &tree, const stdfs::path &p) {
  return p.lexically_relative(tree.work_root()).generic_string();
}

void plan_deleted(const DirectoryTree &tree, NodeId id, Plan &out) {
  const auto &n = tree.node(id);
  for (const auto &[_, f] : n.files) {
    out.delete_files.push_back(&f);
  }
  for (const auto &[_, cid] : n.children) {
    plan_deleted(tree, cid, out);
  }
  out.delete_dirs.push_back(id);
}

void plan_active(const DirectoryTree &tree, NodeId id, const std::regex &filter, Plan &out) {
  const auto &n = tree.node(id);
  for (const auto &[_, f] : n.files) {
    const std::string path = rel_path(tree, f);
    if (!std::regex_search(path, filter, std::regex_constants::match_continuous)) {
      continue;
    }
    if (f.exists_at(out.target)) {
      out.restore_files.push_back(&f);
    } else {
      out.delete_files.push_back(&f);
    }
  }
  for (const auto &[_, cid] : n.children) {
    if (tree.node(cid).is_active_at(out.target)) {
      out.create_dirs.push_back(cid);
      plan_active(tree, cid, filter, out);
    } else {
      out.wholesale.push_back(cid);
      plan_deleted(tree, cid, out);
    }
  }
}

// Anything on disk under a doomed directory that the store has never seen.
void find_untracked(const DirectoryTree &tree, NodeId id, std::vector<std::string> &out) {
  const auto dir = tree.work_dir(id);
  std::error_code ec;
  const auto st = stdfs::symlink_status(dir, ec);
  if (ec || !stdfs::exists(st)) {
    return;
  }
  if (!stdfs::is_directory(st)) {
    out.push_back(rel_path(tree, dir));
    return;
  }
  for (auto it = stdfs::directory_iterator(dir, ec); !ec && it != stdfs::directory_iterator();
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (it->is_directory() && !it->is_symlink()) {
      if (const auto cid = tree.child(id, name)) {
        find_untracked(tree, *cid, out);
      } else {
        out.push_back(rel_path(tree, it->path()));
      }
    } else if (tree.find_file(id, name) == nullptr) {
      out.push_back(rel_path(tree, it->path()));
    }
  }
  if (ec) {
    throw Error(ErrorKind::Io, "scan failed: " + dir.string() + ": " + ec.message());
  }
}

std::string list_paths(const std::vector<std::string> &paths) {
  std::string out;
  for (const auto &p : paths) {
    out += out.empty() ? " " : ", ";
    out += p;
  }
  return out;
}

} // namespace

Plan plan(const DirectoryTree &tree, Revision target, const std::regex &filter) {
  Plan out;
  out.target = target;
  plan_active(tree, tree.root(), filter, out);
  return out;
}

void validate(const DirectoryTree &tree, const Plan &plan, Revision current_max) {
  if (plan.target != current_max) {
    std::vector<std::string> modified;
    for (const auto *list : {&plan.restore_files, &plan.delete_files}) {
      for (const auto *f : *list) {
        if (f->is_modified()) {
          modified.push_back(rel_path(tree, *f));
        }
      }
    }
    if (!modified.empty()) {
      throw Error(ErrorKind::UncommittedChanges,
                  "uncommitted changes, commit or restore the current revision first:" +
                      list_paths(modified));
    }
  }

  std::vector<std::string> untracked;
  for (const NodeId id : plan.wholesale) {
    find_untracked(tree, id, untracked);
  }
  if (!untracked.empty()) {
    throw Error(ErrorKind::UntrackedPath,
                "untracked paths inside directories to remove:" + list_paths(untracked));
  }

  for (const NodeId id : plan.create_dirs) {
    const auto dir = tree.work_dir(id);
    if (fs::exists(dir) && !fs::is_directory(dir)) {
      throw Error(ErrorKind::PathConflict, "not a directory: " + rel_path(tree, dir));
    }
  }
  for (const auto *f : plan.restore_files) {
    if (fs::is_directory(f->work_path())) {
      throw Error(ErrorKind::PathConflict, "directory in the way of: " + rel_path(tree, *f));
    }
  }
}

void apply(const DirectoryTree &tree, const Plan &plan, const log::Sink &sink) {
  for (const NodeId id : plan.create_dirs) {
    const auto dir = tree.work_dir(id);
    if (fs::is_directory(dir)) {
      continue;
    }
    if (fs::exists(dir)) {
      throw Error(ErrorKind::PathConflict, "not a directory: " + rel_path(tree, dir));
    }
    fs::ensure_dir(dir);
    sink(log::Level::Debug, "mkdir " + rel_path(tree, dir));
  }

  for (const auto *f : plan.restore_files) {
    if (fs::is_directory(f->work_path())) {
      throw Error(ErrorKind::PathConflict, "directory in the way of: " + rel_path(tree, *f));
    }
    const auto kind = f->content_kind_at(plan.target);
    fs::write_file_atomic(f->work_path(), f->contents_at(plan.target));
    sink(log::Level::Debug, std::string("restore ") +
                                (kind == ContentKind::Text ? "text " : "binary ") +
                                rel_path(tree, *f));
  }

  for (const auto *f : plan.delete_files) {
    const auto &p = f->work_path();
    if (fs::exists(p) && !fs::is_directory(p)) {
      fs::remove_file(p);
      sink(log::Level::Debug, "remove " + rel_path(tree, *f));
    }
  }

  for (const NodeId id : plan.delete_dirs) {
    const auto dir = tree.work_dir(id);
    if (!fs::is_directory(dir)) {
      continue;
    }
    std::error_code ec;
    stdfs::remove(dir, ec);
    if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
      throw Error(ErrorKind::DirectoryNotEmpty, "directory not empty: " + rel_path(tree, dir));
    }
    if (ec) {
      throw Error(ErrorKind::Io, "rmdir failed: " + dir.string() + ": " + ec.message());
    }
    sink(log::Level::Debug, "rmdir " + rel_path(tree, dir));
  }
}

} // namespace strata::restore
