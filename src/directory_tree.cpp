#include "strata/directory_tree.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"
#include "strata/journal.hpp"

#include <algorithm>
#include <charconv>
#include <regex>
#include <utility>

namespace stdfs = std::filesystem;

namespace strata {

namespace {

std::vector<std::string> split_path(std::string_view path) {
  std::vector<std::string> out;
  while (!path.empty()) {
    const std::size_t pos = path.find('/');
    const auto seg = path.substr(0, pos);
    if (!seg.empty() && seg != ".") {
      out.emplace_back(seg);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(pos + 1);
  }
  return out;
}

std::string join(const std::string &dir, const std::string &name) {
  return dir.empty() ? name : dir + "/" + name;
}

[[noreturn]] void malformed(std::size_t line_no, const std::string &why) {
  throw Error(ErrorKind::MalformedMetadata,
              "metadata line " + std::to_string(line_no) + ": " + why);
}

} // namespace

bool DirectoryNode::is_active_at(Revision revision) const {
  bool active = false;
  for (const Revision r : history) {
    if (r > revision) {
      break;
    }
    active = !active;
  }
  return active;
}

DirectoryTree::DirectoryTree(stdfs::path work_root, stdfs::path data_root)
    : work_root_(std::move(work_root)), data_root_(std::move(data_root)) {
  DirectoryNode top;
  top.history = {0};
  nodes_.push_back(std::move(top));
}

NodeId DirectoryTree::new_node(NodeId parent, std::string name, std::vector<Revision> history) {
  const NodeId id = nodes_.size();
  DirectoryNode n;
  n.name = name;
  n.history = std::move(history);
  n.parent = parent;
  nodes_.push_back(std::move(n));
  nodes_[parent].children.emplace(std::move(name), id);
  return id;
}

std::optional<NodeId> DirectoryTree::child(NodeId parent, const std::string &name) const {
  const auto &kids = node(parent).children;
  if (auto it = kids.find(name); it != kids.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<NodeId> DirectoryTree::find(std::string_view path) const {
  NodeId cur = root();
  for (const auto &seg : split_path(path)) {
    const auto next = child(cur, seg);
    if (!next) {
      return std::nullopt;
    }
    cur = *next;
  }
  return cur;
}

NodeId DirectoryTree::at_path(std::string_view path) const {
  if (auto id = find(path)) {
    return *id;
  }
  throw Error(ErrorKind::PathNotFound, "no directory entry for: " + std::string(path));
}

NodeId DirectoryTree::add(std::string_view path, Revision revision) {
  const auto segments = split_path(path);
  if (segments.empty()) {
    throw Error(ErrorKind::DuplicateEntry, "the root directory always exists");
  }
  NodeId cur = root();
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const bool last = i + 1 == segments.size();
    if (const auto existing = child(cur, segments[i])) {
      cur = *existing;
      if (!node(cur).is_active()) {
        toggle_state(cur, revision);
      } else if (last) {
        throw Error(ErrorKind::DuplicateEntry, "directory already active: " + std::string(path));
      }
    } else {
      cur = new_node(cur, segments[i], {revision});
      note_revision(cur, revision);
    }
  }
  return cur;
}

void DirectoryTree::toggle_state(NodeId id, Revision revision) {
  auto &n = node(id);
  if (!n.history.empty() && revision <= n.history.back()) {
    throw Error(ErrorKind::InvalidEventOrder,
                "revision " + std::to_string(revision) + " not after " +
                    std::to_string(n.history.back()) + " for " + path_of(id));
  }
  n.history.push_back(revision);
  note_revision(id, revision);
}

void DirectoryTree::note_revision(NodeId id, Revision revision) {
  for (NodeId cur = id; cur != kNoNode; cur = node(cur).parent) {
    auto &n = node(cur);
    n.max_revision = std::max(n.max_revision, revision);
  }
}

std::string DirectoryTree::path_of(NodeId id) const {
  std::vector<const std::string *> names;
  for (NodeId cur = id; cur != root(); cur = node(cur).parent) {
    names.push_back(&node(cur).name);
  }
  std::string out;
  for (auto it = names.rbegin(); it != names.rend(); ++it) {
    out = join(out, **it);
  }
  return out;
}

stdfs::path DirectoryTree::work_dir(NodeId id) const {
  const auto rel = path_of(id);
  return rel.empty() ? work_root_ : work_root_ / rel;
}

stdfs::path DirectoryTree::data_dir(NodeId id) const {
  const auto rel = path_of(id);
  return rel.empty() ? data_root_ : data_root_ / rel;
}

VersionedFile &DirectoryTree::file(NodeId dir, const std::string &name) {
  auto &files = node(dir).files;
  if (auto it = files.find(name); it != files.end()) {
    return it->second;
  }
  auto [it, _] = files.try_emplace(name, data_dir(dir), work_dir(dir) / name);
  return it->second;
}

VersionedFile *DirectoryTree::find_file(NodeId dir, const std::string &name) {
  auto &files = node(dir).files;
  auto it = files.find(name);
  return it == files.end() ? nullptr : &it->second;
}

const VersionedFile *DirectoryTree::find_file(NodeId dir, const std::string &name) const {
  const auto &files = node(dir).files;
  auto it = files.find(name);
  return it == files.end() ? nullptr : &it->second;
}

void DirectoryTree::reset_touched() {
  for (auto &n : nodes_) {
    n.touched = false;
    for (auto &[_, f] : n.files) {
      f.touched = false;
    }
  }
}

void DirectoryTree::visit_untouched(
    NodeId id, const std::function<void(NodeId, const std::string *)> &fn) const {
  const auto &n = node(id);
  for (const auto &[name, f] : n.files) {
    if (!f.touched && f.exists_now()) {
      fn(id, &name);
    }
  }
  for (const auto &[name, cid] : n.children) {
    const auto &c = node(cid);
    if (!c.is_active()) {
      continue;
    }
    if (!c.touched) {
      fn(cid, nullptr);
    }
    visit_untouched(cid, fn);
  }
}

std::vector<Change> DirectoryTree::untouched() const {
  std::vector<Change> out;
  visit_untouched(root(), [&](NodeId id, const std::string *file) {
    if (file == nullptr) {
      out.push_back(Change{.kind = ChangeKind::DirDeleted, .path = path_of(id),
                           .content = ContentKind::Binary});
    } else {
      out.push_back(Change{.kind = ChangeKind::FileDeleted, .path = join(path_of(id), *file),
                           .content = ContentKind::Binary});
    }
  });
  return out;
}

std::size_t DirectoryTree::mark_untouched_deleted(Revision revision, Journal &journal) {
  std::vector<std::pair<NodeId, std::optional<std::string>>> targets;
  visit_untouched(root(), [&](NodeId id, const std::string *file) {
    targets.emplace_back(id, file ? std::optional<std::string>(*file) : std::nullopt);
  });
  for (const auto &[id, file] : targets) {
    if (file) {
      find_file(id, *file)->delete_at_revision(revision, journal);
      note_revision(id, revision);
    } else {
      toggle_state(id, revision);
    }
  }
  return targets.size();
}

void DirectoryTree::serialize_node(NodeId id, std::size_t depth, std::string &out) const {
  const auto &n = node(id);
  out.append(depth, consts::kSpace);
  for (std::size_t i = 0; i < n.history.size(); ++i) {
    if (i) {
      out.push_back(consts::kComma);
    }
    out += std::to_string(n.history[i]);
  }
  out.push_back(consts::kSpace);
  out += n.name;
  out.push_back(consts::kLF);
  for (const auto &[_, cid] : n.children) {
    serialize_node(cid, depth + 1, out);
  }
}

std::string DirectoryTree::serialize() const {
  std::string out;
  for (const auto &[_, cid] : node(root()).children) {
    serialize_node(cid, 0, out);
  }
  return out;
}

DirectoryTree DirectoryTree::deserialize(std::string_view text, stdfs::path work_root,
                                         stdfs::path data_root) {
  static const std::regex line_re{"^(\\d+(?:,\\d+)*) (.+)$"};

  DirectoryTree tree(std::move(work_root), std::move(data_root));
  std::vector<NodeId> stack{tree.root()}; // stack[d] is the parent of a depth-d line
  std::size_t line_no = 0;
  while (!text.empty()) {
    const std::size_t nl = text.find('\n');
    std::string line(text.substr(0, nl));
    text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    const std::size_t depth = line.find_first_not_of(consts::kSpace);
    if (depth == std::string::npos) {
      malformed(line_no, "blank entry");
    }
    if (depth >= stack.size()) {
      malformed(line_no, "indentation skips a level");
    }
    std::smatch m;
    const std::string rest = line.substr(depth);
    if (!std::regex_match(rest, m, line_re)) {
      malformed(line_no, "expected \"<rev>[,<rev>...] <name>\"");
    }

    std::vector<Revision> history;
    const std::string revs = m[1].str();
    for (std::size_t pos = 0; pos <= revs.size();) {
      std::size_t end = revs.find(consts::kComma, pos);
      if (end == std::string::npos) {
        end = revs.size();
      }
      Revision r = 0;
      const auto [ptr, ec] = std::from_chars(revs.data() + pos, revs.data() + end, r);
      if (ec != std::errc{} || ptr != revs.data() + end || r == 0) {
        malformed(line_no, "bad revision list");
      }
      if (!history.empty() && r <= history.back()) {
        malformed(line_no, "revisions not strictly increasing");
      }
      history.push_back(r);
      pos = end + 1;
    }

    std::string name = m[2].str();
    if (name.find('/') != std::string::npos || name == "." || name == "..") {
      malformed(line_no, "bad directory name: " + name);
    }
    stack.resize(depth + 1);
    const NodeId parent = stack.back();
    if (tree.child(parent, name)) {
      malformed(line_no, "duplicate directory: " + name);
    }
    const Revision newest = history.back();
    const NodeId id = tree.new_node(parent, std::move(name), std::move(history));
    tree.note_revision(id, newest);
    stack.push_back(id);
  }
  return tree;
}

void DirectoryTree::load_artifacts() {
  for (NodeId id = 0; id < nodes_.size(); ++id) {
    const auto dir = data_dir(id);
    if (!stdfs::is_directory(dir)) {
      continue;
    }
    std::error_code ec;
    for (auto it = stdfs::directory_iterator(dir, ec); !ec && it != stdfs::directory_iterator();
         it.increment(ec)) {
      if (!it->is_regular_file()) {
        continue;
      }
      const std::string locator = it->path().filename().string();
      const auto a = parse_artifact_name(locator);
      if (!a) {
        continue;
      }
      file(id, a->filename).load_event(a->state, a->revision, a->content, locator);
    }
    if (ec) {
      throw Error(ErrorKind::Io, "scan failed: " + dir.string() + ": " + ec.message());
    }
    for (const auto &[_, f] : node(id).files) {
      f.check_history();
      note_revision(id, f.last_revision());
    }
  }
}

} // namespace strata
