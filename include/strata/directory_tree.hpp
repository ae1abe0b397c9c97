#pragma once
#include "strata/changes.hpp"
#include "strata/revision.hpp"
#include "strata/versioned_file.hpp"

#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

class Journal; // fwd

// Index into the tree's node arena. Children own their handles; the parent
// handle exists only to rebuild path strings.
using NodeId = std::size_t;
inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

struct DirectoryNode {
  std::string name;                      // empty only for the root
  std::vector<Revision> history;         // creation, deletion, creation, ...
  std::map<std::string, NodeId> children;
  std::map<std::string, VersionedFile> files;
  NodeId parent = kNoNode;
  Revision max_revision = 0;             // highest revision anywhere in this subtree
  // Commit-walk scratch state, reset at the start of every walk; never persisted.
  bool touched = false;

  // Odd history length means the directory currently exists.
  [[nodiscard]] bool is_active() const { return history.size() % 2 == 1; }
  [[nodiscard]] bool is_active_at(Revision revision) const;
};

// Paths -> activity histories, mirroring the working tree under `work_root`
// and the artifact store under `data_root`.
class DirectoryTree {
public:
  DirectoryTree(std::filesystem::path work_root, std::filesystem::path data_root);

  [[nodiscard]] NodeId root() const { return 0; }
  [[nodiscard]] DirectoryNode& node(NodeId id) { return nodes_.at(id); }
  [[nodiscard]] const DirectoryNode& node(NodeId id) const { return nodes_.at(id); }
  [[nodiscard]] std::size_t size() const { return nodes_.size(); }

  // Throws Error{PathNotFound} if any segment is missing.
  [[nodiscard]] NodeId at_path(std::string_view path) const;
  [[nodiscard]] std::optional<NodeId> find(std::string_view path) const;
  [[nodiscard]] std::optional<NodeId> child(NodeId parent, const std::string& name) const;

  // Create missing segments and reactivate inactive ones at `revision`.
  // Throws Error{DuplicateEntry} if the full path was already active.
  NodeId add(std::string_view path, Revision revision);

  // Append `revision` to the node's history (flip active/inactive).
  void toggle_state(NodeId id, Revision revision);

  // Record that `revision` touched something at or under `id`.
  void note_revision(NodeId id, Revision revision);

  [[nodiscard]] std::string path_of(NodeId id) const;
  [[nodiscard]] std::filesystem::path work_dir(NodeId id) const;
  [[nodiscard]] std::filesystem::path data_dir(NodeId id) const;
  [[nodiscard]] const std::filesystem::path& work_root() const { return work_root_; }

  // Existing file entry or a fresh one (no events yet).
  VersionedFile& file(NodeId dir, const std::string& name);
  [[nodiscard]] VersionedFile* find_file(NodeId dir, const std::string& name);
  [[nodiscard]] const VersionedFile* find_file(NodeId dir, const std::string& name) const;

  void reset_touched();
  // Active nodes and existing files the walk did not touch, as changes.
  [[nodiscard]] std::vector<Change> untouched() const;
  // Delete everything untouched() reports at `revision`. Returns the count.
  std::size_t mark_untouched_deleted(Revision revision, Journal& journal);

  // "<spaces><r1,r2,...> <name>" per node, depth-first, names sorted.
  [[nodiscard]] std::string serialize() const;
  // Throws Error{MalformedMetadata}.
  static DirectoryTree deserialize(std::string_view text, std::filesystem::path work_root,
                                   std::filesystem::path data_root);

  // Rebuild every node's file event logs from the artifacts in its data dir.
  void load_artifacts();

  [[nodiscard]] Revision max_revision() const { return node(root()).max_revision; }

private:
  NodeId new_node(NodeId parent, std::string name, std::vector<Revision> history);
  void serialize_node(NodeId id, std::size_t depth, std::string& out) const;
  // fn(dir, nullptr) for an untouched directory, fn(dir, &name) for an untouched file.
  void visit_untouched(NodeId id, const std::function<void(NodeId, const std::string*)>& fn) const;

  std::filesystem::path work_root_;
  std::filesystem::path data_root_;
  std::deque<DirectoryNode> nodes_;
};

} // namespace strata
