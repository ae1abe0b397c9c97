#pragma once
#include "strata/directory_tree.hpp"
#include "strata/log.hpp"
#include "strata/revision.hpp"

#include <filesystem>
#include <regex>
#include <vector>

namespace strata::restore {

struct Plan {
  Revision target = 0;
  std::vector<NodeId> create_dirs;                  // parents before children
  std::vector<const VersionedFile*> restore_files;  // exist at target, match the filter
  std::vector<const VersionedFile*> delete_files;   // absent at target
  std::vector<NodeId> delete_dirs;                  // inactive at target, children first
  std::vector<NodeId> wholesale;                    // roots of the deleted subtrees
};

// Decide what restoring `target` does. The filter is matched against each
// file's repo-relative path; directories are planned regardless of it.
Plan plan(const DirectoryTree& tree, Revision target, const std::regex& filter);

// Throws Error{UncommittedChanges} / Error{UntrackedPath} before anything
// is touched. Edits are only tolerated when `target` is `current_max`.
void validate(const DirectoryTree& tree, const Plan& plan, Revision current_max);

// Create directories, write restored files, delete files, delete directories.
void apply(const DirectoryTree& tree, const Plan& plan, const log::Sink& sink);

} // namespace strata::restore
