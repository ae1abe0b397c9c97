#include "strata/directory_tree.hpp"
#include "strata/error.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using strata::DirectoryTree;
using strata::ErrorKind;

static bool throws_kind(ErrorKind kind, const auto &fn) {
  try {
    fn();
  } catch (const strata::Error &e) {
    return e.kind() == kind;
  }
  return false;
}

int main() {
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path root = base / ("strata_tree_test_" + suffix);

  try {
    // Activity parity: odd history length means active.
    strata::DirectoryNode n;
    n.name = "x";
    n.history = {2, 5, 7};
    if (!n.is_active() || n.is_active_at(1) || !n.is_active_at(2) || !n.is_active_at(4) ||
        n.is_active_at(5) || n.is_active_at(6) || !n.is_active_at(7) || !n.is_active_at(100)) {
      std::cerr << "is_active_at parity wrong\n";
      return 1;
    }

    DirectoryTree tree{root, root / "REPO" / "DATA"};
    const auto ab = tree.add("a/b", 1);
    tree.add("c", 2);
    if (tree.path_of(ab) != "a/b" || tree.work_dir(ab) != root / "a" / "b" ||
        tree.data_dir(ab) != root / "REPO" / "DATA" / "a" / "b") {
      std::cerr << "path mapping wrong\n";
      return 1;
    }
    if (tree.max_revision() != 2 || tree.node(tree.at_path("a")).max_revision != 1) {
      std::cerr << "max_revision not propagated\n";
      return 1;
    }
    if (!throws_kind(ErrorKind::DuplicateEntry, [&] { tree.add("a/b", 3); })) {
      std::cerr << "re-adding an active directory should fail\n";
      return 1;
    }
    if (!throws_kind(ErrorKind::PathNotFound, [&] { (void)tree.at_path("nope/x"); })) {
      std::cerr << "missing path lookup should fail\n";
      return 1;
    }
    if (!throws_kind(ErrorKind::InvalidEventOrder, [&] { tree.toggle_state(ab, 1); })) {
      std::cerr << "non-increasing toggle should fail\n";
      return 1;
    }

    // Deactivate then reactivate through add().
    tree.toggle_state(ab, 3);
    tree.add("a/b", 4);
    if (tree.node(ab).history != std::vector<strata::Revision>{1, 3, 4}) {
      std::cerr << "reactivation history wrong\n";
      return 1;
    }

    const std::string text = tree.serialize();
    const std::string expected = "1 a\n 1,3,4 b\n2 c\n";
    if (text != expected) {
      std::cerr << "serialize mismatch: [" << text << "]\n";
      return 1;
    }
    const auto back = DirectoryTree::deserialize(text, root, root / "REPO" / "DATA");
    if (back.serialize() != expected || back.max_revision() != 4) {
      std::cerr << "round trip mismatch\n";
      return 1;
    }
    const auto b2 = back.find("a/b");
    if (!b2 || !back.node(*b2).is_active() || back.node(*b2).is_active_at(3)) {
      std::cerr << "deserialized history wrong\n";
      return 1;
    }

    // Malformed metadata.
    for (const std::string bad : {"1 a\n  1 b\n", "x a\n", "3,2 a\n", "1 a\n1 a\n", "0 a\n",
                                  "1,,2 a\n", "1 a/b\n"}) {
      if (!throws_kind(ErrorKind::MalformedMetadata,
                       [&] { (void)DirectoryTree::deserialize(bad, root, root / "DATA"); })) {
        std::cerr << "accepted malformed metadata: [" << bad << "]\n";
        return 1;
      }
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
