#include "strata/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static void spit(const fs::path &p, const std::string &s) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << s;
}

int main() {
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path root = base / ("strata_repository_test_" + suffix);

  try {
    fs::create_directories(root / "deep" / "er");

    std::vector<std::string> messages;
    auto sink = [&](strata::log::Level, std::string_view msg) { messages.emplace_back(msg); };

    {
      auto repo = strata::Repository::open(root, sink);
      if (repo.root() != root || !fs::is_directory(root / "REPO" / "DATA") ||
          slurp(repo.metadata_file()) != "" || slurp(repo.commits_file()) != "") {
        std::cerr << "fresh store layout wrong\n";
        return 1;
      }
      if (fs::exists(root / "REPO" / "config")) {
        std::cerr << "open should not create a config file\n";
        return 1;
      }
      if (repo.list(true) != "" || repo.list(false) != "" || repo.last_revision() != 0) {
        std::cerr << "fresh repository not empty\n";
        return 1;
      }
    }

    // Opening below the root finds the same store.
    {
      auto repo = strata::Repository::open(root / "deep" / "er", sink);
      if (repo.root() != root || fs::exists(root / "deep" / "er" / "REPO")) {
        std::cerr << "nearest ancestor store not used\n";
        return 1;
      }

      spit(root / "deep" / "er" / "note.txt", "n\n");
      spit(root / "deep" / "REPO" / "inner.txt", "tracked\n");
      fs::create_symlink(root / "deep" / "er" / "note.txt", root / "link.txt");
      messages.clear();
      const auto changes = repo.status();
      std::vector<std::string> seen;
      for (const auto &c : changes)
        seen.push_back(strata::describe(c));
      const std::vector<std::string> expected{"+d deep", "+d deep/REPO", "+ft deep/REPO/inner.txt",
                                              "+d deep/er", "+ft deep/er/note.txt"};
      if (seen != expected) {
        std::cerr << "status mismatch:\n";
        for (const auto &s : seen)
          std::cerr << "  " << s << "\n";
        return 1;
      }
      bool warned = false;
      for (const auto &m : messages)
        warned = warned || m.find("link.txt") != std::string::npos;
      if (!warned) {
        std::cerr << "symlink skipped without a diagnostic\n";
        return 1;
      }
      if (repo.last_revision() != 0 || slurp(repo.commits_file()) != "") {
        std::cerr << "status wrote something\n";
        return 1;
      }
      if (repo.commit("nested") != 1u) {
        std::cerr << "commit from subdirectory failed\n";
        return 1;
      }
    }

    // Reopen: rehydrated state sees no changes.
    {
      auto repo = strata::Repository::open(root);
      if (repo.last_revision() != 1 || !repo.status().empty()) {
        std::cerr << "rehydrated repository disagrees with the working tree\n";
        return 1;
      }
      const auto *f = repo.tree().find_file(*repo.tree().find("deep/er"), "note.txt");
      if (f == nullptr || !f->exists_now() || f->live_revision() != 1u) {
        std::cerr << "file events not rehydrated\n";
        return 1;
      }
    }

    // Revision numbering continues from the log even if the tree is behind.
    {
      std::ofstream(root / "REPO" / "commits.txt", std::ios::app) << "7. imported\n\n";
      auto repo = strata::Repository::open(root);
      if (repo.last_revision() != 7) {
        std::cerr << "log header not counted\n";
        return 1;
      }
      spit(root / "new.txt", "x\n");
      if (repo.commit("after import") != 8u) {
        std::cerr << "commit after imported log should be 8\n";
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
