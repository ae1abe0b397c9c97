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
  const fs::path root = base / ("strata_commit_test_" + suffix);

  try {
    fs::create_directories(root);
    auto repo = strata::Repository::open(root);

    // Empty tree: nothing to commit, no revision used.
    if (repo.commit("empty") || repo.last_revision() != 0) {
      std::cerr << "empty commit allocated a revision\n";
      return 1;
    }

    spit(root / "P" / "f.txt", "one\n");
    spit(root / "img.bin", std::string("\x89PNG\xff\x00", 6));
    const auto r1 = repo.commit("first");
    if (!r1 || *r1 != 1) {
      std::cerr << "first commit should be revision 1\n";
      return 1;
    }

    // Idempotent: an unchanged tree commits nothing.
    if (repo.commit("again")) {
      std::cerr << "unchanged tree produced a revision\n";
      return 1;
    }
    if (!repo.status().empty()) {
      std::cerr << "status not empty on clean tree\n";
      return 1;
    }

    // Delete the directory, commit, recreate it, commit.
    fs::remove_all(root / "P");
    const auto st = repo.status();
    if (st.size() != 2 || strata::describe(st[0]) != "-d P" ||
        strata::describe(st[1]) != "-f P/f.txt") {
      std::cerr << "status after delete wrong\n";
      return 1;
    }
    if (repo.commit("drop P") != 2u) {
      std::cerr << "delete commit should be revision 2\n";
      return 1;
    }
    spit(root / "P" / "f.txt", "two\n");
    if (repo.commit("bring P back\nwith a newline") != 3u) {
      std::cerr << "recreate commit should be revision 3\n";
      return 1;
    }

    const auto &tree = repo.tree();
    const auto p = tree.find("P");
    if (!p || tree.node(*p).history != std::vector<strata::Revision>{1, 2, 3}) {
      std::cerr << "directory history should be [1,2,3]\n";
      return 1;
    }
    const auto *f = tree.find_file(*p, "f.txt");
    if (f == nullptr || f->events().size() != 3 ||
        f->events().at(2).kind != strata::EventKind::Delete ||
        f->events().at(3).kind != strata::EventKind::Create) {
      std::cerr << "file history should be create, delete at 2, create at 3\n";
      return 1;
    }
    if (slurp(repo.metadata_file()) != "1,2,3 P\n") {
      std::cerr << "metadata mismatch: [" << slurp(repo.metadata_file()) << "]\n";
      return 1;
    }
    if (!fs::exists(repo.data_dir() / "P" / "D2- f.txt") ||
        !fs::exists(repo.data_dir() / "P" / "ET3- f.txt") ||
        !fs::exists(repo.data_dir() / "EB1- img.bin")) {
      std::cerr << "expected artifacts missing\n";
      return 1;
    }

    // Modification and type change.
    spit(root / "img.bin", "now text\n");
    spit(root / "P" / "f.txt", "two\nthree\n");
    if (repo.commit("edit") != 4u) {
      std::cerr << "edit commit should be revision 4\n";
      return 1;
    }

    const std::string expected_log = "1. first\n"
                                     "  +d P\n"
                                     "  +ft P/f.txt\n"
                                     "  +fb img.bin\n"
                                     "\n"
                                     "2. drop P\n"
                                     "  -d P\n"
                                     "  -f P/f.txt\n"
                                     "\n"
                                     "3. bring P back with a newline\n"
                                     "  +d P\n"
                                     "  +ft P/f.txt\n"
                                     "\n"
                                     "4. edit\n"
                                     "  *ft P/f.txt\n"
                                     "  *ft img.bin\n"
                                     "\n";
    const std::string log = repo.list(true);
    if (log != expected_log) {
      std::cerr << "commit log mismatch:\n" << log;
      return 1;
    }
    if (repo.list(false) != "1. first\n2. drop P\n3. bring P back with a newline\n4. edit\n") {
      std::cerr << "short list mismatch:\n" << repo.list(false);
      return 1;
    }

    // Content comparison, not timestamps: a same-size edit with the old mtime
    // is still reported.
    {
      const fs::path pf = root / "P" / "f.txt";
      const auto stamp = fs::last_write_time(pf);
      spit(pf, "two\nthreE\n");
      fs::last_write_time(pf, stamp);
      const auto changed = repo.status();
      if (changed.size() != 1 || strata::describe(changed[0]) != "*ft P/f.txt") {
        std::cerr << "same-size edit not reported by status\n";
        return 1;
      }
      if (repo.commit("same size") != 5u) {
        std::cerr << "same-size edit should commit revision 5\n";
        return 1;
      }
    }
    if (fs::exists(repo.lock_file())) {
      std::cerr << "LOCK left behind after a clean commit\n";
      return 1;
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
