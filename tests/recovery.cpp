#include "strata/error.hpp"
#include "strata/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

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
  const fs::path root = base / ("strata_recovery_test_" + suffix);

  try {
    fs::create_directories(root);
    fs::path repo_dir;
    std::string meta_before;
    std::string log_before;
    {
      auto repo = strata::Repository::open(root);
      spit(root / "a.txt", "v1\n");
      spit(root / "S" / "s.txt", "stay\n");
      if (repo.commit("base") != 1u) {
        std::cerr << "base commit should be revision 1\n";
        return 1;
      }
      repo_dir = repo.repo_dir();
      meta_before = slurp(repo.metadata_file());
      log_before = slurp(repo.commits_file());
    }
    const fs::path data = repo_dir / "DATA";

    // Leave the store exactly as a commit of revision 2 that died halfway would.
    spit(root / "a.txt", "v2\n");
    spit(repo_dir / "LOCK", "2");
    fs::copy_file(repo_dir / "metadatadir.txt", repo_dir / "BAK2- metadatadir.txt");
    fs::copy_file(repo_dir / "commits.txt", repo_dir / "BAK2- commits.txt");
    fs::copy_file(data / "ET1- a.txt", data / "BAK2- ET1- a.txt");
    fs::rename(data / "ET1- a.txt", data / "HT1- a.txt");
    spit(data / "HT1- a.txt", "s 3\ni 3\nv1\n\n");
    spit(data / "ET2- a.txt", "v2\n");
    spit(data / "T" / "ET2- t.txt", "new\n");
    spit(repo_dir / "metadatadir.txt", "1 S\n2 T\n");
    std::ofstream(repo_dir / "commits.txt", std::ios::app) << "2. crashed\n  +d T\n";

    auto repo = strata::Repository::open(root);
    if (fs::exists(repo_dir / "LOCK")) {
      std::cerr << "LOCK survived recovery\n";
      return 1;
    }
    if (repo.last_revision() != 1) {
      std::cerr << "last revision after recovery: " << repo.last_revision() << "\n";
      return 1;
    }
    if (slurp(repo.metadata_file()) != meta_before || slurp(repo.commits_file()) != log_before) {
      std::cerr << "metadata files not rolled back\n";
      return 1;
    }
    if (!fs::exists(data / "ET1- a.txt") || fs::exists(data / "HT1- a.txt") ||
        fs::exists(data / "ET2- a.txt") || fs::exists(data / "T" / "ET2- t.txt") ||
        fs::exists(data / "BAK2- ET1- a.txt") || fs::exists(repo_dir / "BAK2- metadatadir.txt")) {
      std::cerr << "data store not rolled back\n";
      return 1;
    }
    if (slurp(data / "ET1- a.txt") != "v1\n") {
      std::cerr << "live artifact content wrong after recovery\n";
      return 1;
    }

    // The working tree still has the unsaved edit; restoring the current revision brings back v1.
    repo.restore_to(std::nullopt);
    if (slurp(root / "a.txt") != "v1\n" || slurp(root / "S" / "s.txt") != "stay\n") {
      std::cerr << "working tree not at revision 1\n";
      return 1;
    }

    // The next commit reuses revision 2. Backups left behind by an abandoned
    // attempt at revision 2 are overwritten and cleaned up with the commit.
    spit(repo_dir / "BAK2- metadatadir.txt", "stale\n");
    spit(repo_dir / "BAK2- commits.txt", "stale\n");
    spit(root / "a.txt", "v2\n");
    if (repo.commit("retry") != 2u) {
      std::cerr << "retry should commit revision 2\n";
      return 1;
    }
    if (fs::exists(repo_dir / "BAK2- metadatadir.txt") ||
        fs::exists(repo_dir / "BAK2- commits.txt")) {
      std::cerr << "stale backups survived the commit\n";
      return 1;
    }
    if (slurp(repo.metadata_file()) == "stale\n" ||
        slurp(repo.commits_file()).find("2. retry") == std::string::npos) {
      std::cerr << "metadata wrong after commit over stale backups\n";
      return 1;
    }

    // A LOCK appearing under an open repository is handled before the next operation.
    spit(repo_dir / "LOCK", "3\n");
    spit(data / "ET3- stray.txt", "x\n");
    if (repo.last_revision() != 2 || fs::exists(repo_dir / "LOCK") ||
        fs::exists(data / "ET3- stray.txt")) {
      std::cerr << "in-process lock not recovered\n";
      return 1;
    }

    spit(repo_dir / "LOCK", "not a number");
    bool threw = false;
    try {
      (void)strata::Repository::open(root);
    } catch (const strata::Error &e) {
      threw = e.kind() == strata::ErrorKind::MalformedMetadata;
    }
    if (!threw) {
      std::cerr << "garbage LOCK accepted\n";
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
