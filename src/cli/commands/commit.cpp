#include "cli/session.hpp"

#include "strata/error.hpp"

#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: strata commit <comment...>\n";
    return 2;
  }
  std::string comment;
  for (int i = 1; i < argc; ++i) {
    if (i > 1)
      comment.push_back(' ');
    comment += argv[i];
  }

  try {
    auto repo = strata::cli::open_repository();
    const auto rev = repo.commit(comment);
    if (!rev) {
      std::cout << "nothing to commit\n";
      return 0;
    }
    std::cout << *rev << "\n";
    return 0;
  } catch (const strata::Error &e) {
    std::cerr << "commit: " << strata::to_string(e.kind()) << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
