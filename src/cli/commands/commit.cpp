#include "cli/session.hpp"

#include "revhub/repo.hpp"
#include "revhub/util.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  // revhub commit -m "msg"  |  revhub commit words of the message
  std::string message;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
    } else {
      if (!message.empty()) message += ' ';
      message += a;
    }
  }
  if (message.empty()) {
    std::cerr << "usage: revhub commit <message>\n";
    return 2;
  }

  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo("commit");
  }
  try {
    auto repo = revhub::cli::open_repo(root);
    const auto r = repo->commit(message);
    if (!r) {
      return revhub::cli::report("commit", r.error());
    }
    revhub::cli::save_repo(root, *repo);
    const auto st = repo->status();
    const std::string branch = st ? st.value().head : std::string("?");
    std::cout << "[" << branch << " " << revhub::abbrev(r.value()) << "] " << message << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
