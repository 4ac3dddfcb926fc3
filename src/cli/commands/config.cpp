#include "revhub/config.hpp"

#include <filesystem>
#include <iostream>

int cmd_config(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "usage: revhub config <name> <email>\n";
    return 2;
  }
  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const revhub::Identity id{.name = argv[1], .email = argv[2]};
    revhub::save_identity(root, id);
    std::cout << "Acting as " << id.name << " <" << id.email << ">\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }
}

int cmd_whoami(int /*argc*/, char ** /*argv*/) {
  try {
    const auto id = revhub::load_identity(std::filesystem::current_path());
    if (id.email.empty()) {
      std::cerr << "whoami: no identity configured (run `revhub config <name> <email>`)\n";
      return 1;
    }
    std::cout << id.name << " <" << id.email << ">\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "whoami: " << e.what() << "\n";
    return 1;
  }
}
