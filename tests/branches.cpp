#include "revhub/branches.hpp"
#include "revhub/error.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using revhub::ErrorCode;

template <typename Fn> static bool throws_code(Fn &&fn, ErrorCode code) {
  try {
    fn();
  } catch (const revhub::Error &e) {
    return e.code() == code;
  }
  return false;
}

int main() {
  try {
    revhub::BranchStore store{10};
    if (store.head() != "main" || !store.contains("main") || store.head_branch().tip) {
      std::cerr << "fresh store should hold an empty main as HEAD\n";
      return 1;
    }

    const auto &dev = store.create("dev", "main", 11);
    if (dev.tip || dev.forked_from != "main" || dev.created != 11) {
      std::cerr << "dev branch malformed\n";
      return 1;
    }
    if (!throws_code([&] { (void)store.create("dev", "main", 12); }, ErrorCode::DuplicateBranch)) {
      std::cerr << "duplicate branch not rejected\n";
      return 1;
    }
    if (!throws_code([&] { (void)store.create("x", "nope", 12); }, ErrorCode::BranchNotFound)) {
      std::cerr << "missing fork source not rejected\n";
      return 1;
    }

    // A new branch starts at its source's tip.
    store.set_tip("main", "0123456789");
    const auto &feat = store.create("feat", "main", 13);
    if (feat.tip != std::optional<std::string>("0123456789")) {
      std::cerr << "branch should fork at source tip\n";
      return 1;
    }
    (void)store.create("sub", "dev", 14);

    const std::vector<std::pair<std::string, std::size_t>> tree{
        {"main", 0}, {"dev", 1}, {"sub", 2}, {"feat", 1}};
    if (store.tree() != tree) {
      std::cerr << "fork tree mismatch\n";
      return 1;
    }
    const auto names = store.list();
    if (names.size() != 4 || names[0].name != "dev" || names[3].name != "sub") {
      std::cerr << "branch list not sorted\n";
      return 1;
    }

    if (!throws_code([&] { store.remove("main"); }, ErrorCode::ActiveBranch)) {
      std::cerr << "deleting HEAD should be ActiveBranch\n";
      return 1;
    }
    if (!throws_code([&] { store.remove("ghost"); }, ErrorCode::BranchNotFound)) {
      std::cerr << "deleting unknown branch should be BranchNotFound\n";
      return 1;
    }
    store.checkout("feat");
    if (store.head() != "feat") {
      std::cerr << "checkout did not move HEAD\n";
      return 1;
    }
    if (!throws_code([&] { store.remove("main"); }, ErrorCode::ProtectedBranch)) {
      std::cerr << "default branch must be protected\n";
      return 1;
    }
    if (!throws_code([&] { store.remove("dev"); }, ErrorCode::ProtectedBranch)) {
      std::cerr << "branch with children must be protected\n";
      return 1;
    }
    store.remove("sub");
    store.remove("dev");
    if (store.contains("dev") || store.contains("sub")) {
      std::cerr << "remove did not delete\n";
      return 1;
    }
    if (!throws_code([&] { store.checkout("dev"); }, ErrorCode::BranchNotFound)) {
      std::cerr << "checkout of deleted branch should fail\n";
      return 1;
    }

    // Restore validates HEAD and fork parents.
    revhub::BranchStore other;
    if (!throws_code(
            [&] {
              other.restore({revhub::Branch{.name = "main", .tip = {}, .created = 0,
                                            .forked_from = {}}},
                            "missing");
            },
            ErrorCode::StateCorrupt)) {
      std::cerr << "restore with unknown HEAD should be StateCorrupt\n";
      return 1;
    }

    std::cout << "branches test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
