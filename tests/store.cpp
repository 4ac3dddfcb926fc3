#include "revhub/config.hpp"
#include "revhub/error.hpp"
#include "revhub/fs.hpp"
#include "revhub/repo.hpp"
#include "revhub/store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using revhub::ErrorCode;

template <typename Fn> static bool throws_code(Fn &&fn, ErrorCode code) {
  try {
    fn();
  } catch (const revhub::Error &e) {
    return e.code() == code;
  }
  return false;
}

static revhub::RepositoryOptions fixed_clock(std::time_t start) {
  return revhub::RepositoryOptions{.clock = [t = start]() mutable { return t++; }};
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("revhub_store_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // Identity config
    if (!revhub::load_identity(root).email.empty()) {
      std::cerr << "missing config should give an empty identity\n";
      return 1;
    }
    revhub::save_identity(root, revhub::Identity{.name = "Ana Perez", .email = "ana@example.com"});
    const auto id = revhub::load_identity(root);
    if (id.name != "Ana Perez" || id.email != "ana@example.com") {
      std::cerr << "config load mismatch: {" << id.name << "," << id.email << "}\n";
      return 1;
    }

    if (!throws_code([&] { (void)revhub::load_state(root); }, ErrorCode::NotInitialized)) {
      std::cerr << "missing state should be NotInitialized\n";
      return 1;
    }

    // Build a repository touching every kind of record.
    revhub::Repository repo{fixed_clock(1700000000)};
    if (!repo.init("demo", id).ok()) {
      std::cerr << "init failed\n";
      return 1;
    }
    (void)repo.create_branch("feature");
    (void)repo.checkout("feature");
    (void)repo.stage_add({"src/a file.txt", "b.txt"});
    (void)repo.stage_toggle("src/a file.txt");
    const auto c1 = repo.commit("line one\nline\ttwo \\ done");
    if (!c1) {
      std::cerr << "commit failed: " << c1.error().message << "\n";
      return 1;
    }
    (void)repo.add_contributor("Luis", "Reviewer");
    (void)repo.role_add("dev@example.com", "developer", {"push"});
    (void)repo.role_add("lead@example.com", "maintainer", {"push", "merge"});
    (void)repo.role_update("lead@example.com", "developer", {});
    (void)repo.pr_create("feature", "main");
    (void)repo.pr_review(1, "tabs\tand\nnewlines");
    (void)repo.pr_tag(1, "wip");
    (void)repo.pr_approve(1);
    (void)repo.pr_create("feature", "main");

    revhub::save_repository(root, repo);
    if (!fs::exists(root / ".revhub" / "state")) {
      std::cerr << "state file not written\n";
      return 1;
    }

    const auto loaded = revhub::load_repository(root, fixed_clock(1800000000));
    const std::string before = revhub::encode_state(repo.snapshot());
    const std::string after = revhub::encode_state(loaded->snapshot());
    if (before != after) {
      std::cerr << "reloaded state differs:\n" << before << "\n---\n" << after << "\n";
      return 1;
    }

    // The reloaded repository keeps working where the old one left off.
    const auto log = loaded->log(std::string("feature")).value();
    if (log.size() != 1 || log[0].id != c1.value() ||
        log[0].message != "line one\nline\ttwo \\ done" || log[0].changes[0].path != "src/a file.txt") {
      std::cerr << "reloaded log mismatch\n";
      return 1;
    }
    const auto lead = loaded->role_show("lead@example.com").value();
    if (!lead || lead->role != "developer" || !loaded->role_check("lead@example.com", "merge").value()) {
      std::cerr << "demoted role should reload with the permissions it kept\n";
      return 1;
    }
    const auto staged = loaded->stage_list().value();
    if (staged.size() != 1 || staged[0].path != "b.txt" || staged[0].included) {
      std::cerr << "reloaded staging mismatch\n";
      return 1;
    }
    const auto next_pr = loaded->pr_create("feature", "main");
    if (!next_pr || next_pr.value().id != 3) {
      std::cerr << "pull request ids should continue after reload\n";
      return 1;
    }

    // Tampered commit text is caught on restore.
    auto state = revhub::decode_state(before);
    state.commits[0].message = "forged";
    revhub::Repository victim;
    const auto restored = victim.restore(state);
    if (restored.ok() || restored.error().code != ErrorCode::StateCorrupt ||
        victim.is_initialized()) {
      std::cerr << "tampered state should be rejected without side effects\n";
      return 1;
    }

    // Garbage on disk is StateCorrupt.
    std::ofstream(root / ".revhub" / "state", std::ios::binary | std::ios::trunc)
        << "revhub 1 100\nnot zlib at all";
    if (!throws_code([&] { (void)revhub::load_state(root); }, ErrorCode::StateCorrupt)) {
      std::cerr << "corrupt state file should be StateCorrupt\n";
      return 1;
    }
    // A header claiming an impossible size is rejected before any allocation.
    std::ofstream(root / ".revhub" / "state", std::ios::binary | std::ios::trunc)
        << "revhub 1 18446744073709551000\nxyz";
    if (!throws_code([&] { (void)revhub::load_state(root); }, ErrorCode::StateCorrupt)) {
      std::cerr << "oversized declared length should be StateCorrupt\n";
      return 1;
    }
    if (!throws_code([&] { (void)revhub::decode_state("bogus\trecord\n"); },
                     ErrorCode::StateCorrupt)) {
      std::cerr << "unknown record should be StateCorrupt\n";
      return 1;
    }

    std::cout << "store test OK: " << root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
