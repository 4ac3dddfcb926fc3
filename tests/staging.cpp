#include "revhub/error.hpp"
#include "revhub/staging.hpp"

#include <iostream>
#include <string>
#include <vector>

using revhub::ChangeKind;

static std::vector<std::string> paths_of(const std::vector<revhub::StagingEntry> &xs) {
  std::vector<std::string> out;
  for (const auto &e : xs) out.push_back(e.path);
  return out;
}

int main() {
  try {
    revhub::StagingArea area;

    if (!area.add("main", "a.js", ChangeKind::Added, 1) ||
        !area.add("main", "b.js", ChangeKind::Added, 2) ||
        !area.add("main", "c.js", ChangeKind::Added, 3)) {
      std::cerr << "first add should insert\n";
      return 1;
    }
    if (area.list("main")[0].included) {
      std::cerr << "new entries start deselected\n";
      return 1;
    }

    // Toggle, then re-add: kind changes, position and selection stay.
    if (!area.toggle("main", "a.js")) {
      std::cerr << "toggle should select\n";
      return 1;
    }
    if (area.add("main", "a.js", ChangeKind::Modified, 4)) {
      std::cerr << "re-add should update, not insert\n";
      return 1;
    }
    const auto list = area.list("main");
    if (paths_of(list) != std::vector<std::string>{"a.js", "b.js", "c.js"} ||
        list[0].kind != ChangeKind::Modified || !list[0].included || list[0].staged_at != 4) {
      std::cerr << "re-add changed position or selection\n";
      return 1;
    }

    bool threw = false;
    try {
      area.toggle("main", "missing.js");
    } catch (const revhub::Error &e) {
      threw = e.code() == revhub::ErrorCode::StagingEntryNotFound;
    }
    if (!threw) {
      std::cerr << "toggle of unknown path should be StagingEntryNotFound\n";
      return 1;
    }

    // Branches are independent.
    threw = false;
    try {
      area.toggle("dev", "a.js");
    } catch (const revhub::Error &e) {
      threw = e.code() == revhub::ErrorCode::StagingEntryNotFound;
    }
    if (!threw || !area.list("dev").empty()) {
      std::cerr << "staging leaked across branches\n";
      return 1;
    }

    area.toggle("main", "c.js");
    if (!area.has_included("main") || area.has_included("dev")) {
      std::cerr << "has_included mismatch\n";
      return 1;
    }
    const auto taken = area.consume_included("main");
    if (paths_of(taken) != std::vector<std::string>{"a.js", "c.js"}) {
      std::cerr << "consume_included should return selected entries in order\n";
      return 1;
    }
    if (paths_of(area.list("main")) != std::vector<std::string>{"b.js"} ||
        area.has_included("main")) {
      std::cerr << "unselected entries must survive consume_included\n";
      return 1;
    }
    if (!area.consume_included("main").empty()) {
      std::cerr << "second consume should be empty\n";
      return 1;
    }

    area.add("main", "d.js", ChangeKind::Deleted, 5);
    area.toggle("main", "d.js");
    if (area.clear_included("main") != 1 || paths_of(area.list("main")) !=
                                                std::vector<std::string>{"b.js"}) {
      std::cerr << "clear_included mismatch\n";
      return 1;
    }
    area.add("dev", "x.js", ChangeKind::Added, 6);
    if (area.clear("main") != 1 || !area.list("main").empty() || area.list("dev").size() != 1) {
      std::cerr << "clear should only empty one branch\n";
      return 1;
    }
    if (area.branches() != std::vector<std::string>{"dev"}) {
      std::cerr << "branches() should list branches with entries\n";
      return 1;
    }

    if (revhub::change_kind_code(ChangeKind::Deleted) != 'D' ||
        revhub::change_kind_from_code('M') != ChangeKind::Modified ||
        revhub::change_kind_from_code('X')) {
      std::cerr << "change kind codes mismatch\n";
      return 1;
    }

    std::cout << "staging test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
