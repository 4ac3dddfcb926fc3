#include "revhub/access.hpp"
#include "revhub/error.hpp"

#include <iostream>
#include <string>
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
    revhub::AccessControl ac;

    ac.grant_role("Dev@Example.com", "developer", {"push"});
    if (!ac.check("dev@example.com", "push") || !ac.check("DEV@example.com", "push")) {
      std::cerr << "push should be granted regardless of email case\n";
      return 1;
    }
    if (ac.check("dev@example.com", "merge")) {
      std::cerr << "developer must not hold merge\n";
      return 1;
    }
    if (ac.check("nobody@example.com", "pull")) {
      std::cerr << "unknown collaborator must hold nothing\n";
      return 1;
    }

    if (!throws_code([&] { ac.grant_role("x@example.com", "developer", {"merge"}); },
                     ErrorCode::InvalidPermission)) {
      std::cerr << "developer+merge should be InvalidPermission\n";
      return 1;
    }
    if (!throws_code([&] { ac.grant_role("x@example.com", "wizard", {}); },
                     ErrorCode::InvalidRole)) {
      std::cerr << "unknown role should be InvalidRole\n";
      return 1;
    }
    if (ac.show("x@example.com")) {
      std::cerr << "failed grants must not leave a record\n";
      return 1;
    }

    // Promotion adds the new permissions to the ones already held.
    auto rec = ac.update_role("dev@example.com", "maintainer", {"merge"});
    if (rec.role != "maintainer" || rec.permissions != revhub::PermissionSet{"merge", "push"}) {
      std::cerr << "maintainer update mismatch\n";
      return 1;
    }
    // Demotion changes the role but keeps every permission already held.
    rec = ac.update_role("dev@example.com", "developer", {});
    if (rec.role != "developer" || rec.permissions != revhub::PermissionSet{"merge", "push"} ||
        !ac.check("dev@example.com", "merge")) {
      std::cerr << "developer update should keep merge\n";
      return 1;
    }
    rec = ac.update_role("dev@example.com", "guest", {"pull"});
    if (rec.role != "guest" || rec.permissions != revhub::PermissionSet{"merge", "pull", "push"}) {
      std::cerr << "guest update should add pull and keep push/merge\n";
      return 1;
    }
    if (!throws_code([&] { (void)ac.update_role("dev@example.com", "guest", {"push"}); },
                     ErrorCode::InvalidPermission)) {
      std::cerr << "added permissions must still fit the new role\n";
      return 1;
    }
    if (!throws_code([&] { (void)ac.update_role("ghost@example.com", "guest", {}); },
                     ErrorCode::CollaboratorNotFound)) {
      std::cerr << "update of unknown email should be CollaboratorNotFound\n";
      return 1;
    }

    if (!throws_code([&] { ac.require("nobody@example.com", "merge", "merge into 'main'"); },
                     ErrorCode::PermissionDenied)) {
      std::cerr << "require should raise PermissionDenied\n";
      return 1;
    }

    ac.grant_role("b@example.com", "admin", {"admin", "pull"});
    ac.grant_role("a@example.com", "guest", {});
    const auto all = ac.list();
    if (all.size() != 3 || all[0].email != "a@example.com" || all[1].email != "b@example.com" ||
        all[2].email != "dev@example.com") {
      std::cerr << "role list not alphabetical\n";
      return 1;
    }

    ac.revoke("A@example.com");
    if (ac.show("a@example.com")) {
      std::cerr << "revoke did not remove the record\n";
      return 1;
    }
    if (!throws_code([&] { ac.revoke("a@example.com"); }, ErrorCode::CollaboratorNotFound)) {
      std::cerr << "second revoke should be CollaboratorNotFound\n";
      return 1;
    }

    // Contributors
    revhub::ContributorRegistry reg;
    if (!reg.add("Bob") || reg.add("Bob", "Reviewer")) {
      std::cerr << "add should report insert then update\n";
      return 1;
    }
    reg.add("Alice");
    if (reg.find("bob")) {
      std::cerr << "contributor lookup must be case-sensitive\n";
      return 1;
    }
    const auto bob = reg.find("Bob");
    if (!bob || bob->label != "Reviewer") {
      std::cerr << "relabel lost\n";
      return 1;
    }
    const auto people = reg.list();
    if (people.size() != 2 || people[0].name != "Alice" || people[0].label != "Contributor" ||
        people[1].name != "Bob") {
      std::cerr << "contributor list mismatch\n";
      return 1;
    }
    if (!throws_code([&] { reg.remove("Carol"); }, ErrorCode::CollaboratorNotFound)) {
      std::cerr << "removing unknown contributor should fail\n";
      return 1;
    }
    reg.remove("Alice");
    if (reg.list().size() != 1) {
      std::cerr << "remove did not drop the contributor\n";
      return 1;
    }

    std::cout << "access control test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
