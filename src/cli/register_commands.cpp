#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_config(int argc, char **argv);
int cmd_whoami(int, char **);
int cmd_add(int argc, char **argv);
int cmd_rm(int argc, char **argv);
int cmd_stage(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_status(int, char **);
int cmd_log(int, char **);
int cmd_branch(int, char **);
int cmd_checkout(int, char **);
int cmd_merge(int, char **);
int cmd_contributors(int, char **);
int cmd_add_contributor(int, char **);
int cmd_remove_contributor(int, char **);
int cmd_find_contributor(int, char **);
int cmd_role(int, char **);
int cmd_pr(int, char **);

namespace revhub::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Initialize a repository: revhub init <name>");
  register_command("config", ::cmd_config, "Set the acting identity: revhub config <name> <email>");
  register_command("whoami", ::cmd_whoami, "Show the acting identity");
  register_command("add", ::cmd_add, "Stage file(s) on HEAD: revhub add <path>...");
  register_command("rm", ::cmd_rm, "Stage deletion of tracked file(s): revhub rm <path>...");
  register_command("stage", ::cmd_stage,
                   "Staging area: revhub stage list|toggle <path>|clear|clear_selected");
  register_command("commit", ::cmd_commit, "Commit selected changes: revhub commit <message>");
  register_command("status", ::cmd_status, "Show HEAD and staged changes");
  register_command("log", ::cmd_log, "Show history: revhub log [branch|--all]");
  register_command("branch", ::cmd_branch,
                   "Branches: revhub branch [--list] | -b <name> [from] | -d <name>");
  register_command("checkout", ::cmd_checkout, "Switch HEAD: revhub checkout <branch>");
  register_command("merge", ::cmd_merge, "Merge branches: revhub merge <source> <destination>");
  register_command("contributors", ::cmd_contributors, "List contributors");
  register_command("add-contributor", ::cmd_add_contributor,
                   "Add a contributor: revhub add-contributor <name> [label]");
  register_command("remove-contributor", ::cmd_remove_contributor,
                   "Remove a contributor: revhub remove-contributor <name>");
  register_command("find-contributor", ::cmd_find_contributor,
                   "Look up a contributor: revhub find-contributor <name>");
  register_command("role", ::cmd_role, "Roles: revhub role add|update|check|remove|show|list");
  register_command("pr", ::cmd_pr,
                   "Pull requests: revhub pr create|review|status|show|tag|approve|reject|list|"
                   "next|clear");
}

} // namespace revhub::cli
