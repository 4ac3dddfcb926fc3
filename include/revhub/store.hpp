#pragma once
#include "revhub/repo.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace revhub {

// Line-oriented text form of a RepositoryState. One record per line,
// tab-separated fields, with '\\', '\t' and '\n' escaped inside fields:
//   name    <name>
//   head    <branch>
//   branch  <name> <tip|""> <created> <forked_from>
//   commit  <id> <parent|""> <author> <time> <branch> <kind> <merged_from|""> <message> <code+path>...
//   stage   <branch> <path> <code> <0|1> <staged_at>
//   contributor <name> <label>
//   role    <email> <role> <permission>...
//   pr      <id> <state> <title> <source> <destination> <author> <created> <merge_commit|""> <closed_at|"">
//   review  <reviewer> <at> <comment>      (belongs to the preceding pr)
//   tag     <label>                        (belongs to the preceding pr)
//   last_pr <id>
auto encode_state(const RepositoryState &state) -> std::string;

// Throws Error(StateCorrupt) on malformed input.
auto decode_state(std::string_view text) -> RepositoryState;

// .revhub/state under `root`.
std::filesystem::path state_path(const std::filesystem::path &root);

// File layout: "revhub 1 <raw size>\n" followed by the zlib-compressed text.
void save_state(const std::filesystem::path &root, const RepositoryState &state);

// Throws Error(NotInitialized) if there is no state file,
// Error(StateCorrupt) if it cannot be read back.
auto load_state(const std::filesystem::path &root) -> RepositoryState;

void save_repository(const std::filesystem::path &root, const Repository &repo);

auto load_repository(const std::filesystem::path &root, RepositoryOptions options = {})
    -> std::unique_ptr<Repository>;

} // namespace revhub
