#pragma once
#include "revhub/merge.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revhub {

// open -> en_revision -> {merged, rejected}
enum class PrState : std::uint8_t { Open, InRevision, Merged, Rejected };

// "open" | "en_revision" | "merged" | "rejected"
auto pr_state_name(PrState state) -> std::string_view;
auto pr_state_from_name(std::string_view name) -> std::optional<PrState>;

struct Review {
  std::string reviewer;
  std::string comment;
  std::time_t at = 0;
};

struct PullRequest {
  std::uint64_t id = 0;
  std::string title;
  std::string source;
  std::string destination;
  std::string author;
  std::time_t created = 0;
  PrState state = PrState::Open;
  std::vector<Review> reviews;            // ordered
  std::vector<std::string> tags;          // ordered, duplicates kept
  std::optional<std::string> merge_commit;
  std::optional<std::time_t> closed_at;

  [[nodiscard]] bool closed() const {
    return state == PrState::Merged || state == PrState::Rejected;
  }
};

// One-line listing: "#<id>  [<state>]  <title>  by <author> at <created>  {tags}".
auto pr_summary_line(const PullRequest &pr) -> std::string;

struct PrListing {
  std::vector<PullRequest> active; // FIFO
  std::vector<PullRequest> closed; // closure order
};

struct PrSummary {
  std::size_t open = 0;
  std::size_t in_revision = 0;
  std::size_t merged = 0;
  std::size_t rejected = 0;
  std::optional<std::uint64_t> next; // head of the active queue
};

// Active FIFO queue plus closed archive. Ids are never reused.
class PullRequestQueue {
public:
  // Throws Error(BranchNotFound) naming the missing branch, Error(SameBranch).
  // Nothing is allocated or queued on failure.
  auto create(const BranchStore &branches, std::string_view source, std::string_view destination,
              std::string_view author, std::time_t now) -> PullRequest;

  // Throws Error(PRNotFound) unless `id` is in the active queue.
  auto review(std::uint64_t id, std::string_view reviewer, std::string_view comment,
              std::time_t now) -> PullRequest;

  auto tag(std::uint64_t id, std::string_view label) -> PullRequest;

  // Merge source into destination and archive as merged. A failed merge
  // leaves the pull request active.
  auto approve(std::uint64_t id, const MergeContext &ctx, std::string_view approver,
               std::time_t now) -> PullRequest;

  // Archive as rejected; `reason` is recorded as a review by `rejecter`.
  auto reject(std::uint64_t id, std::string_view rejecter, std::string_view reason,
              std::time_t now) -> PullRequest;

  // Pop the head of the active queue without touching its state.
  auto next() -> std::optional<PullRequest>;

  // Empty the active queue; the archive is kept. Returns the number dropped.
  std::size_t clear();

  [[nodiscard]] auto list() const -> PrListing;
  [[nodiscard]] auto find(std::uint64_t id) const -> std::optional<PullRequest>;
  [[nodiscard]] auto summary() const -> PrSummary;

  [[nodiscard]] std::uint64_t last_id() const { return last_id_; }

  // Throws Error(StateCorrupt) on duplicate ids, ids above `last_id`, or
  // states that do not match the partition.
  void restore(std::vector<PullRequest> active, std::vector<PullRequest> closed,
               std::uint64_t last_id);

private:
  auto active_entry(std::uint64_t id) -> std::deque<PullRequest>::iterator;
  auto archive(std::deque<PullRequest>::iterator it, PrState state, std::time_t now)
      -> PullRequest;

  std::deque<PullRequest> active_;
  std::vector<PullRequest> closed_;
  std::uint64_t last_id_ = 0;
};

} // namespace revhub
