#include "revhub/pull_request.hpp"

#include "revhub/consts.hpp"
#include "revhub/error.hpp"
#include "revhub/time.hpp"
#include "revhub/util.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace revhub {

auto pr_state_name(PrState state) -> std::string_view {
  switch (state) {
  case PrState::Open:       return "open";
  case PrState::InRevision: return "en_revision";
  case PrState::Merged:     return "merged";
  case PrState::Rejected:   return "rejected";
  }
  return "unknown";
}

auto pr_state_from_name(std::string_view name) -> std::optional<PrState> {
  for (const PrState s : {PrState::Open, PrState::InRevision, PrState::Merged,
                          PrState::Rejected}) {
    if (pr_state_name(s) == name) return s;
  }
  return std::nullopt;
}

auto pr_summary_line(const PullRequest &pr) -> std::string {
  std::string line = "#" + std::to_string(pr.id) + "  [" + std::string(pr_state_name(pr.state)) +
                     "]  " + pr.title + "  by " + pr.author + " at " +
                     timeutil::format_timestamp(pr.created);
  if (!pr.tags.empty()) line += "  {" + strutil::join(pr.tags, ", ") + "}";
  return line;
}

auto PullRequestQueue::create(const BranchStore &branches, std::string_view source,
                              std::string_view destination, std::string_view author,
                              std::time_t now) -> PullRequest {
  for (const std::string_view name : {source, destination}) {
    if (!branches.contains(name)) {
      throw Error(ErrorCode::BranchNotFound,
                  "cannot open pull request: branch '" + std::string(name) + "' does not exist");
    }
  }
  if (source == destination) {
    throw Error(ErrorCode::SameBranch, "source and destination are both '" +
                                           std::string(source) + "'");
  }

  PullRequest pr{};
  pr.id          = ++last_id_;
  pr.title       = "PR #" + std::to_string(pr.id) + ": Merge " + std::string(source) +
                   " into " + std::string(destination);
  pr.source      = std::string(source);
  pr.destination = std::string(destination);
  pr.author      = std::string(author);
  pr.created     = now;
  pr.state       = PrState::Open;
  active_.push_back(pr);
  return pr;
}

auto PullRequestQueue::active_entry(std::uint64_t id) -> std::deque<PullRequest>::iterator {
  const auto it = std::ranges::find(active_, id, &PullRequest::id);
  if (it == active_.end()) {
    throw Error(ErrorCode::PRNotFound,
                "pull request #" + std::to_string(id) + " is not in the active queue");
  }
  return it;
}

auto PullRequestQueue::review(std::uint64_t id, std::string_view reviewer,
                              std::string_view comment, std::time_t now) -> PullRequest {
  auto it = active_entry(id);
  it->state = PrState::InRevision;
  it->reviews.push_back(Review{.reviewer = std::string(reviewer),
                               .comment = std::string(comment), .at = now});
  return *it;
}

auto PullRequestQueue::tag(std::uint64_t id, std::string_view label) -> PullRequest {
  auto it = active_entry(id);
  if (label.empty()) {
    throw Error(ErrorCode::InvalidArgument, "tag label must not be empty");
  }
  it->tags.emplace_back(label);
  return *it;
}

auto PullRequestQueue::archive(std::deque<PullRequest>::iterator it, PrState state,
                               std::time_t now) -> PullRequest {
  PullRequest pr = std::move(*it);
  active_.erase(it);
  pr.state = state;
  pr.closed_at = now;
  closed_.push_back(pr);
  return pr;
}

auto PullRequestQueue::approve(std::uint64_t id, const MergeContext &ctx,
                               std::string_view approver, std::time_t now) -> PullRequest {
  auto it = active_entry(id);
  ctx.access.require(approver, consts::kPermMerge,
                     "approve pull request #" + std::to_string(id) + " into '" +
                         it->destination + "'");

  const MergeResult merged = merge_branches(ctx, it->source, it->destination, approver, now);
  it->merge_commit = merged.commit_id;
  return archive(it, PrState::Merged, now);
}

auto PullRequestQueue::reject(std::uint64_t id, std::string_view rejecter,
                              std::string_view reason, std::time_t now) -> PullRequest {
  auto it = active_entry(id);
  const std::string why = reason.empty() ? std::string("Rejected") : std::string(reason);
  it->reviews.push_back(
      Review{.reviewer = std::string(rejecter), .comment = "Rejected: " + why, .at = now});
  return archive(it, PrState::Rejected, now);
}

auto PullRequestQueue::next() -> std::optional<PullRequest> {
  if (active_.empty()) return std::nullopt;
  PullRequest pr = std::move(active_.front());
  active_.pop_front();
  return pr;
}

std::size_t PullRequestQueue::clear() {
  const std::size_t n = active_.size();
  active_.clear();
  return n;
}

auto PullRequestQueue::list() const -> PrListing {
  return PrListing{.active = std::vector<PullRequest>(active_.begin(), active_.end()),
                   .closed = closed_};
}

auto PullRequestQueue::find(std::uint64_t id) const -> std::optional<PullRequest> {
  if (const auto it = std::ranges::find(active_, id, &PullRequest::id); it != active_.end()) {
    return *it;
  }
  if (const auto it = std::ranges::find(closed_, id, &PullRequest::id); it != closed_.end()) {
    return *it;
  }
  return std::nullopt;
}

auto PullRequestQueue::summary() const -> PrSummary {
  PrSummary s{};
  for (const auto &pr : active_) {
    (pr.state == PrState::Open ? s.open : s.in_revision) += 1;
  }
  for (const auto &pr : closed_) {
    (pr.state == PrState::Merged ? s.merged : s.rejected) += 1;
  }
  if (!active_.empty()) s.next = active_.front().id;
  return s;
}

void PullRequestQueue::restore(std::vector<PullRequest> active, std::vector<PullRequest> closed,
                               std::uint64_t last_id) {
  std::set<std::uint64_t> ids;
  const auto check = [&](const PullRequest &pr, bool want_closed) {
    if (pr.id == 0 || pr.id > last_id || !ids.insert(pr.id).second) {
      throw Error(ErrorCode::StateCorrupt, "bad pull request id " + std::to_string(pr.id));
    }
    if (pr.closed() != want_closed) {
      throw Error(ErrorCode::StateCorrupt, "pull request #" + std::to_string(pr.id) +
                                               " is in the wrong partition");
    }
  };
  for (const auto &pr : active) check(pr, false);
  for (const auto &pr : closed) check(pr, true);

  active_ = std::deque<PullRequest>(std::make_move_iterator(active.begin()),
                                    std::make_move_iterator(active.end()));
  closed_ = std::move(closed);
  last_id_ = last_id;
}

} // namespace revhub
