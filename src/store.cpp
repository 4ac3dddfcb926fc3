#include "revhub/store.hpp"

#include "revhub/consts.hpp"
#include "revhub/error.hpp"
#include "revhub/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using revhub::Error;
using revhub::ErrorCode;

constexpr std::string_view kMagic = "revhub";
constexpr int kFormatVersion = 1;
// zlib cannot compress better than about 1032:1.
constexpr std::size_t kMaxInflateRatio = 1032;
constexpr std::size_t kInflateSlack    = 64;

[[noreturn]] void corrupt(const std::string &what) {
  throw Error(ErrorCode::StateCorrupt, "state file: " + what);
}

void put_field(std::string &out, std::string_view field) {
  out.push_back('\t');
  for (const char c : field) {
    switch (c) {
    case '\\': out += "\\\\"; break;
    case '\t': out += "\\t"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    default:   out.push_back(c);
    }
  }
}

// Writes one record: tag followed by escaped fields.
class LineWriter {
public:
  explicit LineWriter(std::string &out, std::string_view tag) : out_(out) { out_ += tag; }
  ~LineWriter() { out_.push_back(revhub::consts::kLF); }
  LineWriter(const LineWriter &) = delete;
  LineWriter &operator=(const LineWriter &) = delete;

  LineWriter &operator<<(std::string_view field) {
    put_field(out_, field);
    return *this;
  }
  LineWriter &operator<<(std::int64_t n) {
    put_field(out_, std::to_string(n));
    return *this;
  }

private:
  std::string &out_;
};

[[nodiscard]] auto or_empty(const std::optional<std::string> &s) -> std::string_view {
  return s ? std::string_view(*s) : std::string_view{};
}

[[nodiscard]] auto split_fields(std::string_view line) -> std::vector<std::string> {
  std::vector<std::string> out(1);
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '\t') {
      out.emplace_back();
    } else if (c == '\\') {
      if (++i == line.size()) corrupt("dangling escape");
      switch (line[i]) {
      case '\\': out.back().push_back('\\'); break;
      case 't':  out.back().push_back('\t'); break;
      case 'n':  out.back().push_back('\n'); break;
      case 'r':  out.back().push_back('\r'); break;
      default:   corrupt(std::string("bad escape \\") + line[i]);
      }
    } else {
      out.back().push_back(c);
    }
  }
  return out;
}

[[nodiscard]] auto to_int(std::string_view s) -> std::int64_t {
  std::int64_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    corrupt("bad number '" + std::string(s) + "'");
  }
  return v;
}

[[nodiscard]] auto to_id(std::string_view s) -> std::uint64_t {
  const std::int64_t v = to_int(s);
  if (v < 0) corrupt("negative id " + std::string(s));
  return static_cast<std::uint64_t>(v);
}

[[nodiscard]] auto opt(std::string s) -> std::optional<std::string> {
  if (s.empty()) return std::nullopt;
  return s;
}

[[nodiscard]] auto kind_of(std::string_view code) -> revhub::ChangeKind {
  const auto k = code.size() == 1 ? revhub::change_kind_from_code(code[0]) : std::nullopt;
  if (!k) corrupt("bad change kind '" + std::string(code) + "'");
  return *k;
}

[[nodiscard]] auto commit_kind_of(std::string_view name) -> revhub::CommitKind {
  for (const auto k :
       {revhub::CommitKind::Root, revhub::CommitKind::Normal, revhub::CommitKind::Merge}) {
    if (revhub::commit_kind_name(k) == name) return k;
  }
  corrupt("bad commit kind '" + std::string(name) + "'");
}

void need(const std::vector<std::string> &f, std::size_t n) {
  if (f.size() < n) corrupt("short '" + f.front() + "' record");
}

} // namespace

namespace revhub {

auto encode_state(const RepositoryState &state) -> std::string {
  std::string out;
  LineWriter(out, "name") << state.name;
  LineWriter(out, "head") << state.head;

  for (const auto &b : state.branches) {
    LineWriter(out, "branch") << b.name << or_empty(b.tip)
                              << static_cast<std::int64_t>(b.created) << b.forked_from;
  }
  for (const auto &c : state.commits) {
    LineWriter w(out, "commit");
    w << c.id << or_empty(c.parent) << c.author << static_cast<std::int64_t>(c.timestamp)
      << c.branch << commit_kind_name(c.kind) << or_empty(c.merged_from) << c.message;
    for (const auto &fc : c.changes) w << (std::string(1, change_kind_code(fc.kind)) + fc.path);
  }
  for (const auto &[branch, entries] : state.staging) {
    for (const auto &e : entries) {
      LineWriter(out, "stage") << branch << e.path << std::string(1, change_kind_code(e.kind))
                               << (e.included ? "1" : "0")
                               << static_cast<std::int64_t>(e.staged_at);
    }
  }
  for (const auto &c : state.contributors) {
    LineWriter(out, "contributor") << c.name << c.label;
  }
  for (const auto &r : state.roles) {
    LineWriter w(out, "role");
    w << r.email << r.role;
    for (const auto &p : r.permissions) w << p;
  }

  const auto write_pr = [&](const PullRequest &pr) {
    {
      LineWriter w(out, "pr");
      w << std::to_string(pr.id) << pr_state_name(pr.state) << pr.title << pr.source
        << pr.destination << pr.author << static_cast<std::int64_t>(pr.created)
        << or_empty(pr.merge_commit);
      w << (pr.closed_at ? std::to_string(*pr.closed_at) : std::string{});
    }
    for (const auto &r : pr.reviews) {
      LineWriter(out, "review") << r.reviewer << static_cast<std::int64_t>(r.at) << r.comment;
    }
    for (const auto &t : pr.tags) LineWriter(out, "tag") << t;
  };
  for (const auto &pr : state.active_prs) write_pr(pr);
  for (const auto &pr : state.closed_prs) write_pr(pr);

  LineWriter(out, "last_pr") << std::to_string(state.last_pr_id);
  return out;
}

auto decode_state(std::string_view text) -> RepositoryState {
  RepositoryState st{};
  std::vector<PullRequest> prs;
  bool have_name = false;
  bool have_head = false;

  while (!text.empty()) {
    const std::size_t nl = text.find(consts::kLF);
    if (nl == std::string_view::npos) corrupt("unterminated record");
    const std::string_view line = text.substr(0, nl);
    text.remove_prefix(nl + 1);
    if (line.empty()) continue;

    auto f = split_fields(line);
    const std::string &tag = f.front();

    if (tag == "name") {
      need(f, 2);
      st.name = f[1];
      have_name = true;
    } else if (tag == "head") {
      need(f, 2);
      st.head = f[1];
      have_head = true;
    } else if (tag == "branch") {
      need(f, 5);
      st.branches.push_back(Branch{.name = f[1], .tip = opt(f[2]),
                                   .created = static_cast<std::time_t>(to_int(f[3])),
                                   .forked_from = f[4]});
    } else if (tag == "commit") {
      need(f, 9);
      Commit c{};
      c.id          = f[1];
      c.parent      = opt(f[2]);
      c.author      = f[3];
      c.timestamp   = static_cast<std::time_t>(to_int(f[4]));
      c.branch      = f[5];
      c.kind        = commit_kind_of(f[6]);
      c.merged_from = opt(f[7]);
      c.message     = f[8];
      for (std::size_t i = 9; i < f.size(); ++i) {
        if (f[i].size() < 2) corrupt("bad file change in commit " + c.id);
        c.changes.push_back(
            FileChange{.path = f[i].substr(1), .kind = kind_of(f[i].substr(0, 1))});
      }
      st.commits.push_back(std::move(c));
    } else if (tag == "stage") {
      need(f, 6);
      if (f[4] != "0" && f[4] != "1") corrupt("bad included flag '" + f[4] + "'");
      st.staging[f[1]].push_back(StagingEntry{.path = f[2], .kind = kind_of(f[3]),
                                              .included = f[4] == "1",
                                              .staged_at = static_cast<std::time_t>(to_int(f[5]))});
    } else if (tag == "contributor") {
      need(f, 3);
      st.contributors.push_back(Contributor{.name = f[1], .label = f[2]});
    } else if (tag == "role") {
      need(f, 3);
      RoleRecord r{.email = f[1], .role = f[2], .permissions = {}};
      r.permissions.insert(f.begin() + 3, f.end());
      st.roles.push_back(std::move(r));
    } else if (tag == "pr") {
      need(f, 10);
      const auto state = pr_state_from_name(f[2]);
      if (!state) corrupt("bad pull request state '" + f[2] + "'");
      PullRequest pr{};
      pr.id           = to_id(f[1]);
      pr.state        = *state;
      pr.title        = f[3];
      pr.source       = f[4];
      pr.destination  = f[5];
      pr.author       = f[6];
      pr.created      = static_cast<std::time_t>(to_int(f[7]));
      pr.merge_commit = opt(f[8]);
      if (!f[9].empty()) pr.closed_at = static_cast<std::time_t>(to_int(f[9]));
      prs.push_back(std::move(pr));
    } else if (tag == "review") {
      need(f, 4);
      if (prs.empty()) corrupt("review before any pull request");
      prs.back().reviews.push_back(Review{.reviewer = f[1],
                                          .comment = f[3],
                                          .at = static_cast<std::time_t>(to_int(f[2]))});
    } else if (tag == "tag") {
      need(f, 2);
      if (prs.empty()) corrupt("tag before any pull request");
      prs.back().tags.push_back(f[1]);
    } else if (tag == "last_pr") {
      need(f, 2);
      st.last_pr_id = to_id(f[1]);
    } else {
      corrupt("unknown record '" + tag + "'");
    }
  }

  if (!have_name || !have_head) corrupt("missing name or head record");
  for (auto &pr : prs) {
    (pr.closed() ? st.closed_prs : st.active_prs).push_back(std::move(pr));
  }
  return st;
}

std::filesystem::path state_path(const std::filesystem::path &root) {
  return root / consts::kStateDir / consts::kStateFile;
}

void save_state(const std::filesystem::path &root, const RepositoryState &state) {
  const std::string text = encode_state(state);
  const auto packed = fs::z_compress(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));

  std::string file = std::string(kMagic) + consts::kSpace + std::to_string(kFormatVersion) +
                     consts::kSpace + std::to_string(text.size()) + consts::kLF;
  file.append(reinterpret_cast<const char *>(packed.data()), packed.size());
  fs::write_file_atomic(state_path(root), std::string_view(file));
}

auto load_state(const std::filesystem::path &root) -> RepositoryState {
  const auto path = state_path(root);
  if (!fs::exists(path)) {
    throw Error(ErrorCode::NotInitialized, "no repository state at " + path.string());
  }
  const auto bytes = fs::read_file(path);

  const auto nl = std::ranges::find(bytes, static_cast<std::uint8_t>(consts::kLF));
  if (nl == bytes.end()) corrupt("missing header");
  std::istringstream header(std::string(bytes.begin(), nl));
  std::string magic;
  int version = 0;
  std::size_t raw_size = 0;
  if (!(header >> magic >> version >> raw_size) || magic != kMagic) corrupt("bad header");
  if (version != kFormatVersion) corrupt("unsupported version " + std::to_string(version));

  const auto offset = static_cast<std::size_t>(std::distance(bytes.begin(), nl)) + 1;
  const std::size_t packed = bytes.size() - offset;
  if (raw_size > (packed * kMaxInflateRatio) + kInflateSlack) {
    corrupt("declared size " + std::to_string(raw_size) + " exceeds what " +
            std::to_string(packed) + " compressed bytes can hold");
  }
  std::vector<std::uint8_t> raw;
  try {
    raw = fs::z_decompress(std::span<const std::uint8_t>(bytes).subspan(offset), raw_size);
  } catch (const std::runtime_error &e) {
    corrupt(e.what());
  }
  return decode_state(std::string_view(reinterpret_cast<const char *>(raw.data()), raw.size()));
}

void save_repository(const std::filesystem::path &root, const Repository &repo) {
  save_state(root, repo.snapshot());
}

auto load_repository(const std::filesystem::path &root, RepositoryOptions options)
    -> std::unique_ptr<Repository> {
  auto repo = std::make_unique<Repository>(std::move(options));
  const auto restored = repo->restore(load_state(root));
  if (!restored) {
    throw Error(restored.error().code, restored.error().message);
  }
  return repo;
}

} // namespace revhub
