#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace revhub {

enum class ErrorCode : std::uint8_t {
  DuplicateBranch,
  BranchNotFound,
  ActiveBranch,
  ProtectedBranch,
  SameBranch,
  EmptyCommit,
  PRNotFound,
  PermissionDenied,
  CollaboratorNotFound,
  StagingEntryNotFound,
  InvalidRole,
  InvalidPermission,
  InvalidArgument,
  NotInitialized,
  AlreadyInitialized,
  StateCorrupt,
};

// Stable name used in CLI diagnostics and state files ("BranchNotFound", ...).
auto error_code_name(ErrorCode code) -> std::string_view;

// Thrown by the core components; converted to a Failure at the Repository boundary.
class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

struct Failure {
  ErrorCode code;
  std::string message;
};

// Success payload or typed failure. Result<void> carries no payload.
template <typename T> class Result {
public:
  Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
  Result(Failure failure) : state_(std::in_place_index<1>, std::move(failure)) {}

  [[nodiscard]] bool ok() const noexcept { return state_.index() == 0; }
  explicit operator bool() const noexcept { return ok(); }

  // Precondition: ok()
  [[nodiscard]] const T &value() const & { return std::get<0>(state_); }
  [[nodiscard]] T &value() & { return std::get<0>(state_); }
  [[nodiscard]] T &&value() && { return std::get<0>(std::move(state_)); }

  // Precondition: !ok()
  [[nodiscard]] const Failure &error() const { return std::get<1>(state_); }

private:
  std::variant<T, Failure> state_;
};

template <> class Result<void> {
public:
  Result() = default;
  Result(Failure failure) : failure_(std::move(failure)), ok_(false) {}

  [[nodiscard]] bool ok() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  [[nodiscard]] const Failure &error() const { return failure_; }

private:
  Failure failure_{};
  bool ok_ = true;
};

// Run `fn` and convert a thrown revhub::Error into a Failure.
template <typename Fn> auto capture(Fn &&fn) -> Result<std::invoke_result_t<Fn>> {
  using T = std::invoke_result_t<Fn>;
  try {
    if constexpr (std::is_void_v<T>) {
      std::forward<Fn>(fn)();
      return Result<void>{};
    } else {
      return Result<T>{std::forward<Fn>(fn)()};
    }
  } catch (const Error &e) {
    return Failure{.code = e.code(), .message = e.what()};
  }
}

} // namespace revhub
