#include "revhub/error.hpp"

namespace revhub {

auto error_code_name(ErrorCode code) -> std::string_view {
  switch (code) {
  case ErrorCode::DuplicateBranch:      return "DuplicateBranch";
  case ErrorCode::BranchNotFound:       return "BranchNotFound";
  case ErrorCode::ActiveBranch:         return "ActiveBranch";
  case ErrorCode::ProtectedBranch:      return "ProtectedBranch";
  case ErrorCode::SameBranch:           return "SameBranch";
  case ErrorCode::EmptyCommit:          return "EmptyCommit";
  case ErrorCode::PRNotFound:           return "PRNotFound";
  case ErrorCode::PermissionDenied:     return "PermissionDenied";
  case ErrorCode::CollaboratorNotFound: return "CollaboratorNotFound";
  case ErrorCode::StagingEntryNotFound: return "StagingEntryNotFound";
  case ErrorCode::InvalidRole:          return "InvalidRole";
  case ErrorCode::InvalidPermission:    return "InvalidPermission";
  case ErrorCode::InvalidArgument:      return "InvalidArgument";
  case ErrorCode::NotInitialized:       return "NotInitialized";
  case ErrorCode::AlreadyInitialized:   return "AlreadyInitialized";
  case ErrorCode::StateCorrupt:         return "StateCorrupt";
  }
  return "Unknown";
}

} // namespace revhub
