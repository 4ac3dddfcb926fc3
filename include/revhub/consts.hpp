#pragma once
#include <cstddef>
#include <string_view>

namespace revhub::consts {

// Directory and file names
inline constexpr std::string_view kStateDir      = ".revhub";
inline constexpr std::string_view kStateFile     = "state";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kDefaultBranch = "main";

// Identifier sizes
inline constexpr std::size_t kDigestRawLen = 20; // 20 bytes (SHA-1)
inline constexpr std::size_t kDigestHexLen = 40; // 40 hex chars (SHA-1)
inline constexpr std::size_t kCommitIdLen  = 10; // commit ids are a digest prefix
inline constexpr std::size_t kShortIdLen   = 7;  // abbreviated form for display

// Role catalogue
inline constexpr std::string_view kRoleAdmin      = "admin";
inline constexpr std::string_view kRoleMaintainer = "maintainer";
inline constexpr std::string_view kRoleDeveloper  = "developer";
inline constexpr std::string_view kRoleGuest      = "guest";

// Permissions
inline constexpr std::string_view kPermPull  = "pull";
inline constexpr std::string_view kPermPush  = "push";
inline constexpr std::string_view kPermMerge = "merge";
inline constexpr std::string_view kPermAdmin = "admin";

inline constexpr std::string_view kDefaultContributorLabel = "Contributor";

// Commit hashing field prefixes
inline constexpr std::string_view kParentPrefix = "parent ";
inline constexpr std::string_view kAuthorPrefix = "author ";
inline constexpr std::string_view kTimePrefix   = "time ";
inline constexpr std::string_view kFilePrefix   = "file ";

// Timestamp format
inline constexpr const char *kTimestampFormat = "%Y-%m-%d %H:%M:%S";

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kLF    = '\n';

} // namespace revhub::consts
