#pragma once

#include <coderag/core/types.h>

#include <string>
#include <string_view>
#include <utility>

namespace coderag::session {

/**
 * @brief Canonical https form of a GitHub repository URL.
 *
 * Accepts https URLs with or without ".git" and extra path segments ("/tree/main", ...), and
 * "git@github.com:owner/repo.git". Only owner and repository are kept.
 */
std::string normalizeRepoUrl(std::string_view url);

// (owner, repo) of a repository URL; empty strings when the path has fewer than two segments
std::pair<std::string, std::string> extractRepoInfo(std::string_view url);

/**
 * @brief Stable session id for a repository: repo_<sha256[:8]>_<owner>_<repo>
 *
 * The same repository always maps to the same id, whatever URL spelling is used.
 */
std::string repoSessionId(std::string_view url);

// Random id for a conversation that is not tied to a repository
std::string chatSessionId();

bool isRepoSessionId(std::string_view session_id);

// Keeps [A-Za-z0-9_-]; InvalidArgument when nothing is left
Result<std::string> sanitizeSessionId(std::string_view session_id);

// Lowercase hex SHA-256 of data
std::string sha256Hex(std::string_view data);

} // namespace coderag::session
