#pragma once
#include <string>

/**
 * @brief Owner/name split of a repository reference.
 *
 * Accepts "owner/repo", "https://github.com/owner/repo(.git)" and local
 * paths; shortName is always the last path segment without ".git".
 */
struct RepositoryRef {
    std::string owner;
    std::string name;
    std::string fullName;
    std::string shortName;

    static RepositoryRef parse(const std::string& reference);

    // True for "owner/repo" style references (and GitHub URLs).
    bool isGithubStyle() const { return !owner.empty() && !name.empty(); }
};
