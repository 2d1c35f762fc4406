#pragma once
#include <string>

struct RepoRef {
    std::string cloneUrl;
    std::string subdir;
    std::string derivedName;
};

// Turns "https://host/owner/repo(.git)", "owner/repo" or "owner/repo:sub/dir"
// into a clone URL, subdirectory and server name. Throws InvalidRepoReference.
class RepoResolver {
public:
    static RepoRef parse(const std::string& input);
};
