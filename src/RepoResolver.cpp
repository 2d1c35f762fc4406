#include "RepoResolver.hpp"
#include "Errors.hpp"
#include <cctype>

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string stripGitSuffix(std::string name) {
    const std::string suffix = ".git";
    if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name.erase(name.size() - suffix.size());
    }
    return name;
}

bool validSegment(const std::string& segment) {
    if (segment.empty() || segment == "." || segment == "..") return false;
    for (unsigned char c : segment) {
        if (std::isspace(c)) return false;
    }
    return true;
}

} // namespace

RepoRef RepoResolver::parse(const std::string& raw) {
    std::string input = trim(raw);
    if (input.empty()) {
        throw InvalidRepoReference(raw, "empty input");
    }

    auto scheme = input.find("://");
    if (scheme != std::string::npos) {
        if (scheme == 0) {
            throw InvalidRepoReference(input, "missing URL scheme");
        }
        auto hostEnd = input.find('/', scheme + 3);
        if (hostEnd == std::string::npos || hostEnd == scheme + 3) {
            throw InvalidRepoReference(input, "URL has no repository path");
        }
        std::string path = input.substr(hostEnd + 1);
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
        auto slash = path.find_last_of('/');
        std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
        std::string name = stripGitSuffix(last);
        if (!validSegment(name) || name == ".git") {
            throw InvalidRepoReference(input, "URL has no repository path");
        }
        return RepoRef{input, "", name};
    }

    std::string subdir;
    std::string repoPart = input;
    auto colon = input.find(':');
    if (colon != std::string::npos) {
        repoPart = input.substr(0, colon);
        subdir = input.substr(colon + 1);
        if (subdir.empty()) {
            throw InvalidRepoReference(input, "empty subdirectory after ':'");
        }
    }

    auto slash = repoPart.find('/');
    if (slash == std::string::npos || repoPart.find('/', slash + 1) != std::string::npos) {
        throw InvalidRepoReference(input, "expected a URL, owner/repo or owner/repo:subdir");
    }
    std::string owner = repoPart.substr(0, slash);
    std::string repo = stripGitSuffix(repoPart.substr(slash + 1));
    if (!validSegment(owner) || !validSegment(repo)) {
        throw InvalidRepoReference(input, "owner and repository must both be non-empty");
    }
    return RepoRef{"https://github.com/" + owner + "/" + repo + ".git", subdir, repo};
}
