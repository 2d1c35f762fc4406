#include <iostream>
#include <string>
#include "../src/Errors.hpp"
#include "../src/RepoResolver.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static bool rejects(const std::string& input) {
    try {
        RepoResolver::parse(input);
    } catch (const InvalidRepoReference&) {
        return true;
    }
    return false;
}

int main() {
    try {
        RepoRef plain = RepoResolver::parse("acme/widgets");
        ASSERT_TRUE(plain.cloneUrl == "https://github.com/acme/widgets.git");
        ASSERT_TRUE(plain.subdir.empty());
        ASSERT_TRUE(plain.derivedName == "widgets");

        RepoRef padded = RepoResolver::parse("  acme/widgets\n");
        ASSERT_TRUE(padded.cloneUrl == plain.cloneUrl);

        RepoRef nested = RepoResolver::parse("acme/monorepo:servers/alpha");
        ASSERT_TRUE(nested.cloneUrl == "https://github.com/acme/monorepo.git");
        ASSERT_TRUE(nested.subdir == "servers/alpha");
        ASSERT_TRUE(nested.derivedName == "monorepo");

        RepoRef suffixed = RepoResolver::parse("acme/widgets.git");
        ASSERT_TRUE(suffixed.derivedName == "widgets");
        ASSERT_TRUE(suffixed.cloneUrl == "https://github.com/acme/widgets.git");

        RepoRef url = RepoResolver::parse("https://gitlab.example.com/group/sub/tool-server.git");
        ASSERT_TRUE(url.cloneUrl == "https://gitlab.example.com/group/sub/tool-server.git");
        ASSERT_TRUE(url.derivedName == "tool-server");
        ASSERT_TRUE(url.subdir.empty());

        RepoRef trailing = RepoResolver::parse("https://github.com/acme/widgets/");
        ASSERT_TRUE(trailing.derivedName == "widgets");

        ASSERT_TRUE(rejects(""));
        ASSERT_TRUE(rejects("   "));
        ASSERT_TRUE(rejects("widgets"));
        ASSERT_TRUE(rejects("/widgets"));
        ASSERT_TRUE(rejects("acme/"));
        ASSERT_TRUE(rejects("acme/widgets/extra"));
        ASSERT_TRUE(rejects("acme/widgets:"));
        ASSERT_TRUE(rejects("https://github.com"));
        ASSERT_TRUE(rejects("https://github.com/"));
        ASSERT_TRUE(rejects("://github.com/acme/widgets"));

        try {
            RepoResolver::parse("nonsense");
            ASSERT_TRUE(false);
        } catch (const InvalidRepoReference& e) {
            ASSERT_TRUE(e.input() == "nonsense");
            ASSERT_TRUE(std::string(e.what()).find("nonsense") != std::string::npos);
        }

        std::cout << "All RepoResolver tests passed." << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
