#include "utils/RepositoryRef.h"
#include <vector>
#include <sstream>

namespace {
const std::string kGithubPrefix = "https://github.com/";

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}
} // namespace

RepositoryRef RepositoryRef::parse(const std::string& reference) {
    RepositoryRef ref;
    std::string rest = reference;
    bool fromGithub = false;
    if (rest.rfind(kGithubPrefix, 0) == 0) {
        rest = rest.substr(kGithubPrefix.size());
        fromGithub = true;
    }
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    if (rest.size() > 4 && rest.compare(rest.size() - 4, 4, ".git") == 0) {
        rest = rest.substr(0, rest.size() - 4);
    }

    auto parts = splitPath(rest);
    ref.shortName = parts.empty() ? rest : parts.back();

    bool looksLocal = !reference.empty() && (reference[0] == '/' || reference[0] == '.' || reference[0] == '~');
    if ((fromGithub && parts.size() >= 2) || (!looksLocal && parts.size() == 2)) {
        ref.owner = parts[0];
        ref.name = parts[1];
        ref.fullName = ref.owner + "/" + ref.name;
    } else {
        ref.fullName = rest;
    }
    return ref;
}
