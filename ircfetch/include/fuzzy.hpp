#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace Fuzzy {
inline std::string normalise(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), not_space));
    out.erase(std::find_if(out.rbegin(), out.rend(), not_space).base(), out.end());
    return out;
}

// Split on every single space; runs of spaces yield empty tokens.
inline std::vector<std::string> space_split(const std::string& text) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(' ', start);
        if (pos == std::string::npos) {
            tokens.push_back(text.substr(start));
            break;
        }
        tokens.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

inline bool normalised_includes(const std::string& target, const std::string& token) {
    return normalise(target).find(normalise(token)) != std::string::npos;
}

// True if every space separated word of query appears in target. An empty
// query matches everything.
inline bool matches(const std::string& target, const std::string& query) {
    const std::string haystack = normalise(target);
    for (const auto& token : space_split(normalise(query))) {
        if (haystack.find(normalise(token)) == std::string::npos) {
            return false;
        }
    }
    return true;
}
}  // namespace Fuzzy
