#include "search.hpp"

#include <fstream>
#include <stdexcept>

#include "fuzzy.hpp"
#include "types.h"

namespace Search {
std::vector<fs::path> resource_files(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        throw std::runtime_error("[SEARCH] Not a resource directory: " + path.string());
    }
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(path)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    return files;
}

std::vector<std::string> search_resource_file(const fs::path& resource, const std::string& search) {
    std::ifstream file(resource);
    if (!file.is_open()) {
        throw std::runtime_error("[SEARCH] Error opening resource file: " + resource.string());
    }
    std::vector<std::string> results;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (Fuzzy::matches(line, search)) {
            results.push_back(line);
        }
    }
    if (file.bad()) {
        throw std::runtime_error("[SEARCH] Error reading resource file: " + resource.string());
    }
    return results;
}

std::vector<std::string> search_resources(const fs::path& resource_path, const std::string& search, EventBus& bus) {
    std::vector<std::string> results;
    for (const auto& resource : resource_files(resource_path)) {
        try {
            auto matches = search_resource_file(resource, search);
            results.insert(results.end(), std::make_move_iterator(matches.begin()),
                           std::make_move_iterator(matches.end()));
        } catch (const std::exception& e) {
            bus.push(EventType::SearchError, {{"file", resource.string()}, {"error", e.what()}});
        }
    }
    return results;
}
}  // namespace Search
