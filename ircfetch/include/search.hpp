#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "event_bus.hpp"

namespace fs = std::filesystem;

namespace Search {
// Regular files directly under path, in directory enumeration order.
std::vector<fs::path> resource_files(const fs::path& path);

std::vector<std::string> search_resource_file(const fs::path& resource, const std::string& search);

// Matching lines across every resource file. Files that cannot be read are
// skipped and reported on the bus.
std::vector<std::string> search_resources(const fs::path& resource_path, const std::string& search, EventBus& bus);
}  // namespace Search
