#pragma once

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace Utils {
inline bool check_file_exists(const fs::path& filepath) { return fs::exists(filepath); }

// Random lower-case hex string of the requested length.
inline std::string random_suffix(std::size_t length = 12) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dis(0, 15);
    std::ostringstream oss;
    oss << std::hex << std::nouppercase;
    for (std::size_t i = 0; i < length; ++i) oss << dis(gen);
    return oss.str();
}

// Creates an empty "<filename>-<random>.tmp" in the system temp directory.
inline fs::path create_temp_file(const std::string& filename) {
    const fs::path dir = fs::temp_directory_path();
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = dir / (filename + "-" + random_suffix() + ".tmp");
        if (check_file_exists(candidate)) continue;
        std::ofstream file(candidate, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("[TEMP FILE] Error creating " + candidate.string());
        }
        return candidate;
    }
    throw std::runtime_error("[TEMP FILE] No free temp file name for " + filename);
}
}  // namespace Utils
