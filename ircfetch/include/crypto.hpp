#pragma once

#include <openssl/sha.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace Crypto {
// Hex encoded SHA-256 of the file contents.
inline std::string compute_file_hash(const std::filesystem::path& path) {
    std::ifstream file(path, std::ifstream::binary);
    if (!file.is_open()) {
        throw std::runtime_error("[CRYPTO] Error opening file: " + path.string());
    }
    SHA256_CTX sha256_context;
    SHA256_Init(&sha256_context);
    const int buffer_size = 4096;
    unsigned char buffer[buffer_size];
    while (file.read(reinterpret_cast<char*>(buffer), buffer_size)) {
        SHA256_Update(&sha256_context, buffer, file.gcount());
    }
    if (file.gcount() > 0) {
        SHA256_Update(&sha256_context, buffer, file.gcount());
    }
    if (file.bad()) {
        throw std::runtime_error("[CRYPTO] Error reading file: " + path.string());
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256_context);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
}  // namespace Crypto
