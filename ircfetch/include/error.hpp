#pragma once

#include <iostream>
#include <string>

namespace Error {
inline void print_usage() {
    std::cerr << "usage:\n"
              << "    ircfetch [-c|--config path/to/config.json] [-s|--search \"search term\"]\n"
              << "    ircfetch [-c|--config path/to/config.json] -f|--fetch \"fetch term\"\n"
              << "    ircfetch -h|--help\n";
}

inline void missing_value(const std::string& option) {
    std::cerr << "Missing value for " << option << "\n";
    print_usage();
}

inline void unknown_option(const std::string& option) {
    std::cerr << "Unknown option: " << option << "\n";
    print_usage();
}

inline void invalid_config(const std::string& reason) { std::cerr << "Invalid configuration: " << reason << "\n"; }
}  // namespace Error
