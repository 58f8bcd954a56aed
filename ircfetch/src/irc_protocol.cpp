#include "irc_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace Irc {
namespace {
bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string strip_line_breaks(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(), [](char c) { return c == '\r' || c == '\n'; }), s.end());
    return s;
}
}  // namespace

std::optional<Message> parse_line(const std::string& raw) {
    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    size_t pos = 0;
    auto skip_spaces = [&]() {
        while (pos < line.size() && line[pos] == ' ') ++pos;
    };
    auto next_word = [&]() {
        size_t end = line.find(' ', pos);
        if (end == std::string::npos) end = line.size();
        std::string word = line.substr(pos, end - pos);
        pos = end;
        return word;
    };

    Message msg;
    skip_spaces();
    if (pos < line.size() && line[pos] == ':') {
        ++pos;
        msg.prefix = next_word();
    }
    skip_spaces();
    msg.command = next_word();
    if (msg.command.empty()) {
        return std::nullopt;
    }
    std::transform(msg.command.begin(), msg.command.end(), msg.command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    while (true) {
        skip_spaces();
        if (pos >= line.size()) break;
        if (line[pos] == ':') {
            msg.params.push_back(line.substr(pos + 1));
            break;
        }
        msg.params.push_back(next_word());
    }
    return msg;
}

std::string nick_from_prefix(const std::string& prefix) { return prefix.substr(0, prefix.find('!')); }

bool is_channel(const std::string& target) {
    return !target.empty() && (target[0] == '#' || target[0] == '&' || target[0] == '+' || target[0] == '!');
}

std::optional<DccSend> parse_dcc_send(const std::string& text) {
    if (text.size() < 2 || text.front() != CTCP_DELIM) {
        return std::nullopt;
    }
    std::string body = text.substr(1);
    if (!body.empty() && body.back() == CTCP_DELIM) {
        body.pop_back();
    }
    const std::string tag = "DCC SEND ";
    if (body.compare(0, tag.size(), tag) != 0) {
        return std::nullopt;
    }
    body = body.substr(tag.size());

    DccSend offer;
    std::string rest;
    if (!body.empty() && body.front() == '"') {
        size_t close = body.find('"', 1);
        if (close == std::string::npos) return std::nullopt;
        offer.raw_filename = body.substr(1, close - 1);
        rest = body.substr(close + 1);
    } else {
        size_t space = body.find(' ');
        if (space == std::string::npos) return std::nullopt;
        offer.raw_filename = body.substr(0, space);
        rest = body.substr(space);
    }
    if (offer.raw_filename.empty()) {
        return std::nullopt;
    }

    std::istringstream iss(rest);
    std::string address, port, size;
    iss >> address >> port >> size;
    auto host = decode_dcc_address(address);
    if (!host || !all_digits(port) || port.size() > 5) {
        return std::nullopt;
    }
    unsigned long port_value = std::stoul(port);
    if (port_value == 0 || port_value > 65535) {
        return std::nullopt;
    }
    offer.host = *host;
    offer.port = static_cast<uint16_t>(port_value);
    if (all_digits(size) && size.size() < 20) {
        offer.size = std::stoull(size);
    }
    return offer;
}

std::optional<std::string> decode_dcc_address(const std::string& address) {
    if (all_digits(address)) {
        if (address.size() > 10) return std::nullopt;
        unsigned long long value = std::stoull(address);
        if (value > 0xFFFFFFFFULL) return std::nullopt;
        std::ostringstream oss;
        oss << ((value >> 24) & 0xFF) << "." << ((value >> 16) & 0xFF) << "." << ((value >> 8) & 0xFF) << "."
            << (value & 0xFF);
        return oss.str();
    }
    std::istringstream iss(address);
    std::string part;
    int parts = 0;
    while (std::getline(iss, part, '.')) {
        if (!all_digits(part) || part.size() > 3 || std::stoi(part) > 255) return std::nullopt;
        ++parts;
    }
    if (parts != 4 || address.back() == '.') return std::nullopt;
    return address;
}

std::string safe_filename(const std::string& raw_filename) {
    std::string name = raw_filename;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    for (auto& c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '.' && c != '-' && c != '_') {
            c = '_';
        }
    }
    if (name.empty() || name == "." || name == "..") {
        return "file";
    }
    return name;
}

std::string format_command(const std::string& command, const std::vector<std::string>& params,
                           const std::optional<std::string>& trailing) {
    std::string line = strip_line_breaks(command);
    for (const auto& param : params) {
        line += " " + strip_line_breaks(param);
    }
    if (trailing) {
        line += " :" + strip_line_breaks(*trailing);
    }
    return line + "\r\n";
}
}  // namespace Irc
