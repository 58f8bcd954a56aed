#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Line level helpers for the IRC client protocol and CTCP DCC offers.
namespace Irc {
inline constexpr char CTCP_DELIM = '\x01';

struct Message {
    std::string prefix;  // without the leading ':'
    std::string command;
    std::vector<std::string> params;  // trailing parameter included last
};

struct DccSend {
    std::string raw_filename;
    std::string host;  // dotted quad
    uint16_t port = 0;
    uint64_t size = 0;
};

// Parses one line without its CRLF. Returns nullopt for blank lines.
std::optional<Message> parse_line(const std::string& line);

// Nick part of "nick!user@host".
std::string nick_from_prefix(const std::string& prefix);

bool is_channel(const std::string& target);

// Recognises "\x01DCC SEND <file> <ip> <port> [size]\x01". The filename may
// be double quoted. Passive (port 0) offers are rejected.
std::optional<DccSend> parse_dcc_send(const std::string& text);

// Accepts the 32-bit integer form used on the wire or a dotted quad.
std::optional<std::string> decode_dcc_address(const std::string& address);

// Final path component with every character outside [A-Za-z0-9._-]
// replaced by '_'. Never empty and never "." or "..".
std::string safe_filename(const std::string& raw_filename);

std::string format_command(const std::string& command, const std::vector<std::string>& params,
                           const std::optional<std::string>& trailing = std::nullopt);
}  // namespace Irc
