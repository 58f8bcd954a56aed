#pragma once

#include <chrono>
#include <string_view>

namespace Command {
inline constexpr std::string_view CONFIG = "--config";
inline constexpr std::string_view CONFIG_SHORT = "-c";
inline constexpr std::string_view SEARCH = "--search";
inline constexpr std::string_view SEARCH_SHORT = "-s";
inline constexpr std::string_view FETCH = "--fetch";
inline constexpr std::string_view FETCH_SHORT = "-f";
inline constexpr std::string_view HELP = "--help";
inline constexpr std::string_view HELP_SHORT = "-h";

inline constexpr std::string_view DEFAULT_CONFIG = "config/config.json";
}  // namespace Command

namespace EventType {
// Run bookkeeping
inline constexpr std::string_view Options = "options";
inline constexpr std::string_view FetchStatus = "fetch-status";
inline constexpr std::string_view FetchCancelled = "fetch-cancelled";
inline constexpr std::string_view Poll = "poll";

// Connection lifecycle
inline constexpr std::string_view ConnectionStatus = "connection status";
inline constexpr std::string_view ConnectionError = "connection error";
inline constexpr std::string_view BotStatus = "bot status";
inline constexpr std::string_view MessageOut = "message out";
inline constexpr std::string_view MessageError = "message error";
inline constexpr std::string_view ServerQuit = "server quit";
inline constexpr std::string_view CloseError = "close error";

// Inbound notifications
inline constexpr std::string_view GenericMessage = "generic-message";
inline constexpr std::string_view GenericChannel = "generic-channel";
inline constexpr std::string_view Join = "join";

// File transfers
inline constexpr std::string_view IncomingFileTransfer = "incoming-file-transfer";
inline constexpr std::string_view AcceptedFileTransfer = "accepted-file-transfer";
inline constexpr std::string_view UnexpectedFileTransfer = "unexpected-file-transfer";
inline constexpr std::string_view CopyResource = "copy-resource";
inline constexpr std::string_view TransferError = "transfer error";
inline constexpr std::string_view CopyError = "copy error";

inline constexpr std::string_view SearchError = "search error";
}  // namespace EventType

struct FetchTimings {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds grace_period{30000};
    std::chrono::milliseconds poll_interval{2000};
    int max_polls = 30;
};
