#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <variant>

namespace fs = std::filesystem;

namespace Notification {
struct GenericMessage {
    std::optional<std::string> user;
    std::string message;
};

struct ChannelMessage {
    std::string channel;
    std::optional<std::string> user;
    std::string message;
};

struct Join {
    std::string channel;
    std::string user;
};

// An unsolicited file offer. accept() receives the file into the given path
// and blocks until the transfer finished; it throws if the transfer failed.
struct IncomingFileTransfer {
    std::string safe_filename;
    std::string raw_filename;
    uint64_t size = 0;
    std::function<void(const fs::path&)> accept;
};
}  // namespace Notification

using IrcNotification = std::variant<Notification::GenericMessage, Notification::ChannelMessage, Notification::Join,
                                     Notification::IncomingFileTransfer>;

// Chat network connection used by the fetch orchestrator. Notifications are
// delivered from the client's own thread.
class IrcClient {
   public:
    using Listener = std::function<void(IrcNotification&)>;

    virtual ~IrcClient() = default;

    virtual void set_listener(Listener listener) = 0;

    // Begins connecting. The future becomes ready once the server accepted
    // the registration, or holds the exception that stopped it.
    virtual std::shared_future<void> start() = 0;

    virtual bool is_connected() const = 0;
    virtual void message(const std::string& target, const std::string& text) = 0;
    virtual void quit(const std::string& reason) = 0;
};
