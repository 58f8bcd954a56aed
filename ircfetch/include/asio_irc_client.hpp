#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>

#include "config.hpp"
#include "irc_client.hpp"
#include "irc_protocol.hpp"

using asio::ip::tcp;

// IrcClient over a plain TCP connection. All protocol traffic runs on one io
// thread; DCC downloads run inside the offer callback on a private
// io_context and fail once the sender has been silent for dcc_idle_timeout.
class AsioIrcClient : public IrcClient {
   public:
    static constexpr std::chrono::milliseconds DEFAULT_DCC_IDLE_TIMEOUT{30000};

    explicit AsioIrcClient(const ConnectionConfig& config,
                           std::chrono::milliseconds dcc_idle_timeout = DEFAULT_DCC_IDLE_TIMEOUT);
    ~AsioIrcClient() override;

    void set_listener(Listener listener) override;
    std::shared_future<void> start() override;
    bool is_connected() const override { return m_registered_flag.load(); }
    void message(const std::string& target, const std::string& text) override;
    void quit(const std::string& reason) override;

   private:
    void run();
    void do_read();
    using WriteHandler = std::function<void(const asio::error_code&)>;

    void send_line(std::string line, WriteHandler on_written = nullptr);
    void do_write();
    void handle_message(const Irc::Message& msg);
    void handle_privmsg(const Irc::Message& msg);
    void notify(IrcNotification notification);
    void registration_succeeded();
    void registration_failed(std::exception_ptr error);

    void receive_dcc(const Irc::DccSend& offer, const fs::path& destination);

    struct PendingWrite {
        std::string line;
        WriteHandler on_written;
    };

    ConnectionConfig m_config;
    asio::io_context m_io;
    tcp::socket m_socket;
    asio::streambuf m_buffer;
    std::deque<PendingWrite> m_outbox;
    std::thread m_thread;

    std::mutex m_mutex;
    Listener m_listener;
    std::promise<void> m_registered;
    std::shared_future<void> m_registered_future;
    bool m_registration_settled = false;

    std::atomic<bool> m_started{false};
    std::atomic<bool> m_registered_flag{false};
    std::atomic<bool> m_socket_open{false};
    int m_nick_retries = 0;

    const std::chrono::milliseconds m_dcc_idle_timeout;
    std::mutex m_dcc_mutex;
    asio::io_context* m_active_dcc = nullptr;
    bool m_closing = false;
};
