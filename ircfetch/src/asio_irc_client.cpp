#include "asio_irc_client.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace {
constexpr int MAX_NICK_RETRIES = 3;
constexpr auto QUIT_WRITE_TIMEOUT = std::chrono::seconds(5);

// One active DCC SEND download. Every step is asynchronous on the given
// io_context; the deadline restarts whenever bytes arrive.
class DccDownload {
   public:
    DccDownload(asio::io_context& io, const Irc::DccSend& offer, const fs::path& destination,
                std::chrono::milliseconds idle_timeout)
        : m_resolver(io), m_socket(io), m_deadline(io), m_offer(offer), m_destination(destination),
          m_idle_timeout(idle_timeout) {}

    void start() {
        m_out.open(m_destination, std::ios::binary | std::ios::trunc);
        if (!m_out.is_open()) {
            throw std::runtime_error("Cannot open output file: " + m_destination.string());
        }
        arm_deadline();
        m_resolver.async_resolve(m_offer.host, std::to_string(m_offer.port),
                                 [this](asio::error_code ec, tcp::resolver::results_type results) {
                                     if (m_done) return;
                                     if (ec) {
                                         finish(std::make_exception_ptr(asio::system_error(ec, "resolve DCC sender")));
                                         return;
                                     }
                                     asio::async_connect(m_socket, results,
                                                         [this](asio::error_code ec, const tcp::endpoint&) {
                                                             if (m_done) return;
                                                             if (ec) {
                                                                 finish(std::make_exception_ptr(
                                                                     asio::system_error(ec, "connect DCC sender")));
                                                                 return;
                                                             }
                                                             read_next();
                                                         });
                                 });
    }

    // Throws unless every announced byte was received and written.
    void complete() {
        if (m_error) std::rethrow_exception(m_error);
        if (!m_done) {
            throw std::runtime_error("DCC transfer of " + m_offer.raw_filename + " was aborted");
        }
        m_out.close();
        if (!m_out) {
            throw std::runtime_error("Error writing " + m_destination.string());
        }
        if (m_offer.size != 0 && m_received < m_offer.size) {
            throw std::runtime_error("DCC transfer of " + m_offer.raw_filename + " ended after " +
                                     std::to_string(m_received) + " of " + std::to_string(m_offer.size) + " bytes");
        }
    }

   private:
    void arm_deadline() {
        m_deadline.expires_after(m_idle_timeout);
        m_deadline.async_wait([this](asio::error_code ec) {
            if (ec == asio::error::operation_aborted || m_done) return;
            finish(std::make_exception_ptr(std::runtime_error(
                "DCC transfer of " + m_offer.raw_filename + " stalled after " + std::to_string(m_received) + " bytes")));
        });
    }

    void read_next() {
        if (m_offer.size != 0 && m_received >= m_offer.size) {
            finish();
            return;
        }
        m_socket.async_read_some(asio::buffer(m_chunk), [this](asio::error_code ec, std::size_t n) {
            if (m_done) return;
            if (ec == asio::error::eof) {
                finish();
                return;
            }
            if (ec) {
                finish(std::make_exception_ptr(asio::system_error(ec)));
                return;
            }
            m_out.write(m_chunk.data(), static_cast<std::streamsize>(n));
            m_received += n;
            arm_deadline();
            send_ack();
        });
    }

    // DCC acknowledges the running byte count as a 32-bit big-endian value
    void send_ack() {
        const auto count = static_cast<uint32_t>(m_received & 0xFFFFFFFFULL);
        m_ack = {static_cast<unsigned char>(count >> 24), static_cast<unsigned char>(count >> 16),
                 static_cast<unsigned char>(count >> 8), static_cast<unsigned char>(count)};
        asio::async_write(m_socket, asio::buffer(m_ack), [this](asio::error_code ec, std::size_t) {
            if (m_done) return;
            if (ec && ec != asio::error::broken_pipe && ec != asio::error::connection_reset) {
                finish(std::make_exception_ptr(asio::system_error(ec)));
                return;
            }
            read_next();
        });
    }

    void finish(std::exception_ptr error = nullptr) {
        if (m_done) return;
        m_done = true;
        m_error = error;
        m_deadline.cancel();
        asio::error_code ignored;
        m_socket.close(ignored);
    }

    tcp::resolver m_resolver;
    tcp::socket m_socket;
    asio::steady_timer m_deadline;
    Irc::DccSend m_offer;
    fs::path m_destination;
    std::chrono::milliseconds m_idle_timeout;
    std::ofstream m_out;
    std::array<char, 8192> m_chunk{};
    std::array<unsigned char, 4> m_ack{};
    uint64_t m_received = 0;
    bool m_done = false;
    std::exception_ptr m_error;
};
}  // namespace

AsioIrcClient::AsioIrcClient(const ConnectionConfig& config, std::chrono::milliseconds dcc_idle_timeout)
    : m_config(config),
      m_socket(m_io),
      m_registered_future(m_registered.get_future().share()),
      m_dcc_idle_timeout(dcc_idle_timeout) {}

AsioIrcClient::~AsioIrcClient() {
    {
        std::lock_guard<std::mutex> lock(m_dcc_mutex);
        m_closing = true;
        if (m_active_dcc) {
            m_active_dcc->stop();
        }
    }
    m_io.stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void AsioIrcClient::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

std::shared_future<void> AsioIrcClient::start() {
    if (!m_started.exchange(true)) {
        m_thread = std::thread(&AsioIrcClient::run, this);
    }
    return m_registered_future;
}

void AsioIrcClient::run() {
    auto resolver = std::make_shared<tcp::resolver>(m_io);
    resolver->async_resolve(
        m_config.server, std::to_string(m_config.port),
        [this, resolver](asio::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                registration_failed(std::make_exception_ptr(asio::system_error(ec, "resolve " + m_config.server)));
                return;
            }
            asio::async_connect(m_socket, results, [this](asio::error_code ec, const tcp::endpoint&) {
                if (ec) {
                    registration_failed(std::make_exception_ptr(asio::system_error(ec, "connect " + m_config.server)));
                    return;
                }
                m_socket_open = true;
                send_line(Irc::format_command("NICK", {m_config.nick}));
                send_line(Irc::format_command("USER", {m_config.login, "0", "*"}, m_config.login));
                do_read();
            });
        });
    try {
        m_io.run();
    } catch (const std::exception& e) {
        std::cerr << "IRC client error: " << e.what() << std::endl;
        registration_failed(std::current_exception());
    }
    m_socket_open = false;
    m_registered_flag = false;
    registration_failed(std::make_exception_ptr(std::runtime_error("Connection closed before registration")));
}

void AsioIrcClient::do_read() {
    asio::async_read_until(m_socket, m_buffer, "\n", [this](asio::error_code ec, std::size_t /*length*/) {
        if (ec) {
            if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
                std::cerr << "IRC read error: " << ec.message() << std::endl;
            }
            asio::error_code ignored;
            m_socket.close(ignored);
            m_socket_open = false;
            m_registered_flag = false;
            registration_failed(std::make_exception_ptr(asio::system_error(ec)));
            return;
        }
        std::istream is(&m_buffer);
        std::string line;
        std::getline(is, line);
        if (auto msg = Irc::parse_line(line)) {
            handle_message(*msg);
        }
        if (m_socket.is_open()) {
            do_read();
        }
    });
}

void AsioIrcClient::send_line(std::string line, WriteHandler on_written) {
    asio::post(m_io, [this, line = std::move(line), on_written = std::move(on_written)]() mutable {
        m_outbox.push_back(PendingWrite{std::move(line), std::move(on_written)});
        if (m_outbox.size() == 1) {
            do_write();
        }
    });
}

void AsioIrcClient::do_write() {
    asio::async_write(m_socket, asio::buffer(m_outbox.front().line), [this](asio::error_code ec, std::size_t) {
        std::deque<PendingWrite> finished;
        finished.push_back(std::move(m_outbox.front()));
        m_outbox.pop_front();
        if (ec) {
            std::cerr << "IRC write error: " << ec.message() << std::endl;
            // Nothing queued behind a failed write will be sent either
            std::move(m_outbox.begin(), m_outbox.end(), std::back_inserter(finished));
            m_outbox.clear();
        } else if (!m_outbox.empty()) {
            do_write();
        }
        for (auto& write : finished) {
            if (write.on_written) write.on_written(ec);
        }
    });
}

void AsioIrcClient::message(const std::string& target, const std::string& text) {
    if (!m_socket_open) {
        throw std::runtime_error("Cannot message " + target + ": not connected");
    }
    send_line(Irc::format_command("PRIVMSG", {target}, text));
}

void AsioIrcClient::quit(const std::string& reason) {
    if (!m_socket_open) {
        throw std::runtime_error("Cannot quit: not connected");
    }
    auto written = std::make_shared<std::promise<void>>();
    auto done = written->get_future();
    send_line(Irc::format_command("QUIT", {}, reason), [written](const asio::error_code& ec) {
        if (ec) {
            written->set_exception(std::make_exception_ptr(asio::system_error(ec, "QUIT")));
        } else {
            written->set_value();
        }
    });
    if (done.wait_for(QUIT_WRITE_TIMEOUT) != std::future_status::ready) {
        throw std::runtime_error("QUIT was not sent within 5 seconds");
    }
    done.get();
}

void AsioIrcClient::handle_message(const Irc::Message& msg) {
    if (msg.command == "PING") {
        send_line(Irc::format_command("PONG", {}, msg.params.empty() ? m_config.server : msg.params.back()));
    } else if (msg.command == "001") {
        send_line(Irc::format_command("JOIN", {m_config.channel}));
        registration_succeeded();
    } else if (msg.command == "433" && !m_registered_flag) {
        if (++m_nick_retries > MAX_NICK_RETRIES) {
            registration_failed(std::make_exception_ptr(std::runtime_error("Nickname already in use: " + m_config.nick)));
            return;
        }
        m_config.nick += "_";
        send_line(Irc::format_command("NICK", {m_config.nick}));
    } else if (msg.command == "ERROR") {
        std::string reason = msg.params.empty() ? "ERROR" : msg.params.back();
        registration_failed(std::make_exception_ptr(std::runtime_error("Server error: " + reason)));
    } else if (msg.command == "JOIN" && !msg.params.empty()) {
        notify(Notification::Join{msg.params[0], Irc::nick_from_prefix(msg.prefix)});
    } else if ((msg.command == "PRIVMSG" || msg.command == "NOTICE") && msg.params.size() >= 2) {
        handle_privmsg(msg);
    }
}

void AsioIrcClient::handle_privmsg(const Irc::Message& msg) {
    const std::string& target = msg.params[0];
    const std::string& text = msg.params[1];
    std::optional<std::string> user;
    if (!msg.prefix.empty()) {
        user = Irc::nick_from_prefix(msg.prefix);
    }

    if (auto offer = Irc::parse_dcc_send(text)) {
        Notification::IncomingFileTransfer transfer;
        transfer.raw_filename = offer->raw_filename;
        transfer.safe_filename = Irc::safe_filename(offer->raw_filename);
        transfer.size = offer->size;
        transfer.accept = [this, offer = *offer](const fs::path& destination) { receive_dcc(offer, destination); };
        notify(std::move(transfer));
        return;
    }

    notify(Notification::GenericMessage{user, text});
    if (Irc::is_channel(target)) {
        notify(Notification::ChannelMessage{target, user, text});
    }
}

void AsioIrcClient::notify(IrcNotification notification) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (!listener) return;
    try {
        listener(notification);
    } catch (const std::exception& e) {
        std::cerr << "IRC listener failed: " << e.what() << std::endl;
    }
}

void AsioIrcClient::registration_succeeded() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_registered_flag = true;
    if (!m_registration_settled) {
        m_registration_settled = true;
        m_registered.set_value();
    }
}

void AsioIrcClient::registration_failed(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_registration_settled) {
        m_registration_settled = true;
        m_registered.set_exception(error);
    }
}

void AsioIrcClient::receive_dcc(const Irc::DccSend& offer, const fs::path& destination) {
    asio::io_context io;
    {
        std::lock_guard<std::mutex> lock(m_dcc_mutex);
        if (m_closing) {
            throw std::runtime_error("DCC transfer of " + offer.raw_filename + " refused: client is closing");
        }
        m_active_dcc = &io;
    }
    struct ActiveDccReset {
        AsioIrcClient& client;
        ~ActiveDccReset() {
            std::lock_guard<std::mutex> lock(client.m_dcc_mutex);
            client.m_active_dcc = nullptr;
        }
    } reset{*this};

    DccDownload download(io, offer, destination, m_dcc_idle_timeout);
    download.start();
    io.run();
    download.complete();
}
