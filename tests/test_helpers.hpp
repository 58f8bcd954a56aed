#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "event_bus.hpp"
#include "irc_client.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

// Subscribes to a bus and keeps every delivered event.
class EventCollector {
   public:
    explicit EventCollector(EventBus& bus) : m_bus(bus) {
        bus.subscribe([this](const Event& event) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(event);
        });
    }

    ~EventCollector() { m_bus.close(); }

    std::vector<Event> events() {
        m_bus.flush();
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    std::vector<std::string> types() {
        std::vector<std::string> out;
        for (const auto& e : events()) out.push_back(e.type);
        return out;
    }

    std::vector<Event> of_type(const std::string& type) {
        std::vector<Event> out;
        for (const auto& e : events()) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

   private:
    EventBus& m_bus;
    std::mutex m_mutex;
    std::vector<Event> m_events;
};

class TempDir {
   public:
    TempDir() : m_path(fs::temp_directory_path() / ("ircfetch-test-" + Utils::random_suffix())) {
        fs::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    const fs::path& path() const { return m_path; }

    fs::path write(const std::string& name, const std::string& contents) const {
        fs::path file = m_path / name;
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

   private:
    fs::path m_path;
};

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline Settings test_settings(const fs::path& resources, const fs::path& transfers) {
    Settings settings;
    settings.irc = ConnectionConfig{"tester", "tester", "irc.example.net", 6667, "#books"};
    settings.resource_file_path = resources;
    settings.transfer_file_path = transfers;
    return settings;
}

// Offer whose accept() writes contents into the given file.
inline Notification::IncomingFileTransfer make_offer(const std::string& filename, const std::string& contents) {
    Notification::IncomingFileTransfer offer;
    offer.safe_filename = filename;
    offer.raw_filename = filename;
    offer.accept = [contents](const fs::path& destination) {
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        out << contents;
    };
    return offer;
}

// Scriptable IrcClient for driving the orchestrator without a network.
class FakeIrcClient : public IrcClient {
   public:
    enum class Connect { Succeed, Fail, Hang };

    explicit FakeIrcClient(Connect mode = Connect::Succeed) : m_mode(mode) {}

    void set_listener(Listener listener) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_listener = std::move(listener);
    }

    std::shared_future<void> start() override {
        switch (m_mode) {
            case Connect::Succeed:
                m_connected = true;
                m_registered.set_value();
                break;
            case Connect::Fail:
                m_registered.set_exception(std::make_exception_ptr(std::runtime_error("connection refused")));
                break;
            case Connect::Hang:
                break;
        }
        return m_future;
    }

    bool is_connected() const override { return m_connected; }

    void message(const std::string& target, const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_messages.emplace_back(target, text);
        }
        if (on_message) on_message(text);
    }

    void quit(const std::string&) override {
        m_quit_calls++;
        if (quit_error) throw std::runtime_error(*quit_error);
        m_connected = false;
    }

    // Delivers a notification the way the client's own thread would.
    void deliver(IrcNotification notification) {
        Listener listener;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            listener = m_listener;
        }
        if (listener) listener(notification);
    }

    std::vector<std::pair<std::string, std::string>> messages() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages;
    }
    int quit_calls() const { return m_quit_calls; }

    std::function<void(const std::string&)> on_message;
    std::optional<std::string> quit_error;

   private:
    Connect m_mode;
    std::mutex m_mutex;
    Listener m_listener;
    std::promise<void> m_registered;
    std::shared_future<void> m_future{m_registered.get_future().share()};
    std::atomic<bool> m_connected{false};
    std::atomic<int> m_quit_calls{0};
    std::vector<std::pair<std::string, std::string>> m_messages;
};
