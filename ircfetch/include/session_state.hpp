#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "config.hpp"
#include "event_bus.hpp"

namespace fs = std::filesystem;

enum class FetchStatus { Initialising, Fetching, Completed, Failed };

std::string to_string(FetchStatus status);

// Shared context of one fetch run. The orchestrator writes the fetch status,
// the transfer callback writes the accepted file; both are safe to read from
// any thread.
class SessionState {
   public:
    SessionState(EventBus& bus, const Settings& settings)
        : m_bus(bus),
          m_connection(settings.irc),
          m_resource_file_path(settings.resource_file_path),
          m_transfer_file_path(settings.transfer_file_path) {}

    EventBus& events() const { return m_bus; }
    const ConnectionConfig& connection() const { return m_connection; }
    const fs::path& resource_file_path() const { return m_resource_file_path; }
    const fs::path& transfer_file_path() const { return m_transfer_file_path; }

    FetchStatus fetch_status() const { return m_status.load(); }
    // Moves the status forward; backwards moves are ignored.
    void advance_fetch_status(FetchStatus status);

    std::optional<fs::path> accepted_file() const;
    bool has_accepted_file() const { return accepted_file().has_value(); }
    // Returns false, keeping the first file, when a file was already accepted.
    bool record_accepted_file(const fs::path& file);

    void cancel();
    bool cancelled() const;

    // Sleeps for duration, waking early on cancellation (returns false) or,
    // with wake_on_accept, once a file has been accepted.
    bool wait_for(std::chrono::milliseconds duration, bool wake_on_accept = false);

   private:
    EventBus& m_bus;
    const ConnectionConfig m_connection;
    const fs::path m_resource_file_path;
    const fs::path m_transfer_file_path;

    std::atomic<FetchStatus> m_status{FetchStatus::Initialising};

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::optional<fs::path> m_accepted_file;
    bool m_cancelled = false;
};
